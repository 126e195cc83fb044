/**
 * @file file_utils.hpp
 * @brief Вспомогательные функции для работы с файлами
 */

#pragma once

#include <filesystem>
#include <string>

namespace wellboard::io {

/**
 * @brief Атомарная запись строковых данных в файл (через временный файл + rename).
 */
void atomicWrite(const std::filesystem::path& path, const std::string& content);

/**
 * @brief Путь относительно базового каталога; абсолютный путь возвращается как есть.
 */
[[nodiscard]] std::filesystem::path resolveRelative(const std::filesystem::path& base,
                                                    const std::filesystem::path& path);

} // namespace wellboard::io
