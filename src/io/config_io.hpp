/**
 * @file config_io.hpp
 * @brief Чтение и запись конфигурации (wellboard.json)
 */

#pragma once

#include "model/selection.hpp"
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace wellboard::io {

using namespace wellboard::model;

/// Текущая версия формата конфигурации
constexpr const char* CONFIG_FORMAT_VERSION = "1.0.0";

/// Идентификатор формата
constexpr const char* CONFIG_FORMAT_ID = "wellboard-config";

/**
 * @brief Ошибка работы с конфигурацией
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Расположение файлов исходных таблиц
 */
struct DatasetLayout {
    std::filesystem::path data_dir = "data";    ///< Относительный путь считается от файла конфигурации
    std::string well_info = "WellInfo.csv";
    std::string dx = "DX.csv";
    std::string board_data = "BoardData.csv";
    std::string board_data_links = "BoardDataLinks.csv";
    std::string plat_data = "PlatData.csv";
    std::string adjacent = "Adjacent.csv";
    std::string field = "Field.csv";            ///< Необязательная таблица
    std::string owner = "Owner.csv";            ///< Необязательная таблица
    std::optional<char> delimiter;              ///< nullopt = автоопределение

    [[nodiscard]] std::filesystem::path tablePath(const std::string& file) const {
        return data_dir / file;
    }
};

/**
 * @brief Конфигурация приложения
 */
struct AppConfig {
    DatasetLayout dataset;
    ResolverSettings resolver;
    std::filesystem::path file_path;    ///< Откуда загружена (не сериализуется)
};

/**
 * @brief Конфигурация по умолчанию с полной таблицей названий месторождений
 */
[[nodiscard]] AppConfig defaultConfig();

/**
 * @brief Загрузка конфигурации
 *
 * Неизвестные ключи игнорируются, отсутствующие получают значения по умолчанию.
 * Относительный data_dir разрешается от каталога файла.
 *
 * @throws ConfigError При ошибке чтения, парсинга или чужом формате
 */
[[nodiscard]] AppConfig loadConfig(const std::filesystem::path& path);

/**
 * @brief Атомарное сохранение конфигурации
 * @throws ConfigError При ошибке записи
 */
void saveConfig(const AppConfig& config, const std::filesystem::path& path);

/**
 * @brief Конфигурация в JSON-строку (с отступами)
 */
[[nodiscard]] std::string configToJson(const AppConfig& config, int indent = 2);

/**
 * @brief Конфигурация из JSON-строки (data_dir не разрешается)
 * @throws ConfigError
 */
[[nodiscard]] AppConfig configFromJson(const std::string& json);

} // namespace wellboard::io
