/**
 * @file csv_table.hpp
 * @brief Чтение выгрузок исходных таблиц из CSV
 */

#pragma once

#include "model/record_table.hpp"
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace wellboard::io {

using namespace wellboard::model;

/**
 * @brief Опции чтения CSV
 */
struct CsvReadOptions {
    std::optional<char> delimiter;   ///< Разделитель; nullopt = автоопределение
    std::string table_name;          ///< Имя таблицы для сообщений; пусто = имя файла без расширения
};

/**
 * @brief Ошибка чтения CSV
 */
class CsvReadError : public std::runtime_error {
public:
    CsvReadError(const std::string& message, size_t line = 0)
        : std::runtime_error(message)
        , line_(line) {}

    [[nodiscard]] size_t line() const noexcept { return line_; }

private:
    size_t line_;
};

/**
 * @brief Чтение CSV файла в таблицу записей
 *
 * Первая непустая строка является заголовком. Поля в кавычках могут
 * содержать разделитель, перевод строки и удвоенную кавычку.
 * BOM в начале файла отбрасывается.
 *
 * @throws CsvReadError Файл не открывается, пуст или кавычка не закрыта
 */
[[nodiscard]] RecordTable readCsvTable(const std::filesystem::path& path,
                                       const CsvReadOptions& options = {});

/**
 * @brief Разбор CSV текста (без обращения к файлу)
 * @throws CsvReadError
 */
[[nodiscard]] RecordTable parseCsvTable(std::string_view content,
                                        const std::string& table_name,
                                        std::optional<char> delimiter = std::nullopt);

/**
 * @brief Определение разделителя по первым строкам
 *
 * Кандидаты: ',', ';', '\\t', '|'. Выбирается разделитель с одинаковым
 * ненулевым числом вхождений во всех строках, иначе самый частый.
 */
[[nodiscard]] char detectDelimiter(const std::vector<std::string>& lines);

} // namespace wellboard::io
