/**
 * @file dataset_loader.hpp
 * @brief Загрузка всех исходных таблиц в память
 */

#pragma once

#include "config_io.hpp"
#include "core/record_mapping.hpp"
#include "model/records.hpp"
#include <map>
#include <string>

namespace wellboard::io {

/**
 * @brief Статистика загрузки
 */
struct LoadReport {
    std::map<std::string, size_t> table_rows;   ///< Прочитано строк (без заголовка) по таблицам
    core::MappingIssues issues;                 ///< Пропущенные строки (только в мягком режиме)
};

/**
 * @brief Загрузка набора данных
 *
 * Таблицы Field и Owner необязательны: при отсутствии файла остаются пустыми.
 * Остальные таблицы обязательны.
 *
 * @param report Если nullptr, первая некорректная строка прерывает загрузку;
 *               иначе строки пропускаются и отмечаются в report->issues.
 * @throws CsvReadError, MissingColumnError, EncodingError, GeometryError
 */
[[nodiscard]] Dataset loadDataset(const AppConfig& config, LoadReport* report = nullptr);

} // namespace wellboard::io
