/**
 * @file diagnostics.hpp
 * @brief Диагностические проверки загруженного набора данных
 */

#pragma once

#include "record_mapping.hpp"
#include "model/diagnostics.hpp"
#include "model/records.hpp"
#include "model/selection.hpp"
#include <filesystem>
#include <map>
#include <string>

namespace wellboard::core {

struct DiagnosticsOptions {
    std::filesystem::path data_dir;                ///< Каталог исходных таблиц
    ResolverSettings settings;                     ///< Для месяца расчёта возраста
    std::map<std::string, size_t> table_rows;      ///< Число строк каждой прочитанной таблицы
    MappingIssues issues;                          ///< Строки, пропущенные при типизации
};

/**
 * @brief Построить диагностический отчёт по набору данных
 *
 * Проверки: сборка, объём таблиц, участки BoardData, коды планов,
 * отметки забоя, точки без скважины в WellInfo, неоднозначные коды.
 */
[[nodiscard]] model::DiagnosticsReport buildDiagnosticsReport(const model::Dataset& dataset,
                                                              const DiagnosticsOptions& options);

/**
 * @brief Отчёт, когда набор данных не удалось загрузить
 *
 * Содержит проверку сборки и проверку "dataset_load" со статусом FAIL.
 */
[[nodiscard]] model::DiagnosticsReport buildLoadFailureReport(const DiagnosticsOptions& options,
                                                              const std::string& error);

} // namespace wellboard::core
