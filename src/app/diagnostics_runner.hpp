/**
 * @file diagnostics_runner.hpp
 * @brief Запуск диагностики набора данных из CLI
 */

#pragma once

#include "io/config_io.hpp"
#include "model/diagnostics.hpp"
#include <filesystem>

namespace wellboard::app {

struct DiagnosticsCommandResult {
    int exit_code = 1;
    std::filesystem::path output_dir;
    wellboard::model::DiagnosticsSummary summary;
    wellboard::model::DiagnosticsReport report;
};

/**
 * @brief Загрузить набор данных в мягком режиме, проверить и сохранить отчёты.
 *
 * Ошибка загрузки не прерывает команду: она попадает в отчёт как FAIL.
 *
 * @param config Конфигурация (расположение таблиц, параметры разрешения)
 * @param output_dir Каталог для report.md/report.json
 */
DiagnosticsCommandResult runDiagnosticsCommand(
    const wellboard::io::AppConfig& config,
    const std::filesystem::path& output_dir
);

} // namespace wellboard::app
