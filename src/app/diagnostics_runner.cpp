/**
 * @file diagnostics_runner.cpp
 * @brief Запуск диагностики набора данных
 */

#include "diagnostics_runner.hpp"
#include "core/diagnostics.hpp"
#include "io/dataset_loader.hpp"
#include "io/diagnostics_writer.hpp"

namespace wellboard::app {

using namespace wellboard::model;

DiagnosticsCommandResult runDiagnosticsCommand(
    const wellboard::io::AppConfig& config,
    const std::filesystem::path& output_dir
) {
    DiagnosticsCommandResult result;
    result.output_dir = output_dir;
    std::filesystem::create_directories(output_dir);

    core::DiagnosticsOptions options;
    options.data_dir = config.dataset.data_dir;
    options.settings = config.resolver;

    DiagnosticsReport report;
    try {
        io::LoadReport load;
        auto dataset = io::loadDataset(config, &load);
        options.table_rows = load.table_rows;
        options.issues = load.issues;
        report = core::buildDiagnosticsReport(dataset, options);
    } catch (const std::exception& e) {
        report = core::buildLoadFailureReport(options, e.what());
    }

    auto summary = report.summarize();
    result.summary = summary;
    result.report = report;

    io::writeDiagnosticsReports(report, output_dir);

    result.exit_code = (summary.status == DiagnosticStatus::Fail) ? 1 : 0;
    return result;
}

} // namespace wellboard::app
