/**
 * @file diagnostics_writer.cpp
 * @brief Запись диагностических отчётов
 */

#include "diagnostics_writer.hpp"
#include "file_utils.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

namespace wellboard::io {
namespace {

using namespace wellboard::model;

std::string statusToMarkdown(DiagnosticStatus status) {
    if (status == DiagnosticStatus::Ok) return "OK";
    if (status == DiagnosticStatus::Warning) return "WARN";
    if (status == DiagnosticStatus::Fail) return "FAIL";
    return "SKIPPED";
}

// Вертикальная черта ломает таблицу Markdown
std::string escapeCell(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (c == '|') {
            result += "\\|";
        } else if (c == '\n') {
            result += ' ';
        } else {
            result += c;
        }
    }
    return result;
}

std::string buildMarkdown(const DiagnosticsReport& report) {
    std::ostringstream out;
    auto summary = report.summarize();

    out << "# Диагностический отчёт wellboard\n\n";
    out << "- Версия приложения: " << report.meta.app_version << "\n";
    out << "- Тип сборки: " << report.meta.build_type << "\n";
    out << "- Платформа: " << report.meta.platform << "\n";
    out << "- Схема отчёта: " << report.meta.schema_version << "\n";
    out << "- Каталог данных: " << report.meta.data_dir.string() << "\n";
    out << "- Месяц расчёта возраста: " << report.meta.reference_month << "\n";
    out << "- Время: " << report.meta.timestamp << "\n\n";

    out << "## Сводка\n";
    out << "- Статус: " << statusToMarkdown(summary.status) << "\n";
    out << "- OK: " << summary.ok << ", WARN: " << summary.warning
        << ", FAIL: " << summary.fail << ", SKIPPED: " << summary.skipped << "\n\n";

    out << "## Проверки\n";
    out << "| Проверка | Статус | Записей | Детали |\n";
    out << "|----------|--------|---------|--------|\n";
    for (const auto& check : report.checks) {
        out << "| " << check.title << " | " << statusToMarkdown(check.status)
            << " | " << check.affected << " | " << escapeCell(check.details) << " |\n";
    }
    out << "\n";

    out << "## Примеры\n";
    for (const auto& check : report.checks) {
        if (check.samples.empty()) continue;
        out << "- " << check.title << ":\n";
        for (const auto& sample : check.samples) {
            out << "  - " << sample << "\n";
        }
        if (check.affected > check.samples.size()) {
            out << "  - ... ещё " << (check.affected - check.samples.size()) << "\n";
        }
    }

    return out.str();
}

nlohmann::json buildJson(const DiagnosticsReport& report) {
    nlohmann::json j;
    auto summary = report.summarize();

    j["schema_version"] = report.meta.schema_version;
    j["meta"] = {
        {"app_version", report.meta.app_version},
        {"build_type", report.meta.build_type},
        {"platform", report.meta.platform},
        {"timestamp", report.meta.timestamp},
        {"data_dir", report.meta.data_dir.string()},
        {"reference_month", report.meta.reference_month}
    };

    j["checks"] = nlohmann::json::array();
    for (const auto& check : report.checks) {
        nlohmann::json c;
        c["id"] = check.id;
        c["title"] = check.title;
        c["status"] = diagnosticStatusToString(check.status);
        c["details"] = check.details;
        c["affected"] = check.affected;
        c["samples"] = check.samples;
        j["checks"].push_back(c);
    }

    j["summary"] = {
        {"status", diagnosticStatusToString(summary.status)},
        {"ok", summary.ok},
        {"warning", summary.warning},
        {"fail", summary.fail},
        {"skipped", summary.skipped}
    };

    return j;
}

} // namespace

DiagnosticsWriteResult writeDiagnosticsReports(
    const DiagnosticsReport& report,
    const std::filesystem::path& output_dir
) {
    std::filesystem::create_directories(output_dir);
    DiagnosticsWriteResult result;

    auto json_path = output_dir / "report.json";
    auto md_path = output_dir / "report.md";

    auto json_text = buildJson(report).dump(2);
    auto md_text = buildMarkdown(report);

    atomicWrite(json_path, json_text);
    atomicWrite(md_path, md_text);

    result.json_path = json_path;
    result.markdown_path = md_path;
    return result;
}

} // namespace wellboard::io
