/**
 * @file diagnostics.cpp
 * @brief Реализация диагностических проверок набора данных
 */

#include "diagnostics.hpp"
#include "board_matters.hpp"
#include "location_codec.hpp"
#include "well_catalog.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <set>
#include <sstream>
#include <unordered_map>

namespace wellboard::core {
namespace {

using namespace wellboard::model;

std::string isoTimestampNow() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return std::string(buf);
}

std::string detectPlatform() {
#if defined(_WIN32)
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

std::string formatMonth(CalendarMonth month) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d", month.year, month.month);
    return std::string(buf);
}

DiagnosticsMeta makeMeta(const DiagnosticsOptions& options) {
    DiagnosticsMeta meta;
    meta.app_version = WELLBOARD_VERSION;
    meta.build_type = WELLBOARD_BUILD_TYPE;
    meta.platform = detectPlatform();
    meta.timestamp = isoTimestampNow();
    meta.data_dir = options.data_dir;
    meta.reference_month = formatMonth(referenceMonth(options.settings));
    return meta;
}

DiagnosticCheck makeBuildInfoCheck(const DiagnosticsMeta& meta) {
    DiagnosticCheck check;
    check.id = "build_info";
    check.title = "Сборка и версия";
    check.status = DiagnosticStatus::Ok;

    std::ostringstream oss;
    oss << "Версия: " << meta.app_version
        << ", сборка: " << meta.build_type
        << ", платформа: " << meta.platform
        << ", месяц расчёта возраста: " << meta.reference_month;
    check.details = oss.str();
    return check;
}

DiagnosticCheck makeTableRowsCheck(const DiagnosticsOptions& options) {
    DiagnosticCheck check;
    check.id = "table_rows";
    check.title = "Объём исходных таблиц";
    check.status = DiagnosticStatus::Ok;

    std::ostringstream oss;
    bool first = true;
    for (const auto& [table, rows] : options.table_rows) {
        oss << (first ? "" : ", ") << table << ": " << rows;
        first = false;
        if (rows == 0 && (table == "WellInfo" || table == "BoardData" || table == "PlatData")) {
            check.status = DiagnosticStatus::Warning;
            check.addSample(table + " пуста");
        }
    }
    check.details = first ? "Таблицы не прочитаны" : oss.str();
    if (first) {
        check.status = DiagnosticStatus::Skipped;
    }
    return check;
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

DiagnosticCheck makeBoardLocationCheck(const MappingIssues& issues) {
    DiagnosticCheck check;
    check.id = "board_locations";
    check.title = "Участки BoardData";
    for (const auto& message : issues.messages) {
        if (startsWith(message, "BoardData ")) {
            check.addSample(message);
        }
    }
    check.status = check.affected == 0 ? DiagnosticStatus::Ok : DiagnosticStatus::Warning;
    check.details = check.affected == 0
        ? "Все строки BoardData кодируются"
        : "Строк с некорректным участком: " + std::to_string(check.affected);
    return check;
}

DiagnosticCheck makeRejectedRowsCheck(const MappingIssues& issues) {
    DiagnosticCheck check;
    check.id = "rejected_rows";
    check.title = "Пропущенные строки таблиц";
    for (const auto& message : issues.messages) {
        if (!startsWith(message, "BoardData ")) {
            check.addSample(message);
        }
    }
    check.status = check.affected == 0 ? DiagnosticStatus::Ok : DiagnosticStatus::Warning;
    check.details = "Пропущено строк: " + std::to_string(check.affected);
    return check;
}

DiagnosticCheck makePlatCodeCheck(const Dataset& dataset) {
    DiagnosticCheck check;
    check.id = "plat_codes";
    check.title = "Коды участков PlatData";
    for (const auto& code : allPlatCodes(dataset)) {
        if (!tryDecodeLocation(std::string_view(code).substr(0, kLocationCodeLength))) {
            check.addSample(code);
        }
    }
    check.status = check.affected == 0 ? DiagnosticStatus::Ok : DiagnosticStatus::Warning;
    check.details = check.affected == 0
        ? "Все коды разбираются"
        : "Кодов без подписи TSR: " + std::to_string(check.affected);
    return check;
}

DiagnosticCheck makeTargetElevationCheck(const Dataset& dataset) {
    DiagnosticCheck check;
    check.id = "target_elevation";
    check.title = "Отметка забоя точек инклинометрии";

    std::unordered_map<std::string, bool> has_elevation;
    for (const auto& well : dataset.wells) {
        auto& flag = has_elevation[well.well_id];
        flag = flag || well.elevation.has_value();
    }

    for (const auto& survey : dataset.surveys) {
        auto it = has_elevation.find(survey.well_id);
        if (it == has_elevation.end()) {
            continue;
        }
        if (!it->second || !survey.true_vertical_depth) {
            check.addSample(survey.well_id);
        }
    }
    check.status = check.affected == 0 ? DiagnosticStatus::Ok : DiagnosticStatus::Warning;
    check.details = "Точек без Elevation или TVD: " + std::to_string(check.affected);
    return check;
}

DiagnosticCheck makeOrphanSurveyCheck(const Dataset& dataset) {
    DiagnosticCheck check;
    check.id = "orphan_surveys";
    check.title = "Точки DX без скважины в WellInfo";

    std::set<std::string> known;
    for (const auto& well : dataset.wells) {
        known.insert(well.well_id);
    }
    std::set<std::string> orphans;
    for (const auto& survey : dataset.surveys) {
        if (known.count(survey.well_id) == 0) {
            ++check.affected;
            orphans.insert(survey.well_id);
        }
    }
    for (const auto& id : orphans) {
        if (check.samples.size() >= DiagnosticCheck::kMaxSamples) {
            break;
        }
        check.samples.push_back(id);
    }
    check.status = check.affected == 0 ? DiagnosticStatus::Ok : DiagnosticStatus::Warning;
    check.details = "Точек: " + std::to_string(check.affected) +
                    ", скважин: " + std::to_string(orphans.size());
    return check;
}

DiagnosticCheck makeAmbiguousCodeCheck(const Dataset& dataset) {
    DiagnosticCheck check;
    check.id = "ambiguous_codes";
    check.title = "Коды участков, входящие в другие коды";

    auto codes = allPlatCodes(dataset);
    for (const auto& warning : findAmbiguousMatches(codes, codes)) {
        check.addSample(warning.message());
    }
    check.status = check.affected == 0 ? DiagnosticStatus::Ok : DiagnosticStatus::Warning;
    check.details = check.affected == 0
        ? "Коды попарно не вложены"
        : "Поиск по подстроке дал бы лишние совпадения: " + std::to_string(check.affected);
    return check;
}

} // namespace

DiagnosticsReport buildDiagnosticsReport(const Dataset& dataset, const DiagnosticsOptions& options) {
    DiagnosticsReport report;
    report.meta = makeMeta(options);

    report.checks.push_back(makeBuildInfoCheck(report.meta));
    report.checks.push_back(makeTableRowsCheck(options));
    report.checks.push_back(makeBoardLocationCheck(options.issues));
    report.checks.push_back(makeRejectedRowsCheck(options.issues));
    report.checks.push_back(makePlatCodeCheck(dataset));
    report.checks.push_back(makeTargetElevationCheck(dataset));
    report.checks.push_back(makeOrphanSurveyCheck(dataset));
    report.checks.push_back(makeAmbiguousCodeCheck(dataset));
    return report;
}

DiagnosticsReport buildLoadFailureReport(const DiagnosticsOptions& options, const std::string& error) {
    DiagnosticsReport report;
    report.meta = makeMeta(options);
    report.checks.push_back(makeBuildInfoCheck(report.meta));

    DiagnosticCheck check;
    check.id = "dataset_load";
    check.title = "Загрузка набора данных";
    check.status = DiagnosticStatus::Fail;
    check.details = error;
    report.checks.push_back(std::move(check));
    return report;
}

} // namespace wellboard::core
