/**
 * @file well_catalog.cpp
 * @brief Реализация навигации по повесткам и сборки скважин
 */

#include "well_catalog.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace wellboard::core {

namespace {

bool matchesYearMonth(const WellInfoRecord& record, std::string_view year, std::string_view month) {
    return record.board_year == year && record.docket_month == month;
}

int monthSortKey(const std::string& name) {
    return monthNumber(name).value_or(13);
}

} // namespace

std::vector<std::string> availableYears(const std::vector<WellInfoRecord>& records) {
    std::set<std::string> years;
    for (const auto& record : records) {
        if (!record.board_year.empty()) {
            years.insert(record.board_year);
        }
    }
    return {years.begin(), years.end()};
}

std::vector<std::string> availableMonths(const std::vector<WellInfoRecord>& records,
                                         std::string_view year) {
    std::set<std::string> months;
    for (const auto& record : records) {
        if (record.board_year == year && !record.docket_month.empty()) {
            months.insert(record.docket_month);
        }
    }

    std::vector<std::string> result(months.begin(), months.end());
    std::stable_sort(result.begin(), result.end(), [](const std::string& a, const std::string& b) {
        return monthSortKey(a) < monthSortKey(b);
    });
    return result;
}

std::vector<std::string> availableDockets(const std::vector<WellInfoRecord>& records,
                                          std::string_view year,
                                          std::string_view month) {
    std::set<std::string> dockets;
    for (const auto& record : records) {
        if (matchesYearMonth(record, year, month) && !record.board_docket.empty()) {
            dockets.insert(record.board_docket);
        }
    }
    return {dockets.begin(), dockets.end()};
}

std::vector<WellInfoRecord> recordsForSelection(const std::vector<WellInfoRecord>& records,
                                                const SelectionContext& context) {
    std::vector<WellInfoRecord> result;
    for (const auto& record : records) {
        if (matchesYearMonth(record, context.year, context.month) &&
            record.board_docket == context.docket) {
            result.push_back(record);
        }
    }
    return result;
}

CalendarMonth currentCalendarMonth() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);
    return {tm.tm_year + 1900, tm.tm_mon + 1};
}

CalendarMonth referenceMonth(const ResolverSettings& settings) {
    return settings.reference_month.value_or(currentCalendarMonth());
}

std::optional<int> wellAgeMonths(WellStatus status,
                                 const std::optional<CalendarMonth>& spud,
                                 CalendarMonth reference) noexcept {
    if (spud) {
        return monthsBetween(*spud, reference);
    }
    if (status == WellStatus::ApprovedPermit) {
        return 0;
    }
    return std::nullopt;
}

std::string translateFieldName(const std::string& name,
                               const std::map<std::string, std::string>& aliases) {
    auto it = aliases.find(name);
    return it != aliases.end() ? it->second : name;
}

std::vector<Well> buildWells(const Dataset& dataset,
                             const SelectionContext& context,
                             const ResolverSettings& settings) {
    const auto reference = referenceMonth(settings);
    const std::unordered_set<std::string> excluded(settings.excluded_work_types.begin(),
                                                   settings.excluded_work_types.end());

    std::vector<Well> wells;
    std::unordered_map<std::string, size_t> index;

    for (const auto& record : recordsForSelection(dataset.wells, context)) {
        if (excluded.count(record.work_type) > 0) {
            continue;
        }
        if (index.count(record.well_id) > 0) {
            continue;
        }

        Well well;
        well.id = record.well_id;
        well.name = record.well_name;
        well.operator_name = record.operator_name;
        well.status_text = record.status_text;
        well.status = parseWellStatus(record.status_text);
        well.type_text = record.type_text;
        well.type = parseWellType(record.type_text);
        well.spud = parseCalendarDate(record.spud_date);
        well.age_months = wellAgeMonths(well.status, well.spud, reference);
        if (record.elevation) {
            well.elevation = Feet{*record.elevation};
        }
        well.field_name = translateFieldName(record.field_name, settings.field_aliases);
        well.mineral_lease = record.mineral_lease;
        well.conc_code = record.conc_code;
        well.main_well = record.main_well;

        index.emplace(well.id, wells.size());
        wells.push_back(std::move(well));
    }

    // Точки инклинометрии (повторы уже отброшены при типизации)
    for (const auto& survey : dataset.surveys) {
        auto it = index.find(survey.well_id);
        if (it == index.end()) {
            continue;
        }
        SurveyPoint point;
        point.easting = Meters{survey.x};
        point.northing = Meters{survey.y};
        if (survey.true_vertical_depth) {
            point.true_vertical_depth = Feet{*survey.true_vertical_depth};
        }
        if (survey.measured_depth) {
            point.measured_depth = Feet{*survey.measured_depth};
        }
        point.citing_type = survey.citing_type;
        wells[it->second].surveys.push_back(point);
    }

    for (auto& well : wells) {
        // Точки без MD идут в конце, порядок источника сохраняется
        std::stable_sort(well.surveys.begin(), well.surveys.end(),
            [](const SurveyPoint& a, const SurveyPoint& b) {
                if (!a.measured_depth || !b.measured_depth) {
                    return a.measured_depth.has_value() && !b.measured_depth.has_value();
                }
                return *a.measured_depth < *b.measured_depth;
            });
        for (size_t i = 0; i < well.surveys.size(); ++i) {
            well.surveys[i].sequence = i;
        }
    }

    return wells;
}

std::vector<std::string> wellListForDocket(const std::vector<Well>& wells) {
    std::vector<std::string> main_wells;
    std::vector<std::string> other_wells;
    for (const auto& well : wells) {
        (well.main_well ? main_wells : other_wells).push_back(well.displayName());
    }
    std::sort(main_wells.begin(), main_wells.end());
    std::sort(other_wells.begin(), other_wells.end());

    main_wells.insert(main_wells.end(), other_wells.begin(), other_wells.end());
    return main_wells;
}

const Well* findWell(const std::vector<Well>& wells, std::string_view id_or_name) noexcept {
    for (const auto& well : wells) {
        if (well.id == id_or_name || well.displayName() == id_or_name) {
            return &well;
        }
    }
    return nullptr;
}

std::map<StatusGroup, size_t> countStatuses(const std::vector<Well>& wells) {
    std::map<StatusGroup, size_t> counts = {
        {StatusGroup::Producing, 0}, {StatusGroup::ShutIn, 0},
        {StatusGroup::PluggedAbandoned, 0}, {StatusGroup::Drilling, 0},
        {StatusGroup::Other, 0}
    };
    for (const auto& well : wells) {
        ++counts[statusGroup(well.status)];
    }
    return counts;
}

std::map<TypeGroup, size_t> countTypes(const std::vector<Well>& wells) {
    std::map<TypeGroup, size_t> counts = {
        {TypeGroup::Oil, 0}, {TypeGroup::Gas, 0}, {TypeGroup::DryHole, 0},
        {TypeGroup::Injection, 0}, {TypeGroup::Disposal, 0}, {TypeGroup::Other, 0}
    };
    for (const auto& well : wells) {
        ++counts[typeGroup(well.type)];
    }
    return counts;
}

std::optional<SurveyPoint> surfaceHoleLocation(const Well& well) {
    if (well.surveys.empty()) {
        return std::nullopt;
    }
    return well.surveys.front();
}

} // namespace wellboard::core
