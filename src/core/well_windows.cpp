/**
 * @file well_windows.cpp
 * @brief Реализация окон возраста
 */

#include "well_windows.hpp"
#include "well_catalog.hpp"
#include <algorithm>

namespace wellboard::core {

namespace {

bool rowLess(const WindowRow& a, const WindowRow& b) {
    if (a.well_id != b.well_id) {
        return a.well_id < b.well_id;
    }
    if (a.measured_depth != b.measured_depth) {
        // Точки без MD в конце скважины
        if (!a.measured_depth) return false;
        if (!b.measured_depth) return true;
        return *a.measured_depth < *b.measured_depth;
    }
    return a.sequence < b.sequence;
}

std::vector<WindowRow> rowsOf(WellCategory category, const std::vector<WindowRow>& rows) {
    std::vector<WindowRow> result;
    for (const auto& row : rows) {
        if (belongsTo(category, row.citing_type, row.status)) {
            result.push_back(row);
        }
    }
    return result;
}

} // namespace

std::set<std::string> WindowSet::wellIds(AgeWindow window) const {
    std::set<std::string> ids;
    for (const auto& row : at(window)) {
        ids.insert(row.well_id);
    }
    return ids;
}

bool belongsTo(WellCategory category, CitingType citing, WellStatus status) noexcept {
    switch (category) {
    case WellCategory::Drilled:
        return citing == CitingType::AsDrilled || citing == CitingType::Vertical;
    case WellCategory::Planned:
        return citing == CitingType::Planned || citing == CitingType::Vertical;
    case WellCategory::CurrentlyDrilling:
        return status == WellStatus::Drilling;
    }
    return false;
}

std::vector<WindowRow> collectWindowRows(const std::vector<Well>& wells, size_t* dropped) {
    std::vector<WindowRow> rows;
    size_t skipped = 0;

    for (const auto& well : wells) {
        for (const auto& point : well.surveys) {
            auto target = well.targetElevation(point);
            if (!target) {
                ++skipped;
                continue;
            }

            WindowRow row;
            row.well_id = well.id;
            row.easting = point.easting;
            row.northing = point.northing;
            row.measured_depth = point.measured_depth;
            row.target_elevation = *target;
            row.citing_type = point.citing_type;
            row.status = well.status;
            row.age_months = well.age_months.value_or(0);
            row.sequence = point.sequence;
            rows.push_back(std::move(row));
        }
    }

    if (dropped) {
        *dropped = skipped;
    }
    return rows;
}

WindowSet partitionByAge(const std::vector<WindowRow>& rows) {
    WindowSet result;
    for (auto window : kAgeWindows) {
        auto& table = result.at(window);
        const int limit = ageWindowMonths(window);
        for (const auto& row : rows) {
            if (row.age_months <= limit) {
                table.push_back(row);
            }
        }
        std::sort(table.begin(), table.end(), rowLess);
    }
    return result;
}

WindowSet reconcilePlanned(const WindowSet& planned, const WindowSet& drilled) {
    WindowSet result;
    for (auto window : kAgeWindows) {
        const auto drilled_ids = drilled.wellIds(window);
        auto& table = result.at(window);
        for (const auto& row : planned.at(window)) {
            if (drilled_ids.count(row.well_id) > 0 || row.status == WellStatus::Drilling) {
                continue;
            }
            table.push_back(row);
        }
    }
    return result;
}

WellWindows aggregateWellWindows(const std::vector<Well>& wells) {
    WellWindows result;
    auto rows = collectWindowRows(wells, &result.dropped_points);
    if (result.dropped_points > 0) {
        result.diagnostics.push_back("Отброшено точек без отметки забоя: " +
                                     std::to_string(result.dropped_points));
    }

    auto drilled = partitionByAge(rowsOf(WellCategory::Drilled, rows));
    auto planned = reconcilePlanned(partitionByAge(rowsOf(WellCategory::Planned, rows)), drilled);
    auto drilling = partitionByAge(rowsOf(WellCategory::CurrentlyDrilling, rows));

    result.categories.emplace(WellCategory::Drilled, std::move(drilled));
    result.categories.emplace(WellCategory::Planned, std::move(planned));
    result.categories.emplace(WellCategory::CurrentlyDrilling, std::move(drilling));
    return result;
}

WellWindows resolveWellWindows(const Dataset& dataset,
                               const SelectionContext& context,
                               const ResolverSettings& settings) {
    return aggregateWellWindows(buildWells(dataset, context, settings));
}

} // namespace wellboard::core
