/**
 * @file trajectory.cpp
 * @brief Реализация выбора траектории и проекции
 */

#include "trajectory.hpp"

namespace wellboard::core {

SelectedSurvey selectSurvey(const Well& well) {
    auto drilled = well.surveysOf(CitingType::AsDrilled);
    if (!drilled.empty()) {
        return DrilledSurvey{std::move(drilled)};
    }
    auto planned = well.surveysOf(CitingType::Planned);
    if (!planned.empty()) {
        return PlannedSurvey{std::move(planned)};
    }
    return VerticalSurvey{well.surveysOf(CitingType::Vertical)};
}

CitingType selectedCitingType(const SelectedSurvey& survey) noexcept {
    switch (survey.index()) {
    case 0: return CitingType::AsDrilled;
    case 1: return CitingType::Planned;
    default: return CitingType::Vertical;
    }
}

const std::vector<SurveyPoint>& selectedPoints(const SelectedSurvey& survey) noexcept {
    return std::visit([](const auto& s) -> const std::vector<SurveyPoint>& {
        return s.points;
    }, survey);
}

std::vector<WellPath> buildWellPaths(const WindowTable& table) {
    std::vector<WellPath> paths;
    for (const auto& row : table) {
        if (paths.empty() || paths.back().well_id != row.well_id) {
            WellPath path;
            path.well_id = row.well_id;
            path.citing_type = row.citing_type;
            paths.push_back(std::move(path));
        }
        auto& path = paths.back();
        path.plan.push_back(planPoint(row.easting, row.northing));
        path.spatial.push_back(statePlanePoint(row.easting, row.northing, row.target_elevation));
    }
    return paths;
}

WellPath buildWellPath(const Well& well, const SelectedSurvey& survey) {
    WellPath path;
    path.well_id = well.id;
    path.citing_type = selectedCitingType(survey);

    for (const auto& point : selectedPoints(survey)) {
        auto target = well.targetElevation(point);
        if (!target) {
            continue;
        }
        path.plan.push_back(planPoint(point.easting, point.northing));
        path.spatial.push_back(statePlanePoint(point.easting, point.northing, *target));
    }
    return path;
}

} // namespace wellboard::core
