/**
 * @file trajectory.hpp
 * @brief Выбор траектории скважины по приоритету и проекция точек
 *
 * Приоритет источника фиксирован: фактическая (asdrilled), затем
 * проектная (planned), затем вертикальная (vertical).
 */

#pragma once

#include "well_windows.hpp"
#include "model/well.hpp"
#include <string>
#include <variant>
#include <vector>

namespace wellboard::core {

using namespace wellboard::model;

/// Фактическая траектория
struct DrilledSurvey {
    std::vector<SurveyPoint> points;
};

/// Проектная траектория
struct PlannedSurvey {
    std::vector<SurveyPoint> points;
};

/// Вертикальная скважина (может быть пустой, если данных нет совсем)
struct VerticalSurvey {
    std::vector<SurveyPoint> points;
};

/**
 * @brief Выбранный источник траектории; тип явно указывает, откуда данные
 */
using SelectedSurvey = std::variant<DrilledSurvey, PlannedSurvey, VerticalSurvey>;

/**
 * @brief Выбор траектории одной скважины
 *
 * asdrilled, если есть; иначе planned; иначе vertical.
 */
[[nodiscard]] SelectedSurvey selectSurvey(const Well& well);

[[nodiscard]] CitingType selectedCitingType(const SelectedSurvey& survey) noexcept;

[[nodiscard]] const std::vector<SurveyPoint>& selectedPoints(const SelectedSurvey& survey) noexcept;

/**
 * @brief Точка на плане: (X, Y) в метрах проекции
 */
[[nodiscard]] constexpr Point2D planPoint(Meters easting, Meters northing) noexcept {
    return {easting.value, northing.value};
}

/**
 * @brief Пространственная точка: (X/0.3048, Y/0.3048, отметка забоя) в футах
 */
[[nodiscard]] constexpr Point3D statePlanePoint(Meters easting, Meters northing,
                                                Feet target_elevation) noexcept {
    return {easting.toFeet().value, northing.toFeet().value, target_elevation.value};
}

/**
 * @brief Полилинии одной скважины
 */
struct WellPath {
    std::string well_id;
    CitingType citing_type = CitingType::Unknown;
    std::vector<Point2D> plan;      ///< План
    std::vector<Point3D> spatial;   ///< 3D (State Plane, футы)
};

/**
 * @brief Полилинии всех скважин таблицы окна (таблица упорядочена по well_id, MD)
 */
[[nodiscard]] std::vector<WellPath> buildWellPaths(const WindowTable& table);

/**
 * @brief Полилиния выбранной скважины
 *
 * Точки без вычислимой отметки забоя пропускаются.
 */
[[nodiscard]] WellPath buildWellPath(const Well& well, const SelectedSurvey& survey);

} // namespace wellboard::core
