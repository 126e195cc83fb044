/**
 * @file well.hpp
 * @brief Скважина и её точки инклинометрии
 */

#pragma once

#include "location.hpp"
#include "types.hpp"
#include "units.hpp"
#include <optional>
#include <string>
#include <vector>

namespace wellboard::model {

/**
 * @brief Точка инклинометрии скважины
 *
 * Неизменяема после загрузки. Порядок по измеренной глубине задаёт полилинию.
 */
struct SurveyPoint {
    Meters easting{0.0};                        ///< X проекции
    Meters northing{0.0};                       ///< Y проекции
    std::optional<Feet> true_vertical_depth;    ///< TVD
    std::optional<Feet> measured_depth;         ///< MD
    CitingType citing_type = CitingType::Unknown;
    size_t sequence = 0;                        ///< Порядковый номер после сортировки

    bool operator==(const SurveyPoint&) const = default;
};

/**
 * @brief Скважина в выбранной повестке
 */
struct Well {
    std::string id;
    std::string name;
    std::string operator_name;
    std::string status_text;
    WellStatus status = WellStatus::Unknown;
    std::string type_text;
    WellType type = WellType::Unknown;
    std::optional<CalendarMonth> spud;
    std::optional<int> age_months;              ///< Возраст (месяцы), см. buildWells
    std::optional<Feet> elevation;              ///< Отметка устья
    std::string field_name;
    std::string mineral_lease;
    LocationCode conc_code;
    bool main_well = false;

    std::vector<SurveyPoint> surveys;           ///< Отсортированы по MD

    /// "WellID - WellName"
    [[nodiscard]] std::string displayName() const {
        return id + " - " + name;
    }

    /**
     * @brief Точки одного типа замера в порядке MD
     */
    [[nodiscard]] std::vector<SurveyPoint> surveysOf(CitingType type) const {
        std::vector<SurveyPoint> result;
        for (const auto& point : surveys) {
            if (point.citing_type == type) {
                result.push_back(point);
            }
        }
        return result;
    }

    /**
     * @brief Отметка забоя точки: elevation − TVD
     * @return std::nullopt, если отметка устья или TVD не заданы
     */
    [[nodiscard]] std::optional<Feet> targetElevation(const SurveyPoint& point) const noexcept {
        if (!elevation || !point.true_vertical_depth) {
            return std::nullopt;
        }
        return *elevation - *point.true_vertical_depth;
    }
};

} // namespace wellboard::model
