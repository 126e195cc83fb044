/**
 * @file render_adapter.hpp
 * @brief Подготовка полилиний к отрисовке (смещение вертикальных скважин)
 *
 * Вертикальная скважина задаётся точками с одинаковыми (X, Y); линия из
 * совпадающих точек на плане вырождается. Адаптер сдвигает Y каждой
 * повторной пары (X, Y) на малую величину и хранит смещения отдельно,
 * исходные полилинии не меняются.
 */

#pragma once

#include "trajectory.hpp"
#include <vector>

namespace wellboard::core {

/// Шаг смещения Y, метры проекции
constexpr double kVerticalJitterStep = 1e-4;

/**
 * @brief Полилиния для отрисовки со смещениями
 */
struct RenderPath {
    std::string well_id;
    CitingType citing_type = CitingType::Unknown;
    std::vector<Point2D> plan;
    std::vector<Point3D> spatial;
    std::vector<double> y_offsets;  ///< Смещение Y каждой точки, метры проекции

    /// Истинная точка плана без смещения
    [[nodiscard]] Point2D truePlanPoint(size_t index) const {
        return {plan[index].x, plan[index].y - y_offsets[index]};
    }

    /// Истинная пространственная точка без смещения
    [[nodiscard]] Point3D trueSpatialPoint(size_t index) const {
        return {spatial[index].x, spatial[index].y - y_offsets[index] / kMetersPerFoot, spatial[index].z};
    }
};

/**
 * @brief Смещение вертикальных скважин
 *
 * Для точек вертикальных полилиний n-е (с нуля) повторение пары (X, Y)
 * во всём наборе получает смещение n * kVerticalJitterStep.
 * Прочие полилинии копируются с нулевыми смещениями.
 */
[[nodiscard]] std::vector<RenderPath> applyVerticalJitter(const std::vector<WellPath>& paths);

} // namespace wellboard::core
