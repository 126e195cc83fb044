/**
 * @file render_adapter.cpp
 * @brief Реализация смещения вертикальных скважин
 */

#include "render_adapter.hpp"
#include <map>
#include <utility>

namespace wellboard::core {

std::vector<RenderPath> applyVerticalJitter(const std::vector<WellPath>& paths) {
    std::map<std::pair<double, double>, size_t> occurrences;
    std::vector<RenderPath> result;
    result.reserve(paths.size());

    for (const auto& path : paths) {
        RenderPath render;
        render.well_id = path.well_id;
        render.citing_type = path.citing_type;
        render.plan = path.plan;
        render.spatial = path.spatial;
        render.y_offsets.assign(path.plan.size(), 0.0);

        if (path.citing_type == CitingType::Vertical) {
            for (size_t i = 0; i < render.plan.size(); ++i) {
                auto& count = occurrences[{path.plan[i].x, path.plan[i].y}];
                double offset = static_cast<double>(count) * kVerticalJitterStep;
                ++count;

                render.y_offsets[i] = offset;
                render.plan[i].y += offset;
                if (i < render.spatial.size()) {
                    render.spatial[i].y += offset / kMetersPerFoot;
                }
            }
        }
        result.push_back(std::move(render));
    }
    return result;
}

} // namespace wellboard::core
