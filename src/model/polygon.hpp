/**
 * @file polygon.hpp
 * @brief Полигон участка или месторождения
 */

#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace wellboard::model {

/**
 * @brief Именованный полигон
 *
 * vertices хранит открытое кольцо без повторов; замыкание выполняет closedRing().
 * Полигон из 1-2 вершин допустим (вырожденный, нулевая площадь).
 */
struct Polygon {
    std::string name;                 ///< Код участка или название месторождения
    std::vector<Point2D> vertices;

    /**
     * @brief Кольцо с совпадающими первой и последней вершинами
     */
    [[nodiscard]] std::vector<Point2D> closedRing() const {
        auto ring = vertices;
        if (!ring.empty() && !(ring.front() == ring.back())) {
            ring.push_back(ring.front());
        }
        return ring;
    }

    bool operator==(const Polygon&) const = default;
};

/**
 * @brief Неупорядоченная пара смежных полигонов (name_a < name_b)
 */
struct AdjacencyEdge {
    std::string name_a;
    std::string name_b;

    auto operator<=>(const AdjacencyEdge&) const = default;
};

} // namespace wellboard::model
