/**
 * @file adjacency_resolver.cpp
 * @brief Реализация смежности на Boost.Geometry
 */

#include "adjacency_resolver.hpp"
#include <boost/geometry.hpp>
#include <algorithm>
#include <optional>
#include <set>
#include <variant>

namespace wellboard::core {

namespace {

namespace bg = boost::geometry;

using BgPoint = bg::model::d2::point_xy<double>;
using BgLinestring = bg::model::linestring<BgPoint>;
using BgPolygon = bg::model::polygon<BgPoint>;
using BgMultiPolygon = bg::model::multi_polygon<BgPolygon>;

/// Исходная геометрия полигона с учётом вырождения
using Footprint = std::variant<BgPoint, BgLinestring, BgPolygon>;

/// Точек на окружность при скруглении буфера
constexpr int kCirclePoints = 32;

std::optional<Footprint> makeFootprint(const Polygon& polygon) {
    const auto& v = polygon.vertices;
    if (v.empty()) {
        return std::nullopt;
    }
    if (v.size() == 1) {
        return Footprint{BgPoint{v[0].x, v[0].y}};
    }
    if (v.size() == 2) {
        BgLinestring line;
        bg::append(line, BgPoint{v[0].x, v[0].y});
        bg::append(line, BgPoint{v[1].x, v[1].y});
        return Footprint{line};
    }

    BgPolygon shape;
    for (const auto& p : polygon.closedRing()) {
        bg::append(shape.outer(), BgPoint{p.x, p.y});
    }
    bg::correct(shape);
    if (bg::is_valid(shape)) {
        return Footprint{shape};
    }

    // Коллинеарные или самопересекающиеся вершины: граница как ломаная
    BgLinestring boundary;
    for (const auto& p : polygon.closedRing()) {
        bg::append(boundary, BgPoint{p.x, p.y});
    }
    return Footprint{boundary};
}

BgMultiPolygon dilate(const Footprint& footprint) {
    bg::strategy::buffer::distance_symmetric<double> distance{kAdjacencyTolerance};
    bg::strategy::buffer::side_straight side;
    bg::strategy::buffer::join_round join{kCirclePoints};
    bg::strategy::buffer::end_round end{kCirclePoints};
    bg::strategy::buffer::point_circle circle{kCirclePoints};

    BgMultiPolygon result;
    std::visit([&](const auto& geometry) {
        bg::buffer(geometry, result, distance, side, join, end, circle);
    }, footprint);
    return result;
}

bool touchesBuffer(const BgMultiPolygon& buffer, const Footprint& source, const Footprint& other) {
    try {
        return std::visit([&buffer](const auto& geometry) {
            return bg::intersects(buffer, geometry);
        }, other);
    } catch (const bg::exception&) {
        // Оверлей не справился с геометрией: проверяем расстояние напрямую
        return std::visit([](const auto& a, const auto& b) {
            return bg::distance(a, b) <= kAdjacencyTolerance;
        }, source, other);
    }
}

} // namespace

AdjacencyMap resolveAdjacency(const std::vector<Polygon>& polygons) {
    AdjacencyMap result;

    std::vector<std::optional<Footprint>> footprints;
    footprints.reserve(polygons.size());
    for (const auto& polygon : polygons) {
        footprints.push_back(makeFootprint(polygon));
        result[polygon.name];
    }

    for (size_t i = 0; i < polygons.size(); ++i) {
        if (!footprints[i]) {
            continue;
        }

        std::optional<BgMultiPolygon> buffer;
        try {
            buffer = dilate(*footprints[i]);
        } catch (const bg::exception&) {
            buffer.reset();
        }

        std::set<std::string> neighbors(result[polygons[i].name].begin(),
                                        result[polygons[i].name].end());
        for (size_t j = 0; j < polygons.size(); ++j) {
            if (j == i || !footprints[j] || polygons[j].name == polygons[i].name) {
                continue;
            }

            bool adjacent = buffer
                ? touchesBuffer(*buffer, *footprints[i], *footprints[j])
                : std::visit([](const auto& a, const auto& b) {
                      return bg::distance(a, b) <= kAdjacencyTolerance;
                  }, *footprints[i], *footprints[j]);
            if (adjacent) {
                neighbors.insert(polygons[j].name);
            }
        }
        result[polygons[i].name].assign(neighbors.begin(), neighbors.end());
    }

    return result;
}

std::vector<AdjacencyEdge> adjacencyEdges(const AdjacencyMap& adjacency) {
    std::set<AdjacencyEdge> edges;
    for (const auto& [name, neighbors] : adjacency) {
        for (const auto& other : neighbors) {
            if (name == other) {
                continue;
            }
            edges.insert(name < other ? AdjacencyEdge{name, other} : AdjacencyEdge{other, name});
        }
    }
    return {edges.begin(), edges.end()};
}

} // namespace wellboard::core
