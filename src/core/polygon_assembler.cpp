/**
 * @file polygon_assembler.cpp
 * @brief Реализация сборки полигонов и центров тяжести
 */

#include "polygon_assembler.hpp"
#include "model/errors.hpp"
#include <algorithm>
#include <cmath>
#include <map>

namespace wellboard::core {

namespace {

// Порог нулевой площади относительно квадрата размера полигона
constexpr double kDegenerateAreaRatio = 1e-12;

double extentSquared(const std::vector<Point2D>& vertices) noexcept {
    if (vertices.empty()) {
        return 0.0;
    }
    auto [min_x, max_x] = std::minmax_element(vertices.begin(), vertices.end(),
        [](const Point2D& a, const Point2D& b) { return a.x < b.x; });
    auto [min_y, max_y] = std::minmax_element(vertices.begin(), vertices.end(),
        [](const Point2D& a, const Point2D& b) { return a.y < b.y; });
    double dx = max_x->x - min_x->x;
    double dy = max_y->y - min_y->y;
    return dx * dx + dy * dy;
}

Point2D meanOf(const std::vector<Point2D>& vertices) noexcept {
    Point2D sum;
    for (const auto& v : vertices) {
        sum.x += v.x;
        sum.y += v.y;
    }
    auto n = static_cast<double>(vertices.size());
    return {sum.x / n, sum.y / n};
}

bool isDegenerate(const Polygon& polygon, double area) noexcept {
    if (polygon.vertices.size() < 3) {
        return true;
    }
    return std::abs(area) <= kDegenerateAreaRatio * extentSquared(polygon.vertices);
}

} // namespace

std::vector<Polygon> assemblePolygons(const std::vector<KeyedPoint>& rows) {
    std::map<std::string, Polygon> groups;

    for (const auto& row : rows) {
        auto& polygon = groups[row.key];
        if (polygon.name.empty()) {
            polygon.name = row.key;
        }

        Point2D point{row.easting, row.northing};
        auto duplicate = std::find(polygon.vertices.begin(), polygon.vertices.end(), point);
        if (duplicate == polygon.vertices.end()) {
            polygon.vertices.push_back(point);
        }
    }

    std::vector<Polygon> result;
    result.reserve(groups.size());
    for (auto& [key, polygon] : groups) {
        result.push_back(std::move(polygon));
    }
    return result;
}

double signedArea(const Polygon& polygon) noexcept {
    const auto& v = polygon.vertices;
    if (v.size() < 3) {
        return 0.0;
    }

    // Смещение к первой вершине: координаты UTM велики, разности точнее
    const auto origin = v.front();
    double sum = 0.0;
    for (size_t i = 0; i < v.size(); ++i) {
        const auto& a = v[i];
        const auto& b = v[(i + 1) % v.size()];
        sum += (a.x - origin.x) * (b.y - origin.y) - (b.x - origin.x) * (a.y - origin.y);
    }
    return sum / 2.0;
}

Point2D polygonCentroid(const Polygon& polygon) {
    const auto& v = polygon.vertices;
    if (v.empty()) {
        throw GeometryError("Полигон " + polygon.name + " не содержит вершин");
    }

    double area = signedArea(polygon);
    if (isDegenerate(polygon, area)) {
        return meanOf(v);
    }

    const auto origin = v.front();
    double cx = 0.0;
    double cy = 0.0;
    for (size_t i = 0; i < v.size(); ++i) {
        double ax = v[i].x - origin.x;
        double ay = v[i].y - origin.y;
        double bx = v[(i + 1) % v.size()].x - origin.x;
        double by = v[(i + 1) % v.size()].y - origin.y;
        double cross = ax * by - bx * ay;
        cx += (ax + bx) * cross;
        cy += (ay + by) * cross;
    }
    return {origin.x + cx / (6.0 * area), origin.y + cy / (6.0 * area)};
}

std::optional<Point2D> combinedCentroid(const std::vector<Polygon>& polygons) {
    double total_area = 0.0;
    Point2D weighted;
    std::vector<Point2D> all_vertices;

    for (const auto& polygon : polygons) {
        if (polygon.vertices.empty()) {
            continue;
        }
        all_vertices.insert(all_vertices.end(), polygon.vertices.begin(), polygon.vertices.end());

        double area = std::abs(signedArea(polygon));
        if (isDegenerate(polygon, area)) {
            continue;
        }
        auto c = polygonCentroid(polygon);
        weighted.x += c.x * area;
        weighted.y += c.y * area;
        total_area += area;
    }

    if (all_vertices.empty()) {
        return std::nullopt;
    }
    if (total_area <= 0.0) {
        return meanOf(all_vertices);
    }
    return Point2D{weighted.x / total_area, weighted.y / total_area};
}

} // namespace wellboard::core
