/**
 * @file geo_projection.cpp
 * @brief Реализация проекции UTM на Boost.Geometry SRS
 */

#include "geo_projection.hpp"
#include "model/errors.hpp"
#include <boost/geometry.hpp>
#include <boost/geometry/srs/projection.hpp>
#include <cctype>
#include <cmath>
#include <string>

namespace wellboard::core {

namespace {

namespace bg = boost::geometry;

using GeoPoint = bg::model::point<double, 2, bg::cs::geographic<bg::degree>>;
using GeoPolygon = bg::model::polygon<GeoPoint>;
using GeoMultiPolygon = bg::model::multi_polygon<GeoPolygon>;
using XyPoint = bg::model::d2::point_xy<double>;

std::string upperTrimmed(std::string_view text) {
    std::string result;
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (result.empty() && std::isspace(c)) {
            continue;
        }
        result += static_cast<char>(std::toupper(c));
    }
    return result;
}

} // namespace

struct UtmProjection::Impl {
    bg::srs::projection<> projection;

    explicit Impl(int zone)
        : projection(bg::srs::dpar::parameters<>(bg::srs::dpar::proj_utm)
                         (bg::srs::dpar::ellps_wgs84)
                         (bg::srs::dpar::zone, zone)
                         (bg::srs::dpar::units_m)) {}
};

UtmProjection::UtmProjection(int zone)
    : zone_(zone) {
    if (zone < 1 || zone > 60) {
        throw GeometryError("Недопустимая зона UTM: " + std::to_string(zone));
    }
    try {
        impl_ = std::make_unique<Impl>(zone);
    } catch (const bg::projection_exception& e) {
        throw GeometryError(std::string("Не удалось создать проекцию UTM: ") + e.what());
    }
}

UtmProjection::~UtmProjection() = default;
UtmProjection::UtmProjection(UtmProjection&&) noexcept = default;
UtmProjection& UtmProjection::operator=(UtmProjection&&) noexcept = default;

Point2D UtmProjection::forward(double latitude, double longitude) const {
    if (!std::isfinite(latitude) || !std::isfinite(longitude) ||
        std::abs(latitude) > 90.0 || std::abs(longitude) > 180.0) {
        throw GeometryError("Координаты вне допустимого диапазона: " +
                            std::to_string(latitude) + ", " + std::to_string(longitude));
    }

    XyPoint projected;
    bool ok = false;
    try {
        ok = impl_->projection.forward(GeoPoint{longitude, latitude}, projected);
    } catch (const bg::projection_exception& e) {
        throw GeometryError(std::string("Ошибка проецирования: ") + e.what());
    }
    if (!ok) {
        throw GeometryError("Точку нельзя спроецировать: " +
                            std::to_string(latitude) + ", " + std::to_string(longitude));
    }
    return {bg::get<0>(projected), bg::get<1>(projected)};
}

std::vector<Polygon> UtmProjection::projectWkt(std::string_view wkt, const std::string& name) const {
    GeoMultiPolygon shapes;
    auto text = std::string(wkt);
    try {
        if (upperTrimmed(text).rfind("MULTIPOLYGON", 0) == 0) {
            bg::read_wkt(text, shapes);
        } else {
            GeoPolygon single;
            bg::read_wkt(text, single);
            shapes.push_back(single);
        }
    } catch (const bg::read_wkt_exception& e) {
        throw GeometryError("Ошибка разбора WKT (" + name + "): " + e.what());
    }

    std::vector<Polygon> result;
    for (const auto& shape : shapes) {
        Polygon polygon;
        polygon.name = name;
        for (const auto& vertex : shape.outer()) {
            auto point = forward(bg::get<1>(vertex), bg::get<0>(vertex));
            if (polygon.vertices.empty() || !(polygon.vertices.back() == point)) {
                polygon.vertices.push_back(point);
            }
        }
        // WKT замыкает кольцо явно, храним открытое
        if (polygon.vertices.size() > 1 && polygon.vertices.front() == polygon.vertices.back()) {
            polygon.vertices.pop_back();
        }
        if (!polygon.vertices.empty()) {
            result.push_back(std::move(polygon));
        }
    }
    return result;
}

} // namespace wellboard::core
