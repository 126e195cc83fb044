/**
 * @file geo_projection.hpp
 * @brief Фиксированная проекция UTM для контуров участков и землевладений
 */

#pragma once

#include "model/polygon.hpp"
#include <memory>
#include <string_view>
#include <vector>

namespace wellboard::core {

using namespace wellboard::model;

/**
 * @brief Проекция WGS84 → UTM (северное полушарие)
 *
 * Используется одна зона на весь набор данных.
 */
class UtmProjection {
public:
    /**
     * @param zone Номер зоны UTM (1..60)
     * @throws GeometryError При недопустимой зоне
     */
    explicit UtmProjection(int zone = 12);
    ~UtmProjection();

    UtmProjection(UtmProjection&&) noexcept;
    UtmProjection& operator=(UtmProjection&&) noexcept;

    [[nodiscard]] int zone() const noexcept { return zone_; }

    /**
     * @brief Широта/долгота (градусы) → easting/northing (метры)
     * @throws GeometryError Если точку нельзя спроецировать
     */
    [[nodiscard]] Point2D forward(double latitude, double longitude) const;

    /**
     * @brief Разбор WKT (POLYGON или MULTIPOLYGON, долгота/широта) с проецированием
     *
     * Каждое внешнее кольцо даёт отдельный полигон с именем name.
     * Внутренние кольца (дыры) отбрасываются.
     *
     * @throws GeometryError При ошибке разбора WKT или проецирования
     */
    [[nodiscard]] std::vector<Polygon> projectWkt(std::string_view wkt, const std::string& name) const;

private:
    struct Impl;
    int zone_;
    std::unique_ptr<Impl> impl_;
};

} // namespace wellboard::core
