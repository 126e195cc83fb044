/**
 * @file polygon_assembler.hpp
 * @brief Сборка полигонов из неупорядоченных строк (ключ, easting, northing)
 */

#pragma once

#include "model/polygon.hpp"
#include <optional>
#include <string>
#include <vector>

namespace wellboard::core {

using namespace wellboard::model;

/**
 * @brief Вершина с ключом группировки (код участка или название месторождения)
 */
struct KeyedPoint {
    std::string key;
    double easting = 0.0;
    double northing = 0.0;

    bool operator==(const KeyedPoint&) const = default;
};

/**
 * @brief Сборка полигонов
 *
 * Строки группируются по ключу. Порядок вершин внутри группы совпадает
 * с порядком строк на входе (геометрическая сортировка не выполняется).
 * Повторные строки отбрасываются, остаётся первое вхождение.
 * Группа с менее чем тремя вершинами даёт вырожденный полигон.
 *
 * @param rows Строки в порядке обхода контура
 * @return По одному полигону на ключ, в порядке возрастания ключа
 */
[[nodiscard]] std::vector<Polygon> assemblePolygons(const std::vector<KeyedPoint>& rows);

/**
 * @brief Ориентированная площадь (формула шнурования)
 */
[[nodiscard]] double signedArea(const Polygon& polygon) noexcept;

/**
 * @brief Центр тяжести полигона
 *
 * Для полигона нулевой площади возвращается среднее арифметическое вершин.
 *
 * @throws GeometryError Для полигона без вершин
 */
[[nodiscard]] Point2D polygonCentroid(const Polygon& polygon);

/**
 * @brief Общий центр набора полигонов, взвешенный по площади
 *
 * Используется для центрирования вида на повестке.
 * @return std::nullopt для пустого набора
 */
[[nodiscard]] std::optional<Point2D> combinedCentroid(const std::vector<Polygon>& polygons);

} // namespace wellboard::core
