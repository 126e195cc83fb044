/**
 * @file docket_sections.hpp
 * @brief Участки повестки: основные и смежные планы, центр вида, владения
 */

#pragma once

#include "adjacency_resolver.hpp"
#include "geo_projection.hpp"
#include "model/polygon.hpp"
#include "model/records.hpp"
#include "model/selection.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wellboard::core {

using namespace wellboard::model;

/// Порядок плана в повестке (колонка Order)
enum class PlatOrder {
    Main = 0,
    FirstAdjacent = 1,
    SecondAdjacent = 2
};

/**
 * @brief Полигон участка с центроидом и подписью
 */
struct SectionPolygon {
    Polygon polygon;           ///< name = код участка
    Point2D centroid;
    std::string label;         ///< "1 15N 2W S" или исходный код
    PlatOrder order = PlatOrder::Main;
};

/**
 * @brief Участок землевладения из таблицы Owner
 */
struct OwnershipParcel {
    LocationCode conc;
    std::string owner;
    std::string agency;
    std::vector<Polygon> polygons;   ///< В метрах проекции
};

/**
 * @brief Участки выбранной повестки
 */
struct DocketSections {
    std::vector<LocationCode> used_codes;       ///< Коды основных планов
    std::vector<LocationCode> board_codes;      ///< Объединение трёх порядков
    std::vector<SectionPolygon> main_polygons;
    std::vector<SectionPolygon> adjacent_1_polygons;
    std::vector<SectionPolygon> adjacent_2_polygons;
    std::optional<Point2D> view_center;         ///< Центр основных планов
    AdjacencyMap plat_adjacency;                ///< Смежность всех планов повестки
    std::vector<OwnershipParcel> ownership;
    std::vector<std::string> diagnostics;
};

/**
 * @brief Разрешение участков повестки
 *
 * Коды каждого порядка берутся из Adjacent (Board_Docket, Order, src_FullCo),
 * вершины из PlatData той же повестки с точным совпадением кода.
 * Владения строятся только при заданной проекции; ошибка геометрии
 * отдельной строки Owner записывается в diagnostics.
 *
 * @param projection Проекция для WKT Owner; nullptr отключает владения
 */
[[nodiscard]] DocketSections resolveSectionsForDocket(const Dataset& dataset,
                                                      const SelectionContext& context,
                                                      const UtmProjection* projection = nullptr);

/**
 * @brief Коды участков по владельцу
 */
[[nodiscard]] std::map<std::string, std::vector<LocationCode>> ownershipByOwner(
    const std::vector<OwnershipParcel>& parcels);

/**
 * @brief Коды участков по ведомству (state_legend)
 */
[[nodiscard]] std::map<std::string, std::vector<LocationCode>> ownershipByAgency(
    const std::vector<OwnershipParcel>& parcels);

/**
 * @brief Полигоны месторождений из таблицы Field
 */
[[nodiscard]] std::vector<Polygon> fieldPolygons(const std::vector<FieldPointRecord>& points);

/**
 * @brief Смежность месторождений
 */
[[nodiscard]] AdjacencyMap resolveFieldAdjacency(const std::vector<FieldPointRecord>& points);

} // namespace wellboard::core
