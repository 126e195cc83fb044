/**
 * @file docket_sections.cpp
 * @brief Реализация разрешения участков повестки
 */

#include "docket_sections.hpp"
#include "location_codec.hpp"
#include "model/errors.hpp"
#include "polygon_assembler.hpp"
#include <array>
#include <set>

namespace wellboard::core {

namespace {

std::vector<SectionPolygon> sectionPolygons(const Dataset& dataset,
                                            const std::string& docket,
                                            const std::set<LocationCode>& codes,
                                            PlatOrder order,
                                            std::vector<std::string>& diagnostics) {
    std::vector<KeyedPoint> points;
    for (const auto& plat : dataset.plats) {
        if (plat.board_docket == docket && codes.count(plat.conc) != 0) {
            points.push_back({plat.conc, plat.easting, plat.northing});
        }
    }

    std::vector<SectionPolygon> result;
    for (auto& polygon : assemblePolygons(points)) {
        SectionPolygon section;
        section.centroid = polygonCentroid(polygon);
        section.order = order;
        if (auto parts = tryDecodeLocation(std::string_view(polygon.name).substr(0, kLocationCodeLength))) {
            section.label = humanizeLocation(*parts);
        } else {
            section.label = polygon.name;
            diagnostics.push_back("Не удалось разобрать код плана: " + polygon.name);
        }
        section.polygon = std::move(polygon);
        result.push_back(std::move(section));
    }
    return result;
}

std::map<std::string, std::vector<LocationCode>> groupParcels(
    const std::vector<OwnershipParcel>& parcels,
    std::string OwnershipParcel::*key) {
    std::map<std::string, std::set<LocationCode>> grouped;
    for (const auto& parcel : parcels) {
        grouped[parcel.*key].insert(parcel.conc);
    }
    std::map<std::string, std::vector<LocationCode>> result;
    for (auto& [name, codes] : grouped) {
        result[name].assign(codes.begin(), codes.end());
    }
    return result;
}

} // namespace

DocketSections resolveSectionsForDocket(const Dataset& dataset,
                                        const SelectionContext& context,
                                        const UtmProjection* projection) {
    DocketSections result;

    std::array<std::set<LocationCode>, 3> codes;
    for (const auto& row : dataset.adjacent) {
        if (row.board_docket != context.docket) {
            continue;
        }
        if (row.order < 0 || row.order > 2) {
            result.diagnostics.push_back("Недопустимый порядок " + std::to_string(row.order) +
                                         " для участка " + row.conc);
            continue;
        }
        codes[static_cast<size_t>(row.order)].insert(row.conc);
    }

    result.main_polygons = sectionPolygons(dataset, context.docket, codes[0],
                                           PlatOrder::Main, result.diagnostics);
    result.adjacent_1_polygons = sectionPolygons(dataset, context.docket, codes[1],
                                                 PlatOrder::FirstAdjacent, result.diagnostics);
    result.adjacent_2_polygons = sectionPolygons(dataset, context.docket, codes[2],
                                                 PlatOrder::SecondAdjacent, result.diagnostics);

    std::vector<Polygon> main;
    std::vector<Polygon> all;
    std::set<LocationCode> board_codes;
    for (const auto* group : {&result.main_polygons, &result.adjacent_1_polygons, &result.adjacent_2_polygons}) {
        for (const auto& section : *group) {
            board_codes.insert(section.polygon.name);
            all.push_back(section.polygon);
            if (section.order == PlatOrder::Main) {
                result.used_codes.push_back(section.polygon.name);
                main.push_back(section.polygon);
            }
        }
    }
    result.board_codes.assign(board_codes.begin(), board_codes.end());
    result.view_center = combinedCentroid(main);
    result.plat_adjacency = resolveAdjacency(all);

    if (projection == nullptr) {
        return result;
    }

    for (const auto& owner : dataset.owners) {
        if (board_codes.count(owner.conc) == 0) {
            continue;
        }
        try {
            OwnershipParcel parcel;
            parcel.conc = owner.conc;
            parcel.owner = owner.owner;
            parcel.agency = owner.agency;
            parcel.polygons = projection->projectWkt(owner.geometry_wkt, owner.conc);
            result.ownership.push_back(std::move(parcel));
        } catch (const GeometryError& e) {
            result.diagnostics.push_back("Владение " + owner.conc + " пропущено: " + e.what());
        }
    }
    return result;
}

std::map<std::string, std::vector<LocationCode>> ownershipByOwner(
    const std::vector<OwnershipParcel>& parcels) {
    return groupParcels(parcels, &OwnershipParcel::owner);
}

std::map<std::string, std::vector<LocationCode>> ownershipByAgency(
    const std::vector<OwnershipParcel>& parcels) {
    return groupParcels(parcels, &OwnershipParcel::agency);
}

std::vector<Polygon> fieldPolygons(const std::vector<FieldPointRecord>& points) {
    std::vector<KeyedPoint> keyed;
    keyed.reserve(points.size());
    for (const auto& point : points) {
        keyed.push_back({point.field_name, point.easting, point.northing});
    }
    return assemblePolygons(keyed);
}

AdjacencyMap resolveFieldAdjacency(const std::vector<FieldPointRecord>& points) {
    return resolveAdjacency(fieldPolygons(points));
}

} // namespace wellboard::core
