/**
 * @file result_writer.cpp
 * @brief Реализация экспорта результатов в JSON
 */

#include "result_writer.hpp"
#include "file_utils.hpp"
#include "core/trajectory.hpp"
#include "core/well_catalog.hpp"
#include <nlohmann/json.hpp>

namespace wellboard::io {

using json = nlohmann::json;

namespace {

json pointToJson(const Point2D& p) {
    return json::array({p.x, p.y});
}

json pointToJson(const Point3D& p) {
    return json::array({p.x, p.y, p.z});
}

json optionalPointToJson(const std::optional<Point2D>& p) {
    return p ? pointToJson(*p) : json(nullptr);
}

json polygonToJson(const Polygon& polygon) {
    json vertices = json::array();
    for (const auto& v : polygon.vertices) {
        vertices.push_back(pointToJson(v));
    }
    return {{"name", polygon.name}, {"vertices", vertices}};
}

json windowRowToJson(const core::WindowRow& row) {
    json j;
    j["well_id"] = row.well_id;
    j["x"] = row.easting.value;
    j["y"] = row.northing.value;
    j["measured_depth"] = row.measured_depth ? json(row.measured_depth->value) : json(nullptr);
    j["target_elevation"] = row.target_elevation.value;
    j["citing_type"] = std::string(toString(row.citing_type));
    j["status"] = std::string(toString(row.status));
    j["age_months"] = row.age_months;
    return j;
}

json renderPathToJson(const core::RenderPath& path) {
    json plan = json::array();
    json spatial = json::array();
    for (const auto& p : path.plan) {
        plan.push_back(pointToJson(p));
    }
    for (const auto& p : path.spatial) {
        spatial.push_back(pointToJson(p));
    }

    json j;
    j["well_id"] = path.well_id;
    j["citing_type"] = std::string(toString(path.citing_type));
    j["plan"] = plan;
    j["spatial"] = spatial;
    j["y_offsets"] = path.y_offsets;
    return j;
}

json sectionPolygonsToJson(const std::vector<core::SectionPolygon>& sections) {
    json arr = json::array();
    for (const auto& s : sections) {
        json j = polygonToJson(s.polygon);
        j["label"] = s.label;
        j["centroid"] = pointToJson(s.centroid);
        arr.push_back(j);
    }
    return arr;
}

json matterToJson(const BoardMatter& m) {
    json documents = json::array();
    for (const auto& d : m.documents) {
        documents.push_back({{"description", d.description}, {"filepath", d.filepath}, {"date", d.date}});
    }

    json j;
    j["docket_number"] = m.docket_number;
    j["cause_number"] = m.cause_number;
    j["order_type"] = m.order_type;
    j["effective_date"] = m.effective_date;
    j["end_date"] = m.end_date;
    j["quip"] = m.quip;
    j["sections"] = m.sections;
    j["documents"] = documents;
    return j;
}

} // anonymous namespace

std::string wellWindowsToJson(const core::WellWindows& windows, int indent) {
    json categories = json::object();
    for (const auto& [category, set] : windows.categories) {
        json per_window = json::object();
        for (auto window : kAgeWindows) {
            const auto& table = set.at(window);
            json rows = json::array();
            for (const auto& row : table) {
                rows.push_back(windowRowToJson(row));
            }
            json paths = json::array();
            for (const auto& path : core::applyVerticalJitter(core::buildWellPaths(table))) {
                paths.push_back(renderPathToJson(path));
            }
            per_window[std::string(toString(window))] = {
                {"months", ageWindowMonths(window)},
                {"rows", rows},
                {"paths", paths}
            };
        }
        categories[std::string(toString(category))] = per_window;
    }

    json j;
    j["categories"] = categories;
    j["dropped_points"] = windows.dropped_points;
    j["diagnostics"] = windows.diagnostics;
    return j.dump(indent);
}

std::string docketSectionsToJson(const core::DocketSections& sections, int indent) {
    json ownership = json::array();
    for (const auto& parcel : sections.ownership) {
        json polygons = json::array();
        for (const auto& p : parcel.polygons) {
            polygons.push_back(polygonToJson(p));
        }
        ownership.push_back({{"conc", parcel.conc}, {"owner", parcel.owner},
                             {"agency", parcel.agency}, {"polygons", polygons}});
    }

    json j;
    j["used_codes"] = sections.used_codes;
    j["board_codes"] = sections.board_codes;
    j["main_polygons"] = sectionPolygonsToJson(sections.main_polygons);
    j["adjacent_1_polygons"] = sectionPolygonsToJson(sections.adjacent_1_polygons);
    j["adjacent_2_polygons"] = sectionPolygonsToJson(sections.adjacent_2_polygons);
    j["view_center"] = optionalPointToJson(sections.view_center);
    j["plat_adjacency"] = sections.plat_adjacency;
    j["ownership"] = ownership;
    j["ownership_by_owner"] = core::ownershipByOwner(sections.ownership);
    j["ownership_by_agency"] = core::ownershipByAgency(sections.ownership);
    j["diagnostics"] = sections.diagnostics;
    return j.dump(indent);
}

std::string boardMattersToJson(const core::BoardMatterResolution& resolution, int indent) {
    json matters = json::array();
    for (const auto& m : resolution.matters) {
        matters.push_back(matterToJson(m));
    }
    json polygons = json::array();
    for (const auto& p : resolution.polygons) {
        polygons.push_back(polygonToJson(p));
    }
    json warnings = json::array();
    for (const auto& w : resolution.warnings) {
        warnings.push_back(w.message());
    }

    json j;
    j["matters"] = matters;
    j["sections"] = resolution.sections;
    j["polygons"] = polygons;
    j["warnings"] = warnings;
    return j.dump(indent);
}

std::string overviewToJson(const std::vector<core::TsrEntry>& tsr,
                           const std::vector<MatterOverviewRow>& rows,
                           int indent) {
    json tsr_json = json::array();
    for (const auto& entry : tsr) {
        tsr_json.push_back({{"conc", entry.conc}, {"label", entry.label}});
    }
    json rows_json = json::array();
    for (const auto& row : rows) {
        rows_json.push_back({{"conc", row.conc}, {"section", row.section_label},
                             {"docket_number", row.docket_number},
                             {"cause_number", row.cause_number}, {"label", row.label()}});
    }
    return json{{"tsr", tsr_json}, {"matters", rows_json}}.dump(indent);
}

std::string wellCatalogToJson(const std::vector<Well>& wells, int indent) {
    json statuses = json::object();
    for (const auto& [group, count] : core::countStatuses(wells)) {
        statuses[std::string(toString(group))] = count;
    }
    json types = json::object();
    for (const auto& [group, count] : core::countTypes(wells)) {
        types[std::string(toString(group))] = count;
    }

    json details = json::array();
    for (const auto& well : wells) {
        json j;
        j["id"] = well.id;
        j["name"] = well.displayName();
        j["operator"] = well.operator_name;
        j["status"] = well.status_text;
        j["type"] = well.type_text;
        j["age_months"] = well.age_months ? json(*well.age_months) : json(nullptr);
        j["field"] = well.field_name;
        j["conc"] = well.conc_code;
        j["main_well"] = well.main_well;
        j["survey"] = std::string(toString(core::selectedCitingType(core::selectSurvey(well))));
        auto shl = core::surfaceHoleLocation(well);
        j["surface_hole"] = shl ? pointToJson(Point2D{shl->easting.value, shl->northing.value}) : json(nullptr);
        details.push_back(j);
    }

    json j;
    j["list"] = core::wellListForDocket(wells);
    j["wells"] = details;
    j["status_counts"] = statuses;
    j["type_counts"] = types;
    return j.dump(indent);
}

std::string stringListToJson(const std::vector<std::string>& values, int indent) {
    return json(values).dump(indent);
}

void writeResult(const std::filesystem::path& path, const std::string& content) {
    atomicWrite(path, content + "\n");
}

} // namespace wellboard::io
