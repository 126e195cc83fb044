/**
 * @file record_mapping.cpp
 * @brief Реализация типизации исходных таблиц
 */

#include "record_mapping.hpp"
#include "location_codec.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <unordered_set>

namespace wellboard::core {

namespace {

std::string trim(std::string_view str) {
    size_t start = 0;
    while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }
    size_t end = str.size();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }
    return std::string(str.substr(start, end - start));
}

std::optional<double> parseNumber(std::string_view raw) {
    auto text = trim(raw);
    if (text.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

bool parseFlag(std::string_view raw) {
    auto text = trim(raw);
    if (text == "true" || text == "True" || text == "TRUE") {
        return true;
    }
    auto value = parseNumber(text);
    return value && *value == 1.0;
}

/**
 * @brief Отбор строк без полных повторов
 */
class DuplicateFilter {
public:
    bool firstOccurrence(const std::vector<std::string>& row) {
        std::string key;
        for (const auto& cell : row) {
            key += cell;
            key += '\x1f';
        }
        return seen_.insert(std::move(key)).second;
    }

private:
    std::unordered_set<std::string> seen_;
};

std::string rowLocation(const RecordTable& table, size_t row) {
    return table.name + " строка " + std::to_string(row + 1);
}

// Пропуск строки с отметкой либо исключение в строгом режиме
template <typename Error>
void rejectRow(MappingIssues* issues, const RecordTable& table, size_t row,
               const std::string& reason, const Error& error) {
    if (!issues) {
        throw error;
    }
    issues->messages.push_back(rowLocation(table, row) + ": " + reason);
}

} // namespace

std::vector<WellInfoRecord> mapWellInfo(const RecordTable& table) {
    const auto c_id = table.requireColumn("WellID");
    const auto c_name = table.requireColumn("WellName");
    const auto c_status = table.requireColumn("CurrentWellStatus");
    const auto c_type = table.requireColumn("CurrentWellType");
    const auto c_spud = table.requireColumn("DrySpud");
    const auto c_year = table.requireColumn("Board_Year");
    const auto c_month = table.requireColumn("Docket_Month");
    const auto c_docket = table.requireColumn("Board_Docket");
    const auto c_elevation = table.requireColumn("Elevation");

    auto c_operator = table.findColumn("Operator");
    if (!c_operator) {
        c_operator = table.findColumn("entityname");
    }
    const auto c_work = table.findColumn("WorkType");
    const auto c_field = table.findColumn("FieldName");
    const auto c_lease = table.findColumn("Mineral Lease");
    const auto c_conc = table.findColumn("ConcCode");
    const auto c_main = table.findColumn("MainWell");

    std::vector<WellInfoRecord> result;
    result.reserve(table.rowCount());
    DuplicateFilter filter;

    for (size_t i = 0; i < table.rowCount(); ++i) {
        if (!filter.firstOccurrence(table.rows[i])) {
            continue;
        }
        WellInfoRecord record;
        record.well_id = trim(table.cell(i, c_id));
        record.well_name = trim(table.cell(i, c_name));
        record.operator_name = trim(table.cell(i, c_operator));
        record.work_type = trim(table.cell(i, c_work));
        record.status_text = trim(table.cell(i, c_status));
        record.type_text = trim(table.cell(i, c_type));
        record.spud_date = trim(table.cell(i, c_spud));
        record.board_year = trim(table.cell(i, c_year));
        record.docket_month = trim(table.cell(i, c_month));
        record.board_docket = trim(table.cell(i, c_docket));
        record.field_name = trim(table.cell(i, c_field));
        record.mineral_lease = trim(table.cell(i, c_lease));
        record.conc_code = trim(table.cell(i, c_conc));
        record.elevation = parseNumber(table.cell(i, c_elevation));
        record.main_well = parseFlag(table.cell(i, c_main));

        // Board_Year может прийти как "2023.0"
        if (auto year = parseNumber(record.board_year); year && std::trunc(*year) == *year) {
            record.board_year = std::to_string(static_cast<long long>(*year));
        }
        result.push_back(std::move(record));
    }
    return result;
}

std::vector<SurveyRecord> mapSurveys(const RecordTable& table, MappingIssues* issues) {
    const auto c_id = table.requireColumn("APINumber");
    const auto c_x = table.requireColumn("X");
    const auto c_y = table.requireColumn("Y");
    const auto c_md = table.requireColumn("MeasuredDepth");
    const auto c_tvd = table.requireColumn("TrueVerticalDepth");
    const auto c_citing = table.requireColumn("CitingType");

    std::vector<SurveyRecord> result;
    result.reserve(table.rowCount());
    DuplicateFilter filter;

    for (size_t i = 0; i < table.rowCount(); ++i) {
        if (!filter.firstOccurrence(table.rows[i])) {
            continue;
        }
        auto x = parseNumber(table.cell(i, c_x));
        auto y = parseNumber(table.cell(i, c_y));
        if (!x || !y) {
            rejectRow(issues, table, i, "нечисловые координаты X/Y",
                      GeometryError(rowLocation(table, i) + ": нечисловые координаты X/Y"));
            continue;
        }

        SurveyRecord record;
        record.well_id = trim(table.cell(i, c_id));
        record.x = *x;
        record.y = *y;
        record.measured_depth = parseNumber(table.cell(i, c_md));
        record.true_vertical_depth = parseNumber(table.cell(i, c_tvd));
        record.citing_type = parseCitingType(table.cell(i, c_citing));
        result.push_back(std::move(record));
    }
    return result;
}

std::vector<BoardRecord> mapBoardData(const RecordTable& table, MappingIssues* issues) {
    const auto c_sec = table.requireColumn("Sec");
    const auto c_twp = table.requireColumn("Township");
    const auto c_twp_dir = table.requireColumn("TownshipDir");
    const auto c_rng = table.requireColumn("Range");
    const auto c_rng_dir = table.requireColumn("RangeDir");
    const auto c_pm = table.requireColumn("PM");
    const auto c_docket = table.requireColumn("DocketNumber");
    const auto c_cause = table.requireColumn("CauseNumber");
    const auto c_quip = table.requireColumn("Quip");
    const auto c_order = table.requireColumn("OrderType");
    const auto c_effective = table.requireColumn("EffectiveDate");
    const auto c_end = table.requireColumn("EndDate");

    std::vector<BoardRecord> result;
    result.reserve(table.rowCount());
    DuplicateFilter filter;

    for (size_t i = 0; i < table.rowCount(); ++i) {
        if (!filter.firstOccurrence(table.rows[i])) {
            continue;
        }

        LocationFields fields;
        fields.section = std::string(table.cell(i, c_sec));
        fields.township = std::string(table.cell(i, c_twp));
        fields.township_dir = std::string(table.cell(i, c_twp_dir));
        fields.range = std::string(table.cell(i, c_rng));
        fields.range_dir = std::string(table.cell(i, c_rng_dir));
        fields.baseline = std::string(table.cell(i, c_pm));

        BoardRecord record;
        try {
            record.conc = encodeLocation(fields);
        } catch (const EncodingError& e) {
            rejectRow(issues, table, i, e.what(),
                      EncodingError(rowLocation(table, i) + ": " + e.what(), e.field()));
            continue;
        }
        record.location = decodeLocation(record.conc);
        record.docket_number = trim(table.cell(i, c_docket));
        record.cause_number = trim(table.cell(i, c_cause));
        record.quip = trim(table.cell(i, c_quip));
        record.order_type = trim(table.cell(i, c_order));
        record.effective_date = trim(table.cell(i, c_effective));
        record.end_date = trim(table.cell(i, c_end));
        result.push_back(std::move(record));
    }
    return result;
}

std::vector<BoardLinkRecord> mapBoardLinks(const RecordTable& table) {
    const auto c_cause = table.requireColumn("Cause");
    const auto c_description = table.requireColumn("Description");
    const auto c_path = table.requireColumn("Filepath");
    const auto c_date = table.requireColumn("DocumentDate");

    std::vector<BoardLinkRecord> result;
    result.reserve(table.rowCount());
    DuplicateFilter filter;

    for (size_t i = 0; i < table.rowCount(); ++i) {
        if (!filter.firstOccurrence(table.rows[i])) {
            continue;
        }
        BoardLinkRecord record;
        record.cause = trim(table.cell(i, c_cause));
        record.description = trim(table.cell(i, c_description));
        record.filepath = trim(table.cell(i, c_path));
        record.document_date = trim(table.cell(i, c_date));
        result.push_back(std::move(record));
    }
    return result;
}

std::vector<PlatRecord> mapPlatData(const RecordTable& table,
                                    const UtmProjection& projection,
                                    MappingIssues* issues) {
    const auto c_lat = table.requireColumn("Lat");
    const auto c_lon = table.requireColumn("Lon");
    const auto c_conc = table.requireColumn("Conc");
    const auto c_docket = table.requireColumn("Board_Docket");
    const auto c_order = table.requireColumn("Order");

    std::vector<PlatRecord> result;
    result.reserve(table.rowCount());
    DuplicateFilter filter;

    for (size_t i = 0; i < table.rowCount(); ++i) {
        if (!filter.firstOccurrence(table.rows[i])) {
            continue;
        }

        auto lat = parseNumber(table.cell(i, c_lat));
        auto lon = parseNumber(table.cell(i, c_lon));
        auto order = parseNumber(table.cell(i, c_order));
        if (!lat || !lon) {
            rejectRow(issues, table, i, "нечисловые Lat/Lon",
                      GeometryError(rowLocation(table, i) + ": нечисловые Lat/Lon"));
            continue;
        }
        if (!order || (*order != 0.0 && *order != 1.0 && *order != 2.0)) {
            rejectRow(issues, table, i, "Order вне набора {0, 1, 2}",
                      RecordValueError(rowLocation(table, i) + ": Order вне набора {0, 1, 2}",
                                       table.name, "Order"));
            continue;
        }

        PlatRecord record;
        record.conc = trim(table.cell(i, c_conc));
        record.board_docket = trim(table.cell(i, c_docket));
        record.order = static_cast<int>(*order);
        record.latitude = *lat;
        record.longitude = *lon;
        try {
            auto projected = projection.forward(*lat, *lon);
            record.easting = projected.x;
            record.northing = projected.y;
        } catch (const GeometryError& e) {
            rejectRow(issues, table, i, e.what(), e);
            continue;
        }
        result.push_back(std::move(record));
    }
    return result;
}

std::vector<AdjacentRecord> mapAdjacent(const RecordTable& table, MappingIssues* issues) {
    const auto c_docket = table.requireColumn("Board_Docket");
    const auto c_order = table.requireColumn("Order");
    const auto c_conc = table.requireColumn("src_FullCo");

    std::vector<AdjacentRecord> result;
    result.reserve(table.rowCount());
    DuplicateFilter filter;

    for (size_t i = 0; i < table.rowCount(); ++i) {
        if (!filter.firstOccurrence(table.rows[i])) {
            continue;
        }
        auto order = parseNumber(table.cell(i, c_order));
        if (!order || (*order != 0.0 && *order != 1.0 && *order != 2.0)) {
            rejectRow(issues, table, i, "Order вне набора {0, 1, 2}",
                      RecordValueError(rowLocation(table, i) + ": Order вне набора {0, 1, 2}",
                                       table.name, "Order"));
            continue;
        }
        AdjacentRecord record;
        record.board_docket = trim(table.cell(i, c_docket));
        record.order = static_cast<int>(*order);
        record.conc = trim(table.cell(i, c_conc));
        result.push_back(std::move(record));
    }
    return result;
}

std::vector<FieldPointRecord> mapFieldPoints(const RecordTable& table, MappingIssues* issues) {
    const auto c_name = table.requireColumn("Field_Name");
    const auto c_easting = table.requireColumn("Easting");
    const auto c_northing = table.requireColumn("Northing");

    std::vector<FieldPointRecord> result;
    result.reserve(table.rowCount());
    DuplicateFilter filter;

    for (size_t i = 0; i < table.rowCount(); ++i) {
        if (!filter.firstOccurrence(table.rows[i])) {
            continue;
        }
        auto easting = parseNumber(table.cell(i, c_easting));
        auto northing = parseNumber(table.cell(i, c_northing));
        if (!easting || !northing) {
            rejectRow(issues, table, i, "нечисловые Easting/Northing",
                      GeometryError(rowLocation(table, i) + ": нечисловые Easting/Northing"));
            continue;
        }
        result.push_back({trim(table.cell(i, c_name)), *easting, *northing});
    }
    return result;
}

std::vector<OwnerRecord> mapOwners(const RecordTable& table) {
    const auto c_conc = table.requireColumn("conc");
    const auto c_owner = table.requireColumn("owner");
    const auto c_agency = table.requireColumn("state_legend");
    const auto c_geometry = table.requireColumn("geometry");

    std::vector<OwnerRecord> result;
    result.reserve(table.rowCount());
    DuplicateFilter filter;

    for (size_t i = 0; i < table.rowCount(); ++i) {
        if (!filter.firstOccurrence(table.rows[i])) {
            continue;
        }
        OwnerRecord record;
        record.conc = trim(table.cell(i, c_conc));
        record.owner = trim(table.cell(i, c_owner));
        record.agency = trim(table.cell(i, c_agency));
        record.geometry_wkt = trim(table.cell(i, c_geometry));
        result.push_back(std::move(record));
    }
    return result;
}

} // namespace wellboard::core
