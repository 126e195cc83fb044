/**
 * @file records.hpp
 * @brief Типизированные строки исходных таблиц и набор данных целиком
 */

#pragma once

#include "location.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace wellboard::model {

/**
 * @brief Строка WellInfo: появление скважины в повестке заседания
 */
struct WellInfoRecord {
    std::string well_id;         ///< WellID (API номер)
    std::string well_name;       ///< WellName
    std::string operator_name;   ///< Operator
    std::string work_type;       ///< WorkType (PLUG исключается)
    std::string status_text;     ///< CurrentWellStatus
    std::string type_text;       ///< CurrentWellType
    std::string spud_date;       ///< DrySpud
    std::string board_year;      ///< Board_Year
    std::string docket_month;    ///< Docket_Month (название месяца)
    std::string board_docket;    ///< Board_Docket
    std::string field_name;      ///< FieldName
    std::string mineral_lease;   ///< Mineral Lease
    LocationCode conc_code;      ///< ConcCode
    std::optional<double> elevation;  ///< Elevation (футы)
    bool main_well = false;      ///< MainWell == 1

    bool operator==(const WellInfoRecord&) const = default;
};

/**
 * @brief Строка DX: точка инклинометрии
 */
struct SurveyRecord {
    std::string well_id;                       ///< APINumber
    double x = 0.0;                            ///< X, метры проекции
    double y = 0.0;                            ///< Y, метры проекции
    std::optional<double> measured_depth;      ///< MeasuredDepth, футы
    std::optional<double> true_vertical_depth; ///< TrueVerticalDepth, футы
    CitingType citing_type = CitingType::Unknown;

    bool operator==(const SurveyRecord&) const = default;
};

/**
 * @brief Строка BoardData: решение совета по участку
 */
struct BoardRecord {
    LocationParts location;      ///< Sec/Township/TownshipDir/Range/RangeDir/PM
    LocationCode conc;           ///< Код участка, вычисленный из location
    std::string docket_number;
    std::string cause_number;
    std::string quip;
    std::string order_type;
    std::string effective_date;
    std::string end_date;

    bool operator==(const BoardRecord&) const = default;
};

/**
 * @brief Строка BoardDataLinks: документ по делу
 */
struct BoardLinkRecord {
    std::string cause;
    std::string description;
    std::string filepath;
    std::string document_date;

    bool operator==(const BoardLinkRecord&) const = default;
};

/**
 * @brief Строка PlatData: вершина контура участка
 */
struct PlatRecord {
    LocationCode conc;
    std::string board_docket;
    int order = 0;               ///< 0 основной, 1 и 2 смежные
    double latitude = 0.0;
    double longitude = 0.0;
    double easting = 0.0;        ///< Вычисляется фиксированной проекцией UTM
    double northing = 0.0;

    bool operator==(const PlatRecord&) const = default;
};

/**
 * @brief Строка Adjacent: участок, затронутый повесткой
 */
struct AdjacentRecord {
    std::string board_docket;
    int order = 0;
    LocationCode conc;           ///< src_FullCo

    bool operator==(const AdjacentRecord&) const = default;
};

/**
 * @brief Строка Field: вершина контура месторождения
 */
struct FieldPointRecord {
    std::string field_name;
    double easting = 0.0;
    double northing = 0.0;

    bool operator==(const FieldPointRecord&) const = default;
};

/**
 * @brief Строка Owner: землевладение на участке (геометрия WKT в широте/долготе)
 */
struct OwnerRecord {
    LocationCode conc;
    std::string owner;
    std::string agency;          ///< state_legend
    std::string geometry_wkt;

    bool operator==(const OwnerRecord&) const = default;
};

/**
 * @brief Все исходные таблицы, уже загруженные в память
 */
struct Dataset {
    std::vector<WellInfoRecord> wells;
    std::vector<SurveyRecord> surveys;
    std::vector<BoardRecord> board;
    std::vector<BoardLinkRecord> board_links;
    std::vector<PlatRecord> plats;
    std::vector<AdjacentRecord> adjacent;
    std::vector<FieldPointRecord> fields;
    std::vector<OwnerRecord> owners;
};

} // namespace wellboard::model
