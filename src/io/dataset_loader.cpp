/**
 * @file dataset_loader.cpp
 * @brief Реализация загрузки набора данных
 */

#include "dataset_loader.hpp"
#include "csv_table.hpp"
#include "core/geo_projection.hpp"
#include <filesystem>

namespace wellboard::io {

namespace {

RecordTable readTable(const AppConfig& config, const std::string& file,
                      const std::string& name, LoadReport* report) {
    CsvReadOptions options;
    options.delimiter = config.dataset.delimiter;
    options.table_name = name;
    auto table = readCsvTable(config.dataset.tablePath(file), options);
    if (report) {
        report->table_rows[name] = table.rowCount();
    }
    return table;
}

bool optionalTablePresent(const AppConfig& config, const std::string& file,
                          const std::string& name, LoadReport* report) {
    if (std::filesystem::exists(config.dataset.tablePath(file))) {
        return true;
    }
    if (report) {
        report->table_rows[name] = 0;
    }
    return false;
}

} // namespace

Dataset loadDataset(const AppConfig& config, LoadReport* report) {
    core::MappingIssues* issues = report ? &report->issues : nullptr;
    core::UtmProjection projection(config.resolver.utm_zone);
    const auto& layout = config.dataset;

    Dataset dataset;
    dataset.wells = core::mapWellInfo(readTable(config, layout.well_info, "WellInfo", report));
    dataset.surveys = core::mapSurveys(readTable(config, layout.dx, "DX", report), issues);
    dataset.board = core::mapBoardData(readTable(config, layout.board_data, "BoardData", report), issues);
    dataset.board_links = core::mapBoardLinks(
        readTable(config, layout.board_data_links, "BoardDataLinks", report));
    dataset.plats = core::mapPlatData(readTable(config, layout.plat_data, "PlatData", report),
                                      projection, issues);
    dataset.adjacent = core::mapAdjacent(readTable(config, layout.adjacent, "Adjacent", report), issues);

    if (optionalTablePresent(config, layout.field, "Field", report)) {
        dataset.fields = core::mapFieldPoints(readTable(config, layout.field, "Field", report), issues);
    }
    if (optionalTablePresent(config, layout.owner, "Owner", report)) {
        dataset.owners = core::mapOwners(readTable(config, layout.owner, "Owner", report));
    }
    return dataset;
}

} // namespace wellboard::io
