/**
 * @file test_dataset_flow.cpp
 * @brief Интеграционный тест: CSV выгрузки → разрешение записей → JSON
 */

#include <doctest/doctest.h>
#include "core/board_matters.hpp"
#include "core/docket_sections.hpp"
#include "core/well_catalog.hpp"
#include "core/well_windows.hpp"
#include "io/config_io.hpp"
#include "io/dataset_loader.hpp"
#include "io/result_writer.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace wellboard::model;
namespace core = wellboard::core;
namespace io = wellboard::io;

namespace {

std::filesystem::path fixturePath(const std::string& relative) {
    return std::filesystem::path(WELLBOARD_SOURCE_DIR) / "tests" / "fixtures" / relative;
}

io::AppConfig fixtureConfig() {
    return io::loadConfig(fixturePath("wellboard_test.json"));
}

SelectionContext january2023() {
    SelectionContext context;
    context.year = "2023";
    context.month = "January";
    context.docket = "2023-001";
    return context;
}

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace

TEST_CASE("Загрузка выгрузок CSV") {
    auto config = fixtureConfig();
    io::LoadReport report;
    auto dataset = io::loadDataset(config, &report);

    CHECK(report.issues.empty());
    CHECK(report.table_rows.at("WellInfo") == 7);
    CHECK(report.table_rows.at("DX") == 13);
    CHECK(report.table_rows.at("Owner") == 3);

    CHECK(dataset.wells.size() == 7);
    CHECK(dataset.surveys.size() == 12);   // один полный повтор отброшен
    CHECK(dataset.board.size() == 4);
    CHECK(dataset.board[2].conc == "0115N02WS");
    CHECK(dataset.board[3].conc == "2203S04WU");
    CHECK(dataset.plats.size() == 20);
    CHECK(dataset.fields.size() == 8);
    CHECK(dataset.wells[5].operator_name == "Ridge Resources, LLC");

    SUBCASE("Строгий режим на чистых данных не отличается") {
        auto strict = io::loadDataset(config);
        CHECK(strict.board.size() == dataset.board.size());
        CHECK(strict.plats.size() == dataset.plats.size());
    }

    SUBCASE("Необязательные таблицы могут отсутствовать") {
        auto partial = config;
        partial.dataset.field = "NoField.csv";
        partial.dataset.owner = "NoOwner.csv";
        io::LoadReport partial_report;
        auto loaded = io::loadDataset(partial, &partial_report);
        CHECK(loaded.fields.empty());
        CHECK(loaded.owners.empty());
        CHECK(partial_report.table_rows.at("Field") == 0);
    }

    SUBCASE("Обязательная таблица отсутствует") {
        auto broken = config;
        broken.dataset.dx = "Missing.csv";
        CHECK_THROWS_AS((void)io::loadDataset(broken), io::CsvReadError);
    }
}

TEST_CASE("Навигация и скважины повестки") {
    auto config = fixtureConfig();
    auto dataset = io::loadDataset(config);

    CHECK(core::availableYears(dataset.wells) == std::vector<std::string>{"2022", "2023"});
    CHECK(core::availableMonths(dataset.wells, "2023") == std::vector<std::string>{"January", "February"});
    CHECK(core::availableDockets(dataset.wells, "2023", "January") == std::vector<std::string>{"2023-001"});

    auto wells = core::buildWells(dataset, january2023(), config.resolver);
    REQUIRE(wells.size() == 4);
    CHECK(core::findWell(wells, "4301350005") == nullptr);

    const auto* permit = core::findWell(wells, "4301350002");
    REQUIRE(permit != nullptr);
    CHECK(permit->age_months == 0);
    CHECK(permit->field_name == "ALTAMONT-BLUEBELL");

    auto list = core::wellListForDocket(wells);
    REQUIRE(list.size() == 4);
    CHECK(list.front() == "4301350001 - Ute Tribal 1-15");

    auto j = nlohmann::json::parse(io::wellCatalogToJson(wells));
    CHECK(j["wells"].size() == 4);
    CHECK(j["status_counts"]["Drilling"] == 1);
    CHECK(j["type_counts"]["Gas Well"] == 1);
}

TEST_CASE("Окна скважин повестки") {
    auto config = fixtureConfig();
    auto dataset = io::loadDataset(config);
    auto windows = core::resolveWellWindows(dataset, january2023(), config.resolver);

    const auto& drilled = windows.at(WellCategory::Drilled);
    const auto& planned = windows.at(WellCategory::Planned);
    const auto& drilling = windows.at(WellCategory::CurrentlyDrilling);

    CHECK(drilled.wellIds(AgeWindow::Year) == std::set<std::string>{"4301350001"});
    CHECK(drilled.wellIds(AgeWindow::All) == std::set<std::string>{"4301350001", "4301350004"});
    for (auto window : kAgeWindows) {
        INFO("Окно: " << toString(window));
        CHECK(planned.wellIds(window) == std::set<std::string>{"4301350002"});
        CHECK(drilling.wellIds(window) == std::set<std::string>{"4301350003"});
    }
    CHECK(windows.dropped_points == 0);

    SUBCASE("JSON со смещением вертикальной скважины") {
        auto j = nlohmann::json::parse(io::wellWindowsToJson(windows));
        const auto& paths = j["categories"]["drilled"]["all"]["paths"];
        REQUIRE(paths.size() == 2);

        const auto& vertical = paths[1];
        CHECK(vertical["well_id"] == "4301350004");
        CHECK(vertical["citing_type"] == "vertical");
        REQUIRE(vertical["y_offsets"].size() == 2);
        CHECK(vertical["y_offsets"][0].get<double>() == doctest::Approx(0.0));
        CHECK(vertical["y_offsets"][1].get<double>() == doctest::Approx(1e-4));

        const auto& rows = j["categories"]["drilled"]["all"]["rows"];
        for (const auto& row : rows) {
            if (row["well_id"] == "4301350004") {
                CHECK(row["y"].get<double>() == doctest::Approx(4461300.0));
            }
        }
    }
}

TEST_CASE("Участки повестки из выгрузок") {
    auto config = fixtureConfig();
    auto dataset = io::loadDataset(config);
    core::UtmProjection projection(config.resolver.utm_zone);

    auto sections = core::resolveSectionsForDocket(dataset, january2023(), &projection);
    CHECK(sections.diagnostics.empty());
    CHECK(sections.used_codes == std::vector<LocationCode>{"0115N02WS", "0215N02WS"});
    REQUIRE(sections.adjacent_1_polygons.size() == 1);
    REQUIRE(sections.adjacent_2_polygons.size() == 1);
    CHECK(sections.adjacent_2_polygons[0].label == "4 15N 2W S");
    REQUIRE(sections.view_center.has_value());

    const auto& adjacency = sections.plat_adjacency;
    CHECK(contains(adjacency.at("0115N02WS"), "0215N02WS"));
    CHECK(contains(adjacency.at("0115N02WS"), "0315N02WS"));
    CHECK(contains(adjacency.at("0315N02WS"), "0415N02WS"));
    CHECK_FALSE(contains(adjacency.at("0215N02WS"), "0415N02WS"));

    REQUIRE(sections.ownership.size() == 3);
    CHECK(sections.ownership[2].polygons.size() == 2);
    CHECK(core::ownershipByAgency(sections.ownership).at("SITLA") == std::vector<LocationCode>{"0215N02WS"});

    auto fields = core::resolveFieldAdjacency(dataset.fields);
    CHECK(fields.at("ALTAMONT") == std::vector<std::string>{"BLUEBELL"});

    auto j = nlohmann::json::parse(io::docketSectionsToJson(sections));
    CHECK(j["main_polygons"].size() == 2);
    CHECK(j["ownership_by_owner"]["Private"][0] == "0115N02WS");
}

TEST_CASE("Дела совета из выгрузок") {
    auto dataset = io::loadDataset(fixtureConfig());

    auto by_section = core::resolveBoardMatters(dataset, core::SectionQuery{"0115N02WS"});
    REQUIRE(by_section.matters.size() == 2);
    CHECK(by_section.matters[0].cause_number == "139-101");
    CHECK(by_section.matters[1].cause_number == "139-180");
    CHECK(by_section.polygons.size() == 1);
    CHECK(by_section.warnings.empty());

    auto by_cause = core::resolveBoardMatters(dataset, core::CauseQuery{"139-180"});
    CHECK(by_cause.sections == std::vector<LocationCode>{"0115N02WS", "0215N02WS"});
    REQUIRE(by_cause.matters.size() == 1);
    const auto& documents = by_cause.matters[0].documents;
    REQUIRE(documents.size() == 2);
    CHECK(documents[0].description == "Request for agency action");

    auto codes = core::allPlatCodes(dataset);
    std::vector<LocationCode> plat_codes(codes.begin(), codes.end());
    std::vector<std::string> rejected;
    auto tsr = core::buildTsrTable(plat_codes, &rejected);
    CHECK(rejected.empty());
    REQUIRE(tsr.size() == 5);
    CHECK(tsr.back().conc == "2203S04WU");

    auto overview = core::allMattersOverview(dataset, tsr);
    REQUIRE(overview.size() == 4);
    CHECK(overview.front().label() == "Docket Number:2019-010, Cause Number:139-101");
    CHECK(overview.back().cause_number == "131-55");

    SUBCASE("Результат пишется в файл") {
        auto path = std::filesystem::temp_directory_path() / "wellboard_overview.json";
        io::writeResult(path, io::overviewToJson(tsr, overview));
        std::ifstream ifs(path);
        nlohmann::json j;
        ifs >> j;
        CHECK(j["matters"].size() == 4);
        CHECK(j["tsr"][0]["label"] == "1 15N 2W S");
        std::filesystem::remove(path);
    }
}
