/**
 * @file test_board_matters.cpp
 * @brief Юнит-тесты связи дел совета с участками
 */

#include <doctest/doctest.h>
#include "core/board_matters.hpp"
#include "core/location_codec.hpp"

using namespace wellboard::core;
using namespace wellboard::model;

namespace {

BoardRecord board(const std::string& conc, const std::string& docket, const std::string& cause) {
    BoardRecord r;
    r.conc = conc;
    if (auto parts = tryDecodeLocation(conc)) {
        r.location = *parts;
    }
    r.docket_number = docket;
    r.cause_number = cause;
    r.order_type = "Spacing";
    r.quip = "Quip " + cause;
    return r;
}

void addSquare(Dataset& dataset, const std::string& conc, const std::string& docket, double x0) {
    const Point2D corners[] = {{0.0, 0.0}, {1600.0, 0.0}, {1600.0, 1600.0}, {0.0, 1600.0}};
    for (const auto& corner : corners) {
        PlatRecord plat;
        plat.conc = conc;
        plat.board_docket = docket;
        plat.easting = x0 + corner.x;
        plat.northing = 4400000.0 + corner.y;
        dataset.plats.push_back(plat);
    }
}

Dataset matterDataset() {
    Dataset dataset;
    dataset.board = {
        board("011501N02WS1", "2020-001", "123-45"),
        board("011502N02WS1", "2020-001", "123-45"),
        board("0115011N02WS1", "2020-002", "123-99"),
        board("0115N02WS", "2021-004", "140-01"),
        board("0115N02WS", "2019-010", "110-07"),
        board("0115N02WS", "2019-010", "110-07"),
    };
    addSquare(dataset, "011501N02WS1", "2020-001", 500000.0);
    addSquare(dataset, "011502N02WS1", "2020-001", 501600.0);
    addSquare(dataset, "0115011N02WS1", "2020-002", 503200.0);
    addSquare(dataset, "0115N02WS", "2021-004", 510000.0);

    dataset.board_links = {
        {"123-45", "Final order", "orders/final.pdf", "03/15/2021"},
        {"123-45", "Request", "orders/request.pdf", "2020-01-05"},
        {" 123-45 ", "Hearing", "orders/hearing.pdf", "2020-11-30 00:00:00"},
        {"123-99", "Other", "orders/other.pdf", "2020-01-01"},
    };
    return dataset;
}

} // namespace

TEST_CASE("Участки дела: только точное совпадение кодов") {
    auto dataset = matterDataset();

    auto sections = sectionsForMatter(dataset, "123-45");
    CHECK(sections == std::vector<LocationCode>{"011501N02WS1", "011502N02WS1"});
    CHECK(sectionsForMatter(dataset, "000-00").empty());

    auto polygons = platPolygons(dataset, {"011501N02WS1", "011502N02WS1"});
    REQUIRE(polygons.size() == 2);
    CHECK(polygons[0].vertices.size() == 4);
}

TEST_CASE("Дела по участку") {
    auto dataset = matterDataset();

    auto matters = mattersForSection(dataset, "0115N02WS");
    REQUIRE(matters.size() == 2);
    CHECK(matters[0].docket_number == "2019-010");
    CHECK(matters[0].cause_number == "110-07");
    CHECK(matters[1].cause_number == "140-01");
    CHECK(matters[1].sections == std::vector<LocationCode>{"0115N02WS"});

    CHECK(causeNumbersForSection(dataset, "0115N02WS") == std::vector<std::string>{"110-07", "140-01"});
    CHECK(mattersForSection(dataset, "3615S25EU").empty());
}

TEST_CASE("Документы дела упорядочены по дате") {
    auto dataset = matterDataset();

    auto documents = documentsForMatter(dataset, "123-45");
    REQUIRE(documents.size() == 3);
    CHECK(documents[0].description == "Request");
    CHECK(documents[1].description == "Hearing");
    CHECK(documents[2].description == "Final order");

    auto details = matterDetails(dataset, "123-45");
    REQUIRE(details.has_value());
    CHECK(details->quip == "Quip 123-45");
    CHECK(details->documents.size() == 3);
    CHECK(details->sections.size() == 2);
    CHECK_FALSE(matterDetails(dataset, "999-99").has_value());
}

TEST_CASE("Документы дела: даты без известного формата идут последними") {
    Dataset dataset;
    dataset.board_links = {
        {"200-1", "Text date", "a.pdf", "March 5, 2021"},
        {"200-1", "Late", "b.pdf", "2022-06-01"},
        {"200-1", "No date", "c.pdf", ""},
        {"200-1", "Early", "d.pdf", "01/02/2019"},
    };

    auto documents = documentsForMatter(dataset, "200-1");
    REQUIRE(documents.size() == 4);
    CHECK(documents[0].description == "Early");
    CHECK(documents[1].description == "Late");
    CHECK(documents[2].description == "Text date");
    CHECK(documents[3].description == "No date");
}

TEST_CASE("Предупреждения о неоднозначных кодах") {
    auto warnings = findAmbiguousMatches({"0115N02WS"}, {"0115N02WS", "0115N02WS1", "0215N02WS"});
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].code == "0115N02WS");
    CHECK(warnings[0].other_code == "0115N02WS1");
    CHECK(warnings[0].message().find("0115N02WS1") != std::string::npos);

    CHECK(findAmbiguousMatches({""}, {"0115N02WS"}).empty());
}

TEST_CASE("Запрос по делу и по участку") {
    auto dataset = matterDataset();

    SUBCASE("По делу") {
        auto resolution = resolveBoardMatters(dataset, CauseQuery{"123-45"});
        REQUIRE(resolution.matters.size() == 1);
        CHECK(resolution.sections == std::vector<LocationCode>{"011501N02WS1", "011502N02WS1"});
        CHECK(resolution.polygons.size() == 2);
        CHECK(resolution.warnings.empty());
    }

    SUBCASE("По участку с кодом-подстрокой") {
        dataset.plats.push_back(dataset.plats.back());
        dataset.plats.back().conc = "0115N02WS9";
        auto resolution = resolveBoardMatters(dataset, SectionQuery{"0115N02WS"});
        CHECK(resolution.matters.size() == 2);
        CHECK(resolution.sections == std::vector<LocationCode>{"0115N02WS"});
        CHECK(resolution.polygons.size() == 1);
        REQUIRE(resolution.warnings.size() == 1);
        CHECK(resolution.warnings[0].other_code == "0115N02WS9");
    }

    SUBCASE("Неизвестное дело") {
        auto resolution = resolveBoardMatters(dataset, CauseQuery{"000-00"});
        CHECK(resolution.matters.empty());
        CHECK(resolution.sections.empty());
        CHECK(resolution.polygons.empty());
    }
}

TEST_CASE("Таблица TSR и сводка дел") {
    auto dataset = matterDataset();
    std::vector<std::string> rejected;
    auto tsr = buildTsrTable({"0215N02WS", "0115N02WS", "0101S01EU", "0115N02WS", "011501N02WS1"}, &rejected);

    REQUIRE(tsr.size() == 3);
    CHECK(tsr[0].conc == "0115N02WS");
    CHECK(tsr[0].label == "1 15N 2W S");
    CHECK(tsr[1].conc == "0215N02WS");
    CHECK(tsr[2].conc == "0101S01EU");
    CHECK(rejected == std::vector<std::string>{"011501N02WS1"});

    CHECK_THROWS_AS((void)buildTsrTable({"BAD"}), DecodeError);

    auto rows = allMattersOverview(dataset, tsr);
    REQUIRE(rows.size() == 2);
    CHECK(rows[0].docket_number == "2019-010");
    CHECK(rows[0].section_label == "1 15N 2W S");
    CHECK(rows[1].label() == "Docket Number:2021-004, Cause Number:140-01");

    SUBCASE("Номер дела из подписи") {
        CHECK(extractCauseNumber(rows[1].label()) == "140-01");
        CHECK(extractCauseNumber("Cause Number: 131-12 ") == "131-12");
        CHECK_FALSE(extractCauseNumber("Docket Number:2021-004").has_value());
        CHECK_FALSE(extractCauseNumber("Cause Number:").has_value());
    }
}

TEST_CASE("Скважины на участках дела") {
    auto dataset = matterDataset();
    std::vector<Well> wells(3);
    wells[0].id = "1";
    wells[0].name = "Alpha";
    wells[0].conc_code = "011501N02WS1";
    wells[1].id = "2";
    wells[1].name = "Bravo";
    wells[1].conc_code = "011502N02WS1";
    wells[1].main_well = true;
    wells[2].id = "3";
    wells[2].name = "Charlie";
    wells[2].conc_code = "0115011N02WS1";

    CHECK(wellsForMatter(dataset, wells, "123-45") == std::vector<std::string>{"2 - Bravo", "1 - Alpha"});
}
