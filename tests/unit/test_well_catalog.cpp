/**
 * @file test_well_catalog.cpp
 * @brief Юнит-тесты навигации по повесткам и сборки скважин
 */

#include <doctest/doctest.h>
#include "core/well_catalog.hpp"

using namespace wellboard::core;
using namespace wellboard::model;

namespace {

WellInfoRecord info(const std::string& id, const std::string& month, const std::string& docket,
                    const std::string& status = "Producing") {
    WellInfoRecord r;
    r.well_id = id;
    r.well_name = "Name " + id;
    r.status_text = status;
    r.type_text = "Oil Well";
    r.board_year = "2023";
    r.docket_month = month;
    r.board_docket = docket;
    r.elevation = 5000.0;
    return r;
}

SurveyRecord survey(const std::string& id, std::optional<double> md, CitingType type) {
    SurveyRecord s;
    s.well_id = id;
    s.x = 100.0;
    s.y = 200.0;
    s.measured_depth = md;
    s.true_vertical_depth = md;
    s.citing_type = type;
    return s;
}

} // namespace

TEST_CASE("Навигация: годы, месяцы, повестки") {
    std::vector<WellInfoRecord> records = {
        info("1", "March", "2023-010"),
        info("2", "January", "2023-001"),
        info("3", "January", "2023-002"),
        info("4", "Smarch", "2023-099"),
    };
    auto other_year = info("5", "May", "2022-005");
    other_year.board_year = "2022";
    records.push_back(other_year);

    CHECK(availableYears(records) == std::vector<std::string>{"2022", "2023"});
    CHECK(availableMonths(records, "2023") == std::vector<std::string>{"January", "March", "Smarch"});
    CHECK(availableDockets(records, "2023", "January") == std::vector<std::string>{"2023-001", "2023-002"});
    CHECK(availableDockets(records, "2024", "January").empty());

    SelectionContext context{"2023", "January", "2023-002", std::nullopt};
    auto selected = recordsForSelection(records, context);
    REQUIRE(selected.size() == 1);
    CHECK(selected[0].well_id == "3");
}

TEST_CASE("Возраст скважины") {
    CalendarMonth reference{2024, 6};

    CHECK(wellAgeMonths(WellStatus::Producing, CalendarMonth{2023, 6}, reference) == 12);
    CHECK(wellAgeMonths(WellStatus::Producing, CalendarMonth{2024, 6}, reference) == 0);
    CHECK_FALSE(wellAgeMonths(WellStatus::Producing, std::nullopt, reference).has_value());

    SUBCASE("Approved Permit без даты забуривания") {
        CHECK(wellAgeMonths(WellStatus::ApprovedPermit, std::nullopt, reference) == 0);
    }

    SUBCASE("Разбор дат DrySpud") {
        CHECK(parseCalendarDate("2021-03-04") == CalendarMonth{2021, 3});
        CHECK(parseCalendarDate("2021-03-04 00:00:00") == CalendarMonth{2021, 3});
        CHECK(parseCalendarDate("03/04/2021") == CalendarMonth{2021, 3});
        CHECK_FALSE(parseCalendarDate("").has_value());
        CHECK_FALSE(parseCalendarDate("not a date").has_value());
    }
}

TEST_CASE("Сборка скважин выбранной повестки") {
    Dataset dataset;
    dataset.wells = {
        info("A", "January", "D1"),
        info("A", "January", "D1", "Shut-in"),  // повтор WellID: берётся первая строка
        info("B", "January", "D1", "Approved Permit"),
        info("C", "January", "D2"),
    };
    dataset.wells[0].spud_date = "2020-06-15";
    dataset.wells[0].field_name = "ALTAMONT";
    auto plugged = info("P", "January", "D1");
    plugged.work_type = "PLUG";
    dataset.wells.push_back(plugged);

    dataset.surveys = {
        survey("A", 300.0, CitingType::AsDrilled),
        survey("A", std::nullopt, CitingType::AsDrilled),
        survey("A", 100.0, CitingType::AsDrilled),
        survey("B", 0.0, CitingType::Planned),
        survey("C", 0.0, CitingType::Planned),
        survey("ZZZ", 0.0, CitingType::Planned),
    };

    ResolverSettings settings;
    settings.reference_month = CalendarMonth{2021, 6};
    settings.field_aliases = {{"ALTAMONT", "ALTAMONT-BLUEBELL"}};

    auto wells = buildWells(dataset, {"2023", "January", "D1", std::nullopt}, settings);
    REQUIRE(wells.size() == 2);

    const auto* a = findWell(wells, "A");
    REQUIRE(a != nullptr);
    CHECK(a->status == WellStatus::Producing);
    CHECK(a->age_months == 12);
    CHECK(a->field_name == "ALTAMONT-BLUEBELL");
    REQUIRE(a->surveys.size() == 3);
    CHECK(a->surveys[0].measured_depth->value == doctest::Approx(100.0));
    CHECK(a->surveys[1].measured_depth->value == doctest::Approx(300.0));
    CHECK_FALSE(a->surveys[2].measured_depth.has_value());
    CHECK(a->surveys[2].sequence == 2);

    const auto* b = findWell(wells, "B - Name B");
    REQUIRE(b != nullptr);
    CHECK(b->status == WellStatus::ApprovedPermit);
    CHECK(b->age_months == 0);

    CHECK(findWell(wells, "P") == nullptr);
    CHECK(findWell(wells, "C") == nullptr);

    SUBCASE("Устье скважины: первая точка по MD") {
        auto shl = surfaceHoleLocation(*a);
        REQUIRE(shl.has_value());
        CHECK(shl->measured_depth->value == doctest::Approx(100.0));

        Well empty;
        CHECK_FALSE(surfaceHoleLocation(empty).has_value());
    }

    SUBCASE("Пустая повестка") {
        CHECK(buildWells(dataset, {"2023", "January", "NONE", std::nullopt}, settings).empty());
    }
}

TEST_CASE("Список скважин: основные первыми") {
    std::vector<Well> wells(3);
    wells[0].id = "3";
    wells[0].name = "Charlie";
    wells[1].id = "2";
    wells[1].name = "Bravo";
    wells[1].main_well = true;
    wells[2].id = "1";
    wells[2].name = "Alpha";

    CHECK(wellListForDocket(wells) == std::vector<std::string>{"2 - Bravo", "1 - Alpha", "3 - Charlie"});
}

TEST_CASE("Счётчики статусов и типов") {
    std::vector<Well> wells(4);
    wells[0].status = WellStatus::Producing;
    wells[0].type = WellType::Oil;
    wells[1].status = WellStatus::Producing;
    wells[1].type = WellType::WaterInjection;
    wells[2].status = WellStatus::NewPermit;
    wells[2].type = WellType::GasInjection;
    wells[3].status = WellStatus::Drilling;
    wells[3].type = WellType::OilWaterDisposal;

    auto statuses = countStatuses(wells);
    CHECK(statuses.size() == 5);
    CHECK(statuses[StatusGroup::Producing] == 2);
    CHECK(statuses[StatusGroup::Drilling] == 1);
    CHECK(statuses[StatusGroup::Other] == 1);
    CHECK(statuses[StatusGroup::ShutIn] == 0);

    auto types = countTypes(wells);
    CHECK(types.size() == 6);
    CHECK(types[TypeGroup::Injection] == 2);
    CHECK(types[TypeGroup::Disposal] == 1);
    CHECK(types[TypeGroup::Gas] == 0);

    SUBCASE("Разбор текстовых значений WellInfo") {
        CHECK(parseWellStatus("Plugged & Abandoned") == WellStatus::PluggedAbandoned);
        CHECK(parseWellStatus("shut-in") == WellStatus::ShutIn);
        CHECK(parseWellStatus("???") == WellStatus::Unknown);
        CHECK(parseWellType("Oil Well/Water Disposal Well") == WellType::OilWaterDisposal);
        CHECK(parseCitingType("As-Drilled") == CitingType::AsDrilled);
        CHECK(parseCitingType("PLANNED") == CitingType::Planned);
        CHECK(parseCitingType("unknown value") == CitingType::Unknown);
    }
}
