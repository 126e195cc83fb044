/**
 * @file test_well_windows.cpp
 * @brief Юнит-тесты окон возраста и согласования категорий
 */

#include <doctest/doctest.h>
#include "core/well_windows.hpp"

using namespace wellboard::core;
using namespace wellboard::model;

namespace {

SurveyPoint point(double x, double y, double md, double tvd, CitingType type) {
    SurveyPoint p;
    p.easting = Meters{x};
    p.northing = Meters{y};
    p.measured_depth = Feet{md};
    p.true_vertical_depth = Feet{tvd};
    p.citing_type = type;
    return p;
}

Well makeWell(const std::string& id, WellStatus status, std::optional<int> age,
              std::vector<SurveyPoint> surveys) {
    Well well;
    well.id = id;
    well.name = "Well " + id;
    well.status = status;
    well.age_months = age;
    well.elevation = Feet{5000.0};
    well.surveys = std::move(surveys);
    for (size_t i = 0; i < well.surveys.size(); ++i) {
        well.surveys[i].sequence = i;
    }
    return well;
}

} // namespace

TEST_CASE("Принадлежность точки категории") {
    CHECK(belongsTo(WellCategory::Drilled, CitingType::AsDrilled, WellStatus::Producing));
    CHECK(belongsTo(WellCategory::Drilled, CitingType::Vertical, WellStatus::Producing));
    CHECK_FALSE(belongsTo(WellCategory::Drilled, CitingType::Planned, WellStatus::Producing));

    CHECK(belongsTo(WellCategory::Planned, CitingType::Planned, WellStatus::ApprovedPermit));
    CHECK(belongsTo(WellCategory::Planned, CitingType::Vertical, WellStatus::ApprovedPermit));
    CHECK_FALSE(belongsTo(WellCategory::Planned, CitingType::AsDrilled, WellStatus::ApprovedPermit));

    CHECK(belongsTo(WellCategory::CurrentlyDrilling, CitingType::Planned, WellStatus::Drilling));
    CHECK(belongsTo(WellCategory::CurrentlyDrilling, CitingType::Unknown, WellStatus::Drilling));
    CHECK_FALSE(belongsTo(WellCategory::CurrentlyDrilling, CitingType::AsDrilled, WellStatus::Producing));
}

TEST_CASE("Отметка забоя и отброшенные точки") {
    auto well = makeWell("A", WellStatus::Producing, 3, {
        point(100.0, 200.0, 0.0, 0.0, CitingType::AsDrilled),
        point(110.0, 210.0, 1000.0, 950.0, CitingType::AsDrilled),
    });
    SurveyPoint no_tvd = point(120.0, 220.0, 2000.0, 0.0, CitingType::AsDrilled);
    no_tvd.true_vertical_depth.reset();
    well.surveys.push_back(no_tvd);

    size_t dropped = 0;
    auto rows = collectWindowRows({well}, &dropped);
    CHECK(dropped == 1);
    REQUIRE(rows.size() == 2);
    CHECK(rows[0].target_elevation.value == doctest::Approx(5000.0));
    CHECK(rows[1].target_elevation.value == doctest::Approx(4050.0));
    CHECK(rows[1].age_months == 3);

    SUBCASE("Скважина без отметки устья отбрасывается целиком") {
        auto bare = well;
        bare.elevation.reset();
        size_t bare_dropped = 0;
        CHECK(collectWindowRows({bare}, &bare_dropped).empty());
        CHECK(bare_dropped == 3);
    }

    SUBCASE("Отсутствующий возраст заменяется нулём") {
        auto ageless = well;
        ageless.age_months.reset();
        auto ageless_rows = collectWindowRows({ageless});
        REQUIRE_FALSE(ageless_rows.empty());
        CHECK(ageless_rows[0].age_months == 0);
    }
}

TEST_CASE("Окна возраста вложены") {
    std::vector<Well> wells = {
        makeWell("A", WellStatus::Producing, 6, {point(0, 0, 0, 0, CitingType::AsDrilled)}),
        makeWell("B", WellStatus::Producing, 12, {point(1, 0, 0, 0, CitingType::AsDrilled)}),
        makeWell("C", WellStatus::Producing, 48, {point(2, 0, 0, 0, CitingType::AsDrilled)}),
        makeWell("D", WellStatus::Producing, 100, {point(3, 0, 0, 0, CitingType::AsDrilled)}),
        makeWell("E", WellStatus::Producing, 500, {point(4, 0, 0, 0, CitingType::AsDrilled)}),
    };

    auto set = partitionByAge(collectWindowRows(wells));
    CHECK(set.wellIds(AgeWindow::Year) == std::set<std::string>{"A", "B"});
    CHECK(set.wellIds(AgeWindow::FiveYears) == std::set<std::string>{"A", "B", "C"});
    CHECK(set.wellIds(AgeWindow::TenYears) == std::set<std::string>{"A", "B", "C", "D"});
    CHECK(set.wellIds(AgeWindow::All) == std::set<std::string>{"A", "B", "C", "D", "E"});

    for (size_t i = 0; i + 1 < kAgeWindows.size(); ++i) {
        for (const auto& id : set.wellIds(kAgeWindows[i])) {
            INFO("Окно " << toString(kAgeWindows[i]) << ", скважина " << id);
            CHECK(set.wellIds(kAgeWindows[i + 1]).count(id) == 1);
        }
    }
}

TEST_CASE("Таблица окна упорядочена по скважине и MD") {
    std::vector<Well> wells = {
        makeWell("B", WellStatus::Producing, 1, {
            point(0, 0, 500, 400, CitingType::AsDrilled),
            point(0, 0, 100, 90, CitingType::AsDrilled),
        }),
        makeWell("A", WellStatus::Producing, 1, {point(0, 0, 50, 40, CitingType::AsDrilled)}),
    };

    const auto& table = partitionByAge(collectWindowRows(wells)).at(AgeWindow::Year);
    REQUIRE(table.size() == 3);
    CHECK(table[0].well_id == "A");
    CHECK(table[1].well_id == "B");
    CHECK(table[1].measured_depth->value == doctest::Approx(100.0));
    CHECK(table[2].measured_depth->value == doctest::Approx(500.0));
}

TEST_CASE("Согласование проектных и пробуренных") {
    std::vector<Well> wells = {
        // Пробурена: проектная траектория не должна попасть в проектные
        makeWell("D1", WellStatus::Producing, 24, {
            point(0, 0, 0, 0, CitingType::Planned),
            point(0, 0, 0, 0, CitingType::AsDrilled),
        }),
        // Только проект
        makeWell("P1", WellStatus::ApprovedPermit, 0, {point(5, 5, 0, 0, CitingType::Planned)}),
        // Бурится: только в категории CurrentlyDrilling
        makeWell("X1", WellStatus::Drilling, 2, {point(9, 9, 0, 0, CitingType::Planned)}),
        // Вертикальная без фактической траектории
        makeWell("V1", WellStatus::Producing, 30, {point(7, 7, 0, 0, CitingType::Vertical)}),
    };

    auto windows = aggregateWellWindows(wells);
    REQUIRE(windows.categories.size() == 3);

    const auto& drilled = windows.at(WellCategory::Drilled);
    const auto& planned = windows.at(WellCategory::Planned);
    const auto& drilling = windows.at(WellCategory::CurrentlyDrilling);

    CHECK(drilled.wellIds(AgeWindow::All) == std::set<std::string>{"D1", "V1"});
    CHECK(planned.wellIds(AgeWindow::All) == std::set<std::string>{"P1"});
    CHECK(drilling.wellIds(AgeWindow::All) == std::set<std::string>{"X1"});

    SUBCASE("Пересечение проектных и пробуренных пусто в каждом окне") {
        for (auto window : kAgeWindows) {
            for (const auto& id : planned.wellIds(window)) {
                INFO("Окно " << toString(window) << ", скважина " << id);
                CHECK(drilled.wellIds(window).count(id) == 0);
            }
        }
    }

    SUBCASE("Согласование выполняется по окну") {
        // D1 старше года: в годовом окне пробуренных её нет, проектная точка тоже не попадает
        CHECK(drilled.wellIds(AgeWindow::Year).empty());
        CHECK(planned.wellIds(AgeWindow::Year) == std::set<std::string>{"P1"});
    }
}

TEST_CASE("Пустой набор скважин") {
    auto windows = aggregateWellWindows({});
    REQUIRE(windows.categories.size() == 3);
    for (auto category : kWellCategories) {
        for (auto window : kAgeWindows) {
            CHECK(windows.at(category).at(window).empty());
        }
    }
    CHECK(windows.dropped_points == 0);
    CHECK(windows.diagnostics.empty());
}
