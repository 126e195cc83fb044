/**
 * @file test_trajectory.cpp
 * @brief Юнит-тесты выбора траектории и адаптера отрисовки
 */

#include <doctest/doctest.h>
#include "core/render_adapter.hpp"
#include "core/trajectory.hpp"
#include <variant>

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

Well wellWith(std::vector<SurveyPoint> surveys) {
    Well well;
    well.id = "43-047-00001";
    well.elevation = Feet{5200.0};
    well.surveys = std::move(surveys);
    return well;
}

WindowRow verticalRow(const std::string& id, double x, double y, double md) {
    WindowRow row;
    row.well_id = id;
    row.easting = Meters{x};
    row.northing = Meters{y};
    row.measured_depth = Feet{md};
    row.target_elevation = Feet{5000.0 - md};
    row.citing_type = CitingType::Vertical;
    return row;
}

} // namespace

TEST_CASE("Приоритет траектории: фактическая, проектная, вертикальная") {
    SUBCASE("Есть фактическая") {
        auto well = wellWith({
            point(0, 0, 0, 0, CitingType::Planned),
            point(1, 1, 0, 0, CitingType::AsDrilled),
            point(2, 2, 0, 0, CitingType::Vertical),
        });
        auto survey = selectSurvey(well);
        CHECK(std::holds_alternative<DrilledSurvey>(survey));
        CHECK(selectedCitingType(survey) == CitingType::AsDrilled);
        REQUIRE(selectedPoints(survey).size() == 1);
        CHECK(selectedPoints(survey)[0].easting.value == doctest::Approx(1.0));
    }

    SUBCASE("Фактической нет, есть проектная") {
        auto well = wellWith({
            point(0, 0, 0, 0, CitingType::Planned),
            point(0, 5, 100, 100, CitingType::Planned),
            point(2, 2, 0, 0, CitingType::Vertical),
        });
        auto survey = selectSurvey(well);
        CHECK(std::holds_alternative<PlannedSurvey>(survey));
        CHECK(selectedPoints(survey).size() == 2);
    }

    SUBCASE("Только вертикальная") {
        auto well = wellWith({point(2, 2, 0, 0, CitingType::Vertical)});
        CHECK(std::holds_alternative<VerticalSurvey>(selectSurvey(well)));
    }

    SUBCASE("Нет данных") {
        auto survey = selectSurvey(wellWith({}));
        CHECK(std::holds_alternative<VerticalSurvey>(survey));
        CHECK(selectedPoints(survey).empty());
    }
}

TEST_CASE("Проекция точек на план и в State Plane") {
    auto plan = planPoint(Meters{304.8}, Meters{609.6});
    CHECK(plan.x == doctest::Approx(304.8));
    CHECK(plan.y == doctest::Approx(609.6));

    auto spatial = statePlanePoint(Meters{304.8}, Meters{609.6}, Feet{4200.0});
    CHECK(spatial.x == doctest::Approx(1000.0));
    CHECK(spatial.y == doctest::Approx(2000.0));
    CHECK(spatial.z == doctest::Approx(4200.0));
}

TEST_CASE("Полилиния выбранной скважины") {
    auto well = wellWith({
        point(100, 100, 0, 0, CitingType::AsDrilled),
        point(110, 120, 1000, 980, CitingType::AsDrilled),
    });
    SurveyPoint no_tvd = point(120, 140, 2000, 0, CitingType::AsDrilled);
    no_tvd.true_vertical_depth.reset();
    well.surveys.push_back(no_tvd);

    auto path = buildWellPath(well, selectSurvey(well));
    CHECK(path.well_id == well.id);
    CHECK(path.citing_type == CitingType::AsDrilled);
    REQUIRE(path.plan.size() == 2);
    REQUIRE(path.spatial.size() == 2);
    CHECK(path.spatial[1].z == doctest::Approx(5200.0 - 980.0));
}

TEST_CASE("Полилинии таблицы окна группируются по скважине") {
    WindowTable table = {
        verticalRow("A", 10, 10, 0),
        verticalRow("A", 10, 10, 500),
        verticalRow("B", 20, 20, 0),
    };
    auto paths = buildWellPaths(table);
    REQUIRE(paths.size() == 2);
    CHECK(paths[0].well_id == "A");
    CHECK(paths[0].plan.size() == 2);
    CHECK(paths[1].well_id == "B");
    CHECK(paths[1].spatial.size() == 1);
}

TEST_CASE("Смещение вертикальных скважин при отрисовке") {
    WindowTable table = {
        verticalRow("A", 10, 10, 0),
        verticalRow("A", 10, 10, 500),
        verticalRow("A", 10, 10, 1000),
        verticalRow("B", 10, 10, 0),
    };
    auto paths = buildWellPaths(table);
    auto rendered = applyVerticalJitter(paths);
    REQUIRE(rendered.size() == 2);

    const auto& a = rendered[0];
    REQUIRE(a.y_offsets.size() == 3);
    CHECK(a.y_offsets[0] == doctest::Approx(0.0));
    CHECK(a.y_offsets[1] == doctest::Approx(kVerticalJitterStep));
    CHECK(a.y_offsets[2] == doctest::Approx(2 * kVerticalJitterStep));
    CHECK(a.plan[1].y != a.plan[0].y);

    // Повторение учитывается по всему набору, а не по одной скважине
    CHECK(rendered[1].y_offsets[0] == doctest::Approx(3 * kVerticalJitterStep));

    SUBCASE("Исходные полилинии не меняются") {
        for (const auto& p : paths[0].plan) {
            CHECK(p.y == doctest::Approx(10.0));
        }
    }

    SUBCASE("Истинные координаты восстанавливаются") {
        for (size_t i = 0; i < a.plan.size(); ++i) {
            CHECK(a.truePlanPoint(i).y == doctest::Approx(10.0));
            CHECK(a.trueSpatialPoint(i).y == doctest::Approx(paths[0].spatial[i].y));
        }
    }

    SUBCASE("Наклонные траектории не смещаются") {
        auto drilled = paths;
        for (auto& path : drilled) {
            path.citing_type = CitingType::AsDrilled;
        }
        for (const auto& path : applyVerticalJitter(drilled)) {
            for (double offset : path.y_offsets) {
                CHECK(offset == 0.0);
            }
        }
    }
}
