/**
 * @file test_adjacency_resolver.cpp
 * @brief Юнит-тесты смежности полигонов
 */

#include <doctest/doctest.h>
#include "core/adjacency_resolver.hpp"
#include <algorithm>

using namespace wellboard::core;
using namespace wellboard::model;

namespace {

Polygon square(const std::string& name, double x, double y, double size) {
    return {name, {{x, y}, {x + size, y}, {x + size, y + size}, {x, y + size}}};
}

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

} // namespace

TEST_CASE("Смежность по общей границе и в пределах буфера") {
    std::vector<Polygon> polygons = {
        square("A", 0.0, 0.0, 1000.0),
        square("B", 1000.0, 0.0, 1000.0),      // общая сторона с A
        square("C", 2005.0, 0.0, 1000.0),      // 5 м от B
        square("D", 5000.0, 5000.0, 1000.0),   // далеко
    };

    auto adjacency = resolveAdjacency(polygons);
    REQUIRE(adjacency.size() == 4);

    CHECK(adjacency.at("A") == std::vector<std::string>{"B"});
    CHECK(adjacency.at("B") == std::vector<std::string>{"A", "C"});
    CHECK(adjacency.at("C") == std::vector<std::string>{"B"});
    CHECK(adjacency.at("D").empty());

    SUBCASE("Отношение симметрично") {
        for (const auto& [name, neighbours] : adjacency) {
            for (const auto& other : neighbours) {
                INFO(name << " -> " << other);
                CHECK(contains(adjacency.at(other), name));
            }
        }
    }

    SUBCASE("Рёбра без повторов") {
        auto edges = adjacencyEdges(adjacency);
        REQUIRE(edges.size() == 2);
        CHECK(edges[0].name_a == "A");
        CHECK(edges[0].name_b == "B");
        CHECK(edges[1].name_a == "B");
        CHECK(edges[1].name_b == "C");
    }
}

TEST_CASE("Вырожденные полигоны не вызывают исключений") {
    std::vector<Polygon> polygons = {
        square("A", 0.0, 0.0, 100.0),
        {"P", {{103.0, 50.0}}},                               // точка рядом с A
        {"L", {{-50.0, 50.0}, {-20.0, 50.0}, {-5.0, 50.0}}},  // коллинеарные вершины
        {"R", {{0.0, 0.0}, {0.0, 0.0}, {100.0, 0.0}}},        // повторы
        {"E", {}},
    };

    AdjacencyMap adjacency;
    CHECK_NOTHROW(adjacency = resolveAdjacency(polygons));
    CHECK(contains(adjacency.at("A"), "P"));
    CHECK(contains(adjacency.at("P"), "A"));
    CHECK(contains(adjacency.at("A"), "L"));
    CHECK(contains(adjacency.at("A"), "R"));
    CHECK(adjacency.at("E").empty());
}
