/**
 * @file adjacency_resolver.hpp
 * @brief Смежность полигонов через пересечение буферной зоны
 */

#pragma once

#include "model/polygon.hpp"
#include <map>
#include <string>
#include <vector>

namespace wellboard::core {

using namespace wellboard::model;

/// Ширина буферной зоны, единицы проекции (метры)
constexpr double kAdjacencyTolerance = 10.0;

/**
 * @brief Имя полигона → имена смежных полигонов (по возрастанию)
 *
 * Каждое имя входного набора присутствует как ключ, в том числе с пустым списком.
 */
using AdjacencyMap = std::map<std::string, std::vector<std::string>>;

/**
 * @brief Вычисление смежности
 *
 * Для каждого полигона строится буфер шириной kAdjacencyTolerance и
 * проверяется пересечение с исходной геометрией каждого другого полигона.
 * Списки вычисляются независимо для каждого полигона-источника.
 * Вырожденные полигоны (точка, отрезок, коллинеарные или самопересекающиеся
 * вершины) обрабатываются как точка или ломаная, без исключений.
 * Полигон без вершин остаётся в результате с пустым списком.
 */
[[nodiscard]] AdjacencyMap resolveAdjacency(const std::vector<Polygon>& polygons);

/**
 * @brief Список рёбер (name_a < name_b) без повторов
 */
[[nodiscard]] std::vector<AdjacencyEdge> adjacencyEdges(const AdjacencyMap& adjacency);

} // namespace wellboard::core
