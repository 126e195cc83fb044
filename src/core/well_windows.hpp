/**
 * @file well_windows.hpp
 * @brief Классификация точек скважин и разбиение по окнам возраста
 *
 * Категории: пробуренные / проектные / бурящиеся.
 * Окна: ≤12, ≤60, ≤120, ≤9999 месяцев (вложенные).
 */

#pragma once

#include "model/records.hpp"
#include "model/selection.hpp"
#include "model/well.hpp"
#include <array>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace wellboard::core {

using namespace wellboard::model;

/**
 * @brief Строка таблицы окна: точка скважины с производными полями
 */
struct WindowRow {
    std::string well_id;
    Meters easting{0.0};
    Meters northing{0.0};
    std::optional<Feet> measured_depth;
    Feet target_elevation{0.0};     ///< Отметка устья − TVD
    CitingType citing_type = CitingType::Unknown;
    WellStatus status = WellStatus::Unknown;
    int age_months = 0;             ///< Отсутствующий возраст заменён на 0
    size_t sequence = 0;

    bool operator==(const WindowRow&) const = default;
};

using WindowTable = std::vector<WindowRow>;

/**
 * @brief Четыре таблицы одной категории, по одной на окно возраста
 */
struct WindowSet {
    std::array<WindowTable, kAgeWindows.size()> tables;

    [[nodiscard]] const WindowTable& at(AgeWindow window) const noexcept {
        return tables[ageWindowIndex(window)];
    }

    [[nodiscard]] WindowTable& at(AgeWindow window) noexcept {
        return tables[ageWindowIndex(window)];
    }

    /// Идентификаторы скважин в окне
    [[nodiscard]] std::set<std::string> wellIds(AgeWindow window) const;
};

/**
 * @brief Результат разрешения окон для повестки
 */
struct WellWindows {
    std::map<WellCategory, WindowSet> categories;   ///< Все три категории присутствуют
    size_t dropped_points = 0;                      ///< Точки без вычислимой отметки забоя
    std::vector<std::string> diagnostics;

    [[nodiscard]] const WindowSet& at(WellCategory category) const {
        return categories.at(category);
    }
};

/**
 * @brief Принадлежность точки категории
 *
 * Drilled: asdrilled или vertical; Planned: planned или vertical;
 * CurrentlyDrilling: статус скважины Drilling (тип замера не важен).
 */
[[nodiscard]] bool belongsTo(WellCategory category, CitingType citing, WellStatus status) noexcept;

/**
 * @brief Точки всех скважин с отметкой забоя
 *
 * Точки без отметки устья или TVD отбрасываются, их число пишется в dropped.
 * Отсутствующий возраст заменяется на 0.
 */
[[nodiscard]] std::vector<WindowRow> collectWindowRows(const std::vector<Well>& wells,
                                                       size_t* dropped = nullptr);

/**
 * @brief Разбиение по окнам возраста, каждая таблица по (well_id, MD)
 */
[[nodiscard]] WindowSet partitionByAge(const std::vector<WindowRow>& rows);

/**
 * @brief Согласование проектных с пробуренными
 *
 * Из каждого окна проектных удаляются скважины, присутствующие в том же окне
 * пробуренных, а также скважины со статусом Drilling.
 */
[[nodiscard]] WindowSet reconcilePlanned(const WindowSet& planned, const WindowSet& drilled);

/**
 * @brief Полный цикл для набора скважин: классификация, очистка, окна, согласование
 */
[[nodiscard]] WellWindows aggregateWellWindows(const std::vector<Well>& wells);

/**
 * @brief Окна для выбранной повестки
 *
 * Пустая повестка даёт пустые таблицы во всех категориях.
 */
[[nodiscard]] WellWindows resolveWellWindows(const Dataset& dataset,
                                             const SelectionContext& context,
                                             const ResolverSettings& settings);

} // namespace wellboard::core
