/**
 * @file types.hpp
 * @brief Базовые типы и перечисления предметной области
 */

#pragma once

#include "units.hpp"
#include <array>
#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace wellboard::model {

/**
 * @brief Тип замера инклинометрии (CitingType в таблице DX)
 */
enum class CitingType {
    AsDrilled,  ///< Фактическая траектория
    Planned,    ///< Проектная траектория
    Vertical,   ///< Вертикальная скважина
    Unknown     ///< Нераспознанное значение
};

/**
 * @brief Категория скважин для построения окон
 */
enum class WellCategory {
    Drilled,            ///< Пробуренные (asdrilled + vertical)
    Planned,            ///< Проектные (planned + vertical)
    CurrentlyDrilling   ///< Статус Drilling
};

constexpr std::array<WellCategory, 3> kWellCategories = {
    WellCategory::Drilled,
    WellCategory::Planned,
    WellCategory::CurrentlyDrilling
};

/**
 * @brief Окно по возрасту скважины (кумулятивное)
 */
enum class AgeWindow {
    Year,       ///< ≤ 12 месяцев
    FiveYears,  ///< ≤ 60 месяцев
    TenYears,   ///< ≤ 120 месяцев
    All         ///< ≤ 9999 месяцев
};

constexpr std::array<AgeWindow, 4> kAgeWindows = {
    AgeWindow::Year,
    AgeWindow::FiveYears,
    AgeWindow::TenYears,
    AgeWindow::All
};

/**
 * @brief Верхняя граница возраста (в месяцах) для окна
 */
[[nodiscard]] constexpr int ageWindowMonths(AgeWindow window) noexcept {
    switch (window) {
    case AgeWindow::Year: return 12;
    case AgeWindow::FiveYears: return 60;
    case AgeWindow::TenYears: return 120;
    case AgeWindow::All: return 9999;
    }
    return 9999;
}

[[nodiscard]] constexpr size_t ageWindowIndex(AgeWindow window) noexcept {
    return static_cast<size_t>(window);
}

/**
 * @brief Текущий статус скважины (CurrentWellStatus)
 */
enum class WellStatus {
    Producing,
    ShutIn,
    PluggedAbandoned,
    Drilling,
    ApprovedPermit,
    Active,
    Inactive,
    NewPermit,
    DrillingOperationsSuspended,
    LocationAbandoned,
    ReturnedApd,
    TemporarilyAbandoned,
    TestOrMonitorWell,
    Unknown
};

/**
 * @brief Группа статусов для счётчиков
 */
enum class StatusGroup {
    Producing,
    ShutIn,
    PluggedAbandoned,
    Drilling,
    Other
};

/**
 * @brief Текущий тип скважины (CurrentWellType)
 */
enum class WellType {
    Oil,
    Gas,
    DryHole,
    WaterInjection,
    GasInjection,
    WaterDisposal,
    OilWaterDisposal,
    TestWell,
    WaterSource,
    Unknown
};

/**
 * @brief Укрупнённая группа типов: нагнетательные и поглощающие объединены
 */
enum class TypeGroup {
    Oil,
    Gas,
    DryHole,
    Injection,
    Disposal,
    Other
};

/**
 * @brief Точка на плане (easting, northing) в метрах проекции
 */
struct Point2D {
    double x = 0.0;
    double y = 0.0;

    constexpr bool operator==(const Point2D&) const noexcept = default;
};

/**
 * @brief Пространственная точка (State Plane X/Y в футах, отметка в футах)
 */
struct Point3D {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    constexpr bool operator==(const Point3D&) const noexcept = default;
};

/**
 * @brief Календарный месяц (точность расчёта возраста скважины)
 */
struct CalendarMonth {
    int year = 1970;
    int month = 1;  ///< 1..12

    constexpr auto operator<=>(const CalendarMonth&) const noexcept = default;
};

/**
 * @brief Количество месяцев между двумя датами (может быть отрицательным)
 */
[[nodiscard]] constexpr int monthsBetween(CalendarMonth from, CalendarMonth to) noexcept {
    return (to.year - from.year) * 12 + (to.month - from.month);
}

[[nodiscard]] std::string_view toString(CitingType type) noexcept;
[[nodiscard]] std::string_view toString(WellCategory category) noexcept;
[[nodiscard]] std::string_view toString(AgeWindow window) noexcept;
[[nodiscard]] std::string_view toString(WellStatus status) noexcept;
[[nodiscard]] std::string_view toString(StatusGroup group) noexcept;
[[nodiscard]] std::string_view toString(WellType type) noexcept;
[[nodiscard]] std::string_view toString(TypeGroup group) noexcept;

/**
 * @brief Разбор CitingType ("asdrilled", "As-Drilled", "planned", "vertical")
 * @return CitingType::Unknown для нераспознанных значений
 */
[[nodiscard]] CitingType parseCitingType(std::string_view text) noexcept;

/**
 * @brief Разбор статуса по тексту из WellInfo (без учёта регистра)
 */
[[nodiscard]] WellStatus parseWellStatus(std::string_view text) noexcept;

/**
 * @brief Разбор типа по тексту из WellInfo (без учёта регистра)
 */
[[nodiscard]] WellType parseWellType(std::string_view text) noexcept;

[[nodiscard]] StatusGroup statusGroup(WellStatus status) noexcept;
[[nodiscard]] TypeGroup typeGroup(WellType type) noexcept;

/**
 * @brief Номер месяца по английскому названию ("January" → 1)
 */
[[nodiscard]] std::optional<int> monthNumber(std::string_view name) noexcept;

/**
 * @brief Английское название месяца (1 → "January")
 */
[[nodiscard]] std::string_view monthName(int month) noexcept;

/**
 * @brief Разбор даты: YYYY-MM-DD[ HH:MM:SS], YYYY-MM, MM/DD/YYYY
 * @return std::nullopt для пустой или нераспознанной строки
 */
[[nodiscard]] std::optional<CalendarMonth> parseCalendarDate(std::string_view text);

} // namespace wellboard::model
