/**
 * @file units.hpp
 * @brief Строго типизированные единицы измерения
 *
 * Типы-обёртки для предотвращения ошибок смешивания метров проекции
 * и футов (отметки, глубины, State Plane).
 * Включает литералы для удобства: 100.0_m, 5280.0_ft
 */

#pragma once

#include <compare>

namespace wellboard::model {

/// Метров в одном футе (международный фут)
constexpr double kMetersPerFoot = 0.3048;

// Предварительное объявление для взаимных преобразований
struct Feet;

/**
 * @brief Расстояние в метрах (единицы проекции UTM)
 */
struct Meters {
    double value;

    constexpr explicit Meters(double v = 0.0) noexcept : value(v) {}

    [[nodiscard]] constexpr Feet toFeet() const noexcept;

    // Арифметические операции
    constexpr Meters operator+(Meters other) const noexcept {
        return Meters{value + other.value};
    }

    constexpr Meters operator-(Meters other) const noexcept {
        return Meters{value - other.value};
    }

    constexpr Meters operator*(double scalar) const noexcept {
        return Meters{value * scalar};
    }

    constexpr Meters& operator+=(Meters other) noexcept {
        value += other.value;
        return *this;
    }

    constexpr Meters operator-() const noexcept {
        return Meters{-value};
    }

    constexpr auto operator<=>(const Meters& other) const noexcept = default;
};

/**
 * @brief Расстояние в футах (глубины, отметки, координаты State Plane)
 */
struct Feet {
    double value;

    constexpr explicit Feet(double v = 0.0) noexcept : value(v) {}

    [[nodiscard]] constexpr Meters toMeters() const noexcept {
        return Meters{value * kMetersPerFoot};
    }

    constexpr Feet operator+(Feet other) const noexcept {
        return Feet{value + other.value};
    }

    constexpr Feet operator-(Feet other) const noexcept {
        return Feet{value - other.value};
    }

    constexpr Feet operator*(double scalar) const noexcept {
        return Feet{value * scalar};
    }

    constexpr Feet operator-() const noexcept {
        return Feet{-value};
    }

    constexpr auto operator<=>(const Feet& other) const noexcept = default;
};

constexpr Feet Meters::toFeet() const noexcept {
    return Feet{value / kMetersPerFoot};
}

namespace literals {

constexpr Meters operator""_m(long double v) noexcept {
    return Meters{static_cast<double>(v)};
}

constexpr Meters operator""_m(unsigned long long v) noexcept {
    return Meters{static_cast<double>(v)};
}

constexpr Feet operator""_ft(long double v) noexcept {
    return Feet{static_cast<double>(v)};
}

constexpr Feet operator""_ft(unsigned long long v) noexcept {
    return Feet{static_cast<double>(v)};
}

} // namespace literals

} // namespace wellboard::model
