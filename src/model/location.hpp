/**
 * @file location.hpp
 * @brief Составные части кода участка (Section / Township / Range / Baseline)
 */

#pragma once

#include <string>
#include <string_view>

namespace wellboard::model {

/**
 * @brief Код участка (Conc): 9 символов SSTTDRRDB, например "0115N02WS".
 *
 * Во всех таблицах используется как непрозрачный ключ соединения:
 * сравнение только на точное равенство.
 */
using LocationCode = std::string;

enum class TownshipDirection {
    North,  ///< "N" (в таблицах "1")
    South   ///< "S" (в таблицах "2")
};

enum class RangeDirection {
    East,   ///< "E" (в таблицах "1")
    West    ///< "W" (в таблицах "2")
};

/**
 * @brief Базисная линия (PM)
 */
enum class Baseline {
    SaltLake,  ///< "S" (в таблицах "1")
    Uintah     ///< "U" (в таблицах "2")
};

/**
 * @brief Разобранный код участка
 */
struct LocationParts {
    int section = 0;
    int township = 0;
    TownshipDirection township_dir = TownshipDirection::North;
    int range = 0;
    RangeDirection range_dir = RangeDirection::East;
    Baseline baseline = Baseline::SaltLake;

    bool operator==(const LocationParts&) const = default;
};

/**
 * @brief Сырые значения шести полей из таблицы (BoardData и аналогичные)
 */
struct LocationFields {
    std::string section;
    std::string township;
    std::string township_dir;
    std::string range;
    std::string range_dir;
    std::string baseline;
};

[[nodiscard]] constexpr char directionLetter(TownshipDirection dir) noexcept {
    return dir == TownshipDirection::North ? 'N' : 'S';
}

[[nodiscard]] constexpr char directionLetter(RangeDirection dir) noexcept {
    return dir == RangeDirection::East ? 'E' : 'W';
}

[[nodiscard]] constexpr char baselineLetter(Baseline baseline) noexcept {
    return baseline == Baseline::SaltLake ? 'S' : 'U';
}

} // namespace wellboard::model
