/**
 * @file test_location_codec.cpp
 * @brief Юнит-тесты кодирования кода участка
 */

#include <doctest/doctest.h>
#include "core/location_codec.hpp"

using namespace wellboard::core;
using namespace wellboard::model;

TEST_CASE("Кодирование участка из строк таблицы BoardData") {
    LocationFields fields{"1", "15", "1", "2", "2", "1"};
    CHECK(encodeLocation(fields) == "0115N02WS");

    SUBCASE("Числа с дробной частью и буквенные направления") {
        LocationFields mixed{"12.0", "3", "S", "21", "e", "U"};
        CHECK(encodeLocation(mixed) == "1203S21EU");
    }

    SUBCASE("Нечисловое поле") {
        LocationFields bad{"A1", "15", "1", "2", "2", "1"};
        CHECK_THROWS_AS((void)encodeLocation(bad), EncodingError);
        try {
            (void)encodeLocation(bad);
        } catch (const EncodingError& e) {
            CHECK(e.field() == "Sec");
        }
    }

    SUBCASE("Неизвестное направление") {
        LocationFields bad{"1", "15", "3", "2", "2", "1"};
        CHECK_THROWS_AS((void)encodeLocation(bad), EncodingError);
    }

    SUBCASE("Значение больше двух цифр") {
        LocationFields bad{"100", "15", "1", "2", "2", "1"};
        CHECK_THROWS_AS((void)encodeLocation(bad), EncodingError);
    }
}

TEST_CASE("Разбор кода участка") {
    auto parts = decodeLocation("0115N02WS");
    CHECK(parts.section == 1);
    CHECK(parts.township == 15);
    CHECK(parts.township_dir == TownshipDirection::North);
    CHECK(parts.range == 2);
    CHECK(parts.range_dir == RangeDirection::West);
    CHECK(parts.baseline == Baseline::SaltLake);

    SUBCASE("Некорректные коды отклоняются целиком") {
        for (const char* code : {"", "0115N02W", "0115N02WS1", "0115X02WS", "01A5N02WS", "0115N02WX"}) {
            INFO("Код: " << code);
            CHECK_THROWS_AS((void)decodeLocation(code), DecodeError);
            CHECK_FALSE(tryDecodeLocation(code).has_value());
        }
    }
}

TEST_CASE("Кодирование и разбор взаимно обратны") {
    for (int section : {1, 9, 36}) {
        for (auto tdir : {TownshipDirection::North, TownshipDirection::South}) {
            for (auto baseline : {Baseline::SaltLake, Baseline::Uintah}) {
                LocationParts parts{section, 4, tdir, 23, RangeDirection::East, baseline};
                CHECK(decodeLocation(encodeLocation(parts)) == parts);
            }
        }
    }
}

TEST_CASE("Подпись участка") {
    auto parts = decodeLocation("0115N02WS");
    CHECK(humanizeLocation(parts) == "1 15N 2W S");
    CHECK(parseLocationLabel("1 15N 2W S") == parts);
    CHECK(parseLocationLabel("  1  15n 2w s ") == parts);
    CHECK_THROWS_AS((void)parseLocationLabel("1 15 2W S"), DecodeError);
    CHECK_THROWS_AS((void)parseLocationLabel("1 15N 2W"), DecodeError);

    SUBCASE("Неразбираемый код сохраняется как есть") {
        CHECK(locationLabel("0115N02WS") == "1 15N 2W S");
        CHECK(locationLabel("XYZ") == "XYZ");
    }
}
