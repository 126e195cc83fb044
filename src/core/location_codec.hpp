/**
 * @file location_codec.hpp
 * @brief Кодирование и разбор кода участка (Conc)
 *
 * Формат: SSTTDRRDB
 *   SS - секция, TT - township, D - N/S,
 *   RR - range, D - E/W, B - базисная линия S/U.
 * Числовые поля дополняются нулями до 2 знаков.
 * В таблицах направления хранятся цифрами: "1" ↔ N/E/S, "2" ↔ S/W/U.
 */

#pragma once

#include "model/errors.hpp"
#include "model/location.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace wellboard::core {

using namespace wellboard::model;

/// Длина кода участка
constexpr size_t kLocationCodeLength = 9;

/**
 * @brief Кодирование разобранного кода
 * @throws EncodingError Если числовое поле вне диапазона 0..99
 */
[[nodiscard]] LocationCode encodeLocation(const LocationParts& parts);

/**
 * @brief Кодирование сырых значений из таблицы
 *
 * Числовые поля принимаются как "1", "01", "1.0" (дробная часть отбрасывается).
 * Направления принимаются цифрами (1/2) или буквами без учёта регистра.
 *
 * @throws EncodingError Если поле не является целым числом или направление неизвестно
 */
[[nodiscard]] LocationCode encodeLocation(const LocationFields& fields);

/**
 * @brief Разбор 9-символьного кода
 * @throws DecodeError Если строка не соответствует формату
 */
[[nodiscard]] LocationParts decodeLocation(std::string_view code);

/**
 * @brief Разбор без исключений
 */
[[nodiscard]] std::optional<LocationParts> tryDecodeLocation(std::string_view code) noexcept;

/**
 * @brief Подпись для отображения: "1 15N 2W S"
 */
[[nodiscard]] std::string humanizeLocation(const LocationParts& parts);

/**
 * @brief Разбор подписи "1 15N 2W S" (обратная операция к humanizeLocation)
 * @throws DecodeError Если подпись не соответствует формату
 */
[[nodiscard]] LocationParts parseLocationLabel(std::string_view label);

/**
 * @brief Подпись участка по коду
 *
 * Для кода, который не удаётся разобрать, возвращается сам код.
 * Вызывающий решает, считать ли это предупреждением (см. tryDecodeLocation).
 */
[[nodiscard]] std::string locationLabel(std::string_view code);

} // namespace wellboard::core
