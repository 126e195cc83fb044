/**
 * @file location_codec.cpp
 * @brief Реализация кодирования кода участка
 */

#include "location_codec.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace wellboard::core {

namespace {

std::string trim(std::string_view str) {
    size_t start = 0;
    while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }
    size_t end = str.size();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }
    return std::string(str.substr(start, end - start));
}

std::string upper(std::string value) {
    for (auto& ch : value) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return value;
}

// Целая часть числа из таблицы: "1", "01", "1.0"
int parseNumericField(const std::string& raw, const char* field) {
    auto text = trim(raw);
    if (text.empty()) {
        throw EncodingError(std::string("Пустое значение поля ") + field, field);
    }

    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(value)) {
        throw EncodingError(std::string("Поле ") + field + " не является числом: " + text, field);
    }

    double truncated = std::trunc(value);
    if (truncated < 0.0 || truncated > 99.0) {
        throw EncodingError(std::string("Поле ") + field + " вне диапазона 0..99: " + text, field);
    }
    return static_cast<int>(truncated);
}

// Код направления: "1"/"2" (в том числе "1.0") или буква
char parseDirectionField(const std::string& raw, const char* field,
                         char first, char second) {
    auto text = upper(trim(raw));
    if (text.size() == 1 && (text[0] == first || text[0] == second)) {
        return text[0];
    }

    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (!text.empty() && end == text.c_str() + text.size()) {
        if (value == 1.0) return first;
        if (value == 2.0) return second;
    }
    throw EncodingError(std::string("Неизвестное направление в поле ") + field + ": " + trim(raw), field);
}

void appendTwoDigits(std::string& out, int value, const char* field) {
    if (value < 0 || value > 99) {
        throw EncodingError(std::string("Поле ") + field + " вне диапазона 0..99: " +
                            std::to_string(value), field);
    }
    out += static_cast<char>('0' + value / 10);
    out += static_cast<char>('0' + value % 10);
}

bool readTwoDigits(std::string_view text, size_t pos, int& out) noexcept {
    if (pos + 2 > text.size()) {
        return false;
    }
    auto hi = static_cast<unsigned char>(text[pos]);
    auto lo = static_cast<unsigned char>(text[pos + 1]);
    if (!std::isdigit(hi) || !std::isdigit(lo)) {
        return false;
    }
    out = (hi - '0') * 10 + (lo - '0');
    return true;
}

// Число из 1-2 цифр в начале токена подписи
bool readLabelNumber(std::string_view token, size_t digits, int& out) noexcept {
    if (digits == 0 || digits > 2) {
        return false;
    }
    out = 0;
    for (size_t i = 0; i < digits; ++i) {
        auto c = static_cast<unsigned char>(token[i]);
        if (!std::isdigit(c)) {
            return false;
        }
        out = out * 10 + (c - '0');
    }
    return true;
}

size_t leadingDigits(std::string_view token) noexcept {
    size_t count = 0;
    while (count < token.size() && std::isdigit(static_cast<unsigned char>(token[count]))) {
        ++count;
    }
    return count;
}

} // namespace

LocationCode encodeLocation(const LocationParts& parts) {
    LocationCode code;
    code.reserve(kLocationCodeLength);
    appendTwoDigits(code, parts.section, "Sec");
    appendTwoDigits(code, parts.township, "Township");
    code += directionLetter(parts.township_dir);
    appendTwoDigits(code, parts.range, "Range");
    code += directionLetter(parts.range_dir);
    code += baselineLetter(parts.baseline);
    return code;
}

LocationCode encodeLocation(const LocationFields& fields) {
    LocationParts parts;
    parts.section = parseNumericField(fields.section, "Sec");
    parts.township = parseNumericField(fields.township, "Township");
    parts.township_dir = parseDirectionField(fields.township_dir, "TownshipDir", 'N', 'S') == 'N'
        ? TownshipDirection::North : TownshipDirection::South;
    parts.range = parseNumericField(fields.range, "Range");
    parts.range_dir = parseDirectionField(fields.range_dir, "RangeDir", 'E', 'W') == 'E'
        ? RangeDirection::East : RangeDirection::West;
    parts.baseline = parseDirectionField(fields.baseline, "PM", 'S', 'U') == 'S'
        ? Baseline::SaltLake : Baseline::Uintah;
    return encodeLocation(parts);
}

std::optional<LocationParts> tryDecodeLocation(std::string_view code) noexcept {
    if (code.size() != kLocationCodeLength) {
        return std::nullopt;
    }

    LocationParts parts;
    if (!readTwoDigits(code, 0, parts.section) ||
        !readTwoDigits(code, 2, parts.township) ||
        !readTwoDigits(code, 5, parts.range)) {
        return std::nullopt;
    }

    switch (code[4]) {
    case 'N': parts.township_dir = TownshipDirection::North; break;
    case 'S': parts.township_dir = TownshipDirection::South; break;
    default: return std::nullopt;
    }
    switch (code[7]) {
    case 'E': parts.range_dir = RangeDirection::East; break;
    case 'W': parts.range_dir = RangeDirection::West; break;
    default: return std::nullopt;
    }
    switch (code[8]) {
    case 'S': parts.baseline = Baseline::SaltLake; break;
    case 'U': parts.baseline = Baseline::Uintah; break;
    default: return std::nullopt;
    }
    return parts;
}

LocationParts decodeLocation(std::string_view code) {
    auto parts = tryDecodeLocation(code);
    if (!parts) {
        throw DecodeError("Некорректный код участка: '" + std::string(code) + "'", std::string(code));
    }
    return *parts;
}

std::string humanizeLocation(const LocationParts& parts) {
    std::ostringstream out;
    out << parts.section << ' '
        << parts.township << directionLetter(parts.township_dir) << ' '
        << parts.range << directionLetter(parts.range_dir) << ' '
        << baselineLetter(parts.baseline);
    return out.str();
}

LocationParts parseLocationLabel(std::string_view label) {
    auto fail = [&label]() -> DecodeError {
        return DecodeError("Некорректная подпись участка: '" + std::string(label) + "'", std::string(label));
    };

    std::vector<std::string> tokens;
    std::istringstream in{std::string(label)};
    std::string token;
    while (in >> token) {
        tokens.push_back(upper(token));
    }
    if (tokens.size() != 4) {
        throw fail();
    }

    LocationParts parts;
    if (leadingDigits(tokens[0]) != tokens[0].size() ||
        !readLabelNumber(tokens[0], tokens[0].size(), parts.section)) {
        throw fail();
    }

    const auto& township = tokens[1];
    auto township_digits = leadingDigits(township);
    if (township_digits + 1 != township.size() ||
        !readLabelNumber(township, township_digits, parts.township)) {
        throw fail();
    }
    if (township.back() == 'N') {
        parts.township_dir = TownshipDirection::North;
    } else if (township.back() == 'S') {
        parts.township_dir = TownshipDirection::South;
    } else {
        throw fail();
    }

    const auto& range = tokens[2];
    auto range_digits = leadingDigits(range);
    if (range_digits + 1 != range.size() ||
        !readLabelNumber(range, range_digits, parts.range)) {
        throw fail();
    }
    if (range.back() == 'E') {
        parts.range_dir = RangeDirection::East;
    } else if (range.back() == 'W') {
        parts.range_dir = RangeDirection::West;
    } else {
        throw fail();
    }

    if (tokens[3] == "S") {
        parts.baseline = Baseline::SaltLake;
    } else if (tokens[3] == "U") {
        parts.baseline = Baseline::Uintah;
    } else {
        throw fail();
    }
    return parts;
}

std::string locationLabel(std::string_view code) {
    auto parts = tryDecodeLocation(code);
    if (!parts) {
        return std::string(code);
    }
    return humanizeLocation(*parts);
}

} // namespace wellboard::core
