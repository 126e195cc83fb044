/**
 * @file record_table.hpp
 * @brief Сырая таблица записей (колонки + строки) до типизации
 */

#pragma once

#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wellboard::model {

/**
 * @brief Таблица из внешнего источника (CSV-выгрузка, база данных)
 *
 * Все значения хранятся строками; типизация выполняется в core/record_mapping.
 */
struct RecordTable {
    std::string name;                              ///< Имя таблицы (WellInfo, DX, ...)
    std::vector<std::string> columns;              ///< Названия колонок
    std::vector<std::vector<std::string>> rows;    ///< Строки (могут быть короче заголовка)

    /**
     * @brief Поиск колонки: сначала точное совпадение, затем без учёта регистра
     */
    [[nodiscard]] std::optional<size_t> findColumn(std::string_view column) const noexcept {
        for (size_t i = 0; i < columns.size(); ++i) {
            if (columns[i] == column) {
                return i;
            }
        }
        auto equalsIgnoreCase = [](std::string_view a, std::string_view b) {
            return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(),
                [](char l, char r) {
                    return std::tolower(static_cast<unsigned char>(l)) ==
                           std::tolower(static_cast<unsigned char>(r));
                });
        };
        for (size_t i = 0; i < columns.size(); ++i) {
            if (equalsIgnoreCase(columns[i], column)) {
                return i;
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Индекс обязательной колонки
     * @throws MissingColumnError Если колонки нет
     */
    [[nodiscard]] size_t requireColumn(std::string_view column) const {
        auto index = findColumn(column);
        if (!index) {
            throw MissingColumnError(name, std::string(column));
        }
        return *index;
    }

    /**
     * @brief Значение ячейки; пустая строка для коротких строк
     */
    [[nodiscard]] std::string_view cell(size_t row, size_t column) const noexcept {
        const auto& values = rows[row];
        if (column >= values.size()) {
            return {};
        }
        return values[column];
    }

    [[nodiscard]] std::string_view cell(size_t row, std::optional<size_t> column) const noexcept {
        return column ? cell(row, *column) : std::string_view{};
    }

    [[nodiscard]] size_t rowCount() const noexcept { return rows.size(); }
    [[nodiscard]] bool empty() const noexcept { return rows.empty(); }
};

} // namespace wellboard::model
