/**
 * @file errors.hpp
 * @brief Исключения разрешения записей
 *
 * Структурные ошибки (некорректный код участка, отсутствующая колонка)
 * прерывают текущий вызов и передаются вызывающему без изменений.
 * Пустые выборки ошибками не являются.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace wellboard::model {

/**
 * @brief Ошибка кодирования кода участка (Conc)
 */
class EncodingError : public std::runtime_error {
public:
    EncodingError(const std::string& message, std::string field)
        : std::runtime_error(message)
        , field_(std::move(field)) {}

    /// Имя поля, которое не удалось закодировать
    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

/**
 * @brief Ошибка разбора кода участка или подписи TSR
 */
class DecodeError : public std::runtime_error {
public:
    DecodeError(const std::string& message, std::string input)
        : std::runtime_error(message)
        , input_(std::move(input)) {}

    [[nodiscard]] const std::string& input() const noexcept { return input_; }

private:
    std::string input_;
};

/**
 * @brief Во входной таблице нет обязательной колонки
 */
class MissingColumnError : public std::runtime_error {
public:
    MissingColumnError(std::string table, std::string column)
        : std::runtime_error("В таблице " + table + " отсутствует обязательная колонка: " + column)
        , table_(std::move(table))
        , column_(std::move(column)) {}

    [[nodiscard]] const std::string& table() const noexcept { return table_; }
    [[nodiscard]] const std::string& column() const noexcept { return column_; }

private:
    std::string table_;
    std::string column_;
};

/**
 * @brief Недопустимое значение в ячейке таблицы
 */
class RecordValueError : public std::runtime_error {
public:
    RecordValueError(const std::string& message, std::string table, std::string column)
        : std::runtime_error(message)
        , table_(std::move(table))
        , column_(std::move(column)) {}

    [[nodiscard]] const std::string& table() const noexcept { return table_; }
    [[nodiscard]] const std::string& column() const noexcept { return column_; }

private:
    std::string table_;
    std::string column_;
};

/**
 * @brief Ошибка геометрии (WKT, проекция)
 */
class GeometryError : public std::runtime_error {
public:
    explicit GeometryError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Предупреждение о неоднозначном совпадении кодов
 *
 * Код является подстрокой другого кода-кандидата: при поиске по подстроке
 * они совпали бы оба. Не является исключением, собирается в результат.
 */
struct AmbiguousMatchWarning {
    std::string code;        ///< Запрошенный код
    std::string other_code;  ///< Код-кандидат, содержащий запрошенный

    [[nodiscard]] std::string message() const {
        return "Код " + code + " является подстрокой кода " + other_code;
    }

    bool operator==(const AmbiguousMatchWarning&) const = default;
};

} // namespace wellboard::model
