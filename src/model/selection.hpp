/**
 * @file selection.hpp
 * @brief Контекст выбора (год, месяц, повестка, участок) и настройки разрешения
 */

#pragma once

#include "location.hpp"
#include "types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wellboard::model {

/**
 * @brief Текущий выбор пользователя, передаётся в каждый вызов явно
 */
struct SelectionContext {
    std::string year;                    ///< Board_Year
    std::string month;                   ///< Docket_Month ("January")
    std::string docket;                  ///< Board_Docket
    std::optional<LocationCode> section; ///< Выбранный участок (если есть)

    bool operator==(const SelectionContext&) const = default;
};

/**
 * @brief Параметры разрешения записей
 */
struct ResolverSettings {
    std::optional<CalendarMonth> reference_month;           ///< "Сейчас" для возраста; nullopt = текущий месяц
    int utm_zone = 12;                                      ///< Зона UTM (северное полушарие, WGS84)
    std::vector<std::string> excluded_work_types{"PLUG"};   ///< WorkType, исключаемые из WellInfo
    std::map<std::string, std::string> field_aliases;       ///< Краткое имя месторождения → полное
};

} // namespace wellboard::model
