/**
 * @file field_aliases.hpp
 * @brief Таблица полных названий месторождений
 */

#pragma once

#include <map>
#include <string>

namespace wellboard::core {

/**
 * @brief Краткое имя месторождения из WellInfo → название в таблице Field
 *
 * Та же таблица поставляется в config/wellboard.json.
 */
[[nodiscard]] const std::map<std::string, std::string>& defaultFieldAliases();

} // namespace wellboard::core
