/**
 * @file board_matter.hpp
 * @brief Дела совета (board matters) и документы к ним
 */

#pragma once

#include "location.hpp"
#include <string>
#include <vector>

namespace wellboard::model {

/**
 * @brief Документ по делу
 */
struct BoardDocument {
    std::string description;
    std::string filepath;
    std::string date;

    bool operator==(const BoardDocument&) const = default;
};

/**
 * @brief Дело совета, идентифицируется CauseNumber
 */
struct BoardMatter {
    std::string docket_number;
    std::string cause_number;
    std::string order_type;
    std::string effective_date;
    std::string end_date;
    std::string quip;                       ///< Краткое описание
    std::vector<LocationCode> sections;     ///< Участки из таблицы связей, без повторов
    std::vector<BoardDocument> documents;   ///< По возрастанию даты
};

/**
 * @brief Строка сводки всех дел: участок × повестка × дело
 */
struct MatterOverviewRow {
    LocationCode conc;
    std::string section_label;   ///< "1 15N 2W S"
    std::string docket_number;
    std::string cause_number;

    /// "Docket Number:<d>, Cause Number:<c>"
    [[nodiscard]] std::string label() const {
        return "Docket Number:" + docket_number + ", Cause Number:" + cause_number;
    }

    auto operator<=>(const MatterOverviewRow&) const = default;
};

} // namespace wellboard::model
