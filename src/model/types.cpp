/**
 * @file types.cpp
 * @brief Реализация базовых типов
 */

#include "types.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace wellboard::model {

namespace {

// Нижний регистр без пробелов, дефисов и подчёркиваний: "As-Drilled" → "asdrilled"
std::string compactLower(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (std::isspace(c) || c == '-' || c == '_') {
            continue;
        }
        result += static_cast<char>(std::tolower(c));
    }
    return result;
}

bool parseInt(std::string_view text, int& out) {
    if (text.empty()) {
        return false;
    }
    int value = 0;
    for (char ch : text) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return false;
        }
        value = value * 10 + (ch - '0');
    }
    out = value;
    return true;
}

constexpr std::array<std::string_view, 12> kMonthNames = {
    "January", "February", "March", "April", "May", "June",
    "July", "August", "September", "October", "November", "December"
};

} // namespace

std::string_view toString(CitingType type) noexcept {
    switch (type) {
    case CitingType::AsDrilled: return "asdrilled";
    case CitingType::Planned: return "planned";
    case CitingType::Vertical: return "vertical";
    case CitingType::Unknown: return "unknown";
    }
    return "unknown";
}

std::string_view toString(WellCategory category) noexcept {
    switch (category) {
    case WellCategory::Drilled: return "drilled";
    case WellCategory::Planned: return "planned";
    case WellCategory::CurrentlyDrilling: return "currently_drilling";
    }
    return "unknown";
}

std::string_view toString(AgeWindow window) noexcept {
    switch (window) {
    case AgeWindow::Year: return "year";
    case AgeWindow::FiveYears: return "5years";
    case AgeWindow::TenYears: return "10years";
    case AgeWindow::All: return "all";
    }
    return "all";
}

std::string_view toString(WellStatus status) noexcept {
    switch (status) {
    case WellStatus::Producing: return "Producing";
    case WellStatus::ShutIn: return "Shut-in";
    case WellStatus::PluggedAbandoned: return "Plugged & Abandoned";
    case WellStatus::Drilling: return "Drilling";
    case WellStatus::ApprovedPermit: return "Approved Permit";
    case WellStatus::Active: return "Active";
    case WellStatus::Inactive: return "Inactive";
    case WellStatus::NewPermit: return "New Permit";
    case WellStatus::DrillingOperationsSuspended: return "Drilling Operations Suspended";
    case WellStatus::LocationAbandoned: return "Location Abandoned - APD rescinded";
    case WellStatus::ReturnedApd: return "Returned APD (Unapproved)";
    case WellStatus::TemporarilyAbandoned: return "Temporarily-abandoned";
    case WellStatus::TestOrMonitorWell: return "Test Well or Monitor Well";
    case WellStatus::Unknown: return "Unknown";
    }
    return "Unknown";
}

std::string_view toString(StatusGroup group) noexcept {
    switch (group) {
    case StatusGroup::Producing: return "Producing";
    case StatusGroup::ShutIn: return "Shut-in";
    case StatusGroup::PluggedAbandoned: return "Plugged & Abandoned";
    case StatusGroup::Drilling: return "Drilling";
    case StatusGroup::Other: return "Other";
    }
    return "Other";
}

std::string_view toString(WellType type) noexcept {
    switch (type) {
    case WellType::Oil: return "Oil Well";
    case WellType::Gas: return "Gas Well";
    case WellType::DryHole: return "Dry Hole";
    case WellType::WaterInjection: return "Water Injection Well";
    case WellType::GasInjection: return "Gas Injection Well";
    case WellType::WaterDisposal: return "Water Disposal Well";
    case WellType::OilWaterDisposal: return "Oil Well/Water Disposal Well";
    case WellType::TestWell: return "Test Well";
    case WellType::WaterSource: return "Water Source Well";
    case WellType::Unknown: return "Unknown";
    }
    return "Unknown";
}

std::string_view toString(TypeGroup group) noexcept {
    switch (group) {
    case TypeGroup::Oil: return "Oil Well";
    case TypeGroup::Gas: return "Gas Well";
    case TypeGroup::DryHole: return "Dry Hole";
    case TypeGroup::Injection: return "Injection Well";
    case TypeGroup::Disposal: return "Disposal Well";
    case TypeGroup::Other: return "Other";
    }
    return "Other";
}

CitingType parseCitingType(std::string_view text) noexcept {
    auto key = compactLower(text);
    if (key == "asdrilled") return CitingType::AsDrilled;
    if (key == "planned") return CitingType::Planned;
    if (key == "vertical") return CitingType::Vertical;
    return CitingType::Unknown;
}

WellStatus parseWellStatus(std::string_view text) noexcept {
    auto key = compactLower(text);
    constexpr std::array<WellStatus, 13> known = {
        WellStatus::Producing, WellStatus::ShutIn, WellStatus::PluggedAbandoned,
        WellStatus::Drilling, WellStatus::ApprovedPermit, WellStatus::Active,
        WellStatus::Inactive, WellStatus::NewPermit, WellStatus::DrillingOperationsSuspended,
        WellStatus::LocationAbandoned, WellStatus::ReturnedApd,
        WellStatus::TemporarilyAbandoned, WellStatus::TestOrMonitorWell
    };
    for (auto status : known) {
        if (compactLower(toString(status)) == key) {
            return status;
        }
    }
    return WellStatus::Unknown;
}

WellType parseWellType(std::string_view text) noexcept {
    auto key = compactLower(text);
    constexpr std::array<WellType, 9> known = {
        WellType::Oil, WellType::Gas, WellType::DryHole,
        WellType::WaterInjection, WellType::GasInjection,
        WellType::WaterDisposal, WellType::OilWaterDisposal,
        WellType::TestWell, WellType::WaterSource
    };
    for (auto type : known) {
        if (compactLower(toString(type)) == key) {
            return type;
        }
    }
    return WellType::Unknown;
}

StatusGroup statusGroup(WellStatus status) noexcept {
    switch (status) {
    case WellStatus::Producing: return StatusGroup::Producing;
    case WellStatus::ShutIn: return StatusGroup::ShutIn;
    case WellStatus::PluggedAbandoned: return StatusGroup::PluggedAbandoned;
    case WellStatus::Drilling: return StatusGroup::Drilling;
    default: return StatusGroup::Other;
    }
}

TypeGroup typeGroup(WellType type) noexcept {
    switch (type) {
    case WellType::Oil: return TypeGroup::Oil;
    case WellType::Gas: return TypeGroup::Gas;
    case WellType::DryHole: return TypeGroup::DryHole;
    case WellType::WaterInjection:
    case WellType::GasInjection: return TypeGroup::Injection;
    case WellType::WaterDisposal:
    case WellType::OilWaterDisposal: return TypeGroup::Disposal;
    case WellType::TestWell:
    case WellType::WaterSource:
    case WellType::Unknown: return TypeGroup::Other;
    }
    return TypeGroup::Other;
}

std::optional<int> monthNumber(std::string_view name) noexcept {
    auto key = compactLower(name);
    for (size_t i = 0; i < kMonthNames.size(); ++i) {
        if (compactLower(kMonthNames[i]) == key) {
            return static_cast<int>(i + 1);
        }
    }
    return std::nullopt;
}

std::string_view monthName(int month) noexcept {
    if (month < 1 || month > 12) {
        return "";
    }
    return kMonthNames[static_cast<size_t>(month - 1)];
}

std::optional<CalendarMonth> parseCalendarDate(std::string_view text) {
    // Отбрасываем время: "2021-03-04 00:00:00" / "2021-03-04T00:00:00"
    auto cut = text.find_first_of(" T");
    if (cut != std::string_view::npos) {
        text = text.substr(0, cut);
    }
    if (text.empty()) {
        return std::nullopt;
    }

    CalendarMonth result;
    if (text.find('/') != std::string_view::npos) {
        // MM/DD/YYYY
        auto first = text.find('/');
        auto second = text.find('/', first + 1);
        if (second == std::string_view::npos) {
            return std::nullopt;
        }
        if (!parseInt(text.substr(0, first), result.month) ||
            !parseInt(text.substr(second + 1), result.year)) {
            return std::nullopt;
        }
    } else {
        // YYYY-MM[-DD]
        auto first = text.find('-');
        if (first == std::string_view::npos) {
            return std::nullopt;
        }
        auto second = text.find('-', first + 1);
        auto month_text = (second == std::string_view::npos)
            ? text.substr(first + 1)
            : text.substr(first + 1, second - first - 1);
        if (!parseInt(text.substr(0, first), result.year) ||
            !parseInt(month_text, result.month)) {
            return std::nullopt;
        }
    }

    if (result.month < 1 || result.month > 12) {
        return std::nullopt;
    }
    return result;
}

} // namespace wellboard::model
