/**
 * @file config_io.cpp
 * @brief Реализация чтения и записи конфигурации
 */

#include "config_io.hpp"
#include "file_utils.hpp"
#include "core/field_aliases.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>

namespace wellboard::io {

using json = nlohmann::json;

namespace {

json delimiterToJson(const std::optional<char>& delimiter) {
    if (!delimiter) {
        return nullptr;
    }
    return std::string(1, *delimiter);
}

std::optional<char> delimiterFromJson(const json& j) {
    if (j.is_null()) {
        return std::nullopt;
    }
    auto text = j.get<std::string>();
    if (text == "\\t" || text == "tab") {
        return '\t';
    }
    if (text.size() != 1) {
        throw ConfigError("Разделитель должен быть одним символом: \"" + text + "\"");
    }
    return text.front();
}

json datasetToJson(const DatasetLayout& d) {
    json tables;
    tables["well_info"] = d.well_info;
    tables["dx"] = d.dx;
    tables["board_data"] = d.board_data;
    tables["board_data_links"] = d.board_data_links;
    tables["plat_data"] = d.plat_data;
    tables["adjacent"] = d.adjacent;
    tables["field"] = d.field;
    tables["owner"] = d.owner;

    json j;
    j["data_dir"] = d.data_dir.generic_string();
    j["tables"] = tables;
    j["delimiter"] = delimiterToJson(d.delimiter);
    return j;
}

DatasetLayout datasetFromJson(const json& j) {
    DatasetLayout d;
    d.data_dir = j.value("data_dir", d.data_dir.string());
    if (j.contains("tables")) {
        const auto& t = j.at("tables");
        d.well_info = t.value("well_info", d.well_info);
        d.dx = t.value("dx", d.dx);
        d.board_data = t.value("board_data", d.board_data);
        d.board_data_links = t.value("board_data_links", d.board_data_links);
        d.plat_data = t.value("plat_data", d.plat_data);
        d.adjacent = t.value("adjacent", d.adjacent);
        d.field = t.value("field", d.field);
        d.owner = t.value("owner", d.owner);
    }
    d.delimiter = delimiterFromJson(j.value("delimiter", json(nullptr)));
    return d;
}

json referenceMonthToJson(const std::optional<CalendarMonth>& month) {
    if (!month) {
        return nullptr;
    }
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d", month->year, month->month);
    return std::string(buf);
}

json resolverToJson(const ResolverSettings& s) {
    json j;
    j["reference_date"] = referenceMonthToJson(s.reference_month);
    j["utm_zone"] = s.utm_zone;
    j["excluded_work_types"] = s.excluded_work_types;
    j["field_aliases"] = s.field_aliases;
    return j;
}

ResolverSettings resolverFromJson(const json& j) {
    ResolverSettings s;
    auto reference = j.value("reference_date", json(nullptr));
    if (!reference.is_null()) {
        auto text = reference.get<std::string>();
        s.reference_month = parseCalendarDate(text);
        if (!s.reference_month) {
            throw ConfigError("Некорректная reference_date: \"" + text + "\"");
        }
    }
    s.utm_zone = j.value("utm_zone", s.utm_zone);
    s.excluded_work_types = j.value("excluded_work_types", s.excluded_work_types);
    s.field_aliases = j.value("field_aliases", s.field_aliases);
    return s;
}

json configToJsonInternal(const AppConfig& config) {
    json j;
    j["format"] = CONFIG_FORMAT_ID;
    j["version"] = CONFIG_FORMAT_VERSION;
    j["dataset"] = datasetToJson(config.dataset);
    j["resolver"] = resolverToJson(config.resolver);
    return j;
}

AppConfig configFromJsonInternal(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Конфигурация должна быть JSON-объектом");
    }
    auto format = j.value("format", std::string(CONFIG_FORMAT_ID));
    if (format != CONFIG_FORMAT_ID) {
        throw ConfigError("Неизвестный формат конфигурации: " + format);
    }

    AppConfig config;
    try {
        if (j.contains("dataset")) {
            config.dataset = datasetFromJson(j.at("dataset"));
        }
        if (j.contains("resolver")) {
            config.resolver = resolverFromJson(j.at("resolver"));
        }
    } catch (const json::exception& e) {
        throw ConfigError("Некорректное значение в конфигурации: " + std::string(e.what()));
    }
    return config;
}

} // anonymous namespace

AppConfig defaultConfig() {
    AppConfig config;
    config.resolver.field_aliases = core::defaultFieldAliases();
    return config;
}

AppConfig loadConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Не удалось открыть файл: " + path.string());
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("Ошибка парсинга JSON: " + std::string(e.what()));
    }

    AppConfig config = configFromJsonInternal(j);
    config.file_path = path;
    config.dataset.data_dir = resolveRelative(path.parent_path(), config.dataset.data_dir);
    return config;
}

void saveConfig(const AppConfig& config, const std::filesystem::path& path) {
    try {
        atomicWrite(path, configToJsonInternal(config).dump(2) + "\n");
    } catch (const std::exception& e) {
        throw ConfigError("Ошибка сохранения файла: " + std::string(e.what()));
    }
}

std::string configToJson(const AppConfig& config, int indent) {
    return configToJsonInternal(config).dump(indent);
}

AppConfig configFromJson(const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw ConfigError("Ошибка парсинга JSON: " + std::string(e.what()));
    }
    return configFromJsonInternal(j);
}

} // namespace wellboard::io
