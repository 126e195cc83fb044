/**
 * @file test_config_io.cpp
 * @brief Юнит-тесты конфигурации
 */

#include <doctest/doctest.h>
#include "io/config_io.hpp"
#include <filesystem>
#include <fstream>

using namespace wellboard::io;
using namespace wellboard::model;

TEST_CASE("Конфигурация: сохранение и загрузка") {
    AppConfig config;
    config.dataset.data_dir = "exports";
    config.dataset.well_info = "wells.csv";
    config.dataset.delimiter = '\t';
    config.resolver.reference_month = CalendarMonth{2024, 3};
    config.resolver.utm_zone = 13;
    config.resolver.excluded_work_types = {"PLUG", "REENTER"};
    config.resolver.field_aliases = {{"ALTAMONT", "ALTAMONT-BLUEBELL"}};

    auto dir = std::filesystem::temp_directory_path() / "wellboard_config_test";
    std::filesystem::create_directories(dir);
    auto path = dir / "wellboard.json";

    saveConfig(config, path);
    auto loaded = loadConfig(path);

    CHECK(loaded.file_path == path);
    CHECK(loaded.dataset.data_dir == dir / "exports");
    CHECK(loaded.dataset.tablePath(loaded.dataset.well_info) == dir / "exports" / "wells.csv");
    CHECK(loaded.dataset.dx == "DX.csv");
    REQUIRE(loaded.dataset.delimiter.has_value());
    CHECK(*loaded.dataset.delimiter == '\t');
    CHECK(loaded.resolver.reference_month == CalendarMonth{2024, 3});
    CHECK(loaded.resolver.utm_zone == 13);
    CHECK(loaded.resolver.excluded_work_types == config.resolver.excluded_work_types);
    CHECK(loaded.resolver.field_aliases == config.resolver.field_aliases);

    std::filesystem::remove_all(dir);
}

TEST_CASE("Конфигурация: значения по умолчанию") {
    auto config = configFromJson(R"({"format": "wellboard-config"})");
    CHECK(config.dataset.data_dir == "data");
    CHECK(config.dataset.plat_data == "PlatData.csv");
    CHECK_FALSE(config.dataset.delimiter.has_value());
    CHECK_FALSE(config.resolver.reference_month.has_value());
    CHECK(config.resolver.utm_zone == 12);
    CHECK(config.resolver.excluded_work_types == std::vector<std::string>{"PLUG"});

    SUBCASE("Разделитель 'tab'") {
        auto tab = configFromJson(R"({"dataset": {"delimiter": "tab"}})");
        CHECK(tab.dataset.delimiter == '\t');
    }

    SUBCASE("Сериализация содержит идентификатор формата") {
        auto text = configToJson(AppConfig{});
        CHECK(text.find(CONFIG_FORMAT_ID) != std::string::npos);
        CHECK(text.find(CONFIG_FORMAT_VERSION) != std::string::npos);
    }
}

TEST_CASE("Конфигурация: ошибки") {
    CHECK_THROWS_AS((void)configFromJson("{ not json"), ConfigError);
    CHECK_THROWS_AS((void)configFromJson("[]"), ConfigError);
    CHECK_THROWS_AS((void)configFromJson(R"({"format": "other-format"})"), ConfigError);
    CHECK_THROWS_AS((void)configFromJson(R"({"resolver": {"reference_date": "soon"}})"), ConfigError);
    CHECK_THROWS_AS((void)configFromJson(R"({"resolver": {"utm_zone": "twelve"}})"), ConfigError);
    CHECK_THROWS_AS((void)configFromJson(R"({"dataset": {"delimiter": ";;"}})"), ConfigError);
    CHECK_THROWS_AS((void)loadConfig("/nonexistent/wellboard.json"), ConfigError);
}

TEST_CASE("Конфигурация из репозитория загружается") {
    auto config = loadConfig(std::filesystem::path(WELLBOARD_SOURCE_DIR) / "config" / "wellboard.json");
    CHECK(config.resolver.utm_zone == 12);
    CHECK_FALSE(config.resolver.field_aliases.empty());
}

TEST_CASE("Конфигурация по умолчанию совпадает с поставляемой") {
    auto defaults = defaultConfig();
    CHECK(defaults.resolver.field_aliases.at("ALTAMONT") == "ALTAMONT FIELD");

    auto shipped = loadConfig(std::filesystem::path(WELLBOARD_SOURCE_DIR) / "config" / "wellboard.json");
    CHECK(defaults.resolver.field_aliases == shipped.resolver.field_aliases);
    CHECK(defaults.resolver.excluded_work_types == shipped.resolver.excluded_work_types);

    SUBCASE("Записанная конфигурация по умолчанию сохраняет таблицу") {
        auto path = std::filesystem::temp_directory_path() / "wellboard_default_config.json";
        saveConfig(defaults, path);
        auto loaded = loadConfig(path);
        CHECK(loaded.resolver.field_aliases.size() == defaults.resolver.field_aliases.size());
        std::filesystem::remove(path);
    }
}
