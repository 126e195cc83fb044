/**
 * @file main.cpp
 * @brief Точка входа wellboard: разрешение записей повестки из командной строки
 */

#include "diagnostics_runner.hpp"
#include "core/board_matters.hpp"
#include "core/docket_sections.hpp"
#include "core/well_catalog.hpp"
#include "core/well_windows.hpp"
#include "io/config_io.hpp"
#include "io/dataset_loader.hpp"
#include "io/result_writer.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

using namespace wellboard::model;
namespace core = wellboard::core;
namespace io = wellboard::io;

struct CommandLine {
    std::string command;                      ///< "--years", "--wells", ...
    std::vector<std::string> args;            ///< Позиционные аргументы команды
    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> out_path;
};

CommandLine parseCommandLine(int argc, char* argv[]) {
    CommandLine cl;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg == "--config" && i + 1 < argc) {
            cl.config_path = std::filesystem::path(argv[++i]);
        } else if (arg == "--out" && i + 1 < argc) {
            cl.out_path = std::filesystem::path(argv[++i]);
        } else if (cl.command.empty() && arg.size() > 2 && arg.substr(0, 2) == "--") {
            cl.command = std::string(arg);
        } else {
            cl.args.emplace_back(arg);
        }
    }
    return cl;
}

void printUsage() {
    std::cout <<
        "Использование:\n"
        "  wellboard --config <файл> --years\n"
        "  wellboard --config <файл> --months <год>\n"
        "  wellboard --config <файл> --dockets <год> <месяц>\n"
        "  wellboard --config <файл> --wells <год> <месяц> <повестка>\n"
        "  wellboard --config <файл> --resolve-wells <год> <месяц> <повестка> [--out <файл>]\n"
        "  wellboard --config <файл> --resolve-sections <год> <месяц> <повестка> [--out <файл>]\n"
        "  wellboard --config <файл> --matters-for-section <код>\n"
        "  wellboard --config <файл> --sections-for-matter <дело>\n"
        "  wellboard --config <файл> --overview [--out <файл>]\n"
        "  wellboard --config <файл> --diagnostics [--out <каталог>]\n"
        "  wellboard --write-default-config <файл>\n";
}

void requireArgs(const CommandLine& cl, size_t count) {
    if (cl.args.size() < count) {
        throw std::invalid_argument("Команде " + cl.command + " нужно аргументов: " + std::to_string(count));
    }
}

io::AppConfig requireConfig(const CommandLine& cl) {
    if (!cl.config_path) {
        throw std::invalid_argument("Не задан файл конфигурации (--config <файл>)");
    }
    return io::loadConfig(*cl.config_path);
}

SelectionContext selectionFromArgs(const CommandLine& cl) {
    requireArgs(cl, 3);
    SelectionContext context;
    context.year = cl.args[0];
    context.month = cl.args[1];
    context.docket = cl.args[2];
    return context;
}

void emit(const CommandLine& cl, const std::string& content) {
    if (cl.out_path) {
        io::writeResult(*cl.out_path, content);
        std::cout << "Результат сохранён: " << cl.out_path->string() << std::endl;
    } else {
        std::cout << content << std::endl;
    }
}

void reportWarnings(const std::vector<AmbiguousMatchWarning>& warnings) {
    for (const auto& warning : warnings) {
        std::cerr << "Предупреждение: " << warning.message() << std::endl;
    }
}

void reportDiagnostics(const std::vector<std::string>& diagnostics) {
    for (const auto& message : diagnostics) {
        std::cerr << "Диагностика: " << message << std::endl;
    }
}

bool isDatasetCommand(const std::string& command) {
    static const std::set<std::string> kCommands = {
        "--years", "--months", "--dockets", "--wells", "--resolve-wells",
        "--resolve-sections", "--matters-for-section", "--sections-for-matter", "--overview"
    };
    return kCommands.count(command) > 0;
}

int runDatasetCommand(const CommandLine& cl) {
    if (!isDatasetCommand(cl.command)) {
        std::cerr << "Неизвестная команда: " << cl.command << std::endl;
        printUsage();
        return 1;
    }

    auto config = requireConfig(cl);
    auto dataset = io::loadDataset(config);
    const auto& settings = config.resolver;

    if (cl.command == "--years") {
        emit(cl, io::stringListToJson(core::availableYears(dataset.wells)));
        return 0;
    }
    if (cl.command == "--months") {
        requireArgs(cl, 1);
        emit(cl, io::stringListToJson(core::availableMonths(dataset.wells, cl.args[0])));
        return 0;
    }
    if (cl.command == "--dockets") {
        requireArgs(cl, 2);
        emit(cl, io::stringListToJson(core::availableDockets(dataset.wells, cl.args[0], cl.args[1])));
        return 0;
    }
    if (cl.command == "--wells") {
        auto wells = core::buildWells(dataset, selectionFromArgs(cl), settings);
        emit(cl, io::wellCatalogToJson(wells));
        return 0;
    }
    if (cl.command == "--resolve-wells") {
        auto windows = core::resolveWellWindows(dataset, selectionFromArgs(cl), settings);
        reportDiagnostics(windows.diagnostics);
        emit(cl, io::wellWindowsToJson(windows));
        return 0;
    }
    if (cl.command == "--resolve-sections") {
        core::UtmProjection projection(settings.utm_zone);
        auto sections = core::resolveSectionsForDocket(dataset, selectionFromArgs(cl), &projection);
        reportDiagnostics(sections.diagnostics);
        emit(cl, io::docketSectionsToJson(sections));
        return 0;
    }
    if (cl.command == "--matters-for-section") {
        requireArgs(cl, 1);
        auto resolution = core::resolveBoardMatters(dataset, core::SectionQuery{cl.args[0]});
        reportWarnings(resolution.warnings);
        emit(cl, io::boardMattersToJson(resolution));
        return 0;
    }
    if (cl.command == "--sections-for-matter") {
        requireArgs(cl, 1);
        auto resolution = core::resolveBoardMatters(dataset, core::CauseQuery{cl.args[0]});
        reportWarnings(resolution.warnings);
        emit(cl, io::boardMattersToJson(resolution));
        return 0;
    }
    if (cl.command == "--overview") {
        auto codes = core::allPlatCodes(dataset);
        std::vector<LocationCode> plat_codes(codes.begin(), codes.end());
        std::vector<std::string> rejected;
        auto tsr = core::buildTsrTable(plat_codes, &rejected);
        for (const auto& code : rejected) {
            std::cerr << "Диагностика: код плана не разобран: " << code << std::endl;
        }
        emit(cl, io::overviewToJson(tsr, core::allMattersOverview(dataset, tsr)));
        return 0;
    }

    std::cerr << "Неизвестная команда: " << cl.command << std::endl;
    printUsage();
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        auto cl = parseCommandLine(argc, argv);

        if (cl.command.empty() || cl.command == "--help") {
            printUsage();
            return cl.command.empty() ? 1 : 0;
        }

        // Конфигурация по умолчанию: --write-default-config <файл>
        if (cl.command == "--write-default-config") {
            requireArgs(cl, 1);
            io::saveConfig(io::defaultConfig(), cl.args[0]);
            std::cout << "Конфигурация сохранена: " << cl.args[0] << std::endl;
            return 0;
        }

        // Диагностика набора данных: --diagnostics [--out <путь>]
        if (cl.command == "--diagnostics") {
            auto config = requireConfig(cl);
            std::filesystem::path out_dir = cl.out_path
                ? *cl.out_path
                : std::filesystem::temp_directory_path() / "wellboard_diagnostics";

            auto result = wellboard::app::runDiagnosticsCommand(config, out_dir);
            if (result.exit_code == 0) {
                std::cout << "Диагностика завершена: " << out_dir << std::endl;
            } else {
                std::cerr << "Диагностика завершилась с ошибками: " << out_dir << std::endl;
            }
            return result.exit_code;
        }

        return runDatasetCommand(cl);
    } catch (const std::exception& e) {
        std::cerr << "Критическая ошибка: " << e.what() << std::endl;
        return 1;
    }
}
