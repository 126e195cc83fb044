/**
 * @file result_writer.hpp
 * @brief Экспорт результатов разрешения в JSON
 */

#pragma once

#include "core/board_matters.hpp"
#include "core/docket_sections.hpp"
#include "core/render_adapter.hpp"
#include "core/well_windows.hpp"
#include "model/well.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace wellboard::io {

using namespace wellboard::model;

/**
 * @brief Окна скважин: категории × окна возраста, строки и полилинии
 *
 * Полилинии проходят через адаптер отрисовки; для каждой точки
 * выводится смещение Y.
 */
[[nodiscard]] std::string wellWindowsToJson(const core::WellWindows& windows, int indent = 2);

/**
 * @brief Участки повестки
 */
[[nodiscard]] std::string docketSectionsToJson(const core::DocketSections& sections, int indent = 2);

/**
 * @brief Дела совета по участку или делу
 */
[[nodiscard]] std::string boardMattersToJson(const core::BoardMatterResolution& resolution, int indent = 2);

/**
 * @brief Сводка всех дел
 */
[[nodiscard]] std::string overviewToJson(const std::vector<core::TsrEntry>& tsr,
                                         const std::vector<MatterOverviewRow>& rows,
                                         int indent = 2);

/**
 * @brief Скважины повестки: список, счётчики статусов и типов
 */
[[nodiscard]] std::string wellCatalogToJson(const std::vector<Well>& wells, int indent = 2);

/**
 * @brief Массив строк
 */
[[nodiscard]] std::string stringListToJson(const std::vector<std::string>& values, int indent = 2);

/**
 * @brief Запись результата в файл (атомарно)
 */
void writeResult(const std::filesystem::path& path, const std::string& content);

} // namespace wellboard::io
