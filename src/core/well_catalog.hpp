/**
 * @file well_catalog.hpp
 * @brief Навигация по повесткам и сборка скважин выбранной повестки
 */

#pragma once

#include "model/records.hpp"
#include "model/selection.hpp"
#include "model/well.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wellboard::core {

using namespace wellboard::model;

/**
 * @brief Годы заседаний (Board_Year) по возрастанию
 */
[[nodiscard]] std::vector<std::string> availableYears(const std::vector<WellInfoRecord>& records);

/**
 * @brief Месяцы заседаний за год в календарном порядке
 *
 * Нераспознанные названия месяцев идут в конце по алфавиту.
 */
[[nodiscard]] std::vector<std::string> availableMonths(const std::vector<WellInfoRecord>& records,
                                                       std::string_view year);

/**
 * @brief Повестки (Board_Docket) за год и месяц по возрастанию
 */
[[nodiscard]] std::vector<std::string> availableDockets(const std::vector<WellInfoRecord>& records,
                                                        std::string_view year,
                                                        std::string_view month);

/**
 * @brief Строки WellInfo, попадающие в выбор (год, месяц, повестка)
 */
[[nodiscard]] std::vector<WellInfoRecord> recordsForSelection(const std::vector<WellInfoRecord>& records,
                                                              const SelectionContext& context);

/**
 * @brief Текущий месяц по системным часам
 */
[[nodiscard]] CalendarMonth currentCalendarMonth();

/**
 * @brief Месяц расчёта возраста: из настроек либо текущий
 */
[[nodiscard]] CalendarMonth referenceMonth(const ResolverSettings& settings);

/**
 * @brief Возраст скважины в месяцах
 *
 * Для статуса Approved Permit без даты забуривания возраст равен 0.
 * Для прочих скважин без даты возраст не определён.
 */
[[nodiscard]] std::optional<int> wellAgeMonths(WellStatus status,
                                               const std::optional<CalendarMonth>& spud,
                                               CalendarMonth reference) noexcept;

/**
 * @brief Полное название месторождения; неизвестные имена не меняются
 */
[[nodiscard]] std::string translateFieldName(const std::string& name,
                                             const std::map<std::string, std::string>& aliases);

/**
 * @brief Скважины выбранной повестки
 *
 * - строки с WorkType из excluded_work_types отбрасываются;
 * - одна скважина на WellID (первая строка);
 * - точки инклинометрии без повторов, по возрастанию MD.
 */
[[nodiscard]] std::vector<Well> buildWells(const Dataset& dataset,
                                           const SelectionContext& context,
                                           const ResolverSettings& settings);

/**
 * @brief Список для выбора скважины: основные (MainWell) первыми, затем остальные
 *
 * Внутри каждой группы сортировка по отображаемому имени.
 */
[[nodiscard]] std::vector<std::string> wellListForDocket(const std::vector<Well>& wells);

/**
 * @brief Поиск скважины по WellID или отображаемому имени
 */
[[nodiscard]] const Well* findWell(const std::vector<Well>& wells, std::string_view id_or_name) noexcept;

/**
 * @brief Счётчики статусов (все группы присутствуют, в том числе нулевые)
 */
[[nodiscard]] std::map<StatusGroup, size_t> countStatuses(const std::vector<Well>& wells);

/**
 * @brief Счётчики типов (все группы присутствуют, в том числе нулевые)
 */
[[nodiscard]] std::map<TypeGroup, size_t> countTypes(const std::vector<Well>& wells);

/**
 * @brief Устье скважины: первая точка по MD
 */
[[nodiscard]] std::optional<SurveyPoint> surfaceHoleLocation(const Well& well);

} // namespace wellboard::core
