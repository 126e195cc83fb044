/**
 * @file board_matters.hpp
 * @brief Связь дел совета (CauseNumber) с участками (Conc)
 *
 * Сопоставление кодов выполняется только по точному равенству.
 * Если запрошенный код является подстрокой другого известного кода,
 * формируется AmbiguousMatchWarning (без совпадения).
 */

#pragma once

#include "model/board_matter.hpp"
#include "model/errors.hpp"
#include "model/polygon.hpp"
#include "model/records.hpp"
#include "model/well.hpp"
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace wellboard::core {

using namespace wellboard::model;

/**
 * @brief Строка таблицы TSR: участок из кода плана
 */
struct TsrEntry {
    LocationCode conc;
    LocationParts parts;
    std::string label;  ///< "1 15N 2W S"

    bool operator==(const TsrEntry&) const = default;
};

/**
 * @brief Дела, затрагивающие участок
 *
 * Одно дело на CauseNumber, по возрастанию (DocketNumber, CauseNumber).
 * Каждое дело заполнено участками и документами.
 */
[[nodiscard]] std::vector<BoardMatter> mattersForSection(const Dataset& dataset,
                                                         const LocationCode& code);

/**
 * @brief Номера дел по участку, без повторов, по возрастанию
 */
[[nodiscard]] std::vector<std::string> causeNumbersForSection(const Dataset& dataset,
                                                              const LocationCode& code);

/**
 * @brief Коды участков дела из таблицы связей (CauseNumber, Conc)
 */
[[nodiscard]] std::set<LocationCode> matterCodes(const Dataset& dataset, std::string_view cause_number);

/**
 * @brief Участки планов, на которые ссылается дело
 *
 * Коды PlatData, входящие в множество кодов дела (точное равенство).
 * Без повторов, по возрастанию.
 */
[[nodiscard]] std::vector<LocationCode> sectionsForMatter(const Dataset& dataset,
                                                          std::string_view cause_number);

/**
 * @brief Полигоны планов для набора кодов
 */
[[nodiscard]] std::vector<Polygon> platPolygons(const Dataset& dataset,
                                                const std::set<LocationCode>& codes);

/**
 * @brief Документы дела по возрастанию даты
 */
[[nodiscard]] std::vector<BoardDocument> documentsForMatter(const Dataset& dataset,
                                                            std::string_view cause_number);

/**
 * @brief Сведения о деле: повестка, тип решения, даты, краткое описание
 * @return std::nullopt, если дела нет в BoardData
 */
[[nodiscard]] std::optional<BoardMatter> matterDetails(const Dataset& dataset,
                                                       std::string_view cause_number);

/**
 * @brief Коды-кандидаты, для которых запрошенный код является подстрокой
 */
[[nodiscard]] std::vector<AmbiguousMatchWarning> findAmbiguousMatches(
    const std::set<LocationCode>& codes,
    const std::set<LocationCode>& candidates);

/**
 * @brief Все коды участков из PlatData
 */
[[nodiscard]] std::set<LocationCode> allPlatCodes(const Dataset& dataset);

/**
 * @brief Таблица TSR по кодам планов
 *
 * Разбираются первые 9 символов кода. Сортировка: базисная линия,
 * направление township, направление range, township, range, секция.
 *
 * @param rejected Если nullptr, некорректный код прерывает построение (DecodeError);
 *                 иначе код пропускается и добавляется в rejected.
 */
[[nodiscard]] std::vector<TsrEntry> buildTsrTable(const std::vector<LocationCode>& codes,
                                                  std::vector<std::string>* rejected = nullptr);

/**
 * @brief Сводка всех дел по участкам TSR
 *
 * Соединение по шести полям участка, одна строка на (участок, повестка, дело),
 * без повторов, по возрастанию (повестка, дело).
 */
[[nodiscard]] std::vector<MatterOverviewRow> allMattersOverview(const Dataset& dataset,
                                                                const std::vector<TsrEntry>& tsr);

/**
 * @brief Номер дела из подписи "Docket Number:<d>, Cause Number:<c>"
 */
[[nodiscard]] std::optional<std::string> extractCauseNumber(std::string_view label);

/**
 * @brief Скважины на участках дела (по ConcCode), основные первыми
 */
[[nodiscard]] std::vector<std::string> wellsForMatter(const Dataset& dataset,
                                                      const std::vector<Well>& wells,
                                                      std::string_view cause_number);

/// Запрос по участку
struct SectionQuery {
    LocationCode code;
};

/// Запрос по делу
struct CauseQuery {
    std::string cause_number;
};

using BoardMatterQuery = std::variant<SectionQuery, CauseQuery>;

/**
 * @brief Результат запроса по делам совета
 */
struct BoardMatterResolution {
    std::vector<BoardMatter> matters;
    std::vector<LocationCode> sections;
    std::vector<Polygon> polygons;
    std::vector<AmbiguousMatchWarning> warnings;
};

/**
 * @brief Разрешение запроса по участку или по делу
 *
 * Отсутствие дел или участков даёт пустые списки.
 */
[[nodiscard]] BoardMatterResolution resolveBoardMatters(const Dataset& dataset,
                                                        const BoardMatterQuery& query);

} // namespace wellboard::core
