/**
 * @file record_mapping.hpp
 * @brief Типизация сырых таблиц в записи model/records.hpp
 *
 * Отсутствие обязательной колонки фатально (MissingColumnError).
 * Полностью совпадающие строки отбрасываются, остаётся первая.
 */

#pragma once

#include "geo_projection.hpp"
#include "model/record_table.hpp"
#include "model/records.hpp"
#include <string>
#include <vector>

namespace wellboard::core {

using namespace wellboard::model;

/**
 * @brief Строки, пропущенные при типизации
 */
struct MappingIssues {
    std::vector<std::string> messages;  ///< "<таблица> строка <n>: <причина>"

    [[nodiscard]] bool empty() const noexcept { return messages.empty(); }
};

/**
 * @brief WellInfo → WellInfoRecord
 * @throws MissingColumnError
 */
[[nodiscard]] std::vector<WellInfoRecord> mapWellInfo(const RecordTable& table);

/**
 * @brief DX → SurveyRecord
 *
 * Пустые MD/TVD сохраняются как std::nullopt.
 *
 * @param issues Если nullptr, строка с нечисловыми X/Y прерывает разбор;
 *               иначе строка пропускается и отмечается.
 * @throws MissingColumnError, GeometryError
 */
[[nodiscard]] std::vector<SurveyRecord> mapSurveys(const RecordTable& table,
                                                   MappingIssues* issues = nullptr);

/**
 * @brief BoardData → BoardRecord, код участка вычисляется кодеком
 *
 * @param issues Если nullptr, строка с некорректным участком прерывает разбор
 *               (EncodingError); иначе строка пропускается и отмечается.
 * @throws MissingColumnError, EncodingError
 */
[[nodiscard]] std::vector<BoardRecord> mapBoardData(const RecordTable& table,
                                                    MappingIssues* issues = nullptr);

/**
 * @brief BoardDataLinks → BoardLinkRecord
 * @throws MissingColumnError
 */
[[nodiscard]] std::vector<BoardLinkRecord> mapBoardLinks(const RecordTable& table);

/**
 * @brief PlatData → PlatRecord с проецированием Lat/Lon в UTM
 *
 * @param issues Если nullptr, некорректные координаты или Order прерывают разбор;
 *               иначе строка пропускается и отмечается.
 * @throws MissingColumnError, GeometryError, RecordValueError
 */
[[nodiscard]] std::vector<PlatRecord> mapPlatData(const RecordTable& table,
                                                  const UtmProjection& projection,
                                                  MappingIssues* issues = nullptr);

/**
 * @brief Adjacent → AdjacentRecord
 * @throws MissingColumnError, RecordValueError (Order вне {0, 1, 2} в строгом режиме)
 */
[[nodiscard]] std::vector<AdjacentRecord> mapAdjacent(const RecordTable& table,
                                                      MappingIssues* issues = nullptr);

/**
 * @brief Field → FieldPointRecord
 * @throws MissingColumnError, GeometryError (нечисловые Easting/Northing в строгом режиме)
 */
[[nodiscard]] std::vector<FieldPointRecord> mapFieldPoints(const RecordTable& table,
                                                           MappingIssues* issues = nullptr);

/**
 * @brief Owner → OwnerRecord (геометрия остаётся текстом WKT)
 * @throws MissingColumnError
 */
[[nodiscard]] std::vector<OwnerRecord> mapOwners(const RecordTable& table);

} // namespace wellboard::core
