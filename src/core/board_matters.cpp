/**
 * @file board_matters.cpp
 * @brief Реализация связи дел совета с участками
 */

#include "board_matters.hpp"
#include "location_codec.hpp"
#include "polygon_assembler.hpp"
#include "well_catalog.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <tuple>

namespace wellboard::core {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

// Ключ сортировки даты документа: YYYYMMDD для ISO и MM/DD/YYYY,
// для прочих форматов ключа нет.
std::optional<std::string> dateSortKey(std::string_view text) {
    text = trim(text);
    auto digits = [](std::string_view s) {
        return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        });
    };
    auto pad2 = [](std::string_view s) {
        return s.size() == 1 ? "0" + std::string(s) : std::string(s);
    };

    if (text.size() >= 10 && text[4] == '-' && text[7] == '-') {
        return std::string(text.substr(0, 4)) + std::string(text.substr(5, 2)) +
               std::string(text.substr(8, 2));
    }

    auto first = text.find('/');
    auto second = first == std::string_view::npos ? first : text.find('/', first + 1);
    if (second != std::string_view::npos) {
        auto month = text.substr(0, first);
        auto day = text.substr(first + 1, second - first - 1);
        auto year = text.substr(second + 1, 4);
        if (digits(month) && digits(day) && digits(year) && year.size() == 4) {
            return std::string(year) + pad2(month) + pad2(day);
        }
    }
    return std::nullopt;
}

BoardMatter matterFromRecord(const BoardRecord& record) {
    BoardMatter matter;
    matter.docket_number = record.docket_number;
    matter.cause_number = record.cause_number;
    matter.order_type = record.order_type;
    matter.effective_date = record.effective_date;
    matter.end_date = record.end_date;
    matter.quip = record.quip;
    return matter;
}

void fillMatter(const Dataset& dataset, BoardMatter& matter) {
    auto codes = matterCodes(dataset, matter.cause_number);
    matter.sections.assign(codes.begin(), codes.end());
    matter.documents = documentsForMatter(dataset, matter.cause_number);
}

auto tsrOrder(const LocationParts& p) {
    return std::make_tuple(static_cast<int>(p.baseline), static_cast<int>(p.township_dir),
                           static_cast<int>(p.range_dir), p.township, p.range, p.section);
}

} // namespace

std::vector<BoardMatter> mattersForSection(const Dataset& dataset, const LocationCode& code) {
    std::vector<BoardMatter> matters;
    std::set<std::string> seen;

    for (const auto& record : dataset.board) {
        if (record.conc != code || !seen.insert(record.cause_number).second) {
            continue;
        }
        matters.push_back(matterFromRecord(record));
    }

    std::stable_sort(matters.begin(), matters.end(), [](const BoardMatter& a, const BoardMatter& b) {
        return std::tie(a.docket_number, a.cause_number) < std::tie(b.docket_number, b.cause_number);
    });

    for (auto& matter : matters) {
        fillMatter(dataset, matter);
    }
    return matters;
}

std::vector<std::string> causeNumbersForSection(const Dataset& dataset, const LocationCode& code) {
    std::set<std::string> causes;
    for (const auto& record : dataset.board) {
        if (record.conc == code) {
            causes.insert(record.cause_number);
        }
    }
    return {causes.begin(), causes.end()};
}

std::set<LocationCode> matterCodes(const Dataset& dataset, std::string_view cause_number) {
    std::set<LocationCode> codes;
    for (const auto& record : dataset.board) {
        if (record.cause_number == cause_number) {
            codes.insert(record.conc);
        }
    }
    return codes;
}

std::vector<LocationCode> sectionsForMatter(const Dataset& dataset, std::string_view cause_number) {
    auto codes = matterCodes(dataset, cause_number);
    std::set<LocationCode> found;
    for (const auto& plat : dataset.plats) {
        if (codes.count(plat.conc) != 0) {
            found.insert(plat.conc);
        }
    }
    return {found.begin(), found.end()};
}

std::vector<Polygon> platPolygons(const Dataset& dataset, const std::set<LocationCode>& codes) {
    std::vector<KeyedPoint> points;
    for (const auto& plat : dataset.plats) {
        if (codes.count(plat.conc) != 0) {
            points.push_back({plat.conc, plat.easting, plat.northing});
        }
    }
    return assemblePolygons(points);
}

std::vector<BoardDocument> documentsForMatter(const Dataset& dataset, std::string_view cause_number) {
    std::vector<std::pair<std::optional<std::string>, BoardDocument>> keyed;
    for (const auto& link : dataset.board_links) {
        if (trim(link.cause) == trim(cause_number)) {
            keyed.emplace_back(dateSortKey(link.document_date),
                               BoardDocument{link.description, link.filepath, link.document_date});
        }
    }

    // Неразобранные даты идут последними в исходном порядке
    std::stable_sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) {
        if (!a.first || !b.first) {
            return a.first.has_value() && !b.first.has_value();
        }
        return *a.first < *b.first;
    });

    std::vector<BoardDocument> documents;
    documents.reserve(keyed.size());
    for (auto& [key, document] : keyed) {
        documents.push_back(std::move(document));
    }
    return documents;
}

std::optional<BoardMatter> matterDetails(const Dataset& dataset, std::string_view cause_number) {
    auto it = std::find_if(dataset.board.begin(), dataset.board.end(), [&](const BoardRecord& r) {
        return r.cause_number == cause_number;
    });
    if (it == dataset.board.end()) {
        return std::nullopt;
    }
    auto matter = matterFromRecord(*it);
    fillMatter(dataset, matter);
    return matter;
}

std::vector<AmbiguousMatchWarning> findAmbiguousMatches(const std::set<LocationCode>& codes,
                                                        const std::set<LocationCode>& candidates) {
    std::vector<AmbiguousMatchWarning> warnings;
    for (const auto& code : codes) {
        if (code.empty()) {
            continue;
        }
        for (const auto& candidate : candidates) {
            if (candidate != code && candidate.find(code) != std::string::npos) {
                warnings.push_back({code, candidate});
            }
        }
    }
    return warnings;
}

std::set<LocationCode> allPlatCodes(const Dataset& dataset) {
    std::set<LocationCode> codes;
    for (const auto& plat : dataset.plats) {
        codes.insert(plat.conc);
    }
    return codes;
}

std::vector<TsrEntry> buildTsrTable(const std::vector<LocationCode>& codes,
                                    std::vector<std::string>* rejected) {
    std::vector<TsrEntry> table;
    std::set<LocationCode> seen;

    for (const auto& code : codes) {
        if (!seen.insert(code).second) {
            continue;
        }
        auto head = std::string_view(code).substr(0, kLocationCodeLength);
        if (rejected == nullptr) {
            auto parts = decodeLocation(head);
            table.push_back({code, parts, humanizeLocation(parts)});
            continue;
        }
        if (auto parts = tryDecodeLocation(head)) {
            table.push_back({code, *parts, humanizeLocation(*parts)});
        } else {
            rejected->push_back(code);
        }
    }

    std::stable_sort(table.begin(), table.end(), [](const TsrEntry& a, const TsrEntry& b) {
        return tsrOrder(a.parts) < tsrOrder(b.parts);
    });
    return table;
}

std::vector<MatterOverviewRow> allMattersOverview(const Dataset& dataset, const std::vector<TsrEntry>& tsr) {
    std::set<MatterOverviewRow> rows;
    for (const auto& entry : tsr) {
        for (const auto& record : dataset.board) {
            if (record.location == entry.parts) {
                rows.insert({entry.conc, entry.label, record.docket_number, record.cause_number});
            }
        }
    }

    std::vector<MatterOverviewRow> result(rows.begin(), rows.end());
    std::stable_sort(result.begin(), result.end(), [](const MatterOverviewRow& a, const MatterOverviewRow& b) {
        return std::tie(a.docket_number, a.cause_number) < std::tie(b.docket_number, b.cause_number);
    });
    return result;
}

std::optional<std::string> extractCauseNumber(std::string_view label) {
    constexpr std::string_view kMarker = "Cause Number:";
    auto pos = label.find(kMarker);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    auto value = trim(label.substr(pos + kMarker.size()));
    auto comma = value.find(',');
    if (comma != std::string_view::npos) {
        value = trim(value.substr(0, comma));
    }
    if (value.empty()) {
        return std::nullopt;
    }
    return std::string(value);
}

std::vector<std::string> wellsForMatter(const Dataset& dataset,
                                        const std::vector<Well>& wells,
                                        std::string_view cause_number) {
    auto codes = matterCodes(dataset, cause_number);
    std::vector<Well> selected;
    for (const auto& well : wells) {
        if (codes.count(well.conc_code) != 0) {
            selected.push_back(well);
        }
    }
    return wellListForDocket(selected);
}

BoardMatterResolution resolveBoardMatters(const Dataset& dataset, const BoardMatterQuery& query) {
    BoardMatterResolution result;
    auto candidates = allPlatCodes(dataset);

    if (const auto* section = std::get_if<SectionQuery>(&query)) {
        result.matters = mattersForSection(dataset, section->code);
        std::set<LocationCode> requested{section->code};
        if (candidates.count(section->code) != 0) {
            result.sections.push_back(section->code);
        }
        result.polygons = platPolygons(dataset, requested);
        result.warnings = findAmbiguousMatches(requested, candidates);
        return result;
    }

    const auto& cause = std::get<CauseQuery>(query).cause_number;
    if (auto matter = matterDetails(dataset, cause)) {
        result.matters.push_back(std::move(*matter));
    }
    result.sections = sectionsForMatter(dataset, cause);
    std::set<LocationCode> requested(result.sections.begin(), result.sections.end());
    result.polygons = platPolygons(dataset, requested);
    result.warnings = findAmbiguousMatches(matterCodes(dataset, cause), candidates);
    return result;
}

} // namespace wellboard::core
