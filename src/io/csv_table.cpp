/**
 * @file csv_table.cpp
 * @brief Реализация чтения CSV таблиц
 */

#include "csv_table.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <sstream>

namespace wellboard::io {

namespace {

std::string trim(std::string_view str) {
    size_t start = 0;
    while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }
    size_t end = str.size();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }
    return std::string(str.substr(start, end - start));
}

std::string_view stripBom(std::string_view str) {
    if (str.size() >= 3 &&
        static_cast<unsigned char>(str[0]) == 0xEF &&
        static_cast<unsigned char>(str[1]) == 0xBB &&
        static_cast<unsigned char>(str[2]) == 0xBF) {
        return str.substr(3);
    }
    return str;
}

// Делит текст на записи; перевод строки внутри кавычек не завершает запись
std::vector<std::pair<size_t, std::string>> splitRecords(std::string_view content) {
    std::vector<std::pair<size_t, std::string>> records;
    std::string current;
    bool in_quotes = false;
    size_t line = 1;
    size_t record_line = 1;

    for (size_t i = 0; i < content.size(); ++i) {
        char c = content[i];
        if (c == '"') {
            in_quotes = !in_quotes;
            current += c;
        } else if ((c == '\n' || c == '\r') && !in_quotes) {
            if (c == '\r' && i + 1 < content.size() && content[i + 1] == '\n') {
                ++i;
            }
            records.emplace_back(record_line, std::move(current));
            current.clear();
            ++line;
            record_line = line;
        } else {
            if (c == '\n') {
                ++line;
            }
            current += c;
        }
    }

    if (in_quotes) {
        throw CsvReadError("Незакрытая кавычка в записи", record_line);
    }
    if (!current.empty()) {
        records.emplace_back(record_line, std::move(current));
    }
    return records;
}

std::vector<std::string> splitLine(std::string_view line, char delimiter) {
    std::vector<std::string> result;
    std::string current;
    bool in_quotes = false;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (c == '"') {
            if (in_quotes && i + 1 < line.size() && line[i + 1] == '"') {
                current += '"';
                ++i;
            } else {
                in_quotes = !in_quotes;
                quoted = true;
            }
        } else if (c == delimiter && !in_quotes) {
            result.push_back(quoted ? current : trim(current));
            current.clear();
            quoted = false;
        } else {
            current += c;
        }
    }

    result.push_back(quoted ? current : trim(current));
    return result;
}

} // anonymous namespace

char detectDelimiter(const std::vector<std::string>& lines) {
    std::array<char, 4> candidates = {',', ';', '\t', '|'};
    std::array<int, 4> counts = {0, 0, 0, 0};

    for (const auto& line : lines) {
        for (size_t i = 0; i < candidates.size(); ++i) {
            counts[i] += static_cast<int>(std::count(line.begin(), line.end(), candidates[i]));
        }
    }

    // Одинаковое количество в каждой строке
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (counts[i] == 0) continue;

        int expected_count = -1;
        bool consistent = true;
        for (const auto& line : lines) {
            int count = static_cast<int>(std::count(line.begin(), line.end(), candidates[i]));
            if (expected_count < 0) {
                expected_count = count;
            } else if (count != expected_count) {
                consistent = false;
                break;
            }
        }

        if (consistent && expected_count > 0) {
            return candidates[i];
        }
    }

    size_t best = 0;
    for (size_t i = 1; i < candidates.size(); ++i) {
        if (counts[i] > counts[best]) {
            best = i;
        }
    }
    return candidates[best];
}

RecordTable parseCsvTable(std::string_view content,
                          const std::string& table_name,
                          std::optional<char> delimiter) {
    auto records = splitRecords(stripBom(content));
    records.erase(std::remove_if(records.begin(), records.end(), [](const auto& record) {
        return trim(record.second).empty();
    }), records.end());

    if (records.empty()) {
        throw CsvReadError("Таблица " + table_name + " пуста: нет строки заголовка");
    }

    char sep = ',';
    if (delimiter) {
        sep = *delimiter;
    } else {
        std::vector<std::string> sample;
        for (size_t i = 0; i < records.size() && i < 20; ++i) {
            sample.push_back(records[i].second);
        }
        sep = detectDelimiter(sample);
    }

    RecordTable table;
    table.name = table_name;
    table.columns = splitLine(records.front().second, sep);
    table.rows.reserve(records.size() - 1);

    for (size_t i = 1; i < records.size(); ++i) {
        auto fields = splitLine(records[i].second, sep);
        if (fields.size() > table.columns.size()) {
            throw CsvReadError("Таблица " + table_name + ": полей больше, чем колонок в заголовке (" +
                               std::to_string(fields.size()) + " > " +
                               std::to_string(table.columns.size()) + ")", records[i].first);
        }
        table.rows.push_back(std::move(fields));
    }
    return table;
}

RecordTable readCsvTable(const std::filesystem::path& path, const CsvReadOptions& options) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw CsvReadError("Не удалось открыть файл: " + path.string());
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    auto name = options.table_name.empty() ? path.stem().string() : options.table_name;
    return parseCsvTable(buffer.str(), name, options.delimiter);
}

} // namespace wellboard::io
