/**
 * @file survey_csv_reader.cpp
 * @brief Реализация импорта инклинометрии из CSV
 */

#include "survey_csv_reader.hpp"
#include "file_utils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <limits>
#include <optional>
#include <sstream>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hydrovol::io {

namespace {

enum class SurveyField { Md, Inclination, Azimuth, Tvd };

// Словарь алиасов для сопоставления колонок
const std::unordered_map<std::string, SurveyField> kFieldAliases = {
    {"md", SurveyField::Md}, {"depth", SurveyField::Md}, {"measured_depth", SurveyField::Md},
    {"dept", SurveyField::Md}, {"глубина", SurveyField::Md}, {"Глубина", SurveyField::Md},

    {"inc", SurveyField::Inclination}, {"incl", SurveyField::Inclination},
    {"inclination", SurveyField::Inclination}, {"зенит", SurveyField::Inclination},
    {"Зенит", SurveyField::Inclination},

    {"azi", SurveyField::Azimuth}, {"az", SurveyField::Azimuth}, {"azim", SurveyField::Azimuth},
    {"azimuth", SurveyField::Azimuth}, {"азимут", SurveyField::Azimuth},
    {"Азимут", SurveyField::Azimuth},

    {"tvd", SurveyField::Tvd}, {"true_vertical_depth", SurveyField::Tvd},
    {"вертикаль", SurveyField::Tvd}, {"Вертикаль", SurveyField::Tvd}
};

struct ColumnMap {
    size_t md = 0;
    size_t inc = 1;
    size_t azi = 2;
    std::optional<size_t> tvd = 3;
};

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

std::string stripBom(std::string_view str) {
    if (str.size() >= 3 &&
        static_cast<unsigned char>(str[0]) == 0xEF &&
        static_cast<unsigned char>(str[1]) == 0xBB &&
        static_cast<unsigned char>(str[2]) == 0xBF) {
        return std::string(str.substr(3));
    }
    return std::string(str);
}

std::string normalizeHeaderToken(std::string_view value) {
    std::string token = trim(value);
    // Единицы в скобках отбрасываются: "MD (m)" -> "md"
    auto paren = token.find('(');
    if (paren != std::string::npos) {
        token = trim(std::string_view(token).substr(0, paren));
    }
    std::string normalized;
    normalized.reserve(token.size());
    for (char ch : token) {
        auto c = static_cast<unsigned char>(ch);
        if (c == ' ' || c == '-') {
            normalized += '_';
        } else {
            normalized += static_cast<char>(c < 0x80 ? std::tolower(c) : c);
        }
    }
    return normalized;
}

std::vector<std::string> splitLine(std::string_view line, char delimiter) {
    std::vector<std::string> result;
    std::string current;
    bool in_quotes = false;

    for (char c : line) {
        if (c == '"') {
            in_quotes = !in_quotes;
        } else if (c == delimiter && !in_quotes) {
            result.push_back(trim(current));
            current.clear();
        } else {
            current += c;
        }
    }

    result.push_back(trim(current));
    return result;
}

std::optional<double> parseNumber(const std::string& str, bool decimal_comma) {
    if (str.empty()) {
        return std::nullopt;
    }

    std::string normalized = str;
    if (decimal_comma) {
        std::replace(normalized.begin(), normalized.end(), ',', '.');
    }

    try {
        size_t pos = 0;
        double value = std::stod(normalized, &pos);
        if (pos != normalized.size() || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

char detectDelimiter(const std::vector<std::string>& lines) {
    constexpr std::array<char, 3> candidates = {'\t', ';', ','};
    for (char c : candidates) {
        bool everywhere = !lines.empty() && std::all_of(lines.begin(), lines.end(), [c](const std::string& l) {
            return l.find(c) != std::string::npos;
        });
        if (everywhere) {
            return c;
        }
    }
    return ',';
}

ColumnMap mapHeader(const std::vector<std::string>& header, size_t line_no) {
    std::optional<size_t> md;
    std::optional<size_t> inc;
    std::optional<size_t> azi;
    std::optional<size_t> tvd;

    for (size_t i = 0; i < header.size(); ++i) {
        auto it = kFieldAliases.find(normalizeHeaderToken(header[i]));
        if (it == kFieldAliases.end()) {
            continue;
        }
        switch (it->second) {
            case SurveyField::Md: if (!md) md = i; break;
            case SurveyField::Inclination: if (!inc) inc = i; break;
            case SurveyField::Azimuth: if (!azi) azi = i; break;
            case SurveyField::Tvd: if (!tvd) tvd = i; break;
        }
    }

    if (!md || !inc) {
        throw SurveyImportError("В заголовке нет обязательных колонок md и inc", line_no);
    }

    ColumnMap map;
    map.md = *md;
    map.inc = *inc;
    map.azi = azi.value_or(std::numeric_limits<size_t>::max());
    map.tvd = tvd;
    return map;
}

} // namespace

SurveyList parseSurveyCsv(const std::string& content) {
    // Значимые строки с номерами в исходном тексте
    std::vector<std::string> lines;
    std::vector<size_t> line_numbers;
    {
        std::istringstream iss(stripBom(content));
        std::string raw;
        size_t number = 0;
        while (std::getline(iss, raw)) {
            ++number;
            if (!raw.empty() && raw.back() == '\r') {
                raw.pop_back();
            }
            auto line = trim(raw);
            if (line.empty() || line.front() == '#') {
                continue;
            }
            lines.push_back(line);
            line_numbers.push_back(number);
        }
    }

    SurveyList stations;
    if (lines.empty()) {
        return stations;
    }

    const char delimiter = detectDelimiter(lines);
    const bool decimal_comma = delimiter == ';' || delimiter == '\t';

    ColumnMap columns;
    size_t first_data = 0;
    auto first = splitLine(lines.front(), delimiter);
    if (!first.empty() && !parseNumber(first.front(), decimal_comma).has_value()) {
        columns = mapHeader(first, line_numbers.front());
        first_data = 1;
    }

    for (size_t i = first_data; i < lines.size(); ++i) {
        auto fields = splitLine(lines[i], delimiter);
        size_t line_no = line_numbers[i];

        auto field = [&fields](size_t idx) -> std::string {
            return idx < fields.size() ? fields[idx] : std::string();
        };

        auto md = parseNumber(field(columns.md), decimal_comma);
        auto inc = parseNumber(field(columns.inc), decimal_comma);
        if (!md.has_value()) {
            throw SurveyImportError("Строка " + std::to_string(line_no) +
                                    ": некорректная глубина \"" + field(columns.md) + "\"", line_no);
        }
        if (!inc.has_value()) {
            throw SurveyImportError("Строка " + std::to_string(line_no) +
                                    ": некорректный зенитный угол \"" + field(columns.inc) + "\"", line_no);
        }

        // Пустой азимут допустим (вертикальный участок), нечисловой - нет
        double azi = 0.0;
        std::string azi_text = field(columns.azi);
        if (!azi_text.empty()) {
            auto parsed = parseNumber(azi_text, decimal_comma);
            if (!parsed.has_value()) {
                throw SurveyImportError("Строка " + std::to_string(line_no) +
                                        ": некорректный азимут \"" + azi_text + "\"", line_no);
            }
            azi = *parsed;
        }

        SurveyStation station(Meters{*md}, Degrees{*inc}, Degrees{azi});
        if (columns.tvd.has_value()) {
            std::string tvd_text = field(*columns.tvd);
            if (!tvd_text.empty()) {
                auto tvd = parseNumber(tvd_text, decimal_comma);
                if (!tvd.has_value()) {
                    throw SurveyImportError("Строка " + std::to_string(line_no) +
                                            ": некорректная вертикальная глубина \"" + tvd_text + "\"", line_no);
                }
                station.tvd = Meters{*tvd};
            }
        }
        stations.push_back(station);
    }

    return stations;
}

SurveyList readSurveyCsv(const std::filesystem::path& path) {
    std::string content;
    try {
        content = readTextFile(path);
    } catch (const std::runtime_error& e) {
        throw SurveyImportError(e.what());
    }
    return parseSurveyCsv(content);
}

} // namespace hydrovol::io
