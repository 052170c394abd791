/**
 * @file survey_csv_reader.hpp
 * @brief Импорт инклинометрии из CSV
 *
 * Формат: md, inc, azi[, tvd]. Разделитель ',', ';' или табуляция
 * (определяется автоматически), необязательная строка заголовка,
 * строки-комментарии начинаются с '#'.
 */

#pragma once

#include "model/survey.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>

namespace hydrovol::io {

using namespace hydrovol::model;

/**
 * @brief Ошибка импорта инклинометрии
 */
class SurveyImportError : public std::runtime_error {
public:
    SurveyImportError(const std::string& message, size_t line = 0)
        : std::runtime_error(message)
        , line_(line) {}

    /// Номер строки файла (1-based), 0 если не относится к строке
    [[nodiscard]] size_t line() const noexcept { return line_; }

private:
    size_t line_;
};

/**
 * @brief Чтение станций инклинометрии из CSV-текста
 *
 * Если есть заголовок, колонки сопоставляются по названиям
 * (md/depth/глубина, inc/inclination/зенит, azi/azimuth/азимут, tvd);
 * иначе порядок колонок фиксирован: md, inc, azi, tvd.
 * При разделителе ';' допускается десятичная запятая.
 *
 * @throws SurveyImportError При отсутствии обязательных колонок или нечисловом значении
 */
[[nodiscard]] SurveyList parseSurveyCsv(const std::string& content);

/**
 * @brief Чтение станций инклинометрии из CSV-файла
 * @throws SurveyImportError При ошибке чтения или разбора
 */
[[nodiscard]] SurveyList readSurveyCsv(const std::filesystem::path& path);

} // namespace hydrovol::io
