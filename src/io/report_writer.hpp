/**
 * @file report_writer.hpp
 * @brief Экспорт отчётов по скважине и самопроверки (Markdown и JSON)
 */

#pragma once

#include "core/diagnostics.hpp"
#include "core/well_analysis.hpp"
#include <filesystem>
#include <string>

namespace hydrovol::io {

struct ReportExportResult {
    std::filesystem::path markdown_path;
    std::filesystem::path json_path;
};

/**
 * @brief Отчёт в формате Markdown
 */
[[nodiscard]] std::string wellReportToMarkdown(const hydrovol::core::WellReport& report);

/**
 * @brief Отчёт в формате JSON (с отступами)
 */
[[nodiscard]] std::string wellReportToJson(const hydrovol::core::WellReport& report, int indent = 2);

/**
 * @brief Записать report.md и report.json в каталог (атомарно).
 */
ReportExportResult writeWellReport(
    const hydrovol::core::WellReport& report,
    const std::filesystem::path& output_dir
);

/**
 * @brief Отчёт самопроверки: по каждой проверке таблица величин с эталоном и отклонением
 */
[[nodiscard]] std::string diagnosticsToMarkdown(const hydrovol::core::DiagnosticsReport& report);

[[nodiscard]] std::string diagnosticsToJson(const hydrovol::core::DiagnosticsReport& report, int indent = 2);

ReportExportResult writeDiagnosticsReport(
    const hydrovol::core::DiagnosticsReport& report,
    const std::filesystem::path& output_dir
);

} // namespace hydrovol::io
