/**
 * @file diagnostics_runner.hpp
 * @brief Запуск диагностики из CLI
 */

#pragma once

#include "core/diagnostics.hpp"
#include <filesystem>

namespace hydrovol::app {

struct DiagnosticsCommandResult {
    int exit_code = 1;
    std::filesystem::path output_dir;
    hydrovol::core::DiagnosticsReport report;
};

/**
 * @brief Выполнить самопроверку и сохранить отчёты в каталог.
 * @param output_dir Каталог артефактов (report.md/json, logs/)
 * @return exit_code 0, если все проверки пройдены
 */
DiagnosticsCommandResult runDiagnosticsCommand(const std::filesystem::path& output_dir);

} // namespace hydrovol::app
