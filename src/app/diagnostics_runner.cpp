/**
 * @file diagnostics_runner.cpp
 * @brief Запуск диагностики
 */

#include "diagnostics_runner.hpp"
#include "io/report_writer.hpp"

namespace hydrovol::app {

DiagnosticsCommandResult runDiagnosticsCommand(const std::filesystem::path& output_dir) {
    DiagnosticsCommandResult result;
    result.output_dir = output_dir;
    std::filesystem::create_directories(output_dir);

    core::DiagnosticsOptions options;
    options.artifacts_dir = output_dir;

    result.report = core::buildDiagnosticsReport(options);
    io::writeDiagnosticsReport(result.report, output_dir);

    result.exit_code = result.report.passed() ? 0 : 1;
    return result;
}

} // namespace hydrovol::app
