/**
 * @file well_command.cpp
 * @brief Команды CLI для файла скважины
 */

#include "well_command.hpp"
#include "core/fluid_overlay.hpp"
#include "io/report_writer.hpp"
#include "io/survey_csv_reader.hpp"
#include "io/well_io.hpp"
#include <iomanip>
#include <ostream>

namespace hydrovol::app {

using namespace hydrovol::model;

namespace {

void printSummary(const core::WellReport& report, std::ostream& out) {
    auto flags = out.flags();
    out << std::fixed << std::setprecision(3);
    out << "Скважина: " << report.well_name << "\n";
    out << "  Глубина: " << report.max_depth_m << " м, срезов: " << report.slices.size() << "\n";
    out << "  Затрубье: " << report.totals.annular_with_pipe << " м³, колонна: "
        << report.totals.string_capacity << " м³, открытый ствол: " << report.totals.open_hole << " м³\n";
    if (report.interval.has_value()) {
        const auto& iv = *report.interval;
        out << "  Интервал " << iv.top_m << "-" << iv.bottom_m << " м: открытый ствол "
            << iv.volumes.open_hole << " м³, пачка при спущенной колонне "
            << iv.plug.length_m << " м (кровля " << iv.plug.mud_top_m << " м)\n";
    }
    out << std::setprecision(1);
    out << "  Давление на MD " << report.pressure.md_m << " м (TVD " << report.pressure.tvd_m
        << " м): затрубье " << report.pressure.annulus_kpa << " кПа, колонна "
        << report.pressure.string_kpa << " кПа, перепад " << report.pressure.differentialKpa() << " кПа\n";
    out << std::setprecision(3);
    out << "  В циркуляции: " << report.circulation.total << " м³\n";
    if (report.barite.has_value()) {
        out << "  Барит: " << report.barite->total_kg << " кг (" << report.barite->sacks << " меш.)\n";
    }
    out.flags(flags);
}

} // namespace

WellCommandResult runWellCommand(const WellCommandOptions& options, std::ostream& out, std::ostream& err) {
    WellCommandResult result;

    Well well = io::loadWell(options.well_path);
    if (options.survey_path.has_value()) {
        well.surveys = io::readSurveyCsv(*options.survey_path);
    }

    auto report = core::analyzeWell(well, options.analysis);

    for (const auto& e : report.validation.errors) {
        err << (options.strict ? "Ошибка: " : "Предупреждение: ") << e.toString() << "\n";
    }
    for (const auto& w : report.validation.warnings) {
        err << "Предупреждение: " << w << "\n";
    }
    if (options.strict && report.validation.hasErrors()) {
        err << "Расчёт прерван: геометрия скважины содержит ошибки (--strict)\n";
        result.exit_code = 1;
        return result;
    }

    printSummary(report, out);

    if (options.output_dir.has_value()) {
        auto files = io::writeWellReport(report, *options.output_dir);
        out << "Отчёт сохранён: " << files.markdown_path.string() << ", "
            << files.json_path.string() << "\n";
    }

    result.report = std::move(report);
    result.exit_code = 0;
    return result;
}

int runRebuildLayersCommand(const std::filesystem::path& input,
                            const std::optional<std::filesystem::path>& output,
                            std::ostream& out) {
    Well well = io::loadWell(input);
    well.layers = core::rebuildLayers(well.mud_steps, well.maxDepth(),
                                      well.settings.base_string_density_kgm3,
                                      well.settings.base_annulus_density_kgm3);

    auto target = output.value_or(input);
    io::saveWell(well, target);

    out << "Слои пересобраны по " << well.mud_steps.size() << " пачкам: затрубье "
        << well.layers.annulus.size() << ", колонна " << well.layers.string.size()
        << ". Файл: " << target.string() << "\n";
    return 0;
}

} // namespace hydrovol::app
