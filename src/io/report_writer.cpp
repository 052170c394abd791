/**
 * @file report_writer.cpp
 * @brief Экспорт отчёта по скважине
 */

#include "report_writer.hpp"
#include "file_utils.hpp"
#include <nlohmann/json.hpp>
#include <iomanip>
#include <sstream>

namespace hydrovol::io {
namespace {

using namespace hydrovol::core;
using json = nlohmann::json;

std::string fixed(double value, int precision = 2) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string cell(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '|') {
            out += "\\|";
        } else if (c == '\n') {
            out += ' ';
        } else {
            out += c;
        }
    }
    return out.empty() ? std::string("-") : out;
}

void writeLayerTable(std::ostringstream& out, const std::vector<LayerSummary>& layers) {
    out << "| Слой | Кровля MD (м) | Подошва MD (м) | TVD (м) | ρ (кг/м³) | Объём (м³) |\n";
    out << "|------|---------------|----------------|---------|-----------|------------|\n";
    for (const auto& s : layers) {
        out << "| " << cell(s.layer.name)
            << " | " << fixed(s.layer.top.value, 1)
            << " | " << fixed(s.layer.bottom.value, 1)
            << " | " << fixed(s.tvd_top_m, 1) << "-" << fixed(s.tvd_bottom_m, 1)
            << " | " << fixed(s.layer.density_kgm3, 0)
            << " | " << fixed(s.volume_m3, 3)
            << " |\n";
    }
    out << "\n";
}

void writeBreakdown(std::ostringstream& out, const VolumeBreakdown& v) {
    out << "| Величина | Объём (м³) | На метр (м³/м) |\n";
    out << "|----------|------------|----------------|\n";
    out << "| Затрубье с колонной | " << fixed(v.annular_with_pipe, 3) << " | " << fixed(v.annularPerMeter(), 5) << " |\n";
    out << "| Вместимость колонны | " << fixed(v.string_capacity, 3) << " | " << fixed(v.capacityPerMeter(), 5) << " |\n";
    out << "| Вытеснение по OD | " << fixed(v.string_displacement, 3) << " | " << fixed(v.displacementPerMeter(), 5) << " |\n";
    out << "| Металл колонны | " << fixed(v.string_metal, 3) << " | " << fixed(v.metalPerMeter(), 5) << " |\n";
    out << "| Открытый ствол | " << fixed(v.open_hole, 3) << " | " << fixed(v.openHolePerMeter(), 5) << " |\n\n";
}

json breakdownToJson(const VolumeBreakdown& v) {
    return {
        {"length", v.length_m},
        {"annular_with_pipe", v.annular_with_pipe},
        {"string_capacity", v.string_capacity},
        {"string_displacement", v.string_displacement},
        {"string_metal", v.string_metal},
        {"open_hole", v.open_hole}
    };
}

json layersToJson(const std::vector<LayerSummary>& layers) {
    json arr = json::array();
    for (const auto& s : layers) {
        arr.push_back({
            {"name", s.layer.name},
            {"top", s.layer.top.value},
            {"bottom", s.layer.bottom.value},
            {"tvd_top", s.tvd_top_m},
            {"tvd_bottom", s.tvd_bottom_m},
            {"density", s.layer.density_kgm3},
            {"color", s.layer.color.toHex()},
            {"volume", s.volume_m3}
        });
    }
    return arr;
}

json buildJson(const WellReport& report) {
    json j;
    j["well"] = report.well_name;
    j["max_depth"] = report.max_depth_m;

    j["pipes"] = json::array();
    for (const auto& p : report.pipes) {
        j["pipes"].push_back({
            {"name", p.name},
            {"top", p.top_m},
            {"bottom", p.bottom_m},
            {"capacity_per_m", p.capacity_m3_per_m},
            {"displacement_per_m", p.displacement_m3_per_m},
            {"metal_per_m", p.metal_m3_per_m},
            {"weight_kdan_per_m", p.weight_kdan_per_m}
        });
    }

    j["slices"] = json::array();
    for (const auto& s : report.slices) {
        j["slices"].push_back({
            {"top", s.top.value},
            {"bottom", s.bottom.value},
            {"area", s.area_m2},
            {"volume", s.volume_m3}
        });
    }

    j["totals"] = breakdownToJson(report.totals);
    j["identity_residual"] = report.identity_residual_m3;

    if (report.interval.has_value()) {
        const auto& iv = *report.interval;
        j["interval"] = {
            {"top", iv.top_m},
            {"bottom", iv.bottom_m},
            {"volumes", breakdownToJson(iv.volumes)},
            {"plug", {
                {"length", iv.plug.length_m},
                {"total", iv.plug.total_m3},
                {"annular", iv.plug.annular_m3},
                {"string", iv.plug.string_m3},
                {"mud_top", iv.plug.mud_top_m},
                {"converged", iv.plug.converged}
            }}
        };
    } else {
        j["interval"] = nullptr;
    }

    j["trajectory_method"] = toString(report.trajectory_method);
    j["surveys"] = json::array();
    for (const auto& s : report.surveys) {
        j["surveys"].push_back({
            {"md", s.md.value},
            {"inc", s.inclination.value},
            {"azi", s.azimuth.value},
            {"tvd", s.tvd.has_value() ? json(s.tvd->value) : json(nullptr)}
        });
    }

    j["layers"] = {
        {"rebuilt", report.layers_rebuilt},
        {"steps_overlap", report.steps_overlap},
        {"string", layersToJson(report.string_layers)},
        {"annulus", layersToJson(report.annulus_layers)}
    };

    j["pressure"] = {
        {"md", report.pressure.md_m},
        {"tvd", report.pressure.tvd_m},
        {"annulus_kpa", report.pressure.annulus_kpa},
        {"string_kpa", report.pressure.string_kpa},
        {"differential_kpa", report.pressure.differentialKpa()}
    };

    const auto& cv = report.circulation;
    j["circulation"] = {
        {"string_capacity", cv.string_capacity},
        {"string_displacement", cv.string_displacement},
        {"string_wet", cv.string_wet},
        {"annular_with_pipe", cv.annular_with_pipe},
        {"open_hole", cv.open_hole},
        {"tanks", cv.tanks},
        {"surface_lines", cv.surface_lines},
        {"total", cv.total}
    };

    if (report.barite.has_value()) {
        j["barite"] = {
            {"target_density", report.target_density_kgm3.value_or(0.0)},
            {"density_increase", report.barite->density_increase_kgm3},
            {"kg_per_m3", report.barite->kg_per_m3},
            {"total_kg", report.barite->total_kg},
            {"sacks", report.barite->sacks}
        };
    } else {
        j["barite"] = nullptr;
    }

    j["validation"]["errors"] = json::array();
    for (const auto& e : report.validation.errors) {
        j["validation"]["errors"].push_back(e.toString());
    }
    j["validation"]["warnings"] = report.validation.warnings;

    return j;
}

const char* passMark(bool passed) {
    return passed ? "OK" : "FAIL";
}

void writeCheckValues(std::ostringstream& out, const std::vector<CheckValue>& values) {
    out << "| Величина | Расчёт | Эталон | Отклонение | Допуск | |\n";
    out << "|----------|--------|--------|------------|--------|-|\n";
    for (const auto& v : values) {
        std::string unit = v.unit.empty() ? std::string() : " " + v.unit;
        out << "| " << cell(v.name)
            << " | " << fixed(v.actual, 6) << unit
            << " | " << fixed(v.expected, 6) << unit
            << " | " << std::scientific << std::setprecision(2) << v.deviation() << std::defaultfloat
            << " | " << std::scientific << std::setprecision(1) << v.tolerance << std::defaultfloat
            << " | " << passMark(v.withinTolerance())
            << " |\n";
    }
    out << "\n";
}

json diagnosticsJson(const DiagnosticsReport& report) {
    json j;
    j["build"] = {
        {"version", report.build.version},
        {"build_type", report.build.build_type},
        {"platform", report.build.platform}
    };
    j["timestamp"] = report.timestamp;
    j["artifacts_dir"] = report.artifacts_dir.string();
    j["passed"] = report.passed();
    j["failed"] = report.failedCount();

    j["checks"] = json::array();
    for (const auto& check : report.checks) {
        json values = json::array();
        for (const auto& v : check.values) {
            values.push_back({
                {"name", v.name},
                {"unit", v.unit},
                {"actual", v.actual},
                {"expected", v.expected},
                {"tolerance", v.tolerance},
                {"passed", v.withinTolerance()}
            });
        }
        j["checks"].push_back({
            {"id", check.id},
            {"title", check.title},
            {"passed", check.passed()},
            {"values", values},
            {"errors", check.errors},
            {"note", check.note}
        });
    }
    return j;
}

} // namespace

std::string wellReportToMarkdown(const WellReport& report) {
    std::ostringstream out;
    out << "# Объёмы и давления: " << report.well_name << "\n\n";
    out << "- Максимальная глубина: " << fixed(report.max_depth_m, 1) << " м\n";
    out << "- Срезов геометрии: " << report.slices.size() << "\n";
    out << "- Невязка баланса объёмов: " << fixed(report.identity_residual_m3, 4) << " м³\n\n";

    if (report.validation.hasErrors() || report.validation.hasWarnings()) {
        out << "## Замечания\n";
        for (const auto& e : report.validation.errors) {
            out << "- Ошибка: " << e.toString() << "\n";
        }
        for (const auto& w : report.validation.warnings) {
            out << "- " << w << "\n";
        }
        out << "\n";
    }

    if (!report.pipes.empty()) {
        out << "## Колонна\n";
        out << "| Секция | Кровля (м) | Подошва (м) | Вместимость (м³/м) | Вытеснение (м³/м) | Металл (м³/м) | Вес (кДаН/м) |\n";
        out << "|--------|------------|-------------|--------------------|-------------------|---------------|--------------|\n";
        for (const auto& p : report.pipes) {
            out << "| " << cell(p.name)
                << " | " << fixed(p.top_m, 1)
                << " | " << fixed(p.bottom_m, 1)
                << " | " << fixed(p.capacity_m3_per_m, 5)
                << " | " << fixed(p.displacement_m3_per_m, 5)
                << " | " << fixed(p.metal_m3_per_m, 5)
                << " | " << fixed(p.weight_kdan_per_m, 4)
                << " |\n";
        }
        out << "\n";
    }

    out << "## Объёмы по скважине\n";
    writeBreakdown(out, report.totals);

    if (report.interval.has_value()) {
        const auto& iv = *report.interval;
        out << "## Интервал " << fixed(iv.top_m, 1) << "-" << fixed(iv.bottom_m, 1) << " м\n";
        writeBreakdown(out, iv.volumes);
        out << "### Равнообъёмная пачка\n";
        if (iv.plug.converged) {
            out << "- Длина при спущенной колонне: " << fixed(iv.plug.length_m, 2) << " м\n";
        } else {
            out << "- Объёма колонны и затрубья недостаточно, приведён целевой интервал\n";
        }
        out << "- Кровля пачки: " << fixed(iv.plug.mud_top_m, 2) << " м\n";
        out << "- Объём: " << fixed(iv.plug.total_m3, 3) << " м³ (затрубье "
            << fixed(iv.plug.annular_m3, 3) << ", колонна " << fixed(iv.plug.string_m3, 3) << ")\n\n";
    }

    out << "## Слои в затрубье" << (report.layers_rebuilt ? "" : " (сохранённые)") << "\n";
    writeLayerTable(out, report.annulus_layers);
    out << "## Слои в колонне" << (report.layers_rebuilt ? "" : " (сохранённые)") << "\n";
    writeLayerTable(out, report.string_layers);

    const auto& p = report.pressure;
    out << "## Гидростатика\n";
    out << "- Глубина: MD " << fixed(p.md_m, 1) << " м, TVD " << fixed(p.tvd_m, 1) << " м\n";
    out << "- Затрубье: " << fixed(p.annulus_kpa, 1) << " кПа (ЭЦП "
        << fixed(p.annulusEquivalentDensity(), 0) << " кг/м³)\n";
    out << "- Колонна: " << fixed(p.string_kpa, 1) << " кПа (ЭЦП "
        << fixed(p.stringEquivalentDensity(), 0) << " кг/м³)\n";
    out << "- Перепад затрубье − колонна: " << fixed(p.differentialKpa(), 1) << " кПа\n\n";

    const auto& cv = report.circulation;
    out << "## Объём в циркуляции\n";
    out << "- Колонна: " << fixed(cv.string_capacity, 3) << " м³\n";
    out << "- Затрубье: " << fixed(cv.annular_with_pipe, 3) << " м³\n";
    out << "- Ёмкости: " << fixed(cv.tanks, 3) << " м³\n";
    out << "- Обвязка: " << fixed(cv.surface_lines, 3) << " м³\n";
    out << "- Итого: " << fixed(cv.total, 3) << " м³\n\n";

    if (report.barite.has_value()) {
        const auto& b = *report.barite;
        out << "## Утяжеление до " << fixed(report.target_density_kgm3.value_or(0.0), 0) << " кг/м³\n";
        out << "- Прирост плотности: " << fixed(b.density_increase_kgm3, 0) << " кг/м³\n";
        out << "- Барит: " << fixed(b.kg_per_m3, 1) << " кг/м³, всего " << fixed(b.total_kg, 0)
            << " кг (" << b.sacks << " меш.)\n\n";
    }

    return out.str();
}

std::string wellReportToJson(const WellReport& report, int indent) {
    return buildJson(report).dump(indent);
}

ReportExportResult writeWellReport(
    const WellReport& report,
    const std::filesystem::path& output_dir
) {
    ReportExportResult result;
    result.markdown_path = output_dir / "report.md";
    result.json_path = output_dir / "report.json";

    atomicWrite(result.markdown_path, wellReportToMarkdown(report));
    atomicWrite(result.json_path, wellReportToJson(report));
    return result;
}

std::string diagnosticsToMarkdown(const DiagnosticsReport& report) {
    std::ostringstream out;
    out << "# Самопроверка HydroVol " << report.build.version << "\n\n";
    out << "- Сборка: " << report.build.build_type << ", " << report.build.platform << "\n";
    out << "- Время: " << report.timestamp << "\n";
    out << "- Каталог: " << report.artifacts_dir.string() << "\n";
    out << "- Итог: " << passMark(report.passed()) << " (не пройдено "
        << report.failedCount() << " из " << report.checks.size() << ")\n\n";

    for (const auto& check : report.checks) {
        out << "## " << check.title << " [" << check.id << "]: " << passMark(check.passed()) << "\n";
        if (!check.note.empty()) {
            out << check.note << "\n";
        }
        out << "\n";
        if (!check.values.empty()) {
            writeCheckValues(out, check.values);
        }
        for (const auto& e : check.errors) {
            out << "- Ошибка: " << e << "\n";
        }
        if (!check.errors.empty()) {
            out << "\n";
        }
    }
    return out.str();
}

std::string diagnosticsToJson(const DiagnosticsReport& report, int indent) {
    return diagnosticsJson(report).dump(indent);
}

ReportExportResult writeDiagnosticsReport(
    const DiagnosticsReport& report,
    const std::filesystem::path& output_dir
) {
    ReportExportResult result;
    result.markdown_path = output_dir / "report.md";
    result.json_path = output_dir / "report.json";

    atomicWrite(result.markdown_path, diagnosticsToMarkdown(report));
    atomicWrite(result.json_path, diagnosticsToJson(report));
    return result;
}

} // namespace hydrovol::io
