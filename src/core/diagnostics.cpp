/**
 * @file diagnostics.cpp
 * @brief Реализация диагностических проверок ядра
 */

#include "diagnostics.hpp"
#include "fluid_overlay.hpp"
#include "geometry.hpp"
#include "hydrostatic.hpp"
#include "volumes.hpp"
#include "well_analysis.hpp"
#include <chrono>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iterator>
#include <numbers>
#include <string>

namespace hydrovol::core {
namespace {

using namespace hydrovol::model;

std::string isoTimestampNow() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return std::string(buf);
}

std::string detectPlatform() {
#if defined(_WIN32)
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

DiagnosticCheck makeFilesystemCheck(const std::filesystem::path& artifacts_dir) {
    DiagnosticCheck check;
    check.id = "filesystem";
    check.title = "Запись и чтение на диске";

    const auto check_path = artifacts_dir / "logs" / "fs_check.txt";
    const std::string payload = "hydrovol diagnostics";
    try {
        std::filesystem::create_directories(check_path.parent_path());
        {
            std::ofstream ofs(check_path, std::ios::binary);
            ofs << payload;
        }
        std::ifstream ifs(check_path, std::ios::binary);
        std::string read_back((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
        if (read_back != payload) {
            check.errors.push_back("Прочитано не то, что записано: " + check_path.string());
        }
        check.note = "logs/fs_check.txt";
    } catch (const std::exception& ex) {
        check.errors.push_back(std::string("Ошибка файловой системы: ") + ex.what());
    }
    return check;
}

/// Кондуктор 340 мм до 500 м, открытый ствол 311 мм до 2500 м, СБТ 127 до забоя
Well makeSampleWell() {
    Well well;
    well.name = "DIAG-SAMPLE";
    well.annuli.emplace_back("Кондуктор", Meters{0.0}, Meters{500.0}, Meters{0.340}, true);
    well.annuli.emplace_back("Открытый ствол", Meters{500.0}, Meters{2000.0}, Meters{0.311});
    well.pipes.emplace_back("СБТ 127", Meters{0.0}, Meters{2500.0}, Meters{0.0953}, Meters{0.127});
    return well;
}

double area(double diameter) {
    return std::numbers::pi * diameter * diameter / 4.0;
}

DiagnosticCheck makeVolumesCheck() {
    DiagnosticCheck check;
    check.id = "reference_volumes";
    check.title = "Объёмы эталонной скважины";

    auto well = makeSampleWell();
    constexpr double tol = 1e-6;

    auto full = volumesBetween(well.pipes, well.annuli, Meters{0.0}, Meters{2500.0});
    auto open_hole = volumesBetween(well.pipes, well.annuli, Meters{500.0}, Meters{2500.0});
    auto shoe = volumesBetween(well.pipes, well.annuli, Meters{0.0}, Meters{500.0});

    check.expect("Вместимость колонны 0-2500", "м³", full.string_capacity, area(0.0953) * 2500.0, tol);
    check.expect("Открытый ствол 500-2500", "м³", open_hole.open_hole, area(0.311) * 2000.0, tol);
    check.expect("Затрубье 0-500", "м³", shoe.annular_with_pipe, (area(0.340) - area(0.127)) * 500.0, tol);
    check.expect("Невязка баланса 0-2500", "м³", identityCheck(full), 0.0, tol);
    return check;
}

DiagnosticCheck makeOverlayCheck() {
    DiagnosticCheck check;
    check.id = "overlay";
    check.title = "Наложение пачки на базовый слой";

    LayerList layers{baseLayer(Domain::Annulus, Meters{1000.0}, 1200.0)};
    FluidLayer pill;
    pill.domain = Domain::Annulus;
    pill.top = Meters{100.0};
    pill.bottom = Meters{200.0};
    pill.name = "Пачка";
    pill.density_kgm3 = 1500.0;
    layers = overlayStep(layers, pill);

    check.expect("Число слоёв", "", static_cast<double>(layers.size()), 3.0, 0.0);
    check.expect("Покрытая длина", "м", coveredLength(layers), 1000.0, kDepthEpsilon);
    for (size_t i = 1; i < layers.size(); ++i) {
        if (std::abs(layers[i].top.value - layers[i - 1].bottom.value) > kDepthEpsilon) {
            check.errors.push_back("Разрыв или наложение слоёв на " +
                                   std::to_string(layers[i - 1].bottom.value) + " м");
        }
    }
    if (layers.size() == 3) {
        check.expect("Подошва пачки", "м", layers[1].bottom.value, 200.0, kDepthEpsilon);
        check.expect("Плотность пачки", "кг/м³", layers[1].density_kgm3, 1500.0, 0.0);
        check.expect("Плотность под пачкой", "кг/м³", layers[2].density_kgm3, 1200.0, 0.0);
    }
    check.note = std::to_string(layers.size()) + " слоя на [0, 1000] м";
    return check;
}

DiagnosticCheck makeHydrostaticCheck() {
    DiagnosticCheck check;
    check.id = "hydrostatic";
    check.title = "Гидростатика наклонной скважины";

    auto well = makeSampleWell();
    well.surveys = {
        SurveyStation(Meters{0.0}, Degrees{0.0}, Degrees{0.0}),
        SurveyStation(Meters{1000.0}, Degrees{0.0}, Degrees{0.0}),
        SurveyStation(Meters{2500.0}, Degrees{30.0}, Degrees{45.0}),
    };
    well.settings.pressure_depth = Meters{2500.0};
    const double rho = well.settings.base_annulus_density_kgm3;

    auto report = analyzeWell(well);
    double shallow = hydrostaticPressure(report.layers.annulus,
                                         buildTvdSampler(well.surveys).asFunction(), 500.0);

    // Дуга 0 -> 30° на 1500 м, минимальная кривизна
    const double dogleg = std::numbers::pi / 6.0;
    const double ratio = 2.0 / dogleg * std::tan(dogleg / 2.0);
    const double expected_tvd = 1000.0 + 750.0 * (1.0 + std::cos(dogleg)) * ratio;

    check.expect("Давление на 500 м", "кПа", shallow, rho * kGravity * 500.0 / 1000.0, 1e-6);
    check.expect("TVD на 2500 м", "м", report.pressure.tvd_m, expected_tvd, 1e-6);
    check.expect("Давление в затрубье на 2500 м", "кПа", report.pressure.annulus_kpa,
                 rho * kGravity * expected_tvd / 1000.0, 1e-3);
    check.expect("Перепад затрубье - колонна", "кПа", report.pressure.differentialKpa(), 0.0, 1e-6);
    if (shallow > report.pressure.annulus_kpa) {
        check.errors.push_back("Давление убывает с глубиной");
    }
    return check;
}

DiagnosticCheck makeInvalidInputCheck() {
    DiagnosticCheck check;
    check.id = "invalid_input";
    check.title = "Пустые и некорректные данные";

    auto empty = analyzeWell(Well{});
    check.expect("Открытый ствол пустой скважины", "м³", empty.totals.open_hole, 0.0, 0.0);
    check.expect("Давление пустой скважины", "кПа", empty.pressure.annulus_kpa, 0.0, 0.0);
    if (!empty.slices.empty()) {
        check.errors.push_back("Срезы у скважины без секций");
    }

    Well broken;
    broken.annuli.emplace_back("", Meters{0.0}, Meters{-100.0}, Meters{-0.2});
    broken.pipes.emplace_back("", Meters{0.0}, Meters{100.0}, Meters{0.3}, Meters{0.2});
    broken.annuli.emplace_back("", Meters{std::nan("")}, Meters{50.0}, Meters{0.2});
    auto bad = analyzeWell(broken);

    const VolumeBreakdown& t = bad.totals;
    for (double v : {t.annular_with_pipe, t.string_capacity, t.string_displacement, t.string_metal, t.open_hole}) {
        if (!std::isfinite(v) || v < 0.0) {
            check.errors.push_back("Недопустимый объём " + std::to_string(v) + " м³");
        }
    }
    if (!bad.validation.hasErrors()) {
        check.errors.push_back("Проверка геометрии не нашла ошибок в некорректной скважине");
    }
    check.note = std::to_string(bad.validation.errors.size()) + " ошибок геометрии обнаружено";
    return check;
}

} // namespace

DiagnosticsReport buildDiagnosticsReport(const DiagnosticsOptions& options) {
    DiagnosticsReport report;
    report.build.version = HYDROVOL_VERSION;
    report.build.build_type = HYDROVOL_BUILD_TYPE;
    report.build.platform = detectPlatform();
    report.timestamp = isoTimestampNow();
    report.artifacts_dir = options.artifacts_dir;

    report.checks.push_back(makeFilesystemCheck(options.artifacts_dir));
    report.checks.push_back(makeVolumesCheck());
    report.checks.push_back(makeOverlayCheck());
    report.checks.push_back(makeHydrostaticCheck());
    report.checks.push_back(makeInvalidInputCheck());

    return report;
}

} // namespace hydrovol::core
