/**
 * @file test_well_report.cpp
 * @brief Интеграционный тест расчёта скважины из файла и выгрузки отчёта
 */

#include <doctest/doctest.h>
#include "app/well_command.hpp"
#include "io/report_writer.hpp"
#include "io/well_io.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iterator>
#include <sstream>

using namespace hydrovol;
using namespace hydrovol::model;

namespace {

Well makeWell() {
    Well well;
    well.name = "Скв. 7";
    well.annuli.emplace_back("Кондуктор", Meters{0.0}, Meters{500.0}, Meters{0.340}, true);
    well.annuli.emplace_back("Открытый ствол", Meters{500.0}, Meters{2000.0}, Meters{0.311});
    well.pipes.emplace_back("СБТ 127", Meters{0.0}, Meters{2500.0}, Meters{0.0953}, Meters{0.127});

    MudStep pill;
    pill.name = "Пачка";
    pill.top = Meters{2000.0};
    pill.bottom = Meters{2500.0};
    pill.density_kgm3 = 1600.0;
    pill.placement = Placement::Annulus;
    well.mud_steps.push_back(pill);

    well.settings.base_string_density_kgm3 = 1200.0;
    well.settings.base_annulus_density_kgm3 = 1200.0;
    well.settings.active_mud_volume_m3 = 40.0;
    well.settings.pressure_depth = Meters{2500.0};
    return well;
}

struct TempDir {
    std::filesystem::path path;

    explicit TempDir(const char* name) : path(std::filesystem::temp_directory_path() / name) {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

} // namespace

TEST_CASE("Расчёт скважины из файла с отчётом") {
    TempDir dir("hydrovol_well_report");
    auto well_path = dir.path / "well.json";
    io::saveWell(makeWell(), well_path);

    auto survey_path = dir.path / "survey.csv";
    {
        std::ofstream ofs(survey_path);
        ofs << "MD,INC,AZI\n0,0,0\n1000,0,0\n2500,40,90\n";
    }

    app::WellCommandOptions options;
    options.well_path = well_path;
    options.survey_path = survey_path;
    options.output_dir = dir.path / "report";
    options.analysis.interval_top = Meters{2000.0};
    options.analysis.interval_bottom = Meters{2500.0};
    options.analysis.target_density_kgm3 = 1300.0;

    std::ostringstream out;
    std::ostringstream err;
    auto result = app::runWellCommand(options, out, err);

    REQUIRE(result.exit_code == 0);
    REQUIRE(result.report.has_value());
    const auto& report = *result.report;

    CHECK(report.well_name == "Скв. 7");
    CHECK(report.max_depth_m == doctest::Approx(2500.0));
    CHECK(report.slices.size() == 2);
    CHECK(report.identity_residual_m3 == doctest::Approx(0.0).epsilon(1e-9));
    CHECK(report.surveys.size() == 3);
    CHECK(report.annulus_layers.size() == 2);
    CHECK(report.string_layers.size() == 1);

    // Наклонный участок: TVD забоя меньше MD
    CHECK(report.pressure.tvd_m < 2500.0);
    CHECK(report.pressure.tvd_m > 1000.0);
    // Тяжёлая пачка в затрубье
    CHECK(report.pressure.annulus_kpa > report.pressure.string_kpa);
    CHECK(report.pressure.differentialKpa() > 0.0);

    REQUIRE(report.interval.has_value());
    CHECK(report.interval->plug.converged);
    CHECK(report.interval->plug.mud_top_m < 2000.0);

    REQUIRE(report.barite.has_value());
    CHECK(report.barite->total_kg > 0.0);
    CHECK(report.circulation.tanks == doctest::Approx(40.0));

    CHECK(out.str().find("Скв. 7") != std::string::npos);
    CHECK(err.str().empty());

    auto md_path = dir.path / "report" / "report.md";
    auto json_path = dir.path / "report" / "report.json";
    REQUIRE(std::filesystem::exists(md_path));
    REQUIRE(std::filesystem::exists(json_path));

    std::ifstream ifs(json_path);
    nlohmann::json j;
    ifs >> j;
    CHECK(j["well"] == "Скв. 7");
    CHECK(j["slices"].size() == 2);
    CHECK(j["trajectory_method"] == "minimum-curvature");
    CHECK(j["layers"]["rebuilt"] == true);
    CHECK(j["layers"]["annulus"].size() == 2);
    CHECK(j["pressure"]["annulus_kpa"].get<double>() == doctest::Approx(report.pressure.annulus_kpa));
    CHECK(j["interval"]["plug"]["converged"] == true);
    CHECK(j["barite"]["sacks"].get<int>() == report.barite->sacks);
    CHECK(j["validation"]["errors"].empty());

    std::ifstream md(md_path);
    std::string text((std::istreambuf_iterator<char>(md)), std::istreambuf_iterator<char>());
    CHECK(text.find("Скв. 7") != std::string::npos);
}

TEST_CASE("Сохранённые слои вместо пересборки") {
    auto well = makeWell();
    well.layers.annulus = {};
    FluidLayer stored;
    stored.domain = Domain::Annulus;
    stored.top = Meters{0.0};
    stored.bottom = Meters{2500.0};
    stored.density_kgm3 = 1000.0;
    well.layers.annulus.push_back(stored);

    core::AnalysisOptions options;
    options.use_stored_layers = true;
    auto report = core::analyzeWell(well, options);

    CHECK_FALSE(report.layers_rebuilt);
    REQUIRE(report.annulus_layers.size() == 1);
    CHECK(report.pressure.annulus_kpa == doctest::Approx(1000.0 * kGravity * 2500.0 / 1000.0));

    auto json = io::wellReportToJson(report);
    CHECK(json.find("\"rebuilt\": false") != std::string::npos);
}

TEST_CASE("Ошибки геометрии и режим --strict") {
    TempDir dir("hydrovol_well_strict");
    auto well = makeWell();
    well.pipes[0].outer_diameter = Meters{0.35};
    auto well_path = dir.path / "broken.json";
    io::saveWell(well, well_path);

    app::WellCommandOptions options;
    options.well_path = well_path;

    SUBCASE("Без --strict расчёт выполняется с предупреждением") {
        std::ostringstream out;
        std::ostringstream err;
        auto result = app::runWellCommand(options, out, err);
        CHECK(result.exit_code == 0);
        CHECK(result.report.has_value());
        CHECK(err.str().find("Предупреждение") != std::string::npos);
    }

    SUBCASE("С --strict расчёт прерывается") {
        options.strict = true;
        std::ostringstream out;
        std::ostringstream err;
        auto result = app::runWellCommand(options, out, err);
        CHECK(result.exit_code == 1);
        CHECK_FALSE(result.report.has_value());
        CHECK(err.str().find("--strict") != std::string::npos);
        CHECK(out.str().empty());
    }
}

TEST_CASE("Пересборка слоёв в файле скважины") {
    TempDir dir("hydrovol_rebuild_layers");
    auto input = dir.path / "well.json";
    auto output = dir.path / "rebuilt.json";
    io::saveWell(makeWell(), input);

    std::ostringstream out;
    CHECK(app::runRebuildLayersCommand(input, output, out) == 0);

    auto rebuilt = io::loadWell(output);
    REQUIRE(rebuilt.layers.annulus.size() == 2);
    CHECK(rebuilt.layers.annulus[1].density_kgm3 == doctest::Approx(1600.0));
    CHECK(rebuilt.layers.string.size() == 1);

    // Исходный файл не изменён
    CHECK(io::loadWell(input).layers.empty());
}

TEST_CASE("Отсутствующий файл скважины") {
    app::WellCommandOptions options;
    options.well_path = std::filesystem::temp_directory_path() / "hydrovol_no_such_well.json";
    std::ostringstream out;
    std::ostringstream err;
    CHECK_THROWS_AS(app::runWellCommand(options, out, err), io::WellFileError);
}
