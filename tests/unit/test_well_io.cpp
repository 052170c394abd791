/**
 * @file test_well_io.cpp
 * @brief Unit-тесты чтения и записи файла скважины
 */

#include <doctest/doctest.h>
#include "io/well_io.hpp"
#include "core/fluid_overlay.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace hydrovol::model;
using namespace hydrovol::io;

namespace {

Well makeWell() {
    Well well;
    well.name = "Скв. 112";
    well.description = "Куст 4";

    PipeSection dp("СБТ 127", Meters{0.0}, Meters{2300.0}, Meters{0.0953}, Meters{0.127});
    PipeSection dc("УБТ 165", Meters{2300.0}, Meters{200.0}, Meters{0.0714}, Meters{0.165});
    dc.unit_weight_kgm = 136.0;
    dc.steel_density_kgm3 = 7800.0;
    well.pipes = {dp, dc};

    well.annuli.emplace_back("Кондуктор", Meters{0.0}, Meters{500.0}, Meters{0.340}, true);
    well.annuli.emplace_back("Открытый ствол", Meters{500.0}, Meters{2000.0}, Meters{0.311});

    well.surveys.emplace_back(Meters{0.0}, Degrees{0.0}, Degrees{0.0}, Meters{0.0});
    well.surveys.emplace_back(Meters{1500.0}, Degrees{12.5}, Degrees{275.0});

    MudStep pill;
    pill.name = "Утяжелённая пачка";
    pill.top = Meters{2200.0};
    pill.bottom = Meters{2500.0};
    pill.density_kgm3 = 1600.0;
    pill.color = Color::fromHex("#AA3300");
    pill.placement = Placement::Both;
    pill.fluid_ref = "mud-2";
    well.mud_steps.push_back(pill);

    well.settings.base_string_density_kgm3 = 1180.0;
    well.settings.base_annulus_density_kgm3 = 1220.0;
    well.settings.active_mud_volume_m3 = 60.0;
    well.settings.surface_line_volume_m3 = 3.5;
    well.settings.pressure_depth = Meters{2450.0};

    well.layers = hydrovol::core::rebuildLayers(well.mud_steps, well.maxDepth(), 1180.0, 1220.0);
    return well;
}

} // namespace

TEST_CASE("Сохранение и загрузка сохраняют все данные скважины") {
    auto original = makeWell();
    auto restored = wellFromJson(wellToJson(original));

    CHECK(restored.name == original.name);
    CHECK(restored.description == original.description);

    REQUIRE(restored.pipes.size() == 2);
    CHECK(restored.pipes[1].name == "УБТ 165");
    CHECK(restored.pipes[1].top.value == doctest::Approx(2300.0));
    CHECK(restored.pipes[1].outer_diameter.value == doctest::Approx(0.165));
    REQUIRE(restored.pipes[1].unit_weight_kgm.has_value());
    CHECK(*restored.pipes[1].unit_weight_kgm == doctest::Approx(136.0));
    CHECK(restored.pipes[1].steel_density_kgm3 == doctest::Approx(7800.0));
    CHECK_FALSE(restored.pipes[0].unit_weight_kgm.has_value());

    REQUIRE(restored.annuli.size() == 2);
    CHECK(restored.annuli[0].is_cased);
    CHECK_FALSE(restored.annuli[1].is_cased);
    CHECK(restored.annuli[1].length.value == doctest::Approx(2000.0));

    REQUIRE(restored.surveys.size() == 2);
    CHECK(restored.surveys[0].tvd.has_value());
    CHECK_FALSE(restored.surveys[1].tvd.has_value());
    CHECK(restored.surveys[1].azimuth.value == doctest::Approx(275.0));

    REQUIRE(restored.mud_steps.size() == 1);
    const auto& step = restored.mud_steps[0];
    CHECK(step.placement == Placement::Both);
    CHECK(step.color == Color::fromHex("#AA3300"));
    CHECK(step.fluid_ref == "mud-2");
    CHECK(step.density_kgm3 == doctest::Approx(1600.0));

    CHECK(restored.layers.annulus.size() == original.layers.annulus.size());
    CHECK(restored.layers.string.size() == original.layers.string.size());
    for (const auto& layer : restored.layers.string) {
        CHECK(layer.domain == Domain::String);
    }
    // Цвет слоя с прозрачностью
    CHECK(restored.layers.annulus[0].color == Color::gray());

    CHECK(restored.settings.base_string_density_kgm3 == doctest::Approx(1180.0));
    CHECK(restored.settings.base_annulus_density_kgm3 == doctest::Approx(1220.0));
    CHECK(restored.settings.active_mud_volume_m3 == doctest::Approx(60.0));
    CHECK(restored.settings.surface_line_volume_m3 == doctest::Approx(3.5));
    CHECK(restored.settings.pressure_depth.value == doctest::Approx(2450.0));
}

TEST_CASE("Файл скважины на диске") {
    namespace fs = std::filesystem;
    auto dir = fs::temp_directory_path() / "hydrovol_well_io";
    std::error_code ec;
    fs::remove_all(dir, ec);

    auto path = dir / "well.json";
    saveWell(makeWell(), path);

    CHECK(fs::exists(path));
    CHECK_FALSE(fs::exists(dir / "well.json.tmp"));
    CHECK(isWellFile(path));

    auto loaded = loadWell(path);
    CHECK(loaded.file_path == path.string());
    CHECK(loaded.pipes.size() == 2);

    std::ifstream ifs(path);
    nlohmann::json j;
    ifs >> j;
    CHECK(j["format"] == WELL_FORMAT_ID);
    CHECK(j["version"] == WELL_FORMAT_VERSION);
    CHECK(j["drill_string"].size() == 2);

    SUBCASE("Файл другого формата не распознаётся") {
        auto other = dir / "other.json";
        std::ofstream(other) << R"({"format": "something-else"})";
        CHECK_FALSE(isWellFile(other));
        CHECK_THROWS_AS(loadWell(other), WellFileError);

        auto txt = dir / "well.txt";
        fs::copy_file(path, txt, fs::copy_options::overwrite_existing);
        CHECK_FALSE(isWellFile(txt));
    }

    SUBCASE("Отсутствующий файл") {
        CHECK_FALSE(isWellFile(dir / "missing.json"));
        CHECK_THROWS_AS(loadWell(dir / "missing.json"), WellFileError);
    }

    fs::remove_all(dir, ec);
}

TEST_CASE("Некорректное содержимое файла скважины") {
    CHECK_THROWS_AS(wellFromJson("{not json"), WellFileError);
    CHECK_THROWS_AS(wellFromJson("[]"), WellFileError);
    CHECK_THROWS_AS(wellFromJson(R"({"format": "hydrovol-well", "drill_string": [{"top": "abc"}]})"),
                    WellFileError);
    CHECK_THROWS_AS(wellFromJson(
        R"({"format": "hydrovol-well", "mud_steps": [{"top": 0, "bottom": 10, "color": "#GG0000"}]})"),
        WellFileError);
    CHECK_THROWS_AS(wellFromJson(R"({"format": "hydrovol-well", "surveys": [{"inc": 5}]})"),
                    WellFileError);
}

TEST_CASE("Минимальный файл скважины дополняется значениями по умолчанию") {
    auto well = wellFromJson(R"({
        "format": "hydrovol-well",
        "annulus": [{"top": 0, "length": 1000, "inner_diameter": 0.2159}],
        "mud_steps": [{"top": 100, "bottom": 200, "density": 1500, "placement": "string"}]
    })");

    CHECK(well.name.empty());
    CHECK(well.displayName() == "Безымянная скважина");
    CHECK(well.pipes.empty());
    REQUIRE(well.annuli.size() == 1);
    CHECK(well.maxDepth().value == doctest::Approx(1000.0));
    REQUIRE(well.mud_steps.size() == 1);
    CHECK(well.mud_steps[0].placement == Placement::String);
    CHECK(well.mud_steps[0].color == Color::blue());
    CHECK(well.layers.empty());
    CHECK(well.settings.base_annulus_density_kgm3 == doctest::Approx(1260.0));
    CHECK(well.settings.pressure_depth.value == doctest::Approx(3200.0));
}
