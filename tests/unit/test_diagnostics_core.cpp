/**
 * @file test_diagnostics_core.cpp
 * @brief Проверки самодиагностики ядра и записи её отчётов
 */

#include <doctest/doctest.h>
#include "core/diagnostics.hpp"
#include "io/report_writer.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <nlohmann/json.hpp>
#include <string>

using namespace hydrovol::core;

TEST_CASE("core diagnostics pass on reference wells") {
    namespace fs = std::filesystem;
    auto out_dir = fs::temp_directory_path() / "hydrovol_diag_core";
    std::error_code ec;
    fs::remove_all(out_dir, ec);

    DiagnosticsOptions options;
    options.artifacts_dir = out_dir;

    auto report = buildDiagnosticsReport(options);
    CHECK(report.passed());
    CHECK(report.failedCount() == 0);
    CHECK_FALSE(report.build.version.empty());
    CHECK_FALSE(report.build.platform.empty());
    CHECK(report.checks.size() == 5);

    for (const auto& check : report.checks) {
        INFO("Проверка: " << check.id);
        CHECK(check.errors.empty());
        for (const auto& v : check.values) {
            INFO(v.name << ": " << v.actual << " / " << v.expected);
            CHECK(v.withinTolerance());
        }
    }

    auto written = hydrovol::io::writeDiagnosticsReport(report, out_dir);
    CHECK(fs::exists(written.json_path));
    CHECK(fs::exists(written.markdown_path));
    CHECK(fs::exists(out_dir / "logs" / "fs_check.txt"));

    std::ifstream ifs(written.json_path);
    nlohmann::json j;
    ifs >> j;
    CHECK(j["passed"] == true);
    CHECK(j["build"]["version"] == report.build.version);
    REQUIRE(j["checks"].size() == report.checks.size());
    CHECK(j["checks"][1]["id"] == "reference_volumes");
    CHECK(j["checks"][1]["values"].size() == report.checks[1].values.size());

    std::ifstream md(written.markdown_path);
    std::string text((std::istreambuf_iterator<char>(md)), std::istreambuf_iterator<char>());
    CHECK(text.find("[reference_volumes]: OK") != std::string::npos);
    CHECK(text.find("| Величина | Расчёт | Эталон |") != std::string::npos);
}

TEST_CASE("check passes only when every value is within tolerance") {
    DiagnosticCheck check;
    check.id = "sample";
    CHECK(check.passed());

    check.expect("Объём", "м³", 10.0005, 10.0, 1e-3);
    CHECK(check.values.back().withinTolerance());
    CHECK(check.values.back().deviation() == doctest::Approx(0.0005));
    CHECK(check.passed());

    check.expect("Давление", "кПа", 101.0, 100.0, 0.5);
    CHECK_FALSE(check.values.back().withinTolerance());
    CHECK_FALSE(check.passed());

    SUBCASE("Нечисловое значение не проходит даже с бесконечным допуском") {
        CheckValue v{"NaN", "", std::nan(""), 0.0, std::numeric_limits<double>::infinity()};
        CHECK_FALSE(v.withinTolerance());
    }
}

TEST_CASE("report counts failed checks") {
    DiagnosticsReport report;
    CHECK(report.passed());

    DiagnosticCheck ok;
    ok.expect("Длина", "м", 100.0, 100.0, 0.0);
    DiagnosticCheck broken;
    broken.errors.push_back("Разрыв слоёв");

    report.checks = {ok, broken, ok};
    CHECK(report.failedCount() == 1);
    CHECK_FALSE(report.passed());

    auto text = hydrovol::io::diagnosticsToMarkdown(report);
    CHECK(text.find("- Итог: FAIL (не пройдено 1 из 3)") != std::string::npos);
    CHECK(text.find("- Ошибка: Разрыв слоёв") != std::string::npos);

    auto j = nlohmann::json::parse(hydrovol::io::diagnosticsToJson(report));
    CHECK(j["passed"] == false);
    CHECK(j["failed"] == 1);
    CHECK(j["checks"][1]["errors"][0] == "Разрыв слоёв");
}
