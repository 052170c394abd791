/**
 * @file test_volumes.cpp
 * @brief Unit-тесты агрегатора объёмов и расчёта пачки при спущенной колонне
 */

#include <doctest/doctest.h>
#include "core/volumes.hpp"
#include "model/well.hpp"
#include <numbers>

using namespace hydrovol::core;
using namespace hydrovol::model;

namespace {

double area(double d) {
    return std::numbers::pi * d * d / 4.0;
}

struct ReferenceWell {
    PipeList pipes{
        PipeSection("СБТ 127", Meters{0.0}, Meters{2500.0}, Meters{0.0953}, Meters{0.127})
    };
    AnnulusList annuli{
        AnnulusSection("Кондуктор", Meters{0.0}, Meters{500.0}, Meters{0.340}, true),
        AnnulusSection("Открытый ствол", Meters{500.0}, Meters{2000.0}, Meters{0.311})
    };

    VolumeBreakdown between(double top, double bottom) const {
        return volumesBetween(pipes, annuli, Meters{top}, Meters{bottom});
    }
};

} // namespace

TEST_CASE("Эталонная скважина: кондуктор, открытый ствол, одна секция СБТ") {
    ReferenceWell well;

    double capacity = well.between(0.0, 2500.0).string_capacity;
    double open_hole = well.between(500.0, 2500.0).open_hole;
    double annular = well.between(0.0, 500.0).annular_with_pipe;

    CHECK(capacity == doctest::Approx(area(0.0953) * 2500.0));
    CHECK(open_hole == doctest::Approx(area(0.311) * 2000.0));
    CHECK(annular == doctest::Approx((area(0.340) - area(0.127)) * 500.0));

    // Справочные значения, округлённые в паспорте скважины
    CHECK(capacity == doctest::Approx(17.86).epsilon(0.01));
    CHECK(open_hole == doctest::Approx(151.76).epsilon(0.01));
    CHECK(annular == doctest::Approx(39.0).epsilon(0.01));
}

TEST_CASE("Разложение объёма интервала") {
    ReferenceWell well;
    auto v = well.between(1000.0, 1500.0);

    CHECK(v.length_m == doctest::Approx(500.0));
    CHECK(v.string_capacity == doctest::Approx(area(0.0953) * 500.0));
    CHECK(v.string_displacement == doctest::Approx(area(0.127) * 500.0));
    CHECK(v.string_metal == doctest::Approx((area(0.127) - area(0.0953)) * 500.0));
    CHECK(v.open_hole == doctest::Approx(area(0.311) * 500.0));
    CHECK(v.annular_with_pipe == doctest::Approx((area(0.311) - area(0.127)) * 500.0));

    CHECK(v.capacityPerMeter() == doctest::Approx(area(0.0953)));
    CHECK(v.openHolePerMeter() == doctest::Approx(area(0.311)));
    CHECK(v.mudWithPipe() == doctest::Approx(v.annular_with_pipe + v.string_capacity));
}

TEST_CASE("Объёмы аддитивны по смежным интервалам") {
    ReferenceWell well;
    well.pipes.emplace_back("УБТ", Meters{2500.0}, Meters{150.0}, Meters{0.0714}, Meters{0.165});
    well.annuli.emplace_back("Хвостовик", Meters{2500.0}, Meters{300.0}, Meters{0.2159});

    for (double split : {120.0, 500.0, 1733.3, 2500.0, 2600.0}) {
        CAPTURE(split);
        auto upper = well.between(0.0, split);
        auto lower = well.between(split, 2800.0);
        auto whole = well.between(0.0, 2800.0);

        CHECK(upper.annular_with_pipe + lower.annular_with_pipe == doctest::Approx(whole.annular_with_pipe));
        CHECK(upper.string_capacity + lower.string_capacity == doctest::Approx(whole.string_capacity));
        CHECK(upper.string_displacement + lower.string_displacement == doctest::Approx(whole.string_displacement));
        CHECK(upper.string_metal + lower.string_metal == doctest::Approx(whole.string_metal));
        CHECK(upper.open_hole + lower.open_hole == doctest::Approx(whole.open_hole));
    }
}

TEST_CASE("Объёмы не убывают с увеличением глубины подошвы") {
    ReferenceWell well;
    VolumeBreakdown prev = well.between(0.0, 0.0);
    for (double bottom = 100.0; bottom <= 3000.0; bottom += 100.0) {
        auto v = well.between(0.0, bottom);
        CHECK(v.annular_with_pipe >= prev.annular_with_pipe);
        CHECK(v.string_capacity >= prev.string_capacity);
        CHECK(v.open_hole >= prev.open_hole);
        prev = v;
    }
    // Ниже забоя ничего не добавляется
    CHECK(well.between(0.0, 3000.0).open_hole == doctest::Approx(well.between(0.0, 2500.0).open_hole));
}

TEST_CASE("Перевёрнутый и отрицательный интервал нормализуются") {
    ReferenceWell well;
    auto normal = well.between(200.0, 900.0);
    auto inverted = well.between(900.0, 200.0);
    CHECK(inverted.length_m == doctest::Approx(normal.length_m));
    CHECK(inverted.annular_with_pipe == doctest::Approx(normal.annular_with_pipe));
    CHECK(inverted.open_hole == doctest::Approx(normal.open_hole));

    auto negative = well.between(-100.0, 300.0);
    CHECK(negative.length_m == doctest::Approx(300.0));

    auto empty = well.between(700.0, 700.0);
    CHECK(empty.length_m == 0.0);
    CHECK(empty.open_hole == 0.0);
    CHECK(empty.annularPerMeter() == 0.0);
}

TEST_CASE("Глубина скважины совпадает с длиной интервала полных объёмов") {
    Well well;
    // Отрицательная длина ограничивается нулём, подошва остаётся на кровле
    well.pipes = {PipeSection("СБТ", Meters{500.0}, Meters{-100.0}, Meters{0.1}, Meters{0.127})};
    well.annuli = {AnnulusSection("Ствол", Meters{0.0}, Meters{300.0}, Meters{0.2159})};

    auto totals = wellTotals(well.pipes, well.annuli);
    CHECK(well.maxDepth().value == doctest::Approx(500.0));
    CHECK(totals.length_m == doctest::Approx(well.maxDepth().value));
}

TEST_CASE("Баланс объёмов: ствол = затрубье + колонна + металл") {
    ReferenceWell well;
    auto totals = wellTotals(well.pipes, well.annuli);
    CHECK(totals.length_m == doctest::Approx(2500.0));
    CHECK(identityCheck(totals) == doctest::Approx(0.0).epsilon(1e-9));

    SUBCASE("Колонна короче ствола") {
        well.pipes[0].length = Meters{1800.0};
        auto partial = wellTotals(well.pipes, well.annuli);
        CHECK(identityCheck(partial) == doctest::Approx(0.0).epsilon(1e-9));
    }
}

TEST_CASE("Длина пачки при спущенной колонне") {
    ReferenceWell well;

    SUBCASE("Пачка в открытом стволе") {
        auto plug = solveEqualVolumePipeLength(well.pipes, well.annuli, Meters{2000.0}, Meters{2500.0});
        double target = well.between(2000.0, 2500.0).open_hole;

        CHECK(plug.converged);
        CHECK(plug.total_m3 == doctest::Approx(target).epsilon(1e-5));
        CHECK(plug.annular_m3 + plug.string_m3 == doctest::Approx(plug.total_m3));
        // С колонной в скважине раствор поднимается выше исходной кровли
        CHECK(plug.length_m > 500.0);
        CHECK(plug.mud_top_m == doctest::Approx(2500.0 - plug.length_m));

        double per_meter = area(0.311) - (area(0.127) - area(0.0953));
        CHECK(plug.length_m == doctest::Approx(target / per_meter).epsilon(1e-5));
    }

    SUBCASE("Колонны не хватает для всего объёма") {
        auto plug = solveEqualVolumePipeLength(well.pipes, well.annuli, Meters{0.0}, Meters{2500.0});
        CHECK_FALSE(plug.converged);
        CHECK(plug.length_m == doctest::Approx(2500.0));
        CHECK(plug.mud_top_m == doctest::Approx(0.0));
    }

    SUBCASE("Пустой интервал") {
        auto plug = solveEqualVolumePipeLength(well.pipes, well.annuli, Meters{1200.0}, Meters{1200.0});
        CHECK(plug.length_m == 0.0);
        CHECK(plug.total_m3 == 0.0);
    }
}
