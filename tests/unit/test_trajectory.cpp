/**
 * @file test_trajectory.cpp
 * @brief Unit-тесты методов расчёта траектории и отображения MD→TVD
 */

#include <doctest/doctest.h>
#include "core/trajectory.hpp"
#include <cmath>
#include <numbers>

using namespace hydrovol::core;
using namespace hydrovol::model;

TEST_CASE("Вертикальный участок (зенит = 0)") {
    Meters d1{0.0}, d2{100.0};
    Degrees inc1{0.0}, inc2{0.0};
    Degrees az1{0.0}, az2{0.0};

    SUBCASE("Average Angle") {
        auto result = averageAngle(d1, inc1, az1, d2, inc2, az2);
        CHECK(result.d_north.value == doctest::Approx(0.0));
        CHECK(result.d_east.value == doctest::Approx(0.0));
        CHECK(result.d_tvd.value == doctest::Approx(100.0));
    }

    SUBCASE("Balanced Tangential") {
        auto result = balancedTangential(d1, inc1, az1, d2, inc2, az2);
        CHECK(result.d_north.value == doctest::Approx(0.0));
        CHECK(result.d_east.value == doctest::Approx(0.0));
        CHECK(result.d_tvd.value == doctest::Approx(100.0));
    }

    SUBCASE("Minimum Curvature") {
        auto result = minimumCurvature(d1, inc1, az1, d2, inc2, az2);
        CHECK(result.d_north.value == doctest::Approx(0.0));
        CHECK(result.d_east.value == doctest::Approx(0.0));
        CHECK(result.d_tvd.value == doctest::Approx(100.0));
        CHECK(result.dogleg_severity == doctest::Approx(0.0));
    }
}

TEST_CASE("Горизонтальный участок (зенит = 90°)") {
    Meters d1{0.0}, d2{100.0};
    Degrees inc{90.0};

    SUBCASE("Азимут 0° (Север)") {
        auto result = minimumCurvature(d1, inc, Degrees{0.0}, d2, inc, Degrees{0.0});
        CHECK(result.d_north.value == doctest::Approx(100.0).epsilon(0.01));
        CHECK(result.d_east.value == doctest::Approx(0.0).epsilon(0.01));
        CHECK(result.d_tvd.value == doctest::Approx(0.0).epsilon(0.01));
    }

    SUBCASE("Азимут 90° (Восток)") {
        auto result = minimumCurvature(d1, inc, Degrees{90.0}, d2, inc, Degrees{90.0});
        CHECK(result.d_north.value == doctest::Approx(0.0).epsilon(0.01));
        CHECK(result.d_east.value == doctest::Approx(100.0).epsilon(0.01));
        CHECK(result.d_tvd.value == doctest::Approx(0.0).epsilon(0.01));
    }
}

TEST_CASE("Наклонный участок") {
    auto result = minimumCurvature(Meters{0.0}, Degrees{45.0}, Degrees{0.0},
                                   Meters{100.0}, Degrees{45.0}, Degrees{0.0});

    double expected = 100.0 * std::cos(std::numbers::pi / 4.0);
    CHECK(result.d_north.value == doctest::Approx(expected).epsilon(0.001));
    CHECK(result.d_tvd.value == doctest::Approx(expected).epsilon(0.001));
    CHECK(result.d_east.value == doctest::Approx(0.0).epsilon(0.001));
}

TEST_CASE("Набор зенитного угла 0°→30° на 100 м") {
    Meters d1{0.0}, d2{100.0};
    Degrees inc1{0.0}, inc2{30.0};
    Degrees az{0.0};

    auto mc = minimumCurvature(d1, inc1, az, d2, inc2, az);
    CHECK(mc.d_tvd.value == doctest::Approx(95.493).epsilon(1e-4));
    CHECK(mc.d_north.value == doctest::Approx(25.587).epsilon(1e-4));
    // 30° на 100 м = 9°/30 м
    CHECK(mc.dogleg_severity == doctest::Approx(9.0));

    SUBCASE("Методы дают близкий результат") {
        auto bt = balancedTangential(d1, inc1, az, d2, inc2, az);
        auto aa = averageAngle(d1, inc1, az, d2, inc2, az);
        CHECK(bt.d_tvd.value == doctest::Approx(mc.d_tvd.value).epsilon(0.05));
        CHECK(aa.d_tvd.value == doctest::Approx(mc.d_tvd.value).epsilon(0.05));
        CHECK(bt.d_tvd.value < mc.d_tvd.value);
    }
}

TEST_CASE("Коэффициент сглаживания") {
    CHECK(calculateRatioFactor(Radians{0.0}) == doctest::Approx(1.0));
    CHECK(calculateRatioFactor(Radians{1e-9}) == doctest::Approx(1.0));
    CHECK(calculateRatioFactor(Degrees{30.0}.toRadians()) == doctest::Approx(1.02349).epsilon(1e-5));
}

TEST_CASE("Нулевой интервал между станциями") {
    auto result = minimumCurvature(Meters{100.0}, Degrees{10.0}, Degrees{0.0},
                                   Meters{100.0}, Degrees{20.0}, Degrees{90.0});
    CHECK(result.d_tvd.value == 0.0);
    CHECK(result.dogleg_severity == 0.0);
}

TEST_CASE("Названия методов") {
    for (auto method : {TrajectoryMethod::AverageAngle, TrajectoryMethod::BalancedTangential,
                        TrajectoryMethod::MinimumCurvature}) {
        CHECK(parseTrajectoryMethod(toString(method)) == method);
    }
    CHECK(parseTrajectoryMethod("unknown") == TrajectoryMethod::MinimumCurvature);
}

TEST_CASE("Расчёт TVD по станциям инклинометрии") {
    SurveyList stations{
        SurveyStation(Meters{1000.0}, Degrees{0.0}, Degrees{0.0}),
        SurveyStation(Meters{0.0}, Degrees{0.0}, Degrees{0.0}),
        SurveyStation(Meters{1100.0}, Degrees{30.0}, Degrees{0.0})
    };

    auto result = computeSurveyTvd(stations);
    REQUIRE(result.size() == 3);
    CHECK(result[0].md.value == doctest::Approx(0.0));
    REQUIRE(result[0].tvd.has_value());
    CHECK(result[0].tvd->value == doctest::Approx(0.0));
    CHECK(result[1].tvd->value == doctest::Approx(1000.0));
    CHECK(result[2].tvd->value == doctest::Approx(1095.493).epsilon(1e-5));

    SUBCASE("Привязка по TVD первой станции") {
        auto tied = computeSurveyTvd(stations, TrajectoryMethod::MinimumCurvature, Meters{-10.0});
        CHECK(tied[1].tvd->value == doctest::Approx(990.0));
    }

    SUBCASE("Пустой список") {
        CHECK(computeSurveyTvd({}).empty());
    }
}

TEST_CASE("Интерполяция TVD по глубине") {
    SurveyList stations{
        SurveyStation(Meters{0.0}, Degrees{0.0}, Degrees{0.0}, Meters{0.0}),
        SurveyStation(Meters{1000.0}, Degrees{0.0}, Degrees{0.0}, Meters{1000.0}),
        SurveyStation(Meters{2000.0}, Degrees{60.0}, Degrees{0.0}, Meters{1600.0})
    };
    TvdSampler sampler(stations);

    REQUIRE(sampler.size() == 3);
    CHECK(sampler.tvd(500.0) == doctest::Approx(500.0));
    CHECK(sampler.tvd(1500.0) == doctest::Approx(1300.0));
    CHECK(sampler(2000.0) == doctest::Approx(1600.0));

    SUBCASE("За пределами станций значение ограничивается крайними") {
        CHECK(sampler.tvd(-100.0) == doctest::Approx(0.0));
        CHECK(sampler.tvd(2500.0) == doctest::Approx(1600.0));
    }

    SUBCASE("Функция-обёртка") {
        auto fn = sampler.asFunction();
        CHECK(fn(1500.0) == doctest::Approx(1300.0));
    }
}

TEST_CASE("Интерполятор TVD устойчив к некорректным станциям") {
    SurveyList stations{
        SurveyStation(Meters{1000.0}, Degrees{0.0}, Degrees{0.0}, Meters{900.0}),
        SurveyStation(Meters{0.0}, Degrees{0.0}, Degrees{0.0}, Meters{0.0}),
        SurveyStation(Meters{1000.0}, Degrees{0.0}, Degrees{0.0}, Meters{950.0}),
        SurveyStation(Meters{std::nan("")}, Degrees{0.0}, Degrees{0.0}),
        SurveyStation(Meters{1500.0}, Degrees{0.0}, Degrees{0.0}, Meters{800.0})
    };
    TvdSampler sampler(stations);

    // Дубликат MD и нечисловая станция отброшены
    CHECK(sampler.size() == 3);
    // TVD не убывает
    CHECK(sampler.tvd(1500.0) == doctest::Approx(900.0));
    CHECK(sampler.tvd(1250.0) >= sampler.tvd(1000.0));

    SUBCASE("Без станций MD = TVD") {
        TvdSampler empty;
        CHECK(empty.empty());
        CHECK(empty.tvd(1234.0) == doctest::Approx(1234.0));
        CHECK(identityTvd()(1234.0) == doctest::Approx(1234.0));
    }
}
