/**
 * @file units.hpp
 * @brief Строго типизированные единицы измерения и физические константы
 *
 * Глубины и диаметры передаются как Meters, углы инклинометрии как Degrees.
 * Плотности (кг/м³), объёмы (м³) и давления (кПа) хранятся в double
 * с суффиксом единицы в имени поля.
 * Литералы: 45.0_deg, 2500.0_m
 */

#pragma once

#include <cmath>
#include <compare>
#include <numbers>

namespace hydrovol::model {

struct Radians;

/**
 * @brief Ускорение свободного падения, м/с²
 */
inline constexpr double kGravity = 9.80665;

/**
 * @brief Плотность стали по умолчанию, кг/м³
 */
inline constexpr double kSteelDensity = 7850.0;

/**
 * @brief Угол в градусах
 */
struct Degrees {
    double value;

    constexpr explicit Degrees(double v = 0.0) noexcept : value(v) {}

    [[nodiscard]] constexpr Radians toRadians() const noexcept;

    constexpr Degrees operator+(Degrees other) const noexcept {
        return Degrees{value + other.value};
    }

    constexpr Degrees operator-(Degrees other) const noexcept {
        return Degrees{value - other.value};
    }

    constexpr auto operator<=>(const Degrees& other) const noexcept = default;
};

/**
 * @brief Угол в радианах
 */
struct Radians {
    double value;

    constexpr explicit Radians(double v = 0.0) noexcept : value(v) {}

    [[nodiscard]] constexpr Degrees toDegrees() const noexcept {
        return Degrees{value * 180.0 / std::numbers::pi};
    }

    constexpr auto operator<=>(const Radians& other) const noexcept = default;
};

constexpr Radians Degrees::toRadians() const noexcept {
    return Radians{value * std::numbers::pi / 180.0};
}

/**
 * @brief Расстояние в метрах (глубина по стволу, TVD, диаметр)
 */
struct Meters {
    double value;

    constexpr explicit Meters(double v = 0.0) noexcept : value(v) {}

    constexpr Meters operator+(Meters other) const noexcept {
        return Meters{value + other.value};
    }

    constexpr Meters operator-(Meters other) const noexcept {
        return Meters{value - other.value};
    }

    constexpr Meters operator*(double scalar) const noexcept {
        return Meters{value * scalar};
    }

    constexpr Meters& operator+=(Meters other) noexcept {
        value += other.value;
        return *this;
    }

    constexpr Meters& operator-=(Meters other) noexcept {
        value -= other.value;
        return *this;
    }

    constexpr auto operator<=>(const Meters& other) const noexcept = default;
};

namespace literals {

constexpr Degrees operator""_deg(long double v) noexcept {
    return Degrees{static_cast<double>(v)};
}

constexpr Degrees operator""_deg(unsigned long long v) noexcept {
    return Degrees{static_cast<double>(v)};
}

constexpr Meters operator""_m(long double v) noexcept {
    return Meters{static_cast<double>(v)};
}

constexpr Meters operator""_m(unsigned long long v) noexcept {
    return Meters{static_cast<double>(v)};
}

} // namespace literals

/**
 * @brief Неотрицательное конечное значение
 *
 * NaN, ±inf и отрицательные числа превращаются в 0.
 * Используется ядром для защитного ограничения входных данных.
 */
[[nodiscard]] inline double nonNegative(double v) noexcept {
    if (!std::isfinite(v) || v < 0.0) {
        return 0.0;
    }
    return v;
}

/**
 * @brief Конечное значение (NaN и ±inf → 0)
 */
[[nodiscard]] inline double finiteOrZero(double v) noexcept {
    return std::isfinite(v) ? v : 0.0;
}

/**
 * @brief Площадь круга по диаметру, м²
 */
[[nodiscard]] inline double circleArea(double diameter) noexcept {
    double d = nonNegative(diameter);
    return std::numbers::pi * d * d / 4.0;
}

} // namespace hydrovol::model
