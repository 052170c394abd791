/**
 * @file trajectory.cpp
 * @brief Реализация методов расчёта траектории
 */

#include "trajectory.hpp"
#include <algorithm>
#include <cmath>

namespace hydrovol::core {

namespace {

constexpr double kMinInterval = 1e-9;
constexpr double kMinDogleg = 1e-6;
constexpr double kMinSpan = 1e-12;

/**
 * @brief Угол искривления между направлениями, рад
 */
double doglegAngle(double theta1, double phi1, double theta2, double phi2) noexcept {
    double cos_DL = std::cos(theta2 - theta1) -
                    std::sin(theta1) * std::sin(theta2) * (1.0 - std::cos(phi2 - phi1));
    // Ограничение для защиты от ошибок округления
    cos_DL = std::clamp(cos_DL, -1.0, 1.0);
    return std::acos(cos_DL);
}

double severity(double dogleg_rad, double length) noexcept {
    return Radians{dogleg_rad}.toDegrees().value / length * 30.0;
}

} // namespace

std::string toString(TrajectoryMethod method) {
    switch (method) {
        case TrajectoryMethod::AverageAngle: return "average-angle";
        case TrajectoryMethod::BalancedTangential: return "balanced-tangential";
        case TrajectoryMethod::MinimumCurvature: return "minimum-curvature";
    }
    return "minimum-curvature";
}

TrajectoryMethod parseTrajectoryMethod(const std::string& str) {
    if (str == "average-angle") return TrajectoryMethod::AverageAngle;
    if (str == "balanced-tangential") return TrajectoryMethod::BalancedTangential;
    return TrajectoryMethod::MinimumCurvature;
}

TrajectoryIncrement averageAngle(
    Meters depth1, Degrees inc1, Degrees az1,
    Meters depth2, Degrees inc2, Degrees az2
) noexcept {
    double L = depth2.value - depth1.value;
    if (std::abs(L) < kMinInterval) {
        return {};
    }

    double theta1 = inc1.toRadians().value;
    double theta2 = inc2.toRadians().value;
    double phi1 = az1.toRadians().value;
    double phi2 = az2.toRadians().value;

    double theta_avg = 0.5 * (theta1 + theta2);
    // Среднее азимутов через единичные векторы (переход через 0°/360°)
    double phi_avg = std::atan2(std::sin(phi1) + std::sin(phi2), std::cos(phi1) + std::cos(phi2));

    TrajectoryIncrement inc;
    inc.d_north = Meters{L * std::sin(theta_avg) * std::cos(phi_avg)};
    inc.d_east = Meters{L * std::sin(theta_avg) * std::sin(phi_avg)};
    inc.d_tvd = Meters{L * std::cos(theta_avg)};
    inc.dogleg_severity = severity(doglegAngle(theta1, phi1, theta2, phi2), L);
    return inc;
}

TrajectoryIncrement balancedTangential(
    Meters depth1, Degrees inc1, Degrees az1,
    Meters depth2, Degrees inc2, Degrees az2
) noexcept {
    double L = depth2.value - depth1.value;
    if (std::abs(L) < kMinInterval) {
        return {};
    }

    double theta1 = inc1.toRadians().value;
    double theta2 = inc2.toRadians().value;
    double phi1 = az1.toRadians().value;
    double phi2 = az2.toRadians().value;

    TrajectoryIncrement inc;
    inc.d_north = Meters{(L / 2.0) * (
        std::sin(theta1) * std::cos(phi1) +
        std::sin(theta2) * std::cos(phi2)
    )};
    inc.d_east = Meters{(L / 2.0) * (
        std::sin(theta1) * std::sin(phi1) +
        std::sin(theta2) * std::sin(phi2)
    )};
    inc.d_tvd = Meters{(L / 2.0) * (std::cos(theta1) + std::cos(theta2))};
    inc.dogleg_severity = severity(doglegAngle(theta1, phi1, theta2, phi2), L);
    return inc;
}

double calculateRatioFactor(Radians dogleg) noexcept {
    double DL = dogleg.value;

    if (std::abs(DL) < kMinDogleg) {
        return 1.0;
    }

    return (2.0 / DL) * std::tan(DL / 2.0);
}

TrajectoryIncrement minimumCurvature(
    Meters depth1, Degrees inc1, Degrees az1,
    Meters depth2, Degrees inc2, Degrees az2
) noexcept {
    double L = depth2.value - depth1.value;
    if (std::abs(L) < kMinInterval) {
        return {};
    }

    double theta1 = inc1.toRadians().value;
    double theta2 = inc2.toRadians().value;
    double phi1 = az1.toRadians().value;
    double phi2 = az2.toRadians().value;

    double DL = doglegAngle(theta1, phi1, theta2, phi2);
    double RF = calculateRatioFactor(Radians{DL});

    TrajectoryIncrement inc;
    inc.d_north = Meters{(L / 2.0) * RF * (
        std::sin(theta1) * std::cos(phi1) +
        std::sin(theta2) * std::cos(phi2)
    )};
    inc.d_east = Meters{(L / 2.0) * RF * (
        std::sin(theta1) * std::sin(phi1) +
        std::sin(theta2) * std::sin(phi2)
    )};
    inc.d_tvd = Meters{(L / 2.0) * RF * (std::cos(theta1) + std::cos(theta2))};
    inc.dogleg_severity = severity(DL, L);
    return inc;
}

TrajectoryIncrement calculateIncrement(
    const SurveyStation& s1, const SurveyStation& s2, TrajectoryMethod method
) noexcept {
    switch (method) {
        case TrajectoryMethod::AverageAngle:
            return averageAngle(s1.md, s1.inclination, s1.azimuth,
                                s2.md, s2.inclination, s2.azimuth);
        case TrajectoryMethod::BalancedTangential:
            return balancedTangential(s1.md, s1.inclination, s1.azimuth,
                                      s2.md, s2.inclination, s2.azimuth);
        case TrajectoryMethod::MinimumCurvature:
            break;
    }
    return minimumCurvature(s1.md, s1.inclination, s1.azimuth,
                            s2.md, s2.inclination, s2.azimuth);
}

SurveyList computeSurveyTvd(SurveyList stations, TrajectoryMethod method, Meters tie_in_tvd) {
    std::stable_sort(stations.begin(), stations.end(), [](const SurveyStation& a, const SurveyStation& b) {
        return a.md.value < b.md.value;
    });
    if (stations.empty()) {
        return stations;
    }

    auto& first = stations.front();
    if (!first.tvd.has_value()) {
        first.tvd = tie_in_tvd + first.md;
    }

    for (size_t i = 1; i < stations.size(); ++i) {
        auto inc = calculateIncrement(stations[i - 1], stations[i], method);
        stations[i].tvd = *stations[i - 1].tvd + inc.d_tvd;
    }
    return stations;
}

TvdFunction identityTvd() {
    return [](double md) { return md; };
}

TvdSampler::TvdSampler(const SurveyList& stations) {
    std::vector<std::pair<double, double>> points;
    points.reserve(stations.size());
    for (const auto& s : stations) {
        double md = s.md.value;
        double tvd = s.tvd.has_value() ? s.tvd->value : md;
        if (!std::isfinite(md) || !std::isfinite(tvd)) {
            continue;
        }
        points.emplace_back(md, tvd);
    }
    std::stable_sort(points.begin(), points.end(), [](const auto& a, const auto& b) {
        return a.first < b.first;
    });

    for (const auto& [md, tvd] : points) {
        if (!md_.empty() && md <= md_.back()) {
            continue;
        }
        md_.push_back(md);
        tvd_.push_back(tvd_.empty() ? tvd : std::max(tvd, tvd_.back()));
    }
}

double TvdSampler::tvd(double md) const noexcept {
    md = finiteOrZero(md);
    if (md_.empty()) {
        return md;
    }
    if (md <= md_.front()) {
        return tvd_.front();
    }
    if (md >= md_.back()) {
        return tvd_.back();
    }

    auto it = std::upper_bound(md_.begin(), md_.end(), md);
    size_t hi = static_cast<size_t>(it - md_.begin());
    size_t lo = hi - 1;
    double span = std::max(md_[hi] - md_[lo], kMinSpan);
    double f = (md - md_[lo]) / span;
    return tvd_[lo] + f * (tvd_[hi] - tvd_[lo]);
}

TvdFunction TvdSampler::asFunction() const {
    return [sampler = *this](double md) { return sampler.tvd(md); };
}

} // namespace hydrovol::core
