/**
 * @file volumes.cpp
 * @brief Реализация агрегатора объёмов
 */

#include "volumes.hpp"
#include "geometry.hpp"
#include "slices.hpp"
#include <algorithm>
#include <cmath>

namespace hydrovol::core {

namespace {

constexpr int kPlugMaxIterations = 60;
constexpr double kPlugTolerance = 1e-6;

double overlapLength(double a_top, double a_bottom, double b_top, double b_bottom) noexcept {
    return std::max(0.0, std::min(a_bottom, b_bottom) - std::max(a_top, b_top));
}

template <typename Section>
double sectionOverlap(const Section& s, double top, double bottom) noexcept {
    double s_top = finiteOrZero(s.top.value);
    double s_bottom = s_top + nonNegative(s.length.value);
    return overlapLength(s_top, s_bottom, top, bottom);
}

} // namespace

VolumeBreakdown volumesBetween(const PipeList& pipes, const AnnulusList& annuli,
                               Meters top, Meters bottom) {
    double a = nonNegative(top.value);
    double b = nonNegative(bottom.value);
    if (a > b) {
        std::swap(a, b);
    }

    VolumeBreakdown result;
    result.length_m = b - a;
    if (b <= a) {
        return result;
    }

    for (const auto& slice : sliceGeometry(pipes, annuli)) {
        double len = overlapLength(slice.top.value, slice.bottom.value, a, b);
        result.annular_with_pipe += slice.area_m2 * len;
    }

    for (const auto& pipe : pipes) {
        double len = sectionOverlap(pipe, a, b);
        if (len <= 0.0) {
            continue;
        }
        result.string_capacity += capacityPerMeter(pipe) * len;
        result.string_displacement += displacementPerMeter(pipe) * len;
        result.string_metal += steelCrossSection(pipe) * len;
    }

    for (const auto& hole : annuli) {
        result.open_hole += holeCapacityPerMeter(hole) * sectionOverlap(hole, a, b);
    }

    return result;
}

VolumeBreakdown wellTotals(const PipeList& pipes, const AnnulusList& annuli) {
    double max_depth = 0.0;
    for (const auto& p : pipes) {
        max_depth = std::max(max_depth, finiteOrZero(p.top.value) + nonNegative(p.length.value));
    }
    for (const auto& a : annuli) {
        max_depth = std::max(max_depth, finiteOrZero(a.top.value) + nonNegative(a.length.value));
    }
    return volumesBetween(pipes, annuli, Meters{0.0}, Meters{max_depth});
}

double identityCheck(const VolumeBreakdown& volumes) noexcept {
    return volumes.open_hole -
           (volumes.annular_with_pipe + volumes.string_capacity + volumes.string_metal);
}

PlugSolution solveEqualVolumePipeLength(const PipeList& pipes, const AnnulusList& annuli,
                                        Meters top, Meters bottom) {
    double t = nonNegative(top.value);
    double b = nonNegative(bottom.value);
    if (t > b) {
        std::swap(t, b);
    }

    PlugSolution solution;
    solution.mud_top_m = b;
    if (b <= t) {
        return solution;
    }

    const double target = volumesBetween(pipes, annuli, Meters{t}, Meters{b}).open_hole;

    auto mudAbove = [&](double length) {
        return volumesBetween(pipes, annuli, Meters{std::max(0.0, b - length)}, Meters{b});
    };
    auto fill = [&](double length) {
        auto v = mudAbove(length);
        solution.length_m = length;
        solution.total_m3 = v.mudWithPipe();
        solution.annular_m3 = v.annular_with_pipe;
        solution.string_m3 = v.string_capacity;
        solution.mud_top_m = std::max(0.0, b - length);
    };

    double lo = 0.0;
    double hi = b;
    if (mudAbove(hi).mudWithPipe() < target) {
        auto v = volumesBetween(pipes, annuli, Meters{t}, Meters{b});
        solution.length_m = b - t;
        solution.total_m3 = v.mudWithPipe();
        solution.annular_m3 = v.annular_with_pipe;
        solution.string_m3 = v.string_capacity;
        solution.mud_top_m = t;
        solution.converged = false;
        return solution;
    }

    const double tolerance = std::max(1e-9, kPlugTolerance * std::max(target, 1.0));
    for (int i = 0; i < kPlugMaxIterations; ++i) {
        double mid = 0.5 * (lo + hi);
        double v = mudAbove(mid).mudWithPipe();
        if (std::abs(v - target) <= tolerance) {
            fill(mid);
            return solution;
        }
        if (v < target) {
            lo = mid;
        } else {
            hi = mid;
        }
    }

    fill(hi);
    return solution;
}

} // namespace hydrovol::core
