/**
 * @file hydrostatic.cpp
 * @brief Реализация гидростатического интегратора
 */

#include "hydrostatic.hpp"
#include <algorithm>
#include <cmath>

namespace hydrovol::core {

namespace {

double safeTvd(const TvdFunction& tvd_of, double md) {
    if (!tvd_of) {
        return md;
    }
    return finiteOrZero(tvd_of(md));
}

} // namespace

double hydrostaticPressure(const LayerList& layers, const TvdFunction& tvd_of,
                           double to_depth_tvd) {
    if (layers.empty()) {
        return 0.0;
    }

    double max_bottom = 0.0;
    for (const auto& layer : layers) {
        max_bottom = std::max({max_bottom, finiteOrZero(layer.top.value), finiteOrZero(layer.bottom.value)});
    }

    double limit = std::min(nonNegative(to_depth_tvd), nonNegative(safeTvd(tvd_of, max_bottom)));
    if (limit <= 0.0) {
        return 0.0;
    }

    double pressure = 0.0;
    for (const auto& layer : layers) {
        double t1 = safeTvd(tvd_of, finiteOrZero(layer.top.value));
        double t2 = safeTvd(tvd_of, finiteOrZero(layer.bottom.value));
        double top = std::max(0.0, std::min(t1, t2));
        double bottom = std::min(limit, std::max(t1, t2));
        if (bottom <= top) {
            continue;
        }
        pressure += nonNegative(layer.density_kgm3) * kGravity * (bottom - top) / 1000.0;
    }
    return pressure;
}

PressureSummary pressureSummary(const LayerSet& layers, const TvdFunction& tvd_of, Meters md) {
    PressureSummary summary;
    summary.md_m = nonNegative(md.value);
    summary.tvd_m = nonNegative(safeTvd(tvd_of, summary.md_m));
    summary.annulus_kpa = hydrostaticPressure(layers.annulus, tvd_of, summary.tvd_m);
    summary.string_kpa = hydrostaticPressure(layers.string, tvd_of, summary.tvd_m);
    return summary;
}

} // namespace hydrovol::core
