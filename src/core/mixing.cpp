/**
 * @file mixing.cpp
 * @brief Реализация расчётов смешения
 */

#include "mixing.hpp"
#include "volumes.hpp"
#include <algorithm>
#include <cmath>

namespace hydrovol::core {

double blendDensity(double volume1_m3, double density1_kgm3,
                    double volume2_m3, double density2_kgm3) noexcept {
    double v1 = nonNegative(volume1_m3);
    double v2 = nonNegative(volume2_m3);
    double total = v1 + v2;
    if (total <= 0.0) {
        return 0.0;
    }
    return (v1 * nonNegative(density1_kgm3) + v2 * nonNegative(density2_kgm3)) / total;
}

BariteRequirement bariteRequirement(double current_density_kgm3,
                                    double desired_density_kgm3,
                                    double volume_m3,
                                    const WeightingAgent& agent) noexcept {
    BariteRequirement req;
    double current = nonNegative(current_density_kgm3);
    double desired = nonNegative(desired_density_kgm3);
    req.density_increase_kgm3 = std::max(desired - current, 0.0);
    if (req.density_increase_kgm3 <= 0.0) {
        return req;
    }

    double rho_b = std::max(nonNegative(agent.density_kgm3), 1.0);
    req.kg_per_m3 = rho_b * req.density_increase_kgm3 / std::max(rho_b - desired, 1.0);
    req.total_kg = req.kg_per_m3 * nonNegative(volume_m3);
    req.sacks = static_cast<int>(std::lround(req.total_kg / std::max(nonNegative(agent.sack_mass_kg), 1.0)));
    return req;
}

CirculatingVolume circulatingVolume(const Well& well) {
    auto totals = wellTotals(well.pipes, well.annuli);

    CirculatingVolume cv;
    cv.string_capacity = totals.string_capacity;
    cv.string_displacement = totals.string_metal;
    cv.string_wet = totals.string_capacity + totals.string_metal;
    cv.annular_with_pipe = totals.annular_with_pipe;
    cv.open_hole = totals.open_hole;
    cv.tanks = nonNegative(well.settings.active_mud_volume_m3);
    cv.surface_lines = nonNegative(well.settings.surface_line_volume_m3);
    cv.total = cv.string_capacity + cv.annular_with_pipe + cv.tanks + cv.surface_lines;
    return cv;
}

} // namespace hydrovol::core
