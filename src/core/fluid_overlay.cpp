/**
 * @file fluid_overlay.cpp
 * @brief Реализация наложения слоёв флюида
 */

#include "fluid_overlay.hpp"
#include "volumes.hpp"
#include <algorithm>
#include <cmath>

namespace hydrovol::core {

namespace {

constexpr double kMergeTolerance = 1e-9;
constexpr double kStepOverlapTolerance = 1e-6;

void sortByTop(LayerList& layers) {
    std::stable_sort(layers.begin(), layers.end(), [](const FluidLayer& a, const FluidLayer& b) {
        return a.top.value < b.top.value;
    });
}

FluidLayer sliceOf(const FluidLayer& source, double top, double bottom) {
    FluidLayer part = source;
    part.top = Meters{top};
    part.bottom = Meters{bottom};
    return part;
}

FluidLayer layerFromStep(const MudStep& step, Domain domain, double top, double bottom) {
    FluidLayer layer;
    layer.domain = domain;
    layer.top = Meters{top};
    layer.bottom = Meters{bottom};
    layer.name = step.name;
    layer.density_kgm3 = step.density_kgm3;
    layer.color = step.color;
    layer.fluid_ref = step.fluid_ref;
    return layer;
}

} // namespace

FluidLayer baseLayer(Domain domain, Meters max_depth, double density_kgm3) {
    FluidLayer layer;
    layer.domain = domain;
    layer.top = Meters{0.0};
    layer.bottom = Meters{nonNegative(max_depth.value)};
    layer.name = "Base";
    layer.density_kgm3 = density_kgm3;
    return layer;
}

LayerList overlayStep(const LayerList& layers, const FluidLayer& layer) {
    double t = std::min(layer.top.value, layer.bottom.value);
    double b = std::max(layer.top.value, layer.bottom.value);

    LayerList out;
    out.reserve(layers.size() + 2);
    for (const auto& existing : layers) {
        double lt = existing.top.value;
        double lb = existing.bottom.value;
        if (lb <= t || lt >= b) {
            out.push_back(existing);
            continue;
        }
        if (lt < t) {
            out.push_back(sliceOf(existing, lt, t));
        }
        if (lb > b) {
            out.push_back(sliceOf(existing, b, lb));
        }
    }

    out.push_back(sliceOf(layer, t, b));
    sortByTop(out);
    return out;
}

LayerSet rebuildLayers(const MudStepList& steps, Meters max_depth,
                       double base_string_density_kgm3,
                       double base_annulus_density_kgm3) {
    double depth = nonNegative(max_depth.value);

    LayerSet set;
    set.string.push_back(baseLayer(Domain::String, Meters{depth}, base_string_density_kgm3));
    set.annulus.push_back(baseLayer(Domain::Annulus, Meters{depth}, base_annulus_density_kgm3));

    for (const auto& step : steps) {
        double t = std::min(finiteOrZero(step.top.value), finiteOrZero(step.bottom.value));
        double b = std::max(finiteOrZero(step.top.value), finiteOrZero(step.bottom.value));
        t = std::clamp(t, 0.0, depth);
        b = std::clamp(b, 0.0, depth);
        if (b <= t) {
            continue;
        }

        if (placementIncludes(step.placement, Domain::Annulus)) {
            set.annulus = overlayStep(set.annulus, layerFromStep(step, Domain::Annulus, t, b));
        }
        if (placementIncludes(step.placement, Domain::String)) {
            set.string = overlayStep(set.string, layerFromStep(step, Domain::String, t, b));
        }
    }

    return set;
}

LayerList mergeAdjacentLayers(LayerList layers) {
    sortByTop(layers);

    LayerList merged;
    merged.reserve(layers.size());
    for (auto& layer : layers) {
        if (!merged.empty()) {
            auto& last = merged.back();
            bool same_density = std::abs(last.density_kgm3 - layer.density_kgm3) < kMergeTolerance;
            bool touching = std::abs(last.bottom.value - layer.top.value) < kMergeTolerance;
            if (same_density && touching) {
                last.bottom = Meters{std::max(last.bottom.value, layer.bottom.value)};
                continue;
            }
        }
        merged.push_back(std::move(layer));
    }
    return merged;
}

bool stepsOverlap(const MudStepList& steps) {
    std::vector<std::pair<double, double>> spans;
    spans.reserve(steps.size());
    for (const auto& s : steps) {
        spans.emplace_back(std::min(s.top.value, s.bottom.value),
                           std::max(s.top.value, s.bottom.value));
    }
    std::sort(spans.begin(), spans.end());

    for (size_t i = 1; i < spans.size(); ++i) {
        if (spans[i].first < spans[i - 1].second - kStepOverlapTolerance) {
            return true;
        }
    }
    return false;
}

double layerVolume(const FluidLayer& layer, const PipeList& pipes, const AnnulusList& annuli) {
    auto v = volumesBetween(pipes, annuli, layer.top, layer.bottom);
    return layer.domain == Domain::Annulus ? v.annular_with_pipe : v.string_capacity;
}

double coveredLength(const LayerList& layers) noexcept {
    double total = 0.0;
    for (const auto& layer : layers) {
        total += nonNegative(layer.length().value);
    }
    return total;
}

} // namespace hydrovol::core
