/**
 * @file well_analysis.cpp
 * @brief Реализация полного расчёта скважины
 */

#include "well_analysis.hpp"
#include "geometry.hpp"
#include "slices.hpp"
#include <algorithm>

namespace hydrovol::core {

namespace {

bool hasMissingTvd(const SurveyList& surveys) {
    return std::any_of(surveys.begin(), surveys.end(), [](const SurveyStation& s) {
        return !s.tvd.has_value();
    });
}

SurveyList resolveSurveys(const SurveyList& surveys, TrajectoryMethod method) {
    if (hasMissingTvd(surveys)) {
        return computeSurveyTvd(surveys, method);
    }
    SurveyList sorted = surveys;
    std::stable_sort(sorted.begin(), sorted.end(), [](const SurveyStation& a, const SurveyStation& b) {
        return a.md.value < b.md.value;
    });
    return sorted;
}

std::vector<LayerSummary> summarizeLayers(const LayerList& layers, const Well& well,
                                          const TvdSampler& sampler) {
    std::vector<LayerSummary> out;
    out.reserve(layers.size());
    for (const auto& layer : layers) {
        LayerSummary s;
        s.layer = layer;
        s.volume_m3 = layerVolume(layer, well.pipes, well.annuli);
        s.tvd_top_m = sampler.tvd(layer.top.value);
        s.tvd_bottom_m = sampler.tvd(layer.bottom.value);
        out.push_back(std::move(s));
    }
    return out;
}

} // namespace

TvdSampler buildTvdSampler(const SurveyList& surveys, TrajectoryMethod method) {
    return TvdSampler(resolveSurveys(surveys, method));
}

WellReport analyzeWell(const Well& well, const AnalysisOptions& options) {
    WellReport report;
    report.well_name = well.displayName();
    report.max_depth_m = well.maxDepth().value;
    report.validation = validateWell(well);

    for (const auto& p : well.pipes) {
        PipeSummary s;
        s.name = p.name;
        s.top_m = p.top.value;
        s.bottom_m = p.bottom().value;
        s.capacity_m3_per_m = capacityPerMeter(p);
        s.displacement_m3_per_m = displacementPerMeter(p);
        s.metal_m3_per_m = steelCrossSection(p);
        s.weight_kdan_per_m = weightInAir(p);
        report.pipes.push_back(std::move(s));
    }

    report.slices = sliceGeometry(well.pipes, well.annuli);
    report.totals = wellTotals(well.pipes, well.annuli);
    report.identity_residual_m3 = identityCheck(report.totals);

    if (options.interval_top.has_value() && options.interval_bottom.has_value()) {
        IntervalReport interval;
        interval.top_m = std::min(options.interval_top->value, options.interval_bottom->value);
        interval.bottom_m = std::max(options.interval_top->value, options.interval_bottom->value);
        interval.volumes = volumesBetween(well.pipes, well.annuli,
                                          *options.interval_top, *options.interval_bottom);
        interval.plug = solveEqualVolumePipeLength(well.pipes, well.annuli,
                                                   *options.interval_top, *options.interval_bottom);
        report.interval = interval;
    }

    report.trajectory_method = options.trajectory_method;
    report.surveys = resolveSurveys(well.surveys, options.trajectory_method);
    TvdSampler sampler(report.surveys);

    report.steps_overlap = stepsOverlap(well.mud_steps);
    if (options.use_stored_layers && !well.layers.empty()) {
        report.layers = well.layers;
        report.layers_rebuilt = false;
    } else {
        report.layers = rebuildLayers(well.mud_steps, well.maxDepth(),
                                      well.settings.base_string_density_kgm3,
                                      well.settings.base_annulus_density_kgm3);
    }
    report.string_layers = summarizeLayers(report.layers.string, well, sampler);
    report.annulus_layers = summarizeLayers(report.layers.annulus, well, sampler);

    Meters depth = options.pressure_depth.value_or(well.settings.pressure_depth);
    report.pressure = pressureSummary(report.layers, sampler.asFunction(), depth);

    report.circulation = circulatingVolume(well);

    if (options.target_density_kgm3.has_value()) {
        report.target_density_kgm3 = options.target_density_kgm3;
        report.barite = bariteRequirement(well.settings.base_annulus_density_kgm3,
                                          *options.target_density_kgm3,
                                          report.circulation.total,
                                          options.weighting_agent);
    }

    if (report.steps_overlap) {
        report.validation.addWarning("Интервалы пачек пересекаются: более поздняя пачка замещает раннюю");
    }

    return report;
}

} // namespace hydrovol::core
