/**
 * @file slices.cpp
 * @brief Реализация построителя срезов
 */

#include "slices.hpp"
#include "geometry.hpp"
#include <algorithm>

namespace hydrovol::core {

namespace {

template <typename Section>
void collectBounds(const std::vector<Section>& sections, std::vector<double>& out) {
    for (const auto& s : sections) {
        double top = finiteOrZero(s.top.value);
        out.push_back(top);
        out.push_back(top + nonNegative(s.length.value));
    }
}

} // namespace

std::vector<double> depthBoundaries(const PipeList& pipes, const AnnulusList& annuli) {
    std::vector<double> bounds;
    bounds.reserve(2 * (pipes.size() + annuli.size()));
    collectBounds(pipes, bounds);
    collectBounds(annuli, bounds);

    std::sort(bounds.begin(), bounds.end());
    auto last = std::unique(bounds.begin(), bounds.end(), [](double a, double b) {
        return b - a < kDepthEpsilon;
    });
    bounds.erase(last, bounds.end());
    return bounds;
}

SliceList sliceGeometry(const PipeList& pipes, const AnnulusList& annuli) {
    SliceList slices;
    if (annuli.empty()) {
        return slices;
    }

    auto bounds = depthBoundaries(pipes, annuli);
    for (size_t i = 0; i + 1 < bounds.size(); ++i) {
        double top = bounds[i];
        double bottom = bounds[i + 1];
        if (bottom <= top) {
            continue;
        }

        const AnnulusSection* hole = findCovering(annuli, top, bottom);
        if (hole == nullptr) {
            continue;
        }

        const PipeSection* pipe = findCovering(pipes, top, bottom);
        double pipe_area = pipe != nullptr ? displacementPerMeter(*pipe) : 0.0;

        DepthSlice slice;
        slice.top = Meters{top};
        slice.bottom = Meters{bottom};
        slice.area_m2 = std::max(0.0, holeCapacityPerMeter(*hole) - pipe_area);
        slice.volume_m3 = slice.area_m2 * (bottom - top);
        slices.push_back(slice);
    }
    return slices;
}

} // namespace hydrovol::core
