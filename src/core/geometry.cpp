/**
 * @file geometry.cpp
 * @brief Реализация геометрии секций
 */

#include "geometry.hpp"
#include <algorithm>
#include <cmath>

namespace hydrovol::core {

double capacityPerMeter(const PipeSection& section) noexcept {
    return circleArea(section.inner_diameter.value);
}

double displacementPerMeter(const PipeSection& section) noexcept {
    return circleArea(section.outer_diameter.value);
}

double steelCrossSection(const PipeSection& section) noexcept {
    return std::max(0.0, displacementPerMeter(section) - capacityPerMeter(section));
}

double weightInAir(const PipeSection& section) noexcept {
    double mass_per_meter = 0.0;
    if (section.unit_weight_kgm.has_value()) {
        mass_per_meter = nonNegative(*section.unit_weight_kgm);
    } else {
        mass_per_meter = nonNegative(section.steel_density_kgm3) * steelCrossSection(section);
    }
    // кг/м · м/с² = Н/м; 1 кДаН = 10000 Н
    return mass_per_meter * kGravity / 10000.0;
}

double holeCapacityPerMeter(const AnnulusSection& section) noexcept {
    return circleArea(section.inner_diameter.value);
}

double clampedLength(const PipeSection& section) noexcept {
    return nonNegative(section.length.value);
}

double clampedLength(const AnnulusSection& section) noexcept {
    return nonNegative(section.length.value);
}

double sectionCapacity(const PipeSection& section) noexcept {
    return capacityPerMeter(section) * clampedLength(section);
}

double sectionDisplacement(const PipeSection& section) noexcept {
    return displacementPerMeter(section) * clampedLength(section);
}

namespace {

template <typename Section>
double topOf(const Section& s) noexcept {
    return finiteOrZero(s.top.value);
}

template <typename Section>
double bottomOf(const Section& s) noexcept {
    return topOf(s) + nonNegative(s.length.value);
}

/**
 * @brief Общая реализация правила неналожения
 *
 * skip - индекс самой секции в siblings (если она там хранится).
 */
template <typename Section>
Section clampToNeighbours(Section current, const std::vector<Section>& siblings,
                          std::optional<size_t> skip) {
    double top = topOf(current);
    double length = nonNegative(current.length.value);

    // Кровля опускается на самую глубокую подошву среди секций, внутри
    // которых она находится. Секции с общей кровлей учитываются все.
    // После сдвига кровля может попасть в следующую секцию, поэтому
    // проверка повторяется до устойчивого положения.
    for (size_t guard = 0; guard <= siblings.size(); ++guard) {
        double pushed = top;
        for (size_t i = 0; i < siblings.size(); ++i) {
            if (skip && *skip == i) {
                continue;
            }
            if (topOf(siblings[i]) <= top && bottomOf(siblings[i]) > top) {
                pushed = std::max(pushed, bottomOf(siblings[i]));
            }
        }
        if (pushed <= top) {
            break;
        }
        top = pushed;
    }

    const Section* next = nullptr;
    for (size_t i = 0; i < siblings.size(); ++i) {
        if (skip && *skip == i) {
            continue;
        }
        double t = topOf(siblings[i]);
        if (t >= top && (next == nullptr || t < topOf(*next))) {
            next = &siblings[i];
        }
    }
    if (next != nullptr) {
        length = std::min(length, std::max(0.0, topOf(*next) - top));
    }

    current.top = Meters{top};
    current.length = Meters{length};
    return current;
}

template <typename Section>
std::vector<Section> fillGapsImpl(std::vector<Section> sections) {
    std::stable_sort(sections.begin(), sections.end(), [](const Section& a, const Section& b) {
        return topOf(a) < topOf(b);
    });
    for (size_t i = 1; i < sections.size(); ++i) {
        auto& prev = sections[i - 1];
        double gap = topOf(sections[i]) - bottomOf(prev);
        if (gap > 0.0) {
            prev.length = Meters{nonNegative(prev.length.value) + gap};
        }
    }
    return sections;
}

template <typename Section>
const Section* findCoveringImpl(const std::vector<Section>& sections,
                                double top, double bottom) noexcept {
    for (const auto& s : sections) {
        if (topOf(s) <= top + kDepthEpsilon && bottomOf(s) >= bottom - kDepthEpsilon) {
            return &s;
        }
    }
    return nullptr;
}

} // namespace

PipeSection enforceNoOverlap(const PipeSection& section, const PipeList& siblings) {
    return clampToNeighbours(section, siblings, std::nullopt);
}

AnnulusSection enforceNoOverlap(const AnnulusSection& section, const AnnulusList& siblings) {
    return clampToNeighbours(section, siblings, std::nullopt);
}

void enforceNoOverlapAt(PipeList& sections, size_t index) {
    if (index >= sections.size()) {
        return;
    }
    sections[index] = clampToNeighbours(sections[index], sections, index);
}

void enforceNoOverlapAt(AnnulusList& sections, size_t index) {
    if (index >= sections.size()) {
        return;
    }
    sections[index] = clampToNeighbours(sections[index], sections, index);
}

PipeList fillGaps(PipeList sections) {
    return fillGapsImpl(std::move(sections));
}

AnnulusList fillGaps(AnnulusList sections) {
    return fillGapsImpl(std::move(sections));
}

const PipeSection* findCovering(const PipeList& pipes, double top, double bottom) noexcept {
    return findCoveringImpl(pipes, top, bottom);
}

const AnnulusSection* findCovering(const AnnulusList& annuli, double top, double bottom) noexcept {
    return findCoveringImpl(annuli, top, bottom);
}

} // namespace hydrovol::core
