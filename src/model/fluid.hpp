/**
 * @file fluid.hpp
 * @brief Флюидные слои и шаги размещения раствора
 */

#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace hydrovol::model {

/**
 * @brief Слой флюида постоянной плотности в одной области
 *
 * Набор слоёв одной области покрывает [0, maxDepth] без разрывов и наложений.
 */
struct FluidLayer {
    Domain domain = Domain::Annulus;
    Meters top{0.0};                  ///< Кровля слоя (MD)
    Meters bottom{0.0};               ///< Подошва слоя (MD)
    std::string name;
    double density_kgm3 = 0.0;
    Color color = Color::gray();
    std::string fluid_ref;            ///< Ссылка на буровой раствор (может быть пустой)

    [[nodiscard]] Meters length() const noexcept { return bottom - top; }
};

using LayerList = std::vector<FluidLayer>;

/**
 * @brief Слои обеих областей скважины
 */
struct LayerSet {
    LayerList string;
    LayerList annulus;

    [[nodiscard]] const LayerList& of(Domain domain) const noexcept {
        return domain == Domain::String ? string : annulus;
    }

    [[nodiscard]] bool empty() const noexcept {
        return string.empty() && annulus.empty();
    }
};

/**
 * @brief Шаг размещения раствора, заданный пользователем
 *
 * Шаги не обязаны быть упорядочены и смежны.
 * Кровля и подошва могут быть перепутаны - нормализуются при наложении.
 */
struct MudStep {
    std::string name;
    Meters top{0.0};
    Meters bottom{0.0};
    double density_kgm3 = 0.0;
    Color color = Color::blue();
    Placement placement = Placement::Annulus;
    std::string fluid_ref;
};

using MudStepList = std::vector<MudStep>;

} // namespace hydrovol::model
