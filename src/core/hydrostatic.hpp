/**
 * @file hydrostatic.hpp
 * @brief Гидростатическое давление столба слоёв флюида
 *
 * Слои заданы по MD, давление интегрируется по TVD:
 * p = Σ ρ · g · ΔTVD / 1000, кПа (ρ в кг/м³, g = 9.80665 м/с²).
 */

#pragma once

#include "model/fluid.hpp"
#include "trajectory.hpp"

namespace hydrovol::core {

using namespace hydrovol::model;

/**
 * @brief Гидростатическое давление от устья до заданной TVD, кПа
 *
 * limit = clamp(to_depth_tvd, 0, tvd(max подошва слоёв)).
 * Границы каждого слоя переводятся в TVD, интервал нормализуется
 * и обрезается по [0, limit]. Отрицательные и нечисловые плотности
 * считаются нулевыми; нечисловые значения tvd() - нулевыми.
 *
 * @param layers Слои одной области
 * @param tvd_of Отображение MD → TVD
 * @param to_depth_tvd Глубина по вертикали
 */
[[nodiscard]] double hydrostaticPressure(const LayerList& layers, const TvdFunction& tvd_of,
                                         double to_depth_tvd);

/**
 * @brief Сводка давлений на глубине
 */
struct PressureSummary {
    double md_m = 0.0;
    double tvd_m = 0.0;
    double annulus_kpa = 0.0;
    double string_kpa = 0.0;

    /**
     * @brief Перепад затрубье − колонна, кПа
     *
     * Положительный - давление в затрубье выше.
     */
    [[nodiscard]] double differentialKpa() const noexcept { return annulus_kpa - string_kpa; }

    /**
     * @brief Эквивалентная плотность столба в затрубье, кг/м³
     */
    [[nodiscard]] double annulusEquivalentDensity() const noexcept {
        return tvd_m > 0.0 ? annulus_kpa * 1000.0 / (kGravity * tvd_m) : 0.0;
    }

    [[nodiscard]] double stringEquivalentDensity() const noexcept {
        return tvd_m > 0.0 ? string_kpa * 1000.0 / (kGravity * tvd_m) : 0.0;
    }
};

/**
 * @brief Давления в затрубье и колонне на глубине md
 */
[[nodiscard]] PressureSummary pressureSummary(const LayerSet& layers, const TvdFunction& tvd_of,
                                              Meters md);

} // namespace hydrovol::core
