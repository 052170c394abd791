/**
 * @file mixing.hpp
 * @brief Расчёты смешения растворов и утяжеления баритом
 */

#pragma once

#include "model/well.hpp"

namespace hydrovol::core {

using namespace hydrovol::model;

/**
 * @brief Параметры утяжелителя
 */
struct WeightingAgent {
    double density_kgm3 = 4250.0;   ///< Плотность барита
    double sack_mass_kg = 40.0;     ///< Масса мешка
};

/**
 * @brief Потребность в утяжелителе
 */
struct BariteRequirement {
    double density_increase_kgm3 = 0.0;   ///< Требуемое повышение плотности
    double kg_per_m3 = 0.0;               ///< Масса барита на 1 м³ раствора
    double total_kg = 0.0;                ///< Масса на весь объём
    int sacks = 0;                        ///< Число мешков (округлено)
};

/**
 * @brief Объём раствора в циркуляции, м³
 */
struct CirculatingVolume {
    double string_capacity = 0.0;       ///< Внутренний объём колонны
    double string_displacement = 0.0;   ///< Металл колонны ("сухое" вытеснение)
    double string_wet = 0.0;            ///< Вместимость + металл
    double annular_with_pipe = 0.0;     ///< Затрубье при спущенной колонне
    double open_hole = 0.0;             ///< Ствол без колонны
    double tanks = 0.0;                 ///< Активные ёмкости
    double surface_lines = 0.0;         ///< Наземная обвязка
    double total = 0.0;                 ///< Колонна + затрубье + ёмкости + обвязка
};

/**
 * @brief Плотность смеси двух растворов по балансу масс, кг/м³
 *
 * (ρ1·V1 + ρ2·V2) / (V1 + V2). Отрицательные входы ограничиваются нулём.
 * При нулевом суммарном объёме смеси нет, возвращается 0, а не ρ1:
 * калькулятор смешения показывает пустую смесь нулевой плотностью.
 */
[[nodiscard]] double blendDensity(double volume1_m3, double density1_kgm3,
                                  double volume2_m3, double density2_kgm3) noexcept;

/**
 * @brief Расчёт барита для утяжеления от current до desired
 *
 * Wb = ρb·Δρ / (ρb − ρdesired) кг на 1 м³ исходного раствора.
 * Если требуемая плотность не выше текущей, все значения нулевые.
 */
[[nodiscard]] BariteRequirement bariteRequirement(double current_density_kgm3,
                                                  double desired_density_kgm3,
                                                  double volume_m3,
                                                  const WeightingAgent& agent = {}) noexcept;

/**
 * @brief Объём раствора в циркуляции по скважине
 */
[[nodiscard]] CirculatingVolume circulatingVolume(const Well& well);

} // namespace hydrovol::core
