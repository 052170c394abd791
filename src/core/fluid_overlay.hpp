/**
 * @file fluid_overlay.hpp
 * @brief Наложение пачек раствора на слои флюида
 *
 * Слои одной области (колонна или затрубье) образуют разбиение [0, maxDepth]
 * без разрывов и наложений. Разбиение создаётся базовым слоем на всю глубину,
 * затем каждая пачка вырезает свой интервал из существующих слоёв.
 */

#pragma once

#include "model/fluid.hpp"
#include "model/sections.hpp"

namespace hydrovol::core {

using namespace hydrovol::model;

/**
 * @brief Базовый слой "Base" на интервале [0, maxDepth]
 */
[[nodiscard]] FluidLayer baseLayer(Domain domain, Meters max_depth, double density_kgm3);

/**
 * @brief Наложение нового слоя на разбиение
 *
 * 1. Интервал нового слоя нормализуется (top ≤ bottom).
 * 2. Слои вне интервала сохраняются; пересекающиеся обрезаются,
 *    остаются только их части выше и ниже интервала.
 * 3. Добавляется новый слой ровно на [top, bottom].
 * 4. Результат упорядочивается по кровле.
 *
 * @return Новый список слоёв (входной не изменяется)
 */
[[nodiscard]] LayerList overlayStep(const LayerList& layers, const FluidLayer& layer);

/**
 * @brief Перестроение слоёв обеих областей по пачкам
 *
 * Пачки применяются в порядке списка. Annulus и Both попадают в затрубье,
 * String и Both - в колонну. Интервал пачки обрезается по [0, maxDepth];
 * пачки нулевой длины после обрезки пропускаются.
 */
[[nodiscard]] LayerSet rebuildLayers(const MudStepList& steps, Meters max_depth,
                                     double base_string_density_kgm3,
                                     double base_annulus_density_kgm3);

/**
 * @brief Слияние соседних слоёв одинаковой плотности
 *
 * Слои упорядочиваются по кровле; касающиеся слои с плотностью,
 * отличающейся менее чем на 1e-9, объединяются (имя и цвет берутся у верхнего).
 */
[[nodiscard]] LayerList mergeAdjacentLayers(LayerList layers);

/**
 * @brief Есть ли среди пачек пересекающиеся интервалы
 *
 * Пачки с разным размещением (колонна/затрубье) тоже сравниваются.
 */
[[nodiscard]] bool stepsOverlap(const MudStepList& steps);

/**
 * @brief Объём, занимаемый слоем, м³
 *
 * Для затрубья - объём затрубья с учётом колонны, для колонны - внутренний объём.
 */
[[nodiscard]] double layerVolume(const FluidLayer& layer, const PipeList& pipes,
                                 const AnnulusList& annuli);

/**
 * @brief Сумма длин слоёв, м
 */
[[nodiscard]] double coveredLength(const LayerList& layers) noexcept;

} // namespace hydrovol::core
