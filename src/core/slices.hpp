/**
 * @file slices.hpp
 * @brief Построение срезов глубины с постоянной геометрией
 */

#pragma once

#include "model/sections.hpp"
#include <vector>

namespace hydrovol::core {

using namespace hydrovol::model;

/**
 * @brief Общие границы двух независимых сегментаций
 *
 * Кровли и подошвы всех секций колонны и ствола, упорядоченные
 * по возрастанию; значения ближе kDepthEpsilon объединяются.
 * Отрицательные длины ограничиваются нулём, нечисловые глубины считаются нулевыми.
 */
[[nodiscard]] std::vector<double> depthBoundaries(const PipeList& pipes, const AnnulusList& annuli);

/**
 * @brief Разбиение скважины на срезы с постоянной геометрией
 *
 * Для каждой пары соседних границ:
 * - ищется секция ствола, покрывающая полосу; если её нет, срез не создаётся;
 * - ищется секция колонны; при её отсутствии OD принимается равным нулю;
 * - площадь кольцевого зазора π·(ID_ствола² − OD_трубы²)/4 ограничивается нулём.
 *
 * @return Срезы по возрастанию глубины (пустой список при отсутствии секций)
 */
[[nodiscard]] SliceList sliceGeometry(const PipeList& pipes, const AnnulusList& annuli);

} // namespace hydrovol::core
