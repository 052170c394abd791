/**
 * @file geometry.hpp
 * @brief Геометрия секций колонны и ствола
 *
 * Удельные объёмы на метр и правило неналожения секций при редактировании.
 * Отрицательные и нечисловые размеры ограничиваются нулём до использования.
 */

#pragma once

#include "model/sections.hpp"
#include <optional>

namespace hydrovol::core {

using namespace hydrovol::model;

/**
 * @brief Толеранс сравнения глубин, м
 *
 * Границы секций, отличающиеся меньше чем на это значение, считаются совпадающими.
 */
inline constexpr double kDepthEpsilon = 1e-6;

/**
 * @brief Вместимость трубы на метр (по ID), м³/м
 *
 * capacity = π·ID²/4
 */
[[nodiscard]] double capacityPerMeter(const PipeSection& section) noexcept;

/**
 * @brief Вытеснение трубы на метр (по OD), м³/м
 *
 * Объём, заметаемый наружным диаметром: π·OD²/4.
 * Используется для затрубных расчётов ("мокрое" вытеснение).
 */
[[nodiscard]] double displacementPerMeter(const PipeSection& section) noexcept;

/**
 * @brief Площадь сечения металла трубы, м² (= "сухое" вытеснение на метр)
 *
 * π·(OD² − ID²)/4, не меньше нуля.
 */
[[nodiscard]] double steelCrossSection(const PipeSection& section) noexcept;

/**
 * @brief Вес трубы в воздухе, кДаН/м
 *
 * Погонная масса берётся из unit_weight_kgm, иначе считается по плотности
 * стали и площади металла. 1 кДаН = 10 кН.
 */
[[nodiscard]] double weightInAir(const PipeSection& section) noexcept;

/**
 * @brief Объём ствола на метр без колонны, м³/м
 */
[[nodiscard]] double holeCapacityPerMeter(const AnnulusSection& section) noexcept;

/**
 * @brief Длина секции, ограниченная нулём
 */
[[nodiscard]] double clampedLength(const PipeSection& section) noexcept;
[[nodiscard]] double clampedLength(const AnnulusSection& section) noexcept;

/**
 * @brief Внутренний объём секции колонны, м³
 */
[[nodiscard]] double sectionCapacity(const PipeSection& section) noexcept;

/**
 * @brief Объём, вытесняемый секцией по OD, м³
 */
[[nodiscard]] double sectionDisplacement(const PipeSection& section) noexcept;

/**
 * @brief Правило неналожения для редактируемой секции
 *
 * 1. prev - ближайшая секция с кровлей не ниже текущей; если текущая кровля
 *    выше подошвы prev, кровля опускается на подошву prev. Шаг повторяется,
 *    пока кровля не окажется вне соседних секций.
 * 2. Длина ограничивается нулём снизу.
 * 3. next - ближайшая секция с кровлей не выше текущей; длина ограничивается
 *    так, чтобы подошва не опустилась ниже кровли next.
 *
 * Соседние секции не изменяются. Повторное применение ничего не меняет.
 *
 * @param section Редактируемая секция
 * @param siblings Остальные секции списка (без редактируемой)
 * @return Скорректированная копия секции
 */
[[nodiscard]] PipeSection enforceNoOverlap(const PipeSection& section, const PipeList& siblings);
[[nodiscard]] AnnulusSection enforceNoOverlap(const AnnulusSection& section, const AnnulusList& siblings);

/**
 * @brief Правило неналожения для секции внутри списка
 *
 * Вариант для случая, когда редактируемая секция хранится в том же векторе.
 * Изменяется только sections[index]; при index вне диапазона ничего не делает.
 */
void enforceNoOverlapAt(PipeList& sections, size_t index);
void enforceNoOverlapAt(AnnulusList& sections, size_t index);

/**
 * @brief Устранение разрывов между секциями
 *
 * Секции упорядочиваются по кровле; при положительном разрыве
 * предыдущая секция удлиняется до кровли следующей.
 *
 * @return Упорядоченный список без разрывов
 */
[[nodiscard]] PipeList fillGaps(PipeList sections);
[[nodiscard]] AnnulusList fillGaps(AnnulusList sections);

/**
 * @brief Секция колонны, целиком покрывающая интервал [top, bottom]
 *
 * Сравнение с толерансом kDepthEpsilon. nullptr, если такой секции нет.
 */
[[nodiscard]] const PipeSection* findCovering(const PipeList& pipes, double top, double bottom) noexcept;

/**
 * @brief Секция ствола, целиком покрывающая интервал [top, bottom]
 */
[[nodiscard]] const AnnulusSection* findCovering(const AnnulusList& annuli, double top, double bottom) noexcept;

} // namespace hydrovol::core
