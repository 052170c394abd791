/**
 * @file volumes.hpp
 * @brief Объёмы затрубья, колонны и открытого ствола в интервале глубин
 *
 * Все функции тотальны: интервал с A > B нормализуется перестановкой,
 * отрицательные глубины ограничиваются нулём, результат не бывает отрицательным.
 */

#pragma once

#include "model/sections.hpp"

namespace hydrovol::core {

using namespace hydrovol::model;

/**
 * @brief Разложение объёма интервала, м³
 */
struct VolumeBreakdown {
    double length_m = 0.0;              ///< Длина интервала
    double annular_with_pipe = 0.0;     ///< Затрубье с учётом колонны
    double string_capacity = 0.0;       ///< Внутренний объём колонны (по ID)
    double string_displacement = 0.0;   ///< "Мокрое" вытеснение (по OD)
    double string_metal = 0.0;          ///< "Сухое" вытеснение (металл трубы)
    double open_hole = 0.0;             ///< Ствол без колонны

    [[nodiscard]] double annularPerMeter() const noexcept { return perMeter(annular_with_pipe); }
    [[nodiscard]] double capacityPerMeter() const noexcept { return perMeter(string_capacity); }
    [[nodiscard]] double displacementPerMeter() const noexcept { return perMeter(string_displacement); }
    [[nodiscard]] double metalPerMeter() const noexcept { return perMeter(string_metal); }
    [[nodiscard]] double openHolePerMeter() const noexcept { return perMeter(open_hole); }

    /**
     * @brief Объём раствора в интервале при спущенной колонне (затрубье + колонна)
     */
    [[nodiscard]] double mudWithPipe() const noexcept { return annular_with_pipe + string_capacity; }

private:
    [[nodiscard]] double perMeter(double volume) const noexcept {
        return length_m > 0.0 ? volume / length_m : 0.0;
    }
};

/**
 * @brief Объёмы в интервале [top, bottom] (MD)
 *
 * - annular_with_pipe: сумма объёмов срезов, обрезанных по интервалу;
 * - string_capacity / string_displacement / string_metal: по секциям колонны,
 *   пересекающим интервал, на длину пересечения;
 * - open_hole: по секциям ствола без учёта колонны.
 */
[[nodiscard]] VolumeBreakdown volumesBetween(const PipeList& pipes, const AnnulusList& annuli,
                                             Meters top, Meters bottom);

/**
 * @brief Объёмы по всей скважине (от 0 до максимальной глубины)
 */
[[nodiscard]] VolumeBreakdown wellTotals(const PipeList& pipes, const AnnulusList& annuli);

/**
 * @brief Невязка баланса объёмов
 *
 * open_hole − (annular_with_pipe + string_capacity + string_metal).
 * Близка к нулю, если в интервале колонна везде находится внутри ствола.
 */
[[nodiscard]] double identityCheck(const VolumeBreakdown& volumes) noexcept;

/**
 * @brief Решение задачи о равнообъёмной пачке (балансовая пробка)
 */
struct PlugSolution {
    double length_m = 0.0;      ///< Длина интервала со спущенной колонной
    double total_m3 = 0.0;      ///< Объём раствора (затрубье + колонна)
    double annular_m3 = 0.0;
    double string_m3 = 0.0;
    double mud_top_m = 0.0;     ///< Кровля пачки при спущенной колонне (MD)
    bool converged = true;      ///< false - колонны не хватает, возвращён целевой интервал
};

/**
 * @brief Длина пачки при спущенной колонне, равная по объёму открытому интервалу
 *
 * Целевой объём - объём ствола без колонны в [top, bottom]. Ищется длина L
 * над подошвой bottom, при которой затрубье + колонна на [bottom − L, bottom]
 * содержат тот же объём. Поиск бисекцией на [0, bottom], не более 60 итераций,
 * относительная точность 1e-6.
 *
 * Если даже при L = bottom объёма не хватает, возвращается интервал [top, bottom]
 * с converged = false.
 */
[[nodiscard]] PlugSolution solveEqualVolumePipeLength(const PipeList& pipes, const AnnulusList& annuli,
                                                      Meters top, Meters bottom);

} // namespace hydrovol::core
