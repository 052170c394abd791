/**
 * @file sections.hpp
 * @brief Секции бурильной колонны и затрубного пространства
 *
 * Обе последовательности секций заданы по глубине по стволу (MD)
 * и сегментированы независимо: границы колонны и ствола
 * не обязаны совпадать.
 */

#pragma once

#include "units.hpp"
#include <optional>
#include <string>
#include <vector>

namespace hydrovol::model {

/**
 * @brief Секция бурильной колонны
 */
struct PipeSection {
    std::string name;                     ///< Название (СБТ, УБТ, ...)
    Meters top{0.0};                      ///< Кровля секции (MD)
    Meters length{0.0};                   ///< Длина секции
    Meters inner_diameter{0.0};           ///< Внутренний диаметр трубы (ID)
    Meters outer_diameter{0.0};           ///< Наружный диаметр трубы (OD)
    double steel_density_kgm3 = kSteelDensity;   ///< Плотность материала трубы
    std::optional<double> unit_weight_kgm;       ///< Погонная масса из справочника, кг/м

    PipeSection() = default;

    PipeSection(std::string n, Meters t, Meters len, Meters id, Meters od)
        : name(std::move(n)), top(t), length(len),
          inner_diameter(id), outer_diameter(od) {}

    /**
     * @brief Подошва секции (MD)
     */
    [[nodiscard]] Meters bottom() const noexcept { return top + length; }
};

/**
 * @brief Секция ствола скважины или обсадной колонны
 *
 * inner_diameter - диаметр открытого ствола либо внутренний диаметр обсадной колонны.
 */
struct AnnulusSection {
    std::string name;                     ///< Название (кондуктор, открытый ствол, ...)
    Meters top{0.0};                      ///< Кровля секции (MD)
    Meters length{0.0};                   ///< Длина секции
    Meters inner_diameter{0.0};           ///< Диаметр ствола / ID обсадной колонны
    bool is_cased = false;                ///< Обсаженный участок

    AnnulusSection() = default;

    AnnulusSection(std::string n, Meters t, Meters len, Meters id, bool cased = false)
        : name(std::move(n)), top(t), length(len), inner_diameter(id), is_cased(cased) {}

    [[nodiscard]] Meters bottom() const noexcept { return top + length; }
};

using PipeList = std::vector<PipeSection>;
using AnnulusList = std::vector<AnnulusSection>;

/**
 * @brief Срез глубины с постоянной геометрией
 *
 * В пределах среза неизменны и секция ствола, и (если есть) секция колонны.
 * Создаётся построителем срезов, не сохраняется.
 */
struct DepthSlice {
    Meters top{0.0};
    Meters bottom{0.0};
    double area_m2 = 0.0;       ///< Площадь кольцевого зазора
    double volume_m3 = 0.0;     ///< Объём затрубья в срезе

    [[nodiscard]] Meters length() const noexcept { return bottom - top; }
};

using SliceList = std::vector<DepthSlice>;

} // namespace hydrovol::model
