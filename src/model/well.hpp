/**
 * @file well.hpp
 * @brief Скважина: геометрия, инклинометрия, размещение растворов
 */

#pragma once

#include "fluid.hpp"
#include "sections.hpp"
#include "survey.hpp"
#include <algorithm>
#include <string>

namespace hydrovol::model {

/**
 * @brief Параметры скважины, не относящиеся к геометрии
 */
struct WellSettings {
    double base_string_density_kgm3 = 1260.0;   ///< Базовый раствор в колонне
    double base_annulus_density_kgm3 = 1260.0;  ///< Базовый раствор в затрубье
    double active_mud_volume_m3 = 0.0;          ///< Раствор в активных ёмкостях
    double surface_line_volume_m3 = 0.0;        ///< Раствор в наземной обвязке
    Meters pressure_depth{3200.0};              ///< Глубина (MD) для расчёта давления
};

/**
 * @brief Скважина
 *
 * Все коллекции непустые по построению (по умолчанию пустые векторы).
 * Слои string_layers/annulus_layers - материализованный результат
 * наложения шагов mud_steps, перестраивается по запросу.
 */
struct Well {
    std::string name;
    std::string description;

    PipeList pipes;
    AnnulusList annuli;
    SurveyList surveys;
    MudStepList mud_steps;
    LayerSet layers;

    WellSettings settings;

    std::string file_path;            ///< Путь к файлу (не сериализуется)

    /**
     * @brief Максимальная глубина по всем секциям колонны и ствола
     */
    [[nodiscard]] Meters maxDepth() const noexcept {
        double depth = 0.0;
        for (const auto& p : pipes) {
            depth = std::max(depth, finiteOrZero(p.top.value) + nonNegative(p.length.value));
        }
        for (const auto& a : annuli) {
            depth = std::max(depth, finiteOrZero(a.top.value) + nonNegative(a.length.value));
        }
        return Meters{depth};
    }

    [[nodiscard]] std::string displayName() const {
        if (!name.empty()) {
            return name;
        }
        if (!file_path.empty()) {
            return file_path;
        }
        return "Безымянная скважина";
    }
};

} // namespace hydrovol::model
