/**
 * @file well_analysis.hpp
 * @brief Полный расчёт скважины: объёмы, слои, давления, циркуляция
 */

#pragma once

#include "fluid_overlay.hpp"
#include "hydrostatic.hpp"
#include "mixing.hpp"
#include "trajectory.hpp"
#include "volumes.hpp"
#include "model/validation.hpp"
#include "model/well.hpp"
#include <optional>
#include <string>
#include <vector>

namespace hydrovol::core {

using namespace hydrovol::model;

/**
 * @brief Опции расчёта
 */
struct AnalysisOptions {
    std::optional<Meters> interval_top;       ///< Кровля интервала для разложения объёмов
    std::optional<Meters> interval_bottom;    ///< Подошва интервала
    std::optional<Meters> pressure_depth;     ///< Переопределение глубины расчёта давления
    std::optional<double> target_density_kgm3;  ///< Плотность для расчёта утяжеления
    bool use_stored_layers = false;           ///< Использовать сохранённые слои вместо пересборки
    TrajectoryMethod trajectory_method = TrajectoryMethod::MinimumCurvature;
    WeightingAgent weighting_agent;
};

/**
 * @brief Удельные характеристики секции колонны
 */
struct PipeSummary {
    std::string name;
    double top_m = 0.0;
    double bottom_m = 0.0;
    double capacity_m3_per_m = 0.0;
    double displacement_m3_per_m = 0.0;
    double metal_m3_per_m = 0.0;
    double weight_kdan_per_m = 0.0;
};

/**
 * @brief Слой флюида с объёмом и положением по TVD
 */
struct LayerSummary {
    FluidLayer layer;
    double volume_m3 = 0.0;
    double tvd_top_m = 0.0;
    double tvd_bottom_m = 0.0;
};

/**
 * @brief Интервальный расчёт (разложение объёмов + балансовая пробка)
 */
struct IntervalReport {
    double top_m = 0.0;
    double bottom_m = 0.0;
    VolumeBreakdown volumes;
    PlugSolution plug;
};

/**
 * @brief Результат расчёта скважины
 */
struct WellReport {
    std::string well_name;
    double max_depth_m = 0.0;

    std::vector<PipeSummary> pipes;
    SliceList slices;
    VolumeBreakdown totals;
    double identity_residual_m3 = 0.0;
    std::optional<IntervalReport> interval;

    SurveyList surveys;                       ///< Станции с рассчитанным TVD
    TrajectoryMethod trajectory_method = TrajectoryMethod::MinimumCurvature;

    LayerSet layers;
    bool layers_rebuilt = true;               ///< false - использованы сохранённые слои
    bool steps_overlap = false;
    std::vector<LayerSummary> string_layers;
    std::vector<LayerSummary> annulus_layers;

    PressureSummary pressure;
    CirculatingVolume circulation;

    std::optional<double> target_density_kgm3;
    std::optional<BariteRequirement> barite;

    ValidationResult validation;
};

/**
 * @brief Расчёт скважины
 *
 * Не выбрасывает исключений на некорректной геометрии: проблемы
 * попадают в report.validation, числа ограничиваются ядром.
 */
[[nodiscard]] WellReport analyzeWell(const Well& well, const AnalysisOptions& options = {});

/**
 * @brief Отображение MD → TVD по инклинометрии скважины
 *
 * Если у части станций нет TVD, он рассчитывается заданным методом.
 * Без станций - тождественное отображение.
 */
[[nodiscard]] TvdSampler buildTvdSampler(const SurveyList& surveys,
                                         TrajectoryMethod method = TrajectoryMethod::MinimumCurvature);

} // namespace hydrovol::core
