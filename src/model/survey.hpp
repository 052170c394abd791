/**
 * @file survey.hpp
 * @brief Станция инклинометрии (замер направленного бурения)
 */

#pragma once

#include "units.hpp"
#include <optional>
#include <vector>

namespace hydrovol::model {

/**
 * @brief Станция инклинометрии
 *
 * TVD может отсутствовать до расчёта траектории; в этом случае
 * при построении отображения MD→TVD станция считается вертикальной (TVD = MD).
 */
struct SurveyStation {
    Meters md{0.0};                   ///< Глубина по стволу
    Degrees inclination{0.0};         ///< Зенитный угол
    Degrees azimuth{0.0};             ///< Азимут
    std::optional<Meters> tvd;        ///< Вертикальная глубина (если рассчитана)

    SurveyStation() = default;

    SurveyStation(Meters d, Degrees inc, Degrees az,
                  std::optional<Meters> tvd_ = std::nullopt)
        : md(d), inclination(inc), azimuth(az), tvd(tvd_) {}
};

using SurveyList = std::vector<SurveyStation>;

} // namespace hydrovol::model
