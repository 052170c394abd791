/**
 * @file trajectory.hpp
 * @brief Траектория по инклинометрии и отображение MD → TVD
 *
 * Методы расчёта приращений: Average Angle, Balanced Tangential,
 * Minimum Curvature. Для гидростатики траектория сводится к функции
 * tvd(md), неубывающей по MD.
 */

#pragma once

#include "model/survey.hpp"
#include <functional>
#include <string>
#include <vector>

namespace hydrovol::core {

using namespace hydrovol::model;

/**
 * @brief Метод расчёта траектории
 */
enum class TrajectoryMethod {
    AverageAngle,         ///< Усреднение углов
    BalancedTangential,   ///< Балансный тангенциальный
    MinimumCurvature      ///< Минимальная кривизна
};

[[nodiscard]] std::string toString(TrajectoryMethod method);

/**
 * @brief Парсинг метода из строки ("average-angle", "balanced-tangential",
 * "minimum-curvature"); неизвестное значение - минимальная кривизна
 */
[[nodiscard]] TrajectoryMethod parseTrajectoryMethod(const std::string& str);

/**
 * @brief Приращения координат на интервале между станциями
 */
struct TrajectoryIncrement {
    Meters d_north{0.0};
    Meters d_east{0.0};
    Meters d_tvd{0.0};
    double dogleg_severity = 0.0;   ///< Интенсивность искривления, °/30 м
};

/**
 * @brief Расчёт приращений координат методом усреднения углов (Average Angle)
 */
[[nodiscard]] TrajectoryIncrement averageAngle(
    Meters depth1, Degrees inc1, Degrees az1,
    Meters depth2, Degrees inc2, Degrees az2
) noexcept;

/**
 * @brief Расчёт приращений координат балансным тангенциальным методом
 *
 * Усредняются компоненты направляющих векторов в начале и конце интервала.
 */
[[nodiscard]] TrajectoryIncrement balancedTangential(
    Meters depth1, Degrees inc1, Degrees az1,
    Meters depth2, Degrees inc2, Degrees az2
) noexcept;

/**
 * @brief Расчёт приращений координат методом минимальной кривизны
 *
 * cos(DL) = cos(I2 − I1) − sin(I1)·sin(I2)·(1 − cos(A2 − A1))
 * dTVD = L/2 · (cos I1 + cos I2) · RF
 */
[[nodiscard]] TrajectoryIncrement minimumCurvature(
    Meters depth1, Degrees inc1, Degrees az1,
    Meters depth2, Degrees inc2, Degrees az2
) noexcept;

/**
 * @brief Расчёт приращений заданным методом
 */
[[nodiscard]] TrajectoryIncrement calculateIncrement(
    const SurveyStation& s1, const SurveyStation& s2, TrajectoryMethod method
) noexcept;

/**
 * @brief Ratio Factor для метода минимальной кривизны
 *
 * RF = (2/DL) * tan(DL/2), где DL - угол искривления.
 * При DL ≈ 0 возвращает 1.0.
 */
[[nodiscard]] double calculateRatioFactor(Radians dogleg) noexcept;

/**
 * @brief Расчёт TVD всех станций
 *
 * Станции упорядочиваются по MD. TVD первой станции берётся из замера,
 * иначе участок от устья до неё считается вертикальным
 * (tie_in_tvd + MD). Остальные TVD накапливаются по приращениям.
 *
 * @param stations Станции инклинометрии
 * @param method Метод расчёта
 * @param tie_in_tvd TVD устья (MD = 0)
 * @return Станции по возрастанию MD с заполненным TVD
 */
[[nodiscard]] SurveyList computeSurveyTvd(
    SurveyList stations,
    TrajectoryMethod method = TrajectoryMethod::MinimumCurvature,
    Meters tie_in_tvd = Meters{0.0}
);

/**
 * @brief Отображение MD → TVD
 */
using TvdFunction = std::function<double(double)>;

/**
 * @brief Тождественное отображение (вертикальная скважина)
 */
[[nodiscard]] TvdFunction identityTvd();

/**
 * @brief Кусочно-линейная интерполяция TVD по станциям
 *
 * - станции упорядочиваются по MD, повторяющиеся MD отбрасываются;
 * - отсутствующий TVD заменяется на MD;
 * - TVD принудительно делается неубывающим;
 * - вне диапазона станций значение ограничивается первой/последней станцией;
 * - без станций отображение тождественное.
 */
class TvdSampler {
public:
    TvdSampler() = default;
    explicit TvdSampler(const SurveyList& stations);

    [[nodiscard]] double tvd(double md) const noexcept;

    [[nodiscard]] double operator()(double md) const noexcept { return tvd(md); }

    [[nodiscard]] bool empty() const noexcept { return md_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return md_.size(); }

    /**
     * @brief Копия сэмплера в виде TvdFunction
     */
    [[nodiscard]] TvdFunction asFunction() const;

private:
    std::vector<double> md_;
    std::vector<double> tvd_;
};

} // namespace hydrovol::core
