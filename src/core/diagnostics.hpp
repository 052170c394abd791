/**
 * @file diagnostics.hpp
 * @brief Самопроверка ядра на эталонных скважинах
 *
 * Каждая проверка сравнивает расчётные величины с эталонными значениями
 * (формулы, а не сохранённые результаты) с абсолютным допуском.
 */

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace hydrovol::core {

/**
 * @brief Расчётная величина и её эталон
 */
struct CheckValue {
    std::string name;
    std::string unit;
    double actual = 0.0;
    double expected = 0.0;
    double tolerance = 0.0;   ///< Абсолютный допуск

    [[nodiscard]] double deviation() const noexcept { return actual - expected; }

    [[nodiscard]] bool withinTolerance() const noexcept {
        return std::isfinite(actual) && std::abs(deviation()) <= tolerance;
    }
};

/**
 * @brief Одна проверка самодиагностики
 *
 * Проверка пройдена, если все величины в допуске и нет ошибок
 * (условий, которые не сводятся к сравнению чисел).
 */
struct DiagnosticCheck {
    std::string id;
    std::string title;
    std::vector<CheckValue> values;
    std::vector<std::string> errors;
    std::string note;                        ///< Краткая сводка для отчёта

    void expect(std::string name, std::string unit, double actual, double expected, double tolerance) {
        values.push_back({std::move(name), std::move(unit), actual, expected, tolerance});
    }

    [[nodiscard]] bool passed() const noexcept {
        return errors.empty() &&
               std::all_of(values.begin(), values.end(),
                           [](const CheckValue& v) { return v.withinTolerance(); });
    }
};

struct BuildInfo {
    std::string version;
    std::string build_type;
    std::string platform;
};

struct DiagnosticsReport {
    BuildInfo build;
    std::string timestamp;
    std::filesystem::path artifacts_dir;
    std::vector<DiagnosticCheck> checks;

    [[nodiscard]] size_t failedCount() const noexcept {
        return static_cast<size_t>(std::count_if(checks.begin(), checks.end(),
            [](const DiagnosticCheck& c) { return !c.passed(); }));
    }

    [[nodiscard]] bool passed() const noexcept { return failedCount() == 0; }
};

struct DiagnosticsOptions {
    std::filesystem::path artifacts_dir;       ///< Корень каталога артефактов
};

/**
 * @brief Построить отчёт самопроверки.
 *
 * Проверки: запись на диск, объёмы эталонной скважины, наложение пачек,
 * гидростатика наклонной скважины, пустые и некорректные данные.
 */
[[nodiscard]] DiagnosticsReport buildDiagnosticsReport(const DiagnosticsOptions& options);

} // namespace hydrovol::core
