/**
 * @file validation.hpp
 * @brief Валидация геометрии и шагов размещения скважины
 *
 * Ядро расчёта не отвергает некорректные данные, а ограничивает их
 * (отрицательные размеры → 0, перевёрнутые интервалы → нормализуются).
 * Эта проверка выполняется на границе (загрузка файла, CLI) и сообщает
 * о проблемах, которые ограничение скрыло бы.
 */

#pragma once

#include "well.hpp"
#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

namespace hydrovol::model {

/**
 * @brief Тип ошибки валидации
 */
enum class ValidationErrorType {
    NegativeLength,          ///< Отрицательная длина секции
    NegativeDiameter,        ///< Отрицательный диаметр
    InnerExceedsOuter,       ///< ID трубы больше OD
    PipeExceedsHole,         ///< OD трубы больше диаметра ствола
    OverlappingSections,     ///< Наложение секций
    InvalidDensity,          ///< Отрицательная или нечисловая плотность
    NonFiniteValue           ///< NaN / бесконечность
};

/**
 * @brief Ошибка валидации
 */
struct ValidationError {
    ValidationErrorType type;
    std::string field;                    ///< Поле или коллекция с ошибкой
    std::string message;                  ///< Описание ошибки
    std::optional<size_t> item_index;     ///< Индекс элемента коллекции

    [[nodiscard]] std::string toString() const {
        if (item_index.has_value()) {
            return field + "[" + std::to_string(*item_index + 1) + "]: " + message;
        }
        return message;
    }
};

/**
 * @brief Результат валидации
 */
struct ValidationResult {
    bool is_valid = true;
    std::vector<ValidationError> errors;
    std::vector<std::string> warnings;    ///< Некритичные замечания

    void addError(ValidationErrorType type, const std::string& field,
                  const std::string& message, std::optional<size_t> idx = std::nullopt) {
        is_valid = false;
        errors.push_back({type, field, message, idx});
    }

    void addWarning(const std::string& message) {
        warnings.push_back(message);
    }

    [[nodiscard]] bool hasErrors() const noexcept { return !errors.empty(); }
    [[nodiscard]] bool hasWarnings() const noexcept { return !warnings.empty(); }
};

namespace validation_limits {
    constexpr double kDepthTolerance = 1e-6;   ///< Толеранс сравнения глубин
}

namespace detail {

template <typename Section>
void checkSectionList(const std::vector<Section>& sections, const std::string& field,
                      ValidationResult& result) {
    for (size_t i = 0; i < sections.size(); ++i) {
        const auto& s = sections[i];
        if (!std::isfinite(s.top.value) || !std::isfinite(s.length.value) ||
            !std::isfinite(s.inner_diameter.value)) {
            result.addError(ValidationErrorType::NonFiniteValue, field,
                "Нечисловое значение глубины, длины или диаметра", i);
            continue;
        }
        if (s.length.value < 0.0) {
            result.addError(ValidationErrorType::NegativeLength, field,
                "Отрицательная длина " + std::to_string(s.length.value) + " м", i);
        }
        if (s.inner_diameter.value < 0.0) {
            result.addError(ValidationErrorType::NegativeDiameter, field,
                "Отрицательный внутренний диаметр " + std::to_string(s.inner_diameter.value) + " м", i);
        }
    }

    // Наложения и разрывы проверяются по списку, упорядоченному по кровле
    // Нечисловые секции уже отмечены ошибкой и в сравнении не участвуют
    std::vector<size_t> order;
    order.reserve(sections.size());
    for (size_t i = 0; i < sections.size(); ++i) {
        if (std::isfinite(sections[i].top.value) && std::isfinite(sections[i].length.value)) {
            order.push_back(i);
        }
    }
    std::sort(order.begin(), order.end(), [&sections](size_t a, size_t b) {
        return sections[a].top.value < sections[b].top.value;
    });

    for (size_t k = 1; k < order.size(); ++k) {
        const auto& prev = sections[order[k - 1]];
        const auto& curr = sections[order[k]];
        double prev_bottom = prev.bottom().value;
        double curr_top = curr.top.value;
        if (curr_top < prev_bottom - validation_limits::kDepthTolerance) {
            result.addError(ValidationErrorType::OverlappingSections, field,
                "Кровля " + std::to_string(curr_top) + " м выше подошвы предыдущей секции (" +
                std::to_string(prev_bottom) + " м)", order[k]);
        } else if (curr_top > prev_bottom + validation_limits::kDepthTolerance) {
            result.addWarning(field + ": разрыв " + std::to_string(curr_top - prev_bottom) +
                " м между " + std::to_string(prev_bottom) + " и " + std::to_string(curr_top) + " м");
        }
    }
}

} // namespace detail

/**
 * @brief Валидация геометрии и шагов размещения
 */
[[nodiscard]] inline ValidationResult validateWell(const Well& well) {
    ValidationResult result;

    detail::checkSectionList(well.pipes, "drill_string", result);
    detail::checkSectionList(well.annuli, "annulus", result);

    for (size_t i = 0; i < well.pipes.size(); ++i) {
        const auto& p = well.pipes[i];
        if (p.outer_diameter.value < 0.0 || !std::isfinite(p.outer_diameter.value)) {
            result.addError(ValidationErrorType::NegativeDiameter, "drill_string",
                "Некорректный наружный диаметр " + std::to_string(p.outer_diameter.value) + " м", i);
            continue;
        }
        if (p.inner_diameter.value > p.outer_diameter.value) {
            result.addError(ValidationErrorType::InnerExceedsOuter, "drill_string",
                "ID " + std::to_string(p.inner_diameter.value) + " м больше OD " +
                std::to_string(p.outer_diameter.value) + " м", i);
        }

        // OD трубы против диаметра ствола на пересекающихся участках
        for (const auto& a : well.annuli) {
            bool overlaps = p.bottom().value > a.top.value && p.top.value < a.bottom().value;
            if (overlaps && p.outer_diameter.value > a.inner_diameter.value) {
                result.addError(ValidationErrorType::PipeExceedsHole, "drill_string",
                    "OD " + std::to_string(p.outer_diameter.value) +
                    " м больше диаметра ствола \"" + a.name + "\" (" +
                    std::to_string(a.inner_diameter.value) + " м)", i);
                break;
            }
        }
    }

    for (size_t i = 0; i < well.mud_steps.size(); ++i) {
        double rho = well.mud_steps[i].density_kgm3;
        if (!std::isfinite(rho) || rho < 0.0) {
            result.addError(ValidationErrorType::InvalidDensity, "mud_steps",
                "Некорректная плотность " + std::to_string(rho) + " кг/м³", i);
        }
    }

    if (well.annuli.empty() && !well.pipes.empty()) {
        result.addWarning("Не заданы секции ствола: объёмы затрубья будут нулевыми");
    }

    return result;
}

} // namespace hydrovol::model
