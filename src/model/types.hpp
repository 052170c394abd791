/**
 * @file types.hpp
 * @brief Базовые типы и перечисления
 */

#pragma once

#include "units.hpp"
#include <cstdint>
#include <string>

namespace hydrovol::model {

/**
 * @brief Область размещения флюида в скважине
 */
enum class Domain {
    String,   ///< Внутри бурильной колонны
    Annulus   ///< Затрубное пространство
};

/**
 * @brief Куда ставится пачка раствора (шаг закачки)
 */
enum class Placement {
    Annulus,  ///< Только в затрубье
    String,   ///< Только в колонну
    Both      ///< В колонну и в затрубье
};

/**
 * @brief Цвет в формате RGBA
 */
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    constexpr Color() noexcept = default;
    constexpr Color(uint8_t r_, uint8_t g_, uint8_t b_, uint8_t a_ = 255) noexcept
        : r(r_), g(g_), b(b_), a(a_) {}

    static constexpr Color gray() noexcept { return {128, 128, 128, 90}; }
    static constexpr Color blue() noexcept { return {0, 122, 255}; }

    /**
     * @brief Парсинг из HEX-строки (#RRGGBB или #RRGGBBAA)
     * @throws std::invalid_argument при некорректной строке
     */
    static Color fromHex(const std::string& hex);

    /**
     * @brief Преобразование в HEX-строку
     */
    [[nodiscard]] std::string toHex() const;

    constexpr bool operator==(const Color&) const noexcept = default;
};

[[nodiscard]] inline std::string toString(Domain domain) {
    switch (domain) {
        case Domain::String: return "string";
        case Domain::Annulus: return "annulus";
    }
    return "annulus";
}

[[nodiscard]] inline Domain parseDomain(const std::string& str) {
    if (str == "string") return Domain::String;
    return Domain::Annulus;
}

[[nodiscard]] inline std::string toString(Placement placement) {
    switch (placement) {
        case Placement::Annulus: return "annulus";
        case Placement::String: return "string";
        case Placement::Both: return "both";
    }
    return "annulus";
}

/**
 * @brief Парсинг Placement из строки
 *
 * Неизвестные значения трактуются как затрубье.
 */
[[nodiscard]] inline Placement parsePlacement(const std::string& str) {
    if (str == "string") return Placement::String;
    if (str == "both") return Placement::Both;
    return Placement::Annulus;
}

/**
 * @brief Попадает ли пачка с данным размещением в область
 */
[[nodiscard]] constexpr bool placementIncludes(Placement placement, Domain domain) noexcept {
    if (placement == Placement::Both) {
        return true;
    }
    return domain == Domain::Annulus ? placement == Placement::Annulus
                                     : placement == Placement::String;
}

} // namespace hydrovol::model
