/**
 * @file types.cpp
 * @brief Реализация базовых типов
 */

#include "types.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace hydrovol::model {

Color Color::fromHex(const std::string& hex) {
    std::string s = hex;

    // Пробелы по краям и ведущий #
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    s = s.substr(start);
    if (!s.empty() && s[0] == '#') {
        s = s.substr(1);
    }

    if (s.length() != 6 && s.length() != 8) {
        throw std::invalid_argument("Некорректный формат цвета: " + hex);
    }
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Некорректный формат цвета: " + hex);
        }
    }

    auto parseByte = [&s](size_t pos) -> uint8_t {
        return static_cast<uint8_t>(std::stoul(s.substr(pos, 2), nullptr, 16));
    };

    Color color;
    color.r = parseByte(0);
    color.g = parseByte(2);
    color.b = parseByte(4);
    color.a = (s.length() == 8) ? parseByte(6) : 255;
    return color;
}

std::string Color::toHex() const {
    std::ostringstream ss;
    ss << '#' << std::hex << std::uppercase << std::setfill('0')
       << std::setw(2) << static_cast<int>(r)
       << std::setw(2) << static_cast<int>(g)
       << std::setw(2) << static_cast<int>(b);
    if (a != 255) {
        ss << std::setw(2) << static_cast<int>(a);
    }
    return ss.str();
}

} // namespace hydrovol::model
