/**
 * @file file_utils.cpp
 * @brief Вспомогательные функции для работы с файлами
 */

#include "file_utils.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace hydrovol::io {

void atomicWrite(const std::filesystem::path& path, const std::string& content) {
    auto dir = path.parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir);
    }

    auto tmp = path;
    tmp += ".tmp";

    {
        std::ofstream ofs(tmp, std::ios::binary);
        if (!ofs) {
            throw std::runtime_error("Не удалось открыть временный файл для записи: " + tmp.string());
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!ofs) {
            throw std::runtime_error("Ошибка записи во временный файл: " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw std::runtime_error("Не удалось атомарно сохранить файл: " + path.string());
    }
}

std::string readTextFile(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw std::runtime_error("Не удалось открыть файл: " + path.string());
    }
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}

} // namespace hydrovol::io
