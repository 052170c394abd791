/**
 * @file file_utils.hpp
 * @brief Вспомогательные функции для работы с файлами
 */

#pragma once

#include <filesystem>
#include <string>

namespace hydrovol::io {

/**
 * @brief Атомарная запись строковых данных в файл (через временный файл + rename).
 *
 * Недостающие каталоги создаются.
 * @throws std::runtime_error при ошибке записи
 */
void atomicWrite(const std::filesystem::path& path, const std::string& content);

/**
 * @brief Чтение файла целиком
 * @throws std::runtime_error если файл не открывается
 */
[[nodiscard]] std::string readTextFile(const std::filesystem::path& path);

} // namespace hydrovol::io
