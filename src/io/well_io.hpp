/**
 * @file well_io.hpp
 * @brief Чтение и запись файла описания скважины (JSON)
 *
 * Файл содержит геометрию колонны и ствола, инклинометрию,
 * пачки раствора, сохранённые слои и параметры расчёта.
 */

#pragma once

#include "model/well.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>

namespace hydrovol::io {

using namespace hydrovol::model;

/// Текущая версия формата файла скважины
constexpr const char* WELL_FORMAT_VERSION = "1.0.0";

/// Идентификатор формата
constexpr const char* WELL_FORMAT_ID = "hydrovol-well";

/**
 * @brief Ошибка чтения или записи файла скважины
 */
class WellFileError : public std::runtime_error {
public:
    explicit WellFileError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Загрузка скважины из файла
 *
 * Отсутствующие ключи принимают значения по умолчанию.
 *
 * @param path Путь к файлу (.json)
 * @return Скважина с заполненным file_path
 * @throws WellFileError При ошибке чтения, парсинга или неверном формате
 */
[[nodiscard]] Well loadWell(const std::filesystem::path& path);

/**
 * @brief Сохранение скважины в файл
 *
 * Выполняет атомарную запись (через временный файл).
 *
 * @throws WellFileError При ошибке записи
 */
void saveWell(const Well& well, const std::filesystem::path& path);

/**
 * @brief Проверка, является ли файл описанием скважины
 */
[[nodiscard]] bool isWellFile(const std::filesystem::path& path) noexcept;

/**
 * @brief Экспорт скважины в JSON (с отступами)
 */
[[nodiscard]] std::string wellToJson(const Well& well, int indent = 2);

/**
 * @brief Импорт скважины из JSON-строки
 * @throws WellFileError При ошибке парсинга или неверном формате
 */
[[nodiscard]] Well wellFromJson(const std::string& json);

} // namespace hydrovol::io
