/**
 * @file well_command.hpp
 * @brief Команды CLI для файла скважины: расчёт и пересборка слоёв
 */

#pragma once

#include "core/well_analysis.hpp"
#include <filesystem>
#include <iosfwd>
#include <optional>

namespace hydrovol::app {

/**
 * @brief Параметры команды --well
 */
struct WellCommandOptions {
    std::filesystem::path well_path;
    std::optional<std::filesystem::path> survey_path;   ///< CSV инклинометрии (заменяет surveys из файла)
    std::optional<std::filesystem::path> output_dir;    ///< Каталог для report.md/report.json
    bool strict = false;                                ///< Ошибки валидации завершают команду
    core::AnalysisOptions analysis;
};

struct WellCommandResult {
    int exit_code = 1;
    std::optional<core::WellReport> report;
};

/**
 * @brief Загрузить скважину, выполнить расчёт, вывести сводку и записать отчёты.
 *
 * Сводка выводится в out, предупреждения и ошибки - в err.
 * Исключения ввода-вывода (WellFileError, SurveyImportError) пробрасываются.
 */
WellCommandResult runWellCommand(const WellCommandOptions& options, std::ostream& out, std::ostream& err);

/**
 * @brief Пересобрать слои по пачкам и сохранить в файл.
 *
 * @param input Файл скважины
 * @param output Файл для сохранения (по умолчанию перезаписывается input)
 * @return Код завершения
 */
int runRebuildLayersCommand(const std::filesystem::path& input,
                            const std::optional<std::filesystem::path>& output,
                            std::ostream& out);

} // namespace hydrovol::app
