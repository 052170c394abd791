/**
 * @file main.cpp
 * @brief Точка входа утилиты HydroVol
 */

#include "diagnostics_runner.hpp"
#include "well_command.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

void printUsage(std::ostream& out) {
    out << "HydroVol " << HYDROVOL_VERSION << " - объёмы и гидростатика скважины\n\n"
        << "Использование:\n"
        << "  hydrovol --well <файл> [--surveys <csv>] [--from A --to B]\n"
        << "           [--pressure-depth MD] [--target-density ρ] [--method <метод>]\n"
        << "           [--stored-layers] [--out <каталог>] [--strict]\n"
        << "  hydrovol --rebuild-layers <файл> [--save <файл>]\n"
        << "  hydrovol --diagnostics [--out <каталог>]\n"
        << "  hydrovol --version\n\n"
        << "Методы траектории: minimum-curvature (по умолчанию), balanced-tangential, average-angle\n";
}

double parseNumber(std::string_view flag, const char* value) {
    try {
        size_t pos = 0;
        double v = std::stod(value, &pos);
        if (pos == std::string(value).size()) {
            return v;
        }
    } catch (const std::exception&) {
        // сообщение ниже
    }
    throw std::invalid_argument("Некорректное значение для " + std::string(flag) + ": " + value);
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace hydrovol;

    try {
        if (argc < 2 || std::string_view(argv[1]) == "--help" || std::string_view(argv[1]) == "-h") {
            printUsage(std::cout);
            return argc < 2 ? 1 : 0;
        }

        if (std::string_view(argv[1]) == "--version") {
            std::cout << "hydrovol " << HYDROVOL_VERSION << " (" << HYDROVOL_BUILD_TYPE << ")" << std::endl;
            return 0;
        }

        // Расчёт скважины: --well <файл> [опции]
        if (argc >= 3 && std::string_view(argv[1]) == "--well") {
            app::WellCommandOptions options;
            options.well_path = std::filesystem::path(argv[2]);

            for (int i = 3; i < argc; ++i) {
                std::string_view arg(argv[i]);
                if (arg == "--surveys" && i + 1 < argc) {
                    options.survey_path = std::filesystem::path(argv[++i]);
                } else if (arg == "--from" && i + 1 < argc) {
                    options.analysis.interval_top = model::Meters{parseNumber(arg, argv[++i])};
                } else if (arg == "--to" && i + 1 < argc) {
                    options.analysis.interval_bottom = model::Meters{parseNumber(arg, argv[++i])};
                } else if (arg == "--pressure-depth" && i + 1 < argc) {
                    options.analysis.pressure_depth = model::Meters{parseNumber(arg, argv[++i])};
                } else if (arg == "--target-density" && i + 1 < argc) {
                    options.analysis.target_density_kgm3 = parseNumber(arg, argv[++i]);
                } else if (arg == "--method" && i + 1 < argc) {
                    options.analysis.trajectory_method = core::parseTrajectoryMethod(argv[++i]);
                } else if (arg == "--stored-layers") {
                    options.analysis.use_stored_layers = true;
                } else if (arg == "--out" && i + 1 < argc) {
                    options.output_dir = std::filesystem::path(argv[++i]);
                } else if (arg == "--strict") {
                    options.strict = true;
                } else {
                    std::cerr << "Неизвестный параметр: " << arg << std::endl;
                    printUsage(std::cerr);
                    return 1;
                }
            }

            if (options.analysis.interval_top.has_value() != options.analysis.interval_bottom.has_value()) {
                std::cerr << "Параметры --from и --to задаются вместе" << std::endl;
                return 1;
            }

            auto result = app::runWellCommand(options, std::cout, std::cerr);
            return result.exit_code;
        }

        // Пересборка слоёв: --rebuild-layers <файл> [--save <файл>]
        if (argc >= 3 && std::string_view(argv[1]) == "--rebuild-layers") {
            std::filesystem::path input(argv[2]);
            std::optional<std::filesystem::path> output;
            for (int i = 3; i < argc; ++i) {
                std::string_view arg(argv[i]);
                if (arg == "--save" && i + 1 < argc) {
                    output = std::filesystem::path(argv[++i]);
                }
            }
            return app::runRebuildLayersCommand(input, output, std::cout);
        }

        // Диагностика: --diagnostics [--out <путь>]
        if (std::string_view(argv[1]) == "--diagnostics") {
            std::filesystem::path out_dir;
            for (int i = 2; i < argc; ++i) {
                std::string_view arg(argv[i]);
                if (arg == "--out" && i + 1 < argc) {
                    out_dir = std::filesystem::path(argv[++i]);
                }
            }

            if (out_dir.empty()) {
                out_dir = std::filesystem::temp_directory_path() / "hydrovol_diagnostics";
            }

            auto result = app::runDiagnosticsCommand(out_dir);
            if (result.exit_code == 0) {
                std::cout << "Диагностика завершена: " << out_dir << std::endl;
            } else {
                std::cerr << "Диагностика завершилась с ошибками: " << out_dir << std::endl;
            }
            return result.exit_code;
        }

        std::cerr << "Неизвестная команда: " << argv[1] << std::endl;
        printUsage(std::cerr);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Ошибка: " << e.what() << std::endl;
        return 1;
    }
}
