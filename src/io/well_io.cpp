/**
 * @file well_io.cpp
 * @brief Реализация работы с файлом скважины
 */

#include "well_io.hpp"
#include "file_utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>

namespace hydrovol::io {

using json = nlohmann::json;

namespace {

// === Сериализация базовых типов ===

json metersToJson(Meters m) {
    return m.value;
}

Meters metersFromJson(const json& j) {
    return Meters{j.get<double>()};
}

json colorToJson(const Color& c) {
    return c.toHex();
}

Color colorFromJson(const json& j, Color fallback) {
    if (j.is_null()) {
        return fallback;
    }
    try {
        return Color::fromHex(j.get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw WellFileError("Некорректный цвет: " + std::string(e.what()));
    }
}

// === Секции ===

json pipeToJson(const PipeSection& p) {
    json j;
    j["name"] = p.name;
    j["top"] = metersToJson(p.top);
    j["length"] = metersToJson(p.length);
    j["inner_diameter"] = metersToJson(p.inner_diameter);
    j["outer_diameter"] = metersToJson(p.outer_diameter);
    j["steel_density"] = p.steel_density_kgm3;
    j["unit_weight"] = p.unit_weight_kgm.has_value() ? json(*p.unit_weight_kgm) : json(nullptr);
    return j;
}

PipeSection pipeFromJson(const json& j) {
    PipeSection p;
    p.name = j.value("name", "");
    p.top = metersFromJson(j.value("top", json(0.0)));
    p.length = metersFromJson(j.value("length", json(0.0)));
    p.inner_diameter = metersFromJson(j.value("inner_diameter", json(0.0)));
    p.outer_diameter = metersFromJson(j.value("outer_diameter", json(0.0)));
    p.steel_density_kgm3 = j.value("steel_density", kSteelDensity);
    if (j.contains("unit_weight") && !j.at("unit_weight").is_null()) {
        p.unit_weight_kgm = j.at("unit_weight").get<double>();
    }
    return p;
}

json annulusToJson(const AnnulusSection& a) {
    json j;
    j["name"] = a.name;
    j["top"] = metersToJson(a.top);
    j["length"] = metersToJson(a.length);
    j["inner_diameter"] = metersToJson(a.inner_diameter);
    j["is_cased"] = a.is_cased;
    return j;
}

AnnulusSection annulusFromJson(const json& j) {
    AnnulusSection a;
    a.name = j.value("name", "");
    a.top = metersFromJson(j.value("top", json(0.0)));
    a.length = metersFromJson(j.value("length", json(0.0)));
    a.inner_diameter = metersFromJson(j.value("inner_diameter", json(0.0)));
    a.is_cased = j.value("is_cased", false);
    return a;
}

// === Инклинометрия ===

json surveyToJson(const SurveyStation& s) {
    json j;
    j["md"] = metersToJson(s.md);
    j["inc"] = s.inclination.value;
    j["azi"] = s.azimuth.value;
    j["tvd"] = s.tvd.has_value() ? metersToJson(*s.tvd) : json(nullptr);
    return j;
}

SurveyStation surveyFromJson(const json& j) {
    SurveyStation s;
    s.md = metersFromJson(j.at("md"));
    s.inclination = Degrees{j.value("inc", 0.0)};
    s.azimuth = Degrees{j.value("azi", 0.0)};
    if (j.contains("tvd") && !j.at("tvd").is_null()) {
        s.tvd = metersFromJson(j.at("tvd"));
    }
    return s;
}

// === Пачки и слои ===

json mudStepToJson(const MudStep& s) {
    json j;
    j["name"] = s.name;
    j["top"] = metersToJson(s.top);
    j["bottom"] = metersToJson(s.bottom);
    j["density"] = s.density_kgm3;
    j["color"] = colorToJson(s.color);
    j["placement"] = toString(s.placement);
    if (!s.fluid_ref.empty()) {
        j["fluid"] = s.fluid_ref;
    }
    return j;
}

MudStep mudStepFromJson(const json& j) {
    MudStep s;
    s.name = j.value("name", "");
    s.top = metersFromJson(j.value("top", json(0.0)));
    s.bottom = metersFromJson(j.value("bottom", json(0.0)));
    s.density_kgm3 = j.value("density", 0.0);
    s.color = colorFromJson(j.value("color", json(nullptr)), Color::blue());
    s.placement = parsePlacement(j.value("placement", "annulus"));
    s.fluid_ref = j.value("fluid", "");
    return s;
}

json layerToJson(const FluidLayer& l) {
    json j;
    j["name"] = l.name;
    j["top"] = metersToJson(l.top);
    j["bottom"] = metersToJson(l.bottom);
    j["density"] = l.density_kgm3;
    j["color"] = colorToJson(l.color);
    if (!l.fluid_ref.empty()) {
        j["fluid"] = l.fluid_ref;
    }
    return j;
}

FluidLayer layerFromJson(const json& j, Domain domain) {
    FluidLayer l;
    l.domain = domain;
    l.name = j.value("name", "");
    l.top = metersFromJson(j.value("top", json(0.0)));
    l.bottom = metersFromJson(j.value("bottom", json(0.0)));
    l.density_kgm3 = j.value("density", 0.0);
    l.color = colorFromJson(j.value("color", json(nullptr)), Color::gray());
    l.fluid_ref = j.value("fluid", "");
    return l;
}

// === Скважина ===

json wellToJsonInternal(const Well& w) {
    json j;

    // Заголовок
    j["version"] = WELL_FORMAT_VERSION;
    j["format"] = WELL_FORMAT_ID;

    json metadata;
    metadata["name"] = w.name;
    metadata["description"] = w.description;
    j["metadata"] = metadata;

    json pipes = json::array();
    for (const auto& p : w.pipes) {
        pipes.push_back(pipeToJson(p));
    }
    j["drill_string"] = pipes;

    json annuli = json::array();
    for (const auto& a : w.annuli) {
        annuli.push_back(annulusToJson(a));
    }
    j["annulus"] = annuli;

    json surveys = json::array();
    for (const auto& s : w.surveys) {
        surveys.push_back(surveyToJson(s));
    }
    j["surveys"] = surveys;

    json steps = json::array();
    for (const auto& s : w.mud_steps) {
        steps.push_back(mudStepToJson(s));
    }
    j["mud_steps"] = steps;

    json final_layers;
    final_layers["string"] = json::array();
    for (const auto& l : w.layers.string) {
        final_layers["string"].push_back(layerToJson(l));
    }
    final_layers["annulus"] = json::array();
    for (const auto& l : w.layers.annulus) {
        final_layers["annulus"].push_back(layerToJson(l));
    }
    j["final_layers"] = final_layers;

    json settings;
    settings["base_string_density"] = w.settings.base_string_density_kgm3;
    settings["base_annulus_density"] = w.settings.base_annulus_density_kgm3;
    settings["active_mud_volume"] = w.settings.active_mud_volume_m3;
    settings["surface_line_volume"] = w.settings.surface_line_volume_m3;
    settings["pressure_depth"] = metersToJson(w.settings.pressure_depth);
    j["settings"] = settings;

    return j;
}

Well wellFromJsonInternal(const json& j) {
    Well w;

    try {
        // Проверка формата
        if (!j.is_object() || j.value("format", "") != WELL_FORMAT_ID) {
            throw WellFileError("Неверный формат файла скважины");
        }

        if (j.contains("metadata")) {
            const auto& meta = j.at("metadata");
            w.name = meta.value("name", "");
            w.description = meta.value("description", "");
        }

        if (j.contains("drill_string")) {
            for (const auto& pj : j.at("drill_string")) {
                w.pipes.push_back(pipeFromJson(pj));
            }
        }
        if (j.contains("annulus")) {
            for (const auto& aj : j.at("annulus")) {
                w.annuli.push_back(annulusFromJson(aj));
            }
        }
        if (j.contains("surveys")) {
            for (const auto& sj : j.at("surveys")) {
                w.surveys.push_back(surveyFromJson(sj));
            }
        }
        if (j.contains("mud_steps")) {
            for (const auto& sj : j.at("mud_steps")) {
                w.mud_steps.push_back(mudStepFromJson(sj));
            }
        }
        if (j.contains("final_layers")) {
            const auto& layers = j.at("final_layers");
            if (layers.contains("string")) {
                for (const auto& lj : layers.at("string")) {
                    w.layers.string.push_back(layerFromJson(lj, Domain::String));
                }
            }
            if (layers.contains("annulus")) {
                for (const auto& lj : layers.at("annulus")) {
                    w.layers.annulus.push_back(layerFromJson(lj, Domain::Annulus));
                }
            }
        }

        if (j.contains("settings")) {
            const auto& s = j.at("settings");
            w.settings.base_string_density_kgm3 = s.value("base_string_density", 1260.0);
            w.settings.base_annulus_density_kgm3 = s.value("base_annulus_density", 1260.0);
            w.settings.active_mud_volume_m3 = s.value("active_mud_volume", 0.0);
            w.settings.surface_line_volume_m3 = s.value("surface_line_volume", 0.0);
            w.settings.pressure_depth = metersFromJson(s.value("pressure_depth", json(3200.0)));
        }
    } catch (const json::exception& e) {
        throw WellFileError("Некорректное содержимое файла скважины: " + std::string(e.what()));
    }

    return w;
}

} // anonymous namespace

bool isWellFile(const std::filesystem::path& path) noexcept {
    try {
        if (!std::filesystem::exists(path)) {
            return false;
        }

        auto ext = path.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
            [](unsigned char c) { return std::tolower(c); });

        if (ext != ".json") {
            return false;
        }

        std::ifstream file(path);
        if (!file) return false;

        json j = json::parse(file, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            return false;
        }

        return j.value("format", "") == WELL_FORMAT_ID;
    } catch (const std::exception&) {
        return false;
    }
}

Well loadWell(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw WellFileError("Не удалось открыть файл: " + path.string());
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw WellFileError("Ошибка парсинга JSON: " + std::string(e.what()));
    }

    Well w = wellFromJsonInternal(j);
    w.file_path = path.string();
    return w;
}

void saveWell(const Well& well, const std::filesystem::path& path) {
    try {
        atomicWrite(path, wellToJsonInternal(well).dump(2));
    } catch (const std::exception& e) {
        throw WellFileError("Ошибка сохранения файла: " + std::string(e.what()));
    }
}

std::string wellToJson(const Well& well, int indent) {
    return wellToJsonInternal(well).dump(indent);
}

Well wellFromJson(const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw WellFileError("Ошибка парсинга JSON: " + std::string(e.what()));
    }

    return wellFromJsonInternal(j);
}

} // namespace hydrovol::io
