#ifndef QUIVERKIT_SERIALIZATION_CONFIG_JSON_HPP
#define QUIVERKIT_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <render/render_options.hpp>

namespace quiverkit {

// Settings read from the -c configuration file
struct QuiverkitConfig {
    RenderOptions render;

    // Append the principal laminations of the triangulation as shear rows
    bool principal_laminations = false;
};

// RenderOptions serialization
inline void to_json(nlohmann::json& j, const RenderOptions& options) {
    j = {
        {"hide_frozen", options.hide_frozen},
        {"show_weights", options.show_weights},
        {"show_laminations", options.show_laminations},
        {"rankdir", options.rankdir}
    };
}

inline void from_json(const nlohmann::json& j, RenderOptions& options) {
    options.hide_frozen = j.value("hide_frozen", false);
    options.show_weights = j.value("show_weights", true);
    options.show_laminations = j.value("show_laminations", true);
    options.rankdir = j.value("rankdir", "LR");
}

// QuiverkitConfig serialization
inline void to_json(nlohmann::json& j, const QuiverkitConfig& config) {
    j = {
        {"render", config.render},
        {"principal_laminations", config.principal_laminations}
    };
}

inline void from_json(const nlohmann::json& j, QuiverkitConfig& config) {
    if (j.contains("render")) {
        config.render = j["render"].get<RenderOptions>();
    }
    config.principal_laminations = j.value("principal_laminations", false);
}

}  // namespace quiverkit

#endif // QUIVERKIT_SERIALIZATION_CONFIG_JSON_HPP
