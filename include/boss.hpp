#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "constants.hpp"
#include "mesh.hpp"

namespace tgen {

/// <boss_config>

enum class boss_family {
    standard_cylindrical,
    integrated,
    flanged,
    multi_port
};

// an offset port on a multi-port boss
struct aux_port {
    float inner_diameter;
    float outer_diameter;
    float length;
    float angle; // degrees around the main port's axis
    float radial_offset; // mm from the main port's axis
};

// family-specific extras, one alternative per family
struct standard_fitting {};
struct integrated_fitting {
    float taper_angle = default_taper_angle; // degrees
};
struct flanged_fitting {
    float flange_diameter = default_flange_diameter;
    float flange_thickness = default_flange_thickness;
    // defaults to bolt_circle_ratio of the flange
    std::optional<float> bolt_circle_diameter = std::nullopt;
    size_t bolt_count = default_bolt_count;
};
struct multi_port_fitting {
    std::vector<aux_port> ports;
};

using boss_fitting = std::variant<standard_fitting, integrated_fitting, flanged_fitting, multi_port_fitting>;

struct boss_config {
    float inner_diameter = default_boss_inner_diameter;
    float outer_diameter = default_boss_outer_diameter;
    float length = default_boss_length; // protrusion from the apex
    boss_fitting fitting = standard_fitting{};
    size_t segments = default_boss_segments;

    boss_family family() const;
    float bore_radius() const {
        return inner_diameter * 0.5f;
    }
};

inline const boss_family boss_families[] {
    boss_family::standard_cylindrical,
    boss_family::integrated,
    boss_family::flanged,
    boss_family::multi_port
};

inline const boss_family default_boss_family = boss_family::standard_cylindrical;

boss_fitting default_fitting(boss_family family);

std::string_view boss_token(boss_family family);
// case-insensitive, falls back to STANDARD_CYLINDRICAL
boss_family parse_boss_family(std::string_view token);

inline const std::map<std::string, boss_family> string_boss_map = []() {
    std::map<std::string, boss_family> map;
    for (boss_family f : boss_families) {
        map[std::string(boss_token(f))] = f;
    }
    return map;
}();

/// </boss_config>

/// <boss_mesh>

// All boss meshes stand on the y = 0 plane and protrude along +Y.
// Every family is coloured boss_color.

// tube with inner bore, outer wall and an annular cap at the tip
mesh_data make_standard_boss(float inner_diameter, float outer_diameter, float length, size_t segments = default_boss_segments);
// tube whose outer wall narrows linearly toward the tip
mesh_data make_integrated_boss(float inner_diameter, float outer_diameter, float length, float taper_angle = default_taper_angle, size_t segments = default_boss_segments);
// standard tube with a flange disk at the tip pierced by a bolt circle
mesh_data make_flanged_boss(float inner_diameter, float outer_diameter, float length, const flanged_fitting& flange, size_t segments = default_boss_segments);
// main standard port plus auxiliary ports mounted halfway up it
mesh_data make_multi_port_boss(float inner_diameter, float outer_diameter, float length, const std::vector<aux_port>& ports, size_t segments = default_boss_segments);

mesh_data make_boss(const boss_config& config);

/// </boss_mesh>

}
