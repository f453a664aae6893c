#pragma once

#include <optional>
#include <string>
#include <vector>

#include "boss.hpp"
#include "constants.hpp"
#include "dome.hpp"
#include "lathe.hpp"
#include "mesh.hpp"
#include "tank_type.hpp"

namespace tgen {

// everything an external panel hands us to describe one tank
struct tank_request {
    tank_type type = default_tank_type;
    dome_shape dome = isotensoid_shape{};
    float cylinder_radius = default_cylinder_radius; // mm
    float cylinder_length = default_cylinder_length; // mm
    std::optional<float> target_depth = std::nullopt;
    // no boss means a default standard boss with a default_boss_radius bore
    std::optional<boss_config> boss = std::nullopt;

    // visual-only, opacity is the only one that reaches the output
    float layer_opacity = default_layer_opacity;
    bool cross_section = false;
    bool auto_rotate = false;
};

struct assembly_options {
    size_t num_points = default_num_points;
    size_t segments = default_lathe_segments;
    // layers are independent, > 1 builds them on worker threads
    size_t n_threads = 1;
    size_t log_level = LOG_NONE;
};

struct layer_mesh {
    std::string name;
    size_t order;
    float thickness;
    float outer_radius; // cylinder wall radius after this layer
    float opacity; // layer opacity times the global multiplier
    mesh_data mesh;
};

struct assembled_tank_model {
    // innermost first
    std::vector<layer_mesh> layers;
    mesh_data bottom_boss;
    mesh_data top_boss;
    dome_profile dome;
    float total_length; // cylinder plus both domes
    float max_radius; // outermost cylinder wall
};

// the numbers a readout needs, without building any meshes
struct tank_summary {
    const tank_type_spec* spec;
    dome_profile dome;
    float mass; // kg
    std::vector<float> layer_masses; // kg, innermost first
    float total_length;
    float max_radius;
};

// bore radius used for the dome opening
float boss_radius_of(const tank_request& request);

dome_profile build_dome(const tank_request& request, size_t num_points = default_num_points);

// full axial meridian, bottom apex to top apex, cylinder spanning 0 <= z <= cylinder_length
std::vector<profile_point> build_meridian(const dome_profile& dome, float cylinder_radius, float cylinder_length);

// pure function of its inputs, identical inputs give identical buffers
assembled_tank_model assemble_tank(const tank_request& request, const assembly_options& options = {});

tank_summary summarize(const tank_request& request, size_t num_points = default_num_points);

}
