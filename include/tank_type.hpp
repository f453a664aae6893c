#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "constants.hpp"

namespace tgen {

/// <tank_type>

// vessel construction families
enum class tank_type {
    type_i,   // all-metal
    type_ii,  // metal liner + hoop wrap
    type_iii, // metal liner + full wrap
    type_iv,  // polymer liner + full wrap
    type_v    // linerless composite
};

enum class composite_pattern {
    none,
    hoop,
    full,
    advanced
};

// one wall layer, order 0 is innermost
struct material_layer {
    std::string name;
    float thickness; // mm
    float density; // kg/m^3
    rgb color;
    float opacity;
    size_t order;
};

struct pressure_range {
    float min; // bar
    float max;
};

struct tank_type_spec {
    tank_type type;
    std::string name;
    std::string description;
    bool has_metal;
    bool has_polymer;
    bool has_composite;
    composite_pattern pattern;
    pressure_range typical_pressure;
    float weight_ratio; // relative to TYPE_IV
    float cost_ratio; // relative to TYPE_IV
    // radial order, innermost first
    std::vector<material_layer> layers;

    float total_thickness() const;
};

inline const tank_type tank_types[] {
    tank_type::type_i,
    tank_type::type_ii,
    tank_type::type_iii,
    tank_type::type_iv,
    tank_type::type_v
};

inline const tank_type default_tank_type = tank_type::type_iv;

// total lookup: anything unrecognised gets the TYPE_IV baseline
const tank_type_spec& spec_for(tank_type type);

float cost_multiplier(tank_type type);

std::string_view tank_type_token(tank_type type);
std::string_view pattern_token(composite_pattern pattern);
// case-insensitive, falls back to TYPE_IV
tank_type parse_tank_type(std::string_view token);

inline const std::map<std::string, tank_type> string_tank_type_map = []() {
    std::map<std::string, tank_type> map;
    for (tank_type t : tank_types) {
        map[std::string(tank_type_token(t))] = t;
    }
    return map;
}();

/// </tank_type>

/// <mass>

// Thin-shell estimate: the enclosed volume (cylinder plus two caps of (2/3)*pi*r^2*depth)
// is scaled by ((r + thickness) / r)^2 for each layer, every layer measured from the bore.
// This overcounts badly for absolute figures (it includes the enclosed volume) and is
// inexact for thick layers; it is only meant for comparing designs.
// inputs in mm, returns kg, one entry per layer
std::vector<float> estimate_layer_masses(const tank_type_spec& spec, float inner_radius, float cylinder_length, float dome_depth);
float estimate_mass(const tank_type_spec& spec, float inner_radius, float cylinder_length, float dome_depth);
float estimate_mass(tank_type type, float inner_radius, float cylinder_length, float dome_depth);

/// </mass>

}
