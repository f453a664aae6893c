#include <algorithm>
#include <numeric>

#include "tank_type.hpp"
#include "utility.hpp"

namespace tgen {

namespace {

// typical constructions per SAE J2579 / ISO 11119, thickness mm, density kg/m^3
const tank_type_spec type_i_spec {
    tank_type::type_i,
    "Type I (All-Metal)",
    "Seamless steel or aluminum pressure vessel",
    true, false, false,
    composite_pattern::none,
    {150.f, 250.f},
    3.5f, 0.3f,
    {
        {"Steel/Aluminum Wall", 12.f, 7850.f, {0.7f, 0.75f, 0.78f}, 1.f, 0}
    }
};

const tank_type_spec type_ii_spec {
    tank_type::type_ii,
    "Type II (Metal + Hoop Wrap)",
    "Metal liner with hoop-wrapped composite reinforcement",
    true, false, true,
    composite_pattern::hoop,
    {200.f, 300.f},
    2.8f, 0.5f,
    {
        {"Metal Liner", 8.f, 2700.f, {0.75f, 0.77f, 0.8f}, 1.f, 0},
        {"Hoop Wrap (Carbon/Glass)", 6.f, 1600.f, {0.15f, 0.15f, 0.15f}, 0.9f, 1}
    }
};

const tank_type_spec type_iii_spec {
    tank_type::type_iii,
    "Type III (Metal Liner + Full Wrap)",
    "Metal liner fully overwrapped with composite material",
    true, false, true,
    composite_pattern::full,
    {350.f, 450.f},
    1.6f, 0.75f,
    {
        {"Metal Liner (Aluminum)", 3.2f, 2700.f, {0.8f, 0.82f, 0.85f}, 0.8f, 0},
        {"Hoop Wrap", 8.f, 1550.f, {0.055f, 0.647f, 0.914f}, 0.85f, 1},
        {"Helical Wrap", 12.f, 1550.f, {0.976f, 0.451f, 0.086f}, 0.85f, 2}
    }
};

const tank_type_spec type_iv_spec {
    tank_type::type_iv,
    "Type IV (Polymer Liner + Full Wrap)",
    "Polymer liner with full composite overwrap (most common 700 bar)",
    false, true, true,
    composite_pattern::full,
    {350.f, 700.f},
    1.f, 1.f,
    {
        {"HDPE Liner", 3.2f, 950.f, {0.612f, 0.639f, 0.686f}, 0.6f, 0},
        {"Hoop Wrap (T700)", 10.f, 1550.f, {0.055f, 0.647f, 0.914f}, 0.9f, 1},
        {"Helical Wrap (T700)", 15.f, 1550.f, {0.976f, 0.451f, 0.086f}, 0.9f, 2}
    }
};

const tank_type_spec type_v_spec {
    tank_type::type_v,
    "Type V (Linerless Composite)",
    "All-composite construction with integrated permeation barrier",
    false, false, true,
    composite_pattern::advanced,
    {350.f, 700.f},
    0.75f, 1.8f,
    {
        {"Permeation Barrier Layer", 0.5f, 1200.f, {0.9f, 0.9f, 0.95f}, 0.4f, 0},
        {"Inner Hoop Wrap", 8.f, 1600.f, {0.055f, 0.647f, 0.914f}, 0.95f, 1},
        {"Helical Wrap", 18.f, 1600.f, {0.976f, 0.451f, 0.086f}, 0.95f, 2},
        {"Outer Protective Layer", 1.5f, 1400.f, {0.1f, 0.1f, 0.12f}, 1.f, 3}
    }
};

}

/// <tank_type>

float tank_type_spec::total_thickness() const {
    return std::accumulate(layers.begin(), layers.end(), 0.f, [](float lhs, const material_layer& rhs){ return lhs + rhs.thickness; });
}

const tank_type_spec& spec_for(tank_type type) {
    switch (type) {
        case tank_type::type_i: return type_i_spec;
        case tank_type::type_ii: return type_ii_spec;
        case tank_type::type_iii: return type_iii_spec;
        case tank_type::type_iv: return type_iv_spec;
        case tank_type::type_v: return type_v_spec;
    }
    return type_iv_spec;
}

float cost_multiplier(tank_type type) {
    return spec_for(type).cost_ratio;
}

std::string_view tank_type_token(tank_type type) {
    switch (type) {
        case tank_type::type_i: return "TYPE_I";
        case tank_type::type_ii: return "TYPE_II";
        case tank_type::type_iii: return "TYPE_III";
        case tank_type::type_iv: return "TYPE_IV";
        case tank_type::type_v: return "TYPE_V";
    }
    return "TYPE_IV";
}

std::string_view pattern_token(composite_pattern pattern) {
    switch (pattern) {
        case composite_pattern::none: return "none";
        case composite_pattern::hoop: return "hoop";
        case composite_pattern::full: return "full";
        case composite_pattern::advanced: return "advanced";
    }
    return "none";
}

tank_type parse_tank_type(std::string_view token) {
    std::string key = normalize_token(token);
    // allow bare roman numerals, "IV" -> TYPE_IV
    if (!key.starts_with("TYPE_")) key = "TYPE_" + key;
    auto it = string_tank_type_map.find(key);
    return it == string_tank_type_map.end() ? default_tank_type : it->second;
}

/// </tank_type>

/// <mass>

std::vector<float> estimate_layer_masses(const tank_type_spec& spec, float inner_radius, float cylinder_length, float dome_depth) {
    std::vector<float> masses(spec.layers.size(), 0.f);
    if (!(inner_radius > 0.f)) return masses;
    cylinder_length = std::max(cylinder_length, 0.f);
    dome_depth = std::max(dome_depth, 0.f);

    float r2 = inner_radius * inner_radius;
    float cylinder_volume = pi * r2 * cylinder_length;
    float dome_volume = 2.f * (2.f / 3.f) * pi * r2 * dome_depth;
    float total_volume = cylinder_volume + dome_volume; // mm^3

    for (size_t i = 0; i < spec.layers.size(); ++i) {
        const material_layer& layer = spec.layers[i];
        // each layer is measured from the bore, not stacked on the previous one
        float layer_radius = inner_radius + std::max(layer.thickness, 0.f);
        float ratio = layer_radius * layer_radius / r2;
        masses[i] = total_volume * ratio * mm3_to_m3 * layer.density;
    }
    return masses;
}

float estimate_mass(const tank_type_spec& spec, float inner_radius, float cylinder_length, float dome_depth) {
    std::vector<float> masses = estimate_layer_masses(spec, inner_radius, cylinder_length, dome_depth);
    return std::accumulate(masses.begin(), masses.end(), 0.f);
}

float estimate_mass(tank_type type, float inner_radius, float cylinder_length, float dome_depth) {
    return estimate_mass(spec_for(type), inner_radius, cylinder_length, dome_depth);
}

/// </mass>

}
