#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "constants.hpp"
#include "lathe.hpp"

namespace tgen {

/// <dome_shape>

enum class dome_family {
    hemispherical,
    isotensoid,
    geodesic,
    elliptical,
    torispherical
};

// family-specific shape parameters, one alternative per family
struct hemispherical_shape {};
struct isotensoid_shape {
    float winding_angle = default_winding_angle; // degrees, (0, 90)
};
struct geodesic_shape {
    float frequency = default_geodesic_frequency;
};
struct elliptical_shape {
    float aspect_ratio = default_aspect_ratio; // depth / radius
};
struct torispherical_shape {
    float crown_ratio = default_crown_ratio; // crown radius / cylinder radius
    float knuckle_ratio = default_knuckle_ratio; // knuckle radius / cylinder radius
};

using dome_shape = std::variant<hemispherical_shape, isotensoid_shape, geodesic_shape, elliptical_shape, torispherical_shape>;

inline const dome_family dome_families[] {
    dome_family::hemispherical,
    dome_family::isotensoid,
    dome_family::geodesic,
    dome_family::elliptical,
    dome_family::torispherical
};

inline const dome_family default_dome_family = dome_family::isotensoid;

dome_family family_of(const dome_shape& shape);
// shape with default parameters for a family
dome_shape default_shape(dome_family family);

std::string_view dome_token(dome_family family);
// case-insensitive, falls back to ISOTENSOID
dome_family parse_dome_family(std::string_view token);

inline const std::map<std::string, dome_family> string_dome_map = []() {
    std::map<std::string, dome_family> map;
    for (dome_family f : dome_families) {
        map[std::string(dome_token(f))] = f;
    }
    return map;
}();

/// </dome_shape>

/// <dome_profile>

struct dome_params {
    float cylinder_radius;
    float boss_radius = default_boss_radius; // open bore at the apex
    // overrides the computed depth for the families that allow it
    std::optional<float> target_depth = std::nullopt;
    // intervals along the meridian, the profile holds num_points + 1 samples
    size_t num_points = default_num_points;
};

// half-shell meridian from apex (index 0) to cylinder joint (last index)
// z is the axial distance from the apex, r never decreases and never drops below the bore
struct dome_profile {
    dome_family family;
    std::vector<profile_point> points;
    float depth;
    float volume; // mm^3
    float surface_area; // mm^2
};

dome_profile hemispherical_profile(const dome_params& params);
// netting theory: r = R sin(a0) / sin(a), a sweeping 90 deg at the apex down to a0 at the joint
dome_profile isotensoid_profile(const dome_params& params, float winding_angle = default_winding_angle);
// flattened hemisphere with a small sinusoidal facet term standing in for tessellation
dome_profile geodesic_profile(const dome_params& params, float frequency = default_geodesic_frequency);
dome_profile elliptical_profile(const dome_params& params, float aspect_ratio = default_aspect_ratio);
// spherical crown blended into a toroidal knuckle at the joint
dome_profile torispherical_profile(const dome_params& params, float crown_ratio = default_crown_ratio, float knuckle_ratio = default_knuckle_ratio);

dome_profile generate_dome(const dome_params& params, const dome_shape& shape);

// discretised surface-of-revolution integrals, summed over frustums between samples
float profile_volume(const std::vector<profile_point>& points);
float profile_surface_area(const std::vector<profile_point>& points);

/// </dome_profile>

}
