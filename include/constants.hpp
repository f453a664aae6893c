#pragma once

#include <array>
#include <cstddef>
#include <numbers>

namespace tgen {

inline const size_t LOG_NONE = 0, LOG_BASIC = 1, LOG_INFO = 2, LOG_DEBUG = 3, LOG_TRACE = 4;

inline constexpr float pi = std::numbers::pi_v<float>;

// RGB, each channel 0-1
using rgb = std::array<float, 3>;

inline const float
// [Dome]
default_boss_radius = 15.f, // bore radius used when no boss is configured
default_winding_angle = 54.74f, // geodesic angle from netting theory, degrees
default_geodesic_frequency = 3.f,
geodesic_depth_ratio = 0.625f, // 5/8 sphere
geodesic_angle_exponent = 1.2f,
geodesic_facet_amplitude = 0.02f,
default_aspect_ratio = 0.6f,
default_crown_ratio = 1.f, // ASME F&D
default_knuckle_ratio = 0.06f,

// [Boss]
default_boss_inner_diameter = 20.f,
default_boss_outer_diameter = 40.f,
default_boss_length = 60.f,
default_taper_angle = 15.f,
default_flange_diameter = 80.f,
default_flange_thickness = 10.f,
bolt_circle_ratio = 0.8f, // of flange radius, when no bolt circle is given
bolt_hole_radius = 4.f,

// [Assembly]
default_cylinder_radius = 200.f,
default_cylinder_length = 800.f,
default_layer_opacity = 0.85f,
min_dimension = 1e-3f,

// [Mass]
mm3_to_m3 = 1e-9f;

inline const size_t
default_num_points = 50,
default_lathe_segments = 64,
default_boss_segments = 32,
default_bolt_count = 6,
integrated_boss_rings = 10,
bolt_hole_segments = 8;

inline const rgb boss_color = {0.122f, 0.161f, 0.216f}; // dark metallic

}
