#include <algorithm>
#include <cmath>

#include "dome.hpp"
#include "utility.hpp"

namespace tgen {

/// <dome_shape>

dome_family family_of(const dome_shape& shape) {
    struct visitor {
        dome_family operator()(const hemispherical_shape&) const { return dome_family::hemispherical; }
        dome_family operator()(const isotensoid_shape&) const { return dome_family::isotensoid; }
        dome_family operator()(const geodesic_shape&) const { return dome_family::geodesic; }
        dome_family operator()(const elliptical_shape&) const { return dome_family::elliptical; }
        dome_family operator()(const torispherical_shape&) const { return dome_family::torispherical; }
    };
    return std::visit(visitor{}, shape);
}

dome_shape default_shape(dome_family family) {
    switch (family) {
        case dome_family::hemispherical: return hemispherical_shape{};
        case dome_family::isotensoid: return isotensoid_shape{};
        case dome_family::geodesic: return geodesic_shape{};
        case dome_family::elliptical: return elliptical_shape{};
        case dome_family::torispherical: return torispherical_shape{};
    }
    return isotensoid_shape{};
}

std::string_view dome_token(dome_family family) {
    switch (family) {
        case dome_family::hemispherical: return "HEMISPHERICAL";
        case dome_family::isotensoid: return "ISOTENSOID";
        case dome_family::geodesic: return "GEODESIC";
        case dome_family::elliptical: return "ELLIPTICAL";
        case dome_family::torispherical: return "TORISPHERICAL";
    }
    return "ISOTENSOID";
}

dome_family parse_dome_family(std::string_view token) {
    auto it = string_dome_map.find(normalize_token(token));
    return it == string_dome_map.end() ? default_dome_family : it->second;
}

/// </dome_shape>

/// <dome_profile>

namespace {

struct profile_inputs {
    float radius;
    float boss;
    size_t intervals;
    // bore at least as wide as the cylinder, nothing to curve
    bool degenerate;
};

profile_inputs sanitize(const dome_params& params) {
    profile_inputs in;
    in.radius = std::isfinite(params.cylinder_radius) ? std::max(params.cylinder_radius, 0.f) : 0.f;
    in.boss = std::isfinite(params.boss_radius) ? std::max(params.boss_radius, 0.f) : 0.f;
    in.intervals = std::max<size_t>(params.num_points, 1);
    in.degenerate = in.boss >= in.radius;
    return in;
}

float depth_or(const dome_params& params, float computed) {
    if (params.target_depth && std::isfinite(*params.target_depth) && *params.target_depth > 0.f) {
        return *params.target_depth;
    }
    return computed;
}

// flat annulus at the bore radius
dome_profile degenerate_profile(dome_family family, const profile_inputs& in) {
    dome_profile profile {family, {}, 0.f, 0.f, 0.f};
    profile.points.assign(in.intervals + 1, profile_point{in.boss, 0.f});
    return profile;
}

// enforces the bore clamp and monotone radius, pins the joint and integrates
dome_profile finish(dome_family family, std::vector<profile_point>&& points, const profile_inputs& in, float depth) {
    float floor_r = in.boss;
    for (profile_point& p : points) {
        p.r = std::max(p.r, floor_r);
        floor_r = p.r;
    }
    points.back() = {std::max(in.radius, floor_r), depth};

    dome_profile profile {family, std::move(points), depth, 0.f, 0.f};
    profile.volume = profile_volume(profile.points);
    profile.surface_area = profile_surface_area(profile.points);
    return profile;
}

}

dome_profile hemispherical_profile(const dome_params& params) {
    profile_inputs in = sanitize(params);
    if (in.degenerate) return degenerate_profile(dome_family::hemispherical, in);

    float R = in.radius;
    float depth = R;
    std::vector<profile_point> points(in.intervals + 1);
    for (size_t i = 0; i <= in.intervals; ++i) {
        float t = (float)i / (float)in.intervals;
        float angle = 0.5f * pi * t;
        points[i] = {R * std::sin(angle), depth * (1.f - std::cos(angle))};
    }

    dome_profile profile = finish(dome_family::hemispherical, std::move(points), in, depth);
    // closed form: hemisphere minus the bore's conical void
    profile.volume = (2.f / 3.f) * pi * R * R * R - (1.f / 3.f) * pi * in.boss * in.boss * depth;
    return profile;
}

dome_profile isotensoid_profile(const dome_params& params, float winding_angle) {
    profile_inputs in = sanitize(params);
    if (in.degenerate) return degenerate_profile(dome_family::isotensoid, in);

    if (!(winding_angle > 0.f && winding_angle < 90.f)) winding_angle = default_winding_angle;
    float alpha0 = deg_to_rad(winding_angle);
    float sin_alpha0 = std::sin(alpha0);
    float R = in.radius;
    float depth = depth_or(params, R * (1.f - sin_alpha0));

    std::vector<profile_point> points(in.intervals + 1);
    for (size_t i = 0; i <= in.intervals; ++i) {
        float t = (float)i / (float)in.intervals;
        // 90 deg at the apex down to alpha0 at the joint, so sin(alpha) >= sin(alpha0) > 0
        float alpha = alpha0 + (0.5f * pi - alpha0) * (1.f - t);
        points[i] = {R * sin_alpha0 / std::sin(alpha), depth * t};
    }

    return finish(dome_family::isotensoid, std::move(points), in, depth);
}

dome_profile geodesic_profile(const dome_params& params, float frequency) {
    profile_inputs in = sanitize(params);
    if (in.degenerate) return degenerate_profile(dome_family::geodesic, in);

    if (!std::isfinite(frequency) || frequency < 0.f) frequency = default_geodesic_frequency;
    float R = in.radius;
    float depth = depth_or(params, R * geodesic_depth_ratio);

    std::vector<profile_point> points(in.intervals + 1);
    for (size_t i = 0; i <= in.intervals; ++i) {
        float t = (float)i / (float)in.intervals;
        float angle = 0.5f * pi * std::pow(t, geodesic_angle_exponent);
        float r = std::max(R * std::sin(angle), in.boss);
        r += std::sin(t * pi * frequency) * geodesic_facet_amplitude * R;
        // facets may not bulge past the cylinder wall
        points[i] = {std::min(r, R), depth * (1.f - std::cos(angle))};
    }

    return finish(dome_family::geodesic, std::move(points), in, depth);
}

dome_profile elliptical_profile(const dome_params& params, float aspect_ratio) {
    profile_inputs in = sanitize(params);
    if (in.degenerate) return degenerate_profile(dome_family::elliptical, in);

    if (!std::isfinite(aspect_ratio) || aspect_ratio <= 0.f) aspect_ratio = default_aspect_ratio;
    float R = in.radius;
    float depth = depth_or(params, R * aspect_ratio);

    std::vector<profile_point> points(in.intervals + 1);
    for (size_t i = 0; i <= in.intervals; ++i) {
        float t = (float)i / (float)in.intervals;
        // (r/R)^2 + zn^2 = 1, zn measured from the joint: 1 at the apex
        float zn = 1.f - t;
        points[i] = {R * std::sqrt(std::max(0.f, 1.f - zn * zn)), depth * t};
    }

    return finish(dome_family::elliptical, std::move(points), in, depth);
}

dome_profile torispherical_profile(const dome_params& params, float crown_ratio, float knuckle_ratio) {
    profile_inputs in = sanitize(params);
    if (in.degenerate) return degenerate_profile(dome_family::torispherical, in);

    if (!std::isfinite(crown_ratio) || crown_ratio <= 0.f) crown_ratio = default_crown_ratio;
    knuckle_ratio = clamp_finite(knuckle_ratio, 0.f, 1.f);

    float R = in.radius;
    float rk = R * knuckle_ratio;
    float transition_r = R - rk;
    // the crown has to reach the knuckle
    float Rc = std::max(R * crown_ratio, transition_r);
    float crown_depth = Rc - std::sqrt(std::max(0.f, Rc * Rc - transition_r * transition_r));
    float depth = crown_depth + rk;
    float transition_t = transition_r / R;

    std::vector<profile_point> points(in.intervals + 1);
    for (size_t i = 0; i <= in.intervals; ++i) {
        float t = (float)i / (float)in.intervals;
        if (t > transition_t) {
            // knuckle, quarter torus tangent to the cylinder
            float angle = (t - transition_t) / (1.f - transition_t) * 0.5f * pi;
            points[i] = {transition_r + rk * std::sin(angle), crown_depth + rk * (1.f - std::cos(angle))};
        } else {
            // crown, sphere of radius Rc through the apex
            float r = t * R;
            points[i] = {r, Rc - std::sqrt(std::max(0.f, Rc * Rc - r * r))};
        }
    }

    return finish(dome_family::torispherical, std::move(points), in, depth);
}

dome_profile generate_dome(const dome_params& params, const dome_shape& shape) {
    struct visitor {
        const dome_params& params;
        dome_profile operator()(const hemispherical_shape&) const { return hemispherical_profile(params); }
        dome_profile operator()(const isotensoid_shape& s) const { return isotensoid_profile(params, s.winding_angle); }
        dome_profile operator()(const geodesic_shape& s) const { return geodesic_profile(params, s.frequency); }
        dome_profile operator()(const elliptical_shape& s) const { return elliptical_profile(params, s.aspect_ratio); }
        dome_profile operator()(const torispherical_shape& s) const { return torispherical_profile(params, s.crown_ratio, s.knuckle_ratio); }
    };
    return std::visit(visitor{params}, shape);
}

float profile_volume(const std::vector<profile_point>& points) {
    float volume = 0.f;
    for (size_t i = 0; i + 1 < points.size(); ++i) {
        float r1 = points[i].r, r2 = points[i + 1].r;
        float dz = points[i + 1].z - points[i].z;
        volume += (pi / 3.f) * dz * (r1 * r1 + r1 * r2 + r2 * r2);
    }
    return volume;
}

float profile_surface_area(const std::vector<profile_point>& points) {
    float area = 0.f;
    for (size_t i = 0; i + 1 < points.size(); ++i) {
        float r1 = points[i].r, r2 = points[i + 1].r;
        float dr = r2 - r1;
        float dz = points[i + 1].z - points[i].z;
        area += pi * (r1 + r2) * std::sqrt(dr * dr + dz * dz);
    }
    return area;
}

/// </dome_profile>

}
