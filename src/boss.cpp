#include <algorithm>
#include <cmath>

#include "boss.hpp"
#include "utility.hpp"

namespace tgen {

/// <boss_config>

boss_family boss_config::family() const {
    struct visitor {
        boss_family operator()(const standard_fitting&) const { return boss_family::standard_cylindrical; }
        boss_family operator()(const integrated_fitting&) const { return boss_family::integrated; }
        boss_family operator()(const flanged_fitting&) const { return boss_family::flanged; }
        boss_family operator()(const multi_port_fitting&) const { return boss_family::multi_port; }
    };
    return std::visit(visitor{}, fitting);
}

boss_fitting default_fitting(boss_family family) {
    switch (family) {
        case boss_family::standard_cylindrical: return standard_fitting{};
        case boss_family::integrated: return integrated_fitting{};
        case boss_family::flanged: return flanged_fitting{};
        case boss_family::multi_port: return multi_port_fitting{};
    }
    return standard_fitting{};
}

std::string_view boss_token(boss_family family) {
    switch (family) {
        case boss_family::standard_cylindrical: return "STANDARD_CYLINDRICAL";
        case boss_family::integrated: return "INTEGRATED";
        case boss_family::flanged: return "FLANGED";
        case boss_family::multi_port: return "MULTI_PORT";
    }
    return "STANDARD_CYLINDRICAL";
}

boss_family parse_boss_family(std::string_view token) {
    auto it = string_boss_map.find(normalize_token(token));
    return it == string_boss_map.end() ? default_boss_family : it->second;
}

/// </boss_config>

/// <boss_mesh>

namespace {

struct tube_dims {
    float inner;
    float outer;
    float length;
    size_t segments;
};

float non_negative(float v) {
    return std::isfinite(v) ? std::max(v, 0.f) : 0.f;
}

tube_dims sanitize(float inner_diameter, float outer_diameter, float length, size_t segments) {
    tube_dims dims;
    dims.inner = non_negative(inner_diameter) * 0.5f;
    dims.outer = std::max(non_negative(outer_diameter) * 0.5f, dims.inner);
    dims.length = non_negative(length);
    dims.segments = std::max<size_t>(segments, 3);
    return dims;
}

// ring of segments + 1 vertices around (cx, cz), seam duplicated
// normal is nr along the ring's radial direction plus ny along the axis
uint32_t add_ring(mesh_data& mesh, float radius, float y, size_t segments, float nr, float ny, float cx = 0.f, float cz = 0.f) {
    uint32_t start = (uint32_t)mesh.vertex_count();
    for (size_t j = 0; j <= segments; ++j) {
        float theta = (float)j / (float)segments * 2.f * pi;
        float c = std::cos(theta), s = std::sin(theta);
        mesh.add_vertex(cx + radius * c, y, cz + radius * s, nr * c, ny, nr * s);
    }
    return start;
}

// inner bore, normals facing the axis
void add_bore(mesh_data& mesh, const tube_dims& dims) {
    uint32_t bottom = add_ring(mesh, dims.inner, 0.f, dims.segments, -1.f, 0.f);
    uint32_t top = add_ring(mesh, dims.inner, dims.length, dims.segments, -1.f, 0.f);
    mesh.stitch_rings(bottom, top, dims.segments + 1, true);
}

// flat annulus at height y facing +Y
void add_tip_cap(mesh_data& mesh, float outer, float inner, float y, size_t segments) {
    uint32_t ring_outer = add_ring(mesh, outer, y, segments, 0.f, 1.f);
    uint32_t ring_inner = add_ring(mesh, inner, y, segments, 0.f, 1.f);
    mesh.stitch_rings(ring_outer, ring_inner, segments + 1);
}

}

mesh_data make_standard_boss(float inner_diameter, float outer_diameter, float length, size_t segments) {
    tube_dims dims = sanitize(inner_diameter, outer_diameter, length, segments);
    mesh_data mesh;
    mesh.color = boss_color;

    uint32_t outer_bottom = add_ring(mesh, dims.outer, 0.f, dims.segments, 1.f, 0.f);
    uint32_t outer_top = add_ring(mesh, dims.outer, dims.length, dims.segments, 1.f, 0.f);
    mesh.stitch_rings(outer_bottom, outer_top, dims.segments + 1);

    add_bore(mesh, dims);
    add_tip_cap(mesh, dims.outer, dims.inner, dims.length, dims.segments);
    return mesh;
}

mesh_data make_integrated_boss(float inner_diameter, float outer_diameter, float length, float taper_angle, size_t segments) {
    tube_dims dims = sanitize(inner_diameter, outer_diameter, length, segments);
    mesh_data mesh;
    mesh.color = boss_color;

    float taper = deg_to_rad(clamp_finite(taper_angle, 0.f, 89.f));
    // the wall can thin down to the bore but not past it
    float tip_radius = std::max(dims.outer - dims.length * std::tan(taper), dims.inner);
    float slope = dims.length > 0.f ? (dims.outer - tip_radius) / dims.length : 0.f;
    // normal of r(y) = outer - slope * y is (radial, slope) normalised
    float inv_len = 1.f / std::sqrt(1.f + slope * slope);

    uint32_t prev_ring = 0;
    for (size_t i = 0; i <= integrated_boss_rings; ++i) {
        float t = (float)i / (float)integrated_boss_rings;
        float y = t * dims.length;
        float radius = dims.outer - slope * y;
        uint32_t ring = add_ring(mesh, radius, y, dims.segments, inv_len, slope * inv_len);
        if (i > 0) mesh.stitch_rings(prev_ring, ring, dims.segments + 1);
        prev_ring = ring;
    }

    add_bore(mesh, dims);
    add_tip_cap(mesh, tip_radius, dims.inner, dims.length, dims.segments);
    return mesh;
}

mesh_data make_flanged_boss(float inner_diameter, float outer_diameter, float length, const flanged_fitting& flange, size_t segments) {
    mesh_data mesh = make_standard_boss(inner_diameter, outer_diameter, length, segments);
    tube_dims dims = sanitize(inner_diameter, outer_diameter, length, segments);
    size_t segs = dims.segments;

    float flange_radius = std::max(non_negative(flange.flange_diameter) * 0.5f, dims.outer);
    float thickness = std::min(non_negative(flange.flange_thickness), dims.length);
    float top = dims.length;
    float bottom = top - thickness;

    // top face, boss wall out to the rim
    uint32_t top_rim = add_ring(mesh, flange_radius, top, segs, 0.f, 1.f);
    uint32_t top_root = add_ring(mesh, dims.outer, top, segs, 0.f, 1.f);
    mesh.stitch_rings(top_rim, top_root, segs + 1);

    // rim
    uint32_t rim_lower = add_ring(mesh, flange_radius, bottom, segs, 1.f, 0.f);
    uint32_t rim_upper = add_ring(mesh, flange_radius, top, segs, 1.f, 0.f);
    mesh.stitch_rings(rim_lower, rim_upper, segs + 1);

    // underside
    uint32_t under_rim = add_ring(mesh, flange_radius, bottom, segs, 0.f, -1.f);
    uint32_t under_root = add_ring(mesh, dims.outer, bottom, segs, 0.f, -1.f);
    mesh.stitch_rings(under_rim, under_root, segs + 1, true);

    if (flange.bolt_count == 0) return mesh;

    float bolt_circle = flange.bolt_circle_diameter ? non_negative(*flange.bolt_circle_diameter) * 0.5f : flange_radius * bolt_circle_ratio;
    bolt_circle = std::clamp(bolt_circle, dims.outer, flange_radius);
    // holes have to fit between the boss wall and the rim
    float hole_radius = std::min(bolt_hole_radius, 0.5f * std::min(flange_radius - bolt_circle, bolt_circle - dims.outer));
    if (hole_radius <= 0.f) return mesh;

    for (size_t b = 0; b < flange.bolt_count; ++b) {
        float angle = (float)b / (float)flange.bolt_count * 2.f * pi;
        float cx = bolt_circle * std::cos(angle);
        float cz = bolt_circle * std::sin(angle);
        // void wall, faces toward the hole's axis
        uint32_t lower = add_ring(mesh, hole_radius, bottom, bolt_hole_segments, -1.f, 0.f, cx, cz);
        uint32_t upper = add_ring(mesh, hole_radius, top, bolt_hole_segments, -1.f, 0.f, cx, cz);
        mesh.stitch_rings(lower, upper, bolt_hole_segments + 1, true);
    }
    return mesh;
}

mesh_data make_multi_port_boss(float inner_diameter, float outer_diameter, float length, const std::vector<aux_port>& ports, size_t segments) {
    mesh_data mesh = make_standard_boss(inner_diameter, outer_diameter, length, segments);
    float mount_y = non_negative(length) * 0.5f;

    for (const aux_port& port : ports) {
        mesh_data aux = make_standard_boss(port.inner_diameter, port.outer_diameter, port.length, segments / 2);
        aux.translate(non_negative(port.radial_offset), mount_y, 0.f);
        aux.rotate_about_axis(deg_to_rad(std::isfinite(port.angle) ? port.angle : 0.f));
        mesh.append(aux);
    }
    return mesh;
}

mesh_data make_boss(const boss_config& config) {
    struct visitor {
        const boss_config& config;
        mesh_data operator()(const standard_fitting&) const {
            return make_standard_boss(config.inner_diameter, config.outer_diameter, config.length, config.segments);
        }
        mesh_data operator()(const integrated_fitting& f) const {
            return make_integrated_boss(config.inner_diameter, config.outer_diameter, config.length, f.taper_angle, config.segments);
        }
        mesh_data operator()(const flanged_fitting& f) const {
            return make_flanged_boss(config.inner_diameter, config.outer_diameter, config.length, f, config.segments);
        }
        mesh_data operator()(const multi_port_fitting& f) const {
            return make_multi_port_boss(config.inner_diameter, config.outer_diameter, config.length, f.ports, config.segments);
        }
    };
    return std::visit(visitor{config}, config.fitting);
}

/// </boss_mesh>

}
