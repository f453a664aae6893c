#include <algorithm>
#include <cmath>
#include <exception>
#include <format>
#include <numeric>
#include <thread>

#include "assembler.hpp"
#include "utility.hpp"

namespace tgen {

namespace {

float cylinder_radius_of(const tank_request& request) {
    float r = request.cylinder_radius;
    return std::isfinite(r) ? std::max(r, min_dimension) : min_dimension;
}

float cylinder_length_of(const tank_request& request) {
    float l = request.cylinder_length;
    return std::isfinite(l) ? std::max(l, 0.f) : 0.f;
}

layer_mesh build_layer(const material_layer& layer, float outer_radius, const std::vector<profile_point>& meridian,
                       float cylinder_radius, float opacity_scale, const assembly_options& options) {
    // radial scaling keeps the dome's proportions and can't self-intersect,
    // at the cost of some dome distortion for thick walls
    float scale = outer_radius / cylinder_radius;
    std::vector<profile_point> scaled(meridian);
    for (profile_point& p : scaled) {
        p.r *= scale;
    }

    layer_mesh out;
    out.name = layer.name;
    out.order = layer.order;
    out.thickness = layer.thickness;
    out.outer_radius = outer_radius;
    out.opacity = clamp_finite(layer.opacity * opacity_scale, 0.f, 1.f);
    out.mesh = revolve(scaled, options.segments);
    out.mesh.color = layer.color;

    CHECKEXCEPT {
        check_mesh(out.mesh);
    }
    log([&]() { return std::format("[Assembler] layer {} '{}': r={} verts={} tris={}", out.order, out.name, outer_radius, out.mesh.vertex_count(), out.mesh.triangle_count()); },
        options.log_level, LOG_DEBUG);
    return out;
}

}

float boss_radius_of(const tank_request& request) {
    return request.boss ? request.boss->bore_radius() : default_boss_radius;
}

dome_profile build_dome(const tank_request& request, size_t num_points) {
    dome_params params {cylinder_radius_of(request), boss_radius_of(request), request.target_depth, num_points};
    return generate_dome(params, request.dome);
}

std::vector<profile_point> build_meridian(const dome_profile& dome, float cylinder_radius, float cylinder_length) {
    const std::vector<profile_point>& pts = dome.points;
    std::vector<profile_point> meridian;
    meridian.reserve(pts.size() * 2 + 2);

    // bottom dome, apex first, mirrored below the joint
    for (const profile_point& p : pts) {
        meridian.push_back({p.r, p.z - dome.depth});
    }

    // cylinder wall
    meridian.push_back({cylinder_radius, 0.f});
    meridian.push_back({cylinder_radius, cylinder_length});

    // top dome, joint first
    for (auto it = pts.rbegin(); it != pts.rend(); ++it) {
        meridian.push_back({it->r, cylinder_length + dome.depth - it->z});
    }
    return meridian;
}

assembled_tank_model assemble_tank(const tank_request& request, const assembly_options& options) {
    float R = cylinder_radius_of(request);
    float L = cylinder_length_of(request);
    float opacity_scale = clamp_finite(request.layer_opacity, 0.f, 1.f);
    const tank_type_spec& spec = spec_for(request.type);

    assembled_tank_model model;
    model.dome = build_dome(request, options.num_points);
    std::vector<profile_point> meridian = build_meridian(model.dome, R, L);

    size_t count = spec.layers.size();
    std::vector<float> outer_radii(count);
    float cumulative = R;
    for (size_t i = 0; i < count; ++i) {
        cumulative += spec.layers[i].thickness;
        outer_radii[i] = cumulative;
    }

    log([&]() { return std::format("[Assembler] {} with {} dome: {} layers, depth {}, {} meridian samples", spec.name, dome_token(model.dome.family), count, model.dome.depth, meridian.size()); },
        options.log_level, LOG_INFO);

    model.layers.resize(count);
    auto build = [&](size_t i) {
        model.layers[i] = build_layer(spec.layers[i], outer_radii[i], meridian, R, opacity_scale, options);
    };

    size_t n_threads = std::min(std::max<size_t>(options.n_threads, 1), std::max<size_t>(count, 1));
    if (n_threads == 1) {
        for (size_t i = 0; i < count; ++i) build(i);
    } else {
        // each worker owns a strided set of slots, no other sharing until the join
        std::vector<std::exception_ptr> errors(n_threads);
        std::vector<std::thread> workers;
        workers.reserve(n_threads);
        for (size_t w = 0; w < n_threads; ++w) {
            workers.emplace_back([&, w]() {
                try {
                    for (size_t i = w; i < count; i += n_threads) build(i);
                } catch (...) {
                    errors[w] = std::current_exception();
                }
            });
        }
        for (std::thread& t : workers) t.join();
        for (const std::exception_ptr& e : errors) {
            if (e) std::rethrow_exception(e);
        }
    }

    boss_config boss = request.boss.value_or(boss_config{});
    model.top_boss = make_boss(boss);
    model.top_boss.translate(0.f, L + model.dome.depth, 0.f);
    model.bottom_boss = make_boss(boss);
    model.bottom_boss.mirror_axial().translate(0.f, -model.dome.depth, 0.f);
    CHECKEXCEPT {
        check_mesh(model.top_boss);
        check_mesh(model.bottom_boss);
    }

    model.total_length = L + 2.f * model.dome.depth;
    model.max_radius = cumulative;

    log([&]() { return std::format("[Assembler] {} boss, length {}, max radius {}", boss_token(boss.family()), model.total_length, model.max_radius); },
        options.log_level, LOG_INFO);
    return model;
}

tank_summary summarize(const tank_request& request, size_t num_points) {
    float R = cylinder_radius_of(request);
    float L = cylinder_length_of(request);

    tank_summary summary;
    summary.spec = &spec_for(request.type);
    summary.dome = build_dome(request, num_points);
    summary.layer_masses = estimate_layer_masses(*summary.spec, R, L, summary.dome.depth);
    summary.mass = std::accumulate(summary.layer_masses.begin(), summary.layer_masses.end(), 0.f);
    summary.total_length = L + 2.f * summary.dome.depth;
    summary.max_radius = R + summary.spec->total_thickness();
    return summary;
}

}
