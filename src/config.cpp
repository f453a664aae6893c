#include <algorithm>
#include <cstdint>
#include <format>

#include "config.hpp"
#include "utility.hpp"

namespace tgen {

namespace {

using view = toml::node_view<const toml::node>;

float read_float(view node, std::string_view key, float fallback) {
    if (!node) return fallback;
    if (std::optional<double> v = node.value<double>()) return (float)*v;
    throw config_error(std::format("'{}' must be a number", key));
}

size_t read_count(view node, std::string_view key, size_t fallback) {
    if (!node) return fallback;
    if (std::optional<int64_t> v = node.value<int64_t>()) return (size_t)std::max<int64_t>(*v, 0);
    throw config_error(std::format("'{}' must be an integer", key));
}

bool read_bool(view node, std::string_view key, bool fallback) {
    if (!node) return fallback;
    if (std::optional<bool> v = node.value<bool>()) return *v;
    throw config_error(std::format("'{}' must be true or false", key));
}

std::string read_string(view node, std::string_view key, std::string_view fallback) {
    if (!node) return std::string(fallback);
    if (std::optional<std::string> v = node.value<std::string>()) return *v;
    throw config_error(std::format("'{}' must be a string", key));
}

dome_shape read_dome(dome_family family, view params) {
    switch (family) {
        case dome_family::hemispherical:
            return hemispherical_shape{};
        case dome_family::isotensoid:
            return isotensoid_shape{read_float(params["winding_angle"], "dome_params.winding_angle", default_winding_angle)};
        case dome_family::geodesic:
            return geodesic_shape{read_float(params["frequency"], "dome_params.frequency", default_geodesic_frequency)};
        case dome_family::elliptical:
            return elliptical_shape{read_float(params["aspect_ratio"], "dome_params.aspect_ratio", default_aspect_ratio)};
        case dome_family::torispherical:
            return torispherical_shape{read_float(params["crown_ratio"], "dome_params.crown_ratio", default_crown_ratio),
                                       read_float(params["knuckle_ratio"], "dome_params.knuckle_ratio", default_knuckle_ratio)};
    }
    return isotensoid_shape{};
}

std::vector<aux_port> read_ports(view node) {
    std::vector<aux_port> ports;
    if (!node) return ports;
    const toml::array* arr = node.as_array();
    if (!arr) throw config_error("'boss.ports' must be an array of tables");
    for (const toml::node& entry : *arr) {
        const toml::table* port = entry.as_table();
        if (!port) throw config_error("'boss.ports' must be an array of tables");
        view p(port);
        ports.push_back({
            read_float(p["inner_diameter"], "boss.ports.inner_diameter", 6.f),
            read_float(p["outer_diameter"], "boss.ports.outer_diameter", 12.f),
            read_float(p["length"], "boss.ports.length", 25.f),
            read_float(p["angle"], "boss.ports.angle", 0.f),
            read_float(p["radial_offset"], "boss.ports.radial_offset", 0.f)
        });
    }
    return ports;
}

boss_config read_boss(view node) {
    if (!node.as_table()) throw config_error("'boss' must be a table");

    boss_config boss;
    boss.inner_diameter = read_float(node["inner_diameter"], "boss.inner_diameter", default_boss_inner_diameter);
    boss.outer_diameter = read_float(node["outer_diameter"], "boss.outer_diameter", default_boss_outer_diameter);
    boss.length = read_float(node["length"], "boss.length", default_boss_length);
    boss.segments = read_count(node["segments"], "boss.segments", default_boss_segments);

    boss_family family = parse_boss_family(read_string(node["type"], "boss.type", boss_token(default_boss_family)));
    switch (family) {
        case boss_family::standard_cylindrical:
            boss.fitting = standard_fitting{};
            break;
        case boss_family::integrated:
            boss.fitting = integrated_fitting{read_float(node["taper_angle"], "boss.taper_angle", default_taper_angle)};
            break;
        case boss_family::flanged: {
            flanged_fitting flange;
            flange.flange_diameter = read_float(node["flange_diameter"], "boss.flange_diameter", default_flange_diameter);
            flange.flange_thickness = read_float(node["flange_thickness"], "boss.flange_thickness", default_flange_thickness);
            if (node["bolt_circle_diameter"]) {
                flange.bolt_circle_diameter = read_float(node["bolt_circle_diameter"], "boss.bolt_circle_diameter", 0.f);
            }
            flange.bolt_count = read_count(node["bolt_count"], "boss.bolt_count", default_bolt_count);
            boss.fitting = flange;
            break;
        }
        case boss_family::multi_port:
            boss.fitting = multi_port_fitting{read_ports(node["ports"])};
            break;
    }
    return boss;
}

}

tank_config load_config(const toml::table& table) {
    view root(table);
    tank_config config;
    tank_request& req = config.request;

    req.type = parse_tank_type(read_string(root["tank_type"], "tank_type", tank_type_token(default_tank_type)));
    dome_family family = parse_dome_family(read_string(root["dome"], "dome", dome_token(default_dome_family)));
    req.dome = read_dome(family, root["dome_params"]);
    if (root["dome_params"]["target_depth"]) {
        req.target_depth = read_float(root["dome_params"]["target_depth"], "dome_params.target_depth", 0.f);
    }

    req.cylinder_radius = read_float(root["cylinder_radius"], "cylinder_radius", default_cylinder_radius);
    req.cylinder_length = read_float(root["cylinder_length"], "cylinder_length", default_cylinder_length);
    req.layer_opacity = read_float(root["layer_opacity"], "layer_opacity", default_layer_opacity);
    if (root["boss"]) req.boss = read_boss(root["boss"]);

    req.cross_section = read_bool(root["view"]["cross_section"], "view.cross_section", false);
    req.auto_rotate = read_bool(root["view"]["auto_rotate"], "view.auto_rotate", false);

    config.options.segments = read_count(root["segments"], "segments", default_lathe_segments);
    config.options.num_points = read_count(root["num_points"], "num_points", default_num_points);
    config.options.n_threads = read_count(root["threads"], "threads", 1);
    return config;
}

tank_config parse_config(std::string_view text) {
    try {
        return load_config(toml::parse(text));
    } catch (const toml::parse_error& e) {
        throw config_error(std::format("couldn't parse configuration: {} (line {})", e.description(), e.source().begin.line));
    }
}

tank_config load_config_file(const std::string& path) {
    try {
        return load_config(toml::parse_file(path));
    } catch (const toml::parse_error& e) {
        throw config_error(std::format("couldn't read {}: {} (line {})", path, e.description(), e.source().begin.line));
    }
}

}
