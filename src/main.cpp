#include <cmath>
#include <format>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include <argparse/args.hpp>
#include <argparse/read.hpp>

#include "assembler.hpp"
#include "config.hpp"
#include "constants.hpp"
#include "utility.hpp"

using namespace std;
using namespace tgen;

template<typename T, typename F>
string list_tokens(const T& values, F&& token) {
    vector<string> names;
    for (auto v : values) names.push_back(string(token(v)));
    return vec_to_str<string>(names);
}

string describe_mesh(const mesh_data& mesh) {
    return format("{} verts, {} tris", mesh.vertex_count(), mesh.triangle_count());
}

// applies command-line overrides on top of whatever the config file gave us
void apply_boss_overrides(tank_request& req, const string& boss_tok, float boss_id, float boss_od, float boss_len) {
    bool touched = !boss_tok.empty() || !isnan(boss_id) || !isnan(boss_od) || !isnan(boss_len);
    if (!touched) return;

    boss_config boss = req.boss.value_or(boss_config{});
    if (!boss_tok.empty()) {
        boss_family family = parse_boss_family(boss_tok);
        if (family != boss.family()) boss.fitting = default_fitting(family);
    }
    if (!isnan(boss_id)) boss.inner_diameter = boss_id;
    if (!isnan(boss_od)) boss.outer_diameter = boss_od;
    if (!isnan(boss_len)) boss.length = boss_len;
    req.boss = boss;
}

string print_full(const tank_request& req, const tank_summary& summary, const assembled_tank_model& model) {
    const tank_type_spec& spec = *summary.spec;
    const dome_profile& dome = summary.dome;
    string out = format(
        "Type: {} ({})\n"
        "  {}\n"
        "  Pressure: {}-{} bar, weight ratio {:.2f}, cost ratio {:.2f}, pattern {}\n"
        "Dome: {}\n"
        "  Depth: {:.2f} mm\n"
        "  Volume: {:.1f} mm^3\n"
        "  Surface area: {:.1f} mm^2\n"
        "Cylinder: radius {:.1f} mm, length {:.1f} mm\n"
        "Total length: {:.2f} mm\n"
        "Max radius: {:.2f} mm\n"
        "Estimated mass: {:.3f} kg\n"
        "Layers:\n",
        spec.name, tank_type_token(spec.type), spec.description,
        spec.typical_pressure.min, spec.typical_pressure.max, spec.weight_ratio, spec.cost_ratio, pattern_token(spec.pattern),
        dome_token(dome.family), dome.depth, dome.volume, dome.surface_area,
        req.cylinder_radius, req.cylinder_length, model.total_length, model.max_radius, summary.mass);

    for (size_t i = 0; i < model.layers.size(); ++i) {
        const layer_mesh& layer = model.layers[i];
        out += format("  [{}] {:<28} {:>5.1f} mm  r={:.1f}  opacity {:.2f}  {:.3f} kg  {}\n",
                      layer.order, layer.name, layer.thickness, layer.outer_radius, layer.opacity,
                      summary.layer_masses[i], describe_mesh(layer.mesh));
    }
    boss_family family = req.boss ? req.boss->family() : default_boss_family;
    out += format("Boss: {}\n  Top: {}\n  Bottom: {}", boss_token(family), describe_mesh(model.top_boss), describe_mesh(model.bottom_boss));
    return out;
}

string print_very_simple(const tank_summary& summary, const assembled_tank_model& model) {
    return format("{} {} {} {} {} {}", tank_type_token(summary.spec->type), dome_token(summary.dome.family),
                  summary.dome.depth, model.total_length, model.max_radius, summary.mass);
}

int main(int argc, char* argv[]) {
    size_t log_level = LOG_BASIC;

    string config_path;
    string type_tok, dome_tok, boss_tok;
    float radius = numeric_limits<float>::quiet_NaN(), length = numeric_limits<float>::quiet_NaN();
    float boss_id = numeric_limits<float>::quiet_NaN(), boss_od = numeric_limits<float>::quiet_NaN(), boss_len = numeric_limits<float>::quiet_NaN();
    float opacity = numeric_limits<float>::quiet_NaN();
    // 0 means keep what the config says
    size_t segments = 0, num_points = 0, nthreads = 0;
    bool list_mode = false, simple_output = false;

    std::vector<std::shared_ptr<argp::base_argument>> args = {
        argp::make_argument("config", "c", "TOML file describing the tank, flags below override it", config_path),
        argp::make_argument("type", "t", "tank construction type (default " + string(tank_type_token(default_tank_type)) + ")", type_tok),
        argp::make_argument("dome", "d", "dome family (default " + string(dome_token(default_dome_family)) + ")", dome_tok),
        argp::make_argument("radius", "r", "inner cylinder radius, mm (default " + to_string(default_cylinder_radius) + ")", radius),
        argp::make_argument("length", "L", "cylinder length, mm (default " + to_string(default_cylinder_length) + ")", length),
        argp::make_argument("boss", "b", "boss family (default " + string(boss_token(default_boss_family)) + ")", boss_tok),
        argp::make_argument("bossid", "", "boss inner diameter, mm", boss_id),
        argp::make_argument("bossod", "", "boss outer diameter, mm", boss_od),
        argp::make_argument("bosslen", "", "boss protrusion length, mm", boss_len),
        argp::make_argument("opacity", "o", "global layer opacity multiplier, 0-1", opacity),
        argp::make_argument("segments", "s", "segments around the axis (default " + to_string(default_lathe_segments) + ")", segments),
        argp::make_argument("points", "p", "dome meridian intervals (default " + to_string(default_num_points) + ")", num_points),
        argp::make_argument("threads", "j", "number of threads to build layers on", nthreads),
        argp::make_argument("loglevel", "l", "how much to log (default " + to_string(log_level) + ")", log_level),
        argp::make_argument("list", "", "list available type, dome and boss families and exit", list_mode),
        argp::make_argument("simpleout", "", "makes very simple output, for use by other programs", simple_output)
    };

    argp::parse_arguments(args, argc, argv,
    // pre-help
        "Tankgen: procedural pressure vessel geometry\n"
        "  Builds the layered shell and boss meshes of a composite pressure vessel and prints a readout of its dimensions and estimated mass.\n"
        "\n"
        "  Tank types:\n"
        "    " + list_tokens(tank_types, tank_type_token) + "\n"
        "  Dome families:\n"
        "    " + list_tokens(dome_families, dome_token) + "\n"
        "  Boss families:\n"
        "    " + list_tokens(boss_families, boss_token) + "\n",
    // post-help
        "\n"
        "Example usage:\n"
        "  $ ./tankgen --type=TYPE_III --dome=torispherical -r=150 -L=600\n"
        "  $ ./tankgen --config=example_tank.toml --boss=flanged -j=3\n"
        "  Family names are case-insensitive, unknown ones fall back to the defaults."
    );

    if (list_mode) {
        cout << "Tank types: " << list_tokens(tank_types, tank_type_token) << '\n'
             << "Dome families: " << list_tokens(dome_families, dome_token) << '\n'
             << "Boss families: " << list_tokens(boss_families, boss_token) << endl;
        return 0;
    }

    tank_config config;
    try {
        if (!config_path.empty()) {
            config = load_config_file(config_path);
            log([&]() { return format("Loaded {}", config_path); }, log_level, LOG_INFO);
        }
    } catch (const config_error& e) {
        cerr << e.what() << endl;
        return 1;
    }

    tank_request& req = config.request;
    if (!type_tok.empty()) req.type = parse_tank_type(type_tok);
    if (!dome_tok.empty()) {
        dome_family family = parse_dome_family(dome_tok);
        if (family != family_of(req.dome)) req.dome = default_shape(family);
    }
    if (!isnan(radius)) req.cylinder_radius = radius;
    if (!isnan(length)) req.cylinder_length = length;
    if (!isnan(opacity)) req.layer_opacity = opacity;
    apply_boss_overrides(req, boss_tok, boss_id, boss_od, boss_len);

    assembly_options& options = config.options;
    if (segments != 0) options.segments = segments;
    if (num_points != 0) options.num_points = num_points;
    if (nthreads != 0) options.n_threads = nthreads;
    options.log_level = simple_output ? LOG_NONE : log_level;

    log([&]() { return format("Building {} tank with {} domes", tank_type_token(req.type), dome_token(family_of(req.dome))); },
        options.log_level, LOG_BASIC);

    try {
        assembled_tank_model model = assemble_tank(req, options);
        tank_summary summary = summarize(req, options.num_points);
        cout << (simple_output ? print_very_simple(summary, model) : print_full(req, summary, model)) << endl;
    } catch (const invalid_geometry_parameters& e) {
        cerr << "Invalid geometry: " << e.what() << endl;
        return 1;
    }
    return 0;
}
