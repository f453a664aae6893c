#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include <tomlplusplus/toml.hpp>

#include "assembler.hpp"

namespace tgen {

struct config_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// a request plus how finely to build it
struct tank_config {
    tank_request request;
    assembly_options options;
};

// missing keys keep their defaults, unknown family tokens fall back to the family default
// throws config_error if a present key has the wrong type
tank_config load_config(const toml::table& table);
tank_config parse_config(std::string_view text);
tank_config load_config_file(const std::string& path);

}
