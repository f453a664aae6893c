#pragma once

#include <vector>

#include "constants.hpp"
#include "mesh.hpp"

namespace tgen {

// a meridian sample: distance from the axis and position along it
struct profile_point {
    float r;
    float z;
};

// revolves a meridian about the +Y axis into a triangulated shell
// each sample becomes a ring of segments + 1 vertices, the seam vertex duplicated
// normals come from central differences along the meridian, so they face outward
// when the meridian runs in increasing z
// throws invalid_geometry_parameters for fewer than 2 samples or 3 segments
mesh_data revolve(const std::vector<profile_point>& profile, size_t segments = default_lathe_segments);

}
