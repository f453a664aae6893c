#include <algorithm>
#include <cmath>
#include <format>

#include "lathe.hpp"

namespace tgen {

mesh_data revolve(const std::vector<profile_point>& profile, size_t segments) {
    if (profile.size() < 2) {
        throw invalid_geometry_parameters(std::format("lathe needs at least 2 profile samples, got {}", profile.size()));
    }
    if (segments < 3) {
        throw invalid_geometry_parameters(std::format("lathe needs at least 3 segments, got {}", segments));
    }

    size_t n = profile.size();
    size_t ring = segments + 1;

    mesh_data mesh;
    mesh.positions.reserve(n * ring * 3);
    mesh.normals.reserve(n * ring * 3);
    mesh.indices.reserve((n - 1) * segments * 6);

    // trig table shared by every ring
    std::vector<float> cos_t(ring), sin_t(ring);
    for (size_t j = 0; j < ring; ++j) {
        float theta = (float)j / (float)segments * 2.f * pi;
        cos_t[j] = std::cos(theta);
        sin_t[j] = std::sin(theta);
    }

    for (size_t i = 0; i < n; ++i) {
        const profile_point& prev = profile[i == 0 ? 0 : i - 1];
        const profile_point& next = profile[std::min(n - 1, i + 1)];
        float dr = next.r - prev.r;
        float dz = next.z - prev.z;
        float len = std::sqrt(dr * dr + dz * dz);
        // meridian-plane normal, radial fallback where neighbours coincide
        float nr = 1.f, nz = 0.f;
        if (len > 1e-12f) {
            nr = dz / len;
            nz = -dr / len;
        }

        float r = profile[i].r;
        float z = profile[i].z;
        for (size_t j = 0; j < ring; ++j) {
            mesh.add_vertex(r * cos_t[j], z, r * sin_t[j],
                            nr * cos_t[j], nz, nr * sin_t[j]);
        }
    }

    for (size_t i = 0; i + 1 < n; ++i) {
        mesh.stitch_rings((uint32_t)(i * ring), (uint32_t)((i + 1) * ring), ring);
    }

    return mesh;
}

}
