#pragma once

#include <array>
#include <cmath>
#include <cstddef>

#include "mesh.hpp"

namespace tgen {

// counts triangles whose winding disagrees with the averaged vertex normal
// slivers below min_area are skipped, they have no meaningful facing
inline size_t count_misoriented(const mesh_data& mesh, float min_area = 1e-6f) {
    const std::vector<float>& p = mesh.positions;
    const std::vector<float>& n = mesh.normals;
    size_t bad = 0;
    for (size_t t = 0; t + 2 < mesh.indices.size(); t += 3) {
        size_t a = mesh.indices[t] * 3, b = mesh.indices[t + 1] * 3, c = mesh.indices[t + 2] * 3;
        std::array<float, 3> e1 = {p[b] - p[a], p[b + 1] - p[a + 1], p[b + 2] - p[a + 2]};
        std::array<float, 3> e2 = {p[c] - p[a], p[c + 1] - p[a + 1], p[c + 2] - p[a + 2]};
        std::array<float, 3> face = {
            e1[1] * e2[2] - e1[2] * e2[1],
            e1[2] * e2[0] - e1[0] * e2[2],
            e1[0] * e2[1] - e1[1] * e2[0]
        };
        float area = 0.5f * std::sqrt(face[0] * face[0] + face[1] * face[1] + face[2] * face[2]);
        if (area < min_area) continue;

        float dot = 0.f;
        for (size_t k = 0; k < 3; ++k) {
            dot += face[k] * (n[a + k] + n[b + k] + n[c + k]);
        }
        if (dot < 0.f) ++bad;
    }
    return bad;
}

inline bool normals_unit(const mesh_data& mesh, float tol = 1e-3f) {
    for (size_t i = 0; i + 2 < mesh.normals.size(); i += 3) {
        float len = std::hypot(mesh.normals[i], mesh.normals[i + 1], mesh.normals[i + 2]);
        if (std::abs(len - 1.f) > tol) return false;
    }
    return true;
}

}
