#include <algorithm>
#include <cmath>
#include <format>
#include <limits>

#include "mesh.hpp"

namespace tgen {

uint32_t mesh_data::add_vertex(float x, float y, float z, float nx, float ny, float nz) {
    uint32_t idx = (uint32_t)vertex_count();
    positions.insert(positions.end(), {x, y, z});
    normals.insert(normals.end(), {nx, ny, nz});
    return idx;
}

void mesh_data::add_triangle(uint32_t a, uint32_t b, uint32_t c) {
    indices.insert(indices.end(), {a, b, c});
}

void mesh_data::stitch_rings(uint32_t ring_a, uint32_t ring_b, size_t ring_size, bool flip) {
    for (uint32_t j = 0; j + 1 < ring_size; ++j) {
        uint32_t curr = ring_a + j;
        uint32_t next = ring_b + j;
        if (flip) {
            add_triangle(curr, curr + 1, next);
            add_triangle(curr + 1, next + 1, next);
        } else {
            add_triangle(curr, next, curr + 1);
            add_triangle(curr + 1, next, next + 1);
        }
    }
}

void mesh_data::append(const mesh_data& other) {
    uint32_t base = (uint32_t)vertex_count();
    positions.insert(positions.end(), other.positions.begin(), other.positions.end());
    normals.insert(normals.end(), other.normals.begin(), other.normals.end());
    indices.reserve(indices.size() + other.indices.size());
    for (uint32_t idx : other.indices) {
        indices.push_back(idx + base);
    }
}

mesh_data& mesh_data::translate(float dx, float dy, float dz) {
    for (size_t i = 0; i + 2 < positions.size(); i += 3) {
        positions[i] += dx;
        positions[i + 1] += dy;
        positions[i + 2] += dz;
    }
    return *this;
}

mesh_data& mesh_data::rotate_about_axis(float angle) {
    float c = std::cos(angle), s = std::sin(angle);
    auto rotate = [c, s](std::vector<float>& buf) {
        for (size_t i = 0; i + 2 < buf.size(); i += 3) {
            float x = buf[i], z = buf[i + 2];
            buf[i] = x * c - z * s;
            buf[i + 2] = x * s + z * c;
        }
    };
    rotate(positions);
    rotate(normals);
    return *this;
}

mesh_data& mesh_data::mirror_axial() {
    for (size_t i = 1; i < positions.size(); i += 3) {
        positions[i] = -positions[i];
    }
    for (size_t i = 1; i < normals.size(); i += 3) {
        normals[i] = -normals[i];
    }
    for (size_t i = 0; i + 2 < indices.size(); i += 3) {
        std::swap(indices[i + 1], indices[i + 2]);
    }
    return *this;
}

std::array<std::array<float, 3>, 2> mesh_data::bounds() const {
    if (positions.empty()) return {};
    constexpr float big = std::numeric_limits<float>::max();
    std::array<float, 3> lo = {big, big, big}, hi = {-big, -big, -big};
    for (size_t i = 0; i + 2 < positions.size(); i += 3) {
        for (size_t k = 0; k < 3; ++k) {
            lo[k] = std::min(lo[k], positions[i + k]);
            hi[k] = std::max(hi[k], positions[i + k]);
        }
    }
    return {lo, hi};
}

float mesh_data::max_radius() const {
    float best = 0.f;
    for (size_t i = 0; i + 2 < positions.size(); i += 3) {
        best = std::max(best, std::hypot(positions[i], positions[i + 2]));
    }
    return best;
}

void check_mesh(const mesh_data& mesh) {
    if (mesh.positions.size() % 3 != 0) {
        throw invalid_geometry_parameters(std::format("position buffer length {} is not a multiple of 3", mesh.positions.size()));
    }
    if (mesh.normals.size() != mesh.positions.size()) {
        throw invalid_geometry_parameters(std::format("normal buffer length {} doesn't match position buffer length {}", mesh.normals.size(), mesh.positions.size()));
    }
    if (mesh.indices.size() % 3 != 0) {
        throw invalid_geometry_parameters(std::format("index buffer length {} is not a multiple of 3", mesh.indices.size()));
    }
    size_t verts = mesh.vertex_count();
    for (size_t i = 0; i < mesh.indices.size(); ++i) {
        if (mesh.indices[i] >= verts) {
            throw invalid_geometry_parameters(std::format("index {} at {} is out of range for {} vertices", mesh.indices[i], i, verts));
        }
    }
}

}
