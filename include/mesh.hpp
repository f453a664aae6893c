#pragma once

#include <array>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include "constants.hpp"

namespace tgen {

// thrown when asked for geometry that can't form a triangulated surface
struct invalid_geometry_parameters : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// flat triangle mesh buffers, ready to hand to any renderer
// positions and normals are xyz triplets, indices are triangle triplets
struct mesh_data {
    std::vector<float> positions;
    std::vector<float> normals;
    std::vector<uint32_t> indices;
    rgb color = {1.f, 1.f, 1.f};

    size_t vertex_count() const {
        return positions.size() / 3;
    }
    size_t triangle_count() const {
        return indices.size() / 3;
    }

    // returns: index of the added vertex
    uint32_t add_vertex(float x, float y, float z, float nx, float ny, float nz);
    void add_triangle(uint32_t a, uint32_t b, uint32_t c);
    // connects two rings of ring_size vertices each starting at ring_a and ring_b
    // faces point along (ring_b - ring_a) x (around the ring), flip to reverse
    void stitch_rings(uint32_t ring_a, uint32_t ring_b, size_t ring_size, bool flip = false);

    // appends other's geometry, rebasing its indices onto our vertex buffer
    void append(const mesh_data& other);

    mesh_data& translate(float dx, float dy, float dz);
    // rotates about the longitudinal (+Y) axis, radians
    mesh_data& rotate_about_axis(float angle);
    // reflects through the y = 0 plane, reversing winding so faces stay outward
    mesh_data& mirror_axial();

    // {min xyz, max xyz}, zeroes if empty
    std::array<std::array<float, 3>, 2> bounds() const;
    // largest distance of any vertex from the longitudinal axis
    float max_radius() const;
};

// throws invalid_geometry_parameters if the buffers break mesh invariants
void check_mesh(const mesh_data& mesh);

}
