#include <cmath>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "dome.hpp"
#include "lathe.hpp"
#include "mesh_checks.hpp"

using Catch::Approx;
using namespace tgen;

TEST_CASE("Lathe revolve") {
    SECTION("Buffer sizes") {
        std::vector<profile_point> profile {{10.f, 0.f}, {10.f, 5.f}, {8.f, 9.f}};
        mesh_data mesh = revolve(profile, 8);
        REQUIRE(mesh.vertex_count() == 3 * 9);
        REQUIRE(mesh.triangle_count() == 2 * 8 * 2);
        REQUIRE(mesh.positions.size() % 3 == 0);
        REQUIRE(mesh.indices.size() % 3 == 0);
        REQUIRE(mesh.normals.size() == mesh.positions.size());
        REQUIRE_NOTHROW(check_mesh(mesh));
    }

    SECTION("Seam vertex is duplicated") {
        mesh_data mesh = revolve({{4.f, 0.f}, {4.f, 2.f}}, 6);
        for (size_t k = 0; k < 3; ++k) {
            REQUIRE(mesh.positions[k] == Approx(mesh.positions[6 * 3 + k]).margin(1e-5));
        }
    }

    SECTION("Rings sit on the sampled radius and height") {
        std::vector<profile_point> profile {{3.f, -1.f}, {7.f, 2.f}};
        mesh_data mesh = revolve(profile, 12);
        for (size_t v = 0; v < mesh.vertex_count(); ++v) {
            const profile_point& p = profile[v / 13];
            REQUIRE(std::hypot(mesh.positions[v * 3], mesh.positions[v * 3 + 2]) == Approx(p.r).epsilon(1e-5));
            REQUIRE(mesh.positions[v * 3 + 1] == Approx(p.z));
        }
    }

    SECTION("Normals are unit length and face outward") {
        dome_profile dome = isotensoid_profile({200.f, 15.f, std::nullopt, 40});
        mesh_data mesh = revolve(dome.points, 32);
        REQUIRE(normals_unit(mesh));
        REQUIRE(count_misoriented(mesh) == 0);

        // straight wall points straight out
        mesh_data wall = revolve({{5.f, 0.f}, {5.f, 10.f}}, 4);
        REQUIRE(wall.normals[0] == Approx(1.f));
        REQUIRE(wall.normals[1] == Approx(0.f).margin(1e-6));
        REQUIRE(wall.normals[2] == Approx(0.f).margin(1e-6));
    }

    SECTION("Coincident samples fall back to a radial normal") {
        mesh_data mesh = revolve({{5.f, 0.f}, {5.f, 0.f}}, 4);
        REQUIRE(normals_unit(mesh));
        REQUIRE(mesh.normals[0] == Approx(1.f));
        REQUIRE(mesh.normals[1] == Approx(0.f).margin(1e-6));
    }

    SECTION("Rejects profiles that can't form a surface") {
        REQUIRE_THROWS_AS(revolve({}, 16), invalid_geometry_parameters);
        REQUIRE_THROWS_AS(revolve({{1.f, 0.f}}, 16), invalid_geometry_parameters);
        REQUIRE_THROWS_AS(revolve({{1.f, 0.f}, {1.f, 1.f}}, 2), invalid_geometry_parameters);
        REQUIRE_THROWS_AS(revolve({{1.f, 0.f}, {1.f, 1.f}}, 0), invalid_geometry_parameters);
        REQUIRE_NOTHROW(revolve({{1.f, 0.f}, {1.f, 1.f}}, 3));
    }
}

TEST_CASE("Mesh utilities") {
    mesh_data base = revolve({{2.f, 0.f}, {2.f, 4.f}}, 6);

    SECTION("Append rebases indices") {
        mesh_data joined = base;
        joined.append(base);
        REQUIRE(joined.vertex_count() == 2 * base.vertex_count());
        REQUIRE(joined.triangle_count() == 2 * base.triangle_count());
        size_t half = base.indices.size();
        for (size_t i = 0; i < half; ++i) {
            REQUIRE(joined.indices[half + i] == base.indices[i] + base.vertex_count());
        }
        REQUIRE_NOTHROW(check_mesh(joined));
    }

    SECTION("Mirroring keeps faces outward") {
        mesh_data mirrored = base;
        mirrored.mirror_axial();
        REQUIRE(count_misoriented(mirrored) == 0);
        auto box = mirrored.bounds();
        REQUIRE(box[0][1] == Approx(-4.f));
        REQUIRE(box[1][1] == Approx(0.f).margin(1e-6));
    }

    SECTION("Rotation keeps distance from the axis") {
        mesh_data turned = base;
        turned.rotate_about_axis(0.7f).translate(0.f, 3.f, 0.f);
        REQUIRE(turned.max_radius() == Approx(base.max_radius()));
        REQUIRE(count_misoriented(turned) == 0);
        REQUIRE(turned.bounds()[0][1] == Approx(3.f));
    }

    SECTION("Invariant check catches broken buffers") {
        mesh_data broken = base;
        broken.indices.push_back(0);
        REQUIRE_THROWS_AS(check_mesh(broken), invalid_geometry_parameters);

        broken = base;
        broken.indices.back() = (uint32_t)broken.vertex_count();
        REQUIRE_THROWS_AS(check_mesh(broken), invalid_geometry_parameters);

        broken = base;
        broken.normals.pop_back();
        REQUIRE_THROWS_AS(check_mesh(broken), invalid_geometry_parameters);
    }

    SECTION("Empty mesh bounds are zero") {
        mesh_data empty;
        REQUIRE(empty.bounds()[0][0] == 0.f);
        REQUIRE(empty.max_radius() == 0.f);
    }
}
