#include <cmath>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "dome.hpp"
#include "utility.hpp"

using Catch::Approx;
using namespace tgen;

namespace {

bool radius_non_decreasing(const dome_profile& profile) {
    for (size_t i = 1; i < profile.points.size(); ++i) {
        if (profile.points[i].r < profile.points[i - 1].r) return false;
    }
    return true;
}

}

TEST_CASE("Dome profile invariants") {
    for (dome_family family : dome_families) {
        dome_shape shape = default_shape(family);
        REQUIRE(family_of(shape) == family);

        for (float R : {50.f, 200.f, 750.f}) {
            dome_params params {R, 15.f, std::nullopt, 50};
            dome_profile profile = generate_dome(params, shape);

            REQUIRE(profile.family == family);
            REQUIRE(profile.points.size() == 51);
            REQUIRE(profile.points.front().z == Approx(0.f).margin(1e-4));
            REQUIRE(profile.points.front().r >= 15.f);
            REQUIRE(profile.points.back().r == Approx(R));
            REQUIRE(profile.points.back().z == Approx(profile.depth));
            REQUIRE(profile.depth > 0.f);
            REQUIRE(profile.volume > 0.f);
            REQUIRE(profile.surface_area > 0.f);
            REQUIRE(radius_non_decreasing(profile));
            for (const profile_point& p : profile.points) {
                REQUIRE(p.r >= 15.f);
                REQUIRE(p.r <= R * 1.0001f);
            }
        }
    }
}

TEST_CASE("Dome apex sits at the bore or the family's own apex") {
    dome_params params {200.f, 15.f, std::nullopt, 50};

    SECTION("Closed families open to the bore") {
        REQUIRE(hemispherical_profile(params).points.front().r == Approx(15.f));
        REQUIRE(elliptical_profile(params).points.front().r == Approx(15.f));
        REQUIRE(torispherical_profile(params).points.front().r == Approx(15.f));
        REQUIRE(geodesic_profile(params).points.front().r == Approx(15.f));
    }

    SECTION("Isotensoid polar opening is wider than a small bore") {
        float expected = 200.f * std::sin(deg_to_rad(default_winding_angle));
        REQUIRE(isotensoid_profile(params).points.front().r == Approx(expected).epsilon(1e-4));

        params.boss_radius = 180.f;
        REQUIRE(isotensoid_profile(params).points.front().r == Approx(180.f));
    }
}

TEST_CASE("Hemispherical dome") {
    for (size_t n : {1, 4, 50, 200}) {
        dome_params params {120.f, 10.f, std::nullopt, n};
        dome_profile profile = hemispherical_profile(params);
        REQUIRE(profile.points.size() == n + 1);
        REQUIRE(profile.depth == Approx(120.f));
    }

    SECTION("Ignores a target depth") {
        dome_params params {120.f, 10.f, 30.f, 50};
        REQUIRE(hemispherical_profile(params).depth == Approx(120.f));
    }

    SECTION("Volume is the closed form") {
        dome_params params {100.f, 0.f, std::nullopt, 50};
        REQUIRE(hemispherical_profile(params).volume == Approx((2.f / 3.f) * pi * 1e6f).epsilon(1e-4));
    }

    SECTION("Surface area approaches 2 pi R^2") {
        dome_params params {100.f, 0.f, std::nullopt, 200};
        REQUIRE(hemispherical_profile(params).surface_area == Approx(2.f * pi * 1e4f).epsilon(1e-3));
    }
}

TEST_CASE("Isotensoid dome") {
    for (float angle : {30.f, 45.f, 54.74f, 70.f}) {
        dome_params params {200.f, 15.f, std::nullopt, 50};
        dome_profile profile = isotensoid_profile(params, angle);
        REQUIRE(profile.points.back().r == Approx(200.f).epsilon(1e-4));
        REQUIRE(profile.depth == Approx(200.f * (1.f - std::sin(deg_to_rad(angle)))).epsilon(1e-4));
    }

    SECTION("Out-of-range winding angles fall back to the default") {
        dome_params params {200.f, 15.f, std::nullopt, 50};
        float expected = isotensoid_profile(params).depth;
        REQUIRE(isotensoid_profile(params, 0.f).depth == Approx(expected));
        REQUIRE(isotensoid_profile(params, 90.f).depth == Approx(expected));
        REQUIRE(isotensoid_profile(params, NAN).depth == Approx(expected));
    }

    SECTION("Honours a target depth") {
        dome_params params {200.f, 15.f, 80.f, 50};
        dome_profile profile = isotensoid_profile(params);
        REQUIRE(profile.depth == Approx(80.f));
        REQUIRE(profile.points.back().z == Approx(80.f));
    }
}

TEST_CASE("Elliptical and geodesic domes") {
    SECTION("Elliptical depth is radius times aspect ratio") {
        dome_params params {200.f, 15.f, std::nullopt, 50};
        REQUIRE(elliptical_profile(params, 0.5f).depth == Approx(100.f));
        REQUIRE(elliptical_profile(params, -1.f).depth == Approx(200.f * default_aspect_ratio));
        params.target_depth = 55.f;
        REQUIRE(elliptical_profile(params).depth == Approx(55.f));
    }

    SECTION("Geodesic facets stay inside the cylinder wall") {
        dome_params params {200.f, 15.f, std::nullopt, 80};
        for (float freq : {0.f, 3.f, 7.5f}) {
            dome_profile profile = geodesic_profile(params, freq);
            REQUIRE(profile.depth == Approx(200.f * geodesic_depth_ratio));
            REQUIRE(radius_non_decreasing(profile));
            for (const profile_point& p : profile.points) {
                REQUIRE(p.r <= 200.f);
            }
        }
    }
}

TEST_CASE("Torispherical dome") {
    dome_params params {200.f, 15.f, std::nullopt, 100};

    SECTION("ASME F&D proportions") {
        dome_profile profile = torispherical_profile(params);
        float rk = 200.f * default_knuckle_ratio;
        float tr = 200.f - rk;
        float Rc = 200.f * default_crown_ratio;
        float expected = Rc - std::sqrt(Rc * Rc - tr * tr) + rk;
        REQUIRE(profile.depth == Approx(expected).epsilon(1e-4));
    }

    SECTION("A crown too small to reach the knuckle is widened") {
        dome_profile profile = torispherical_profile(params, 0.1f, 0.06f);
        REQUIRE(std::isfinite(profile.depth));
        REQUIRE(profile.depth > 0.f);
        REQUIRE(radius_non_decreasing(profile));
    }

    SECTION("Ignores a target depth") {
        float natural = torispherical_profile(params).depth;
        params.target_depth = 10.f;
        REQUIRE(torispherical_profile(params).depth == Approx(natural));
    }
}

TEST_CASE("Dome volume grows with radius") {
    for (dome_family family : dome_families) {
        dome_shape shape = default_shape(family);
        float prev = 0.f;
        for (float R : {60.f, 100.f, 150.f, 200.f, 400.f}) {
            dome_profile profile = generate_dome({R, 15.f, std::nullopt, 50}, shape);
            REQUIRE(profile.volume > prev);
            prev = profile.volume;
        }
    }

    SECTION("Holding depth fixed") {
        for (dome_family family : dome_families) {
            dome_shape shape = default_shape(family);
            float prev = 0.f;
            for (float R : {60.f, 100.f, 150.f, 200.f, 400.f}) {
                dome_profile profile = generate_dome({R, 15.f, 30.f, 50}, shape);
                REQUIRE(profile.volume > prev);
                prev = profile.volume;
            }
        }
    }
}

TEST_CASE("Bore at least as wide as the cylinder gives a flat annulus") {
    for (dome_family family : dome_families) {
        for (float boss : {200.f, 250.f}) {
            dome_profile profile = generate_dome({200.f, boss, std::nullopt, 10}, default_shape(family));
            REQUIRE(profile.points.size() == 11);
            REQUIRE(profile.depth == 0.f);
            REQUIRE(profile.volume == 0.f);
            REQUIRE(profile.surface_area == 0.f);
            for (const profile_point& p : profile.points) {
                REQUIRE(p.r == Approx(boss));
                REQUIRE(p.z == 0.f);
            }
        }
    }
}

TEST_CASE("Dome family tokens") {
    REQUIRE(parse_dome_family("hemispherical") == dome_family::hemispherical);
    REQUIRE(parse_dome_family("Torispherical") == dome_family::torispherical);
    REQUIRE(parse_dome_family("GEODESIC") == dome_family::geodesic);
    REQUIRE(parse_dome_family("oblate") == default_dome_family);
    for (dome_family f : dome_families) {
        REQUIRE(parse_dome_family(dome_token(f)) == f);
    }
}
