/// @file test_projection.cpp
/// @brief Unit tests for skychart::astro::Projection and chart::FieldOfView.

#include <doctest/doctest.h>

#include "astro/projection.hpp"
#include "chart/field_of_view.hpp"
#include "core/types.hpp"

#include <cmath>

using namespace skychart;
using namespace skychart::astro;

static constexpr f64 kTol = 1e-9;

// =================================================================
// Tangent-plane projection
// =================================================================

TEST_CASE("Field centre projects to the origin")
{
    const EquatorialCoord centre{1.5, 1.0};
    const Vec2d lm = Projection::radec_to_lm(centre, centre);

    CHECK(lm.x == doctest::Approx(0.0).epsilon(kTol));
    CHECK(lm.y == doctest::Approx(0.0).epsilon(kTol));
}

TEST_CASE("East is +l and north is +m")
{
    const EquatorialCoord centre{2.0, 0.3};

    const Vec2d east = Projection::radec_to_lm({2.01, 0.3}, centre);
    const Vec2d north = Projection::radec_to_lm({2.0, 0.31}, centre);

    CHECK(east.x > 0.0);
    CHECK(north.y > 0.0);
    CHECK(north.x == doctest::Approx(0.0).epsilon(kTol));
}

TEST_CASE("Projection is antisymmetric in RA about the centre meridian")
{
    const EquatorialCoord centre{1.0, -0.4};
    const Vec2d plus = Projection::radec_to_lm({1.05, -0.35}, centre);
    const Vec2d minus = Projection::radec_to_lm({0.95, -0.35}, centre);

    CHECK(plus.x == doctest::Approx(-minus.x).epsilon(kTol));
    CHECK(plus.y == doctest::Approx(minus.y).epsilon(kTol));
}

TEST_CASE("Equator point 90 degrees away lies on the unit circle")
{
    const Vec2d lm = Projection::radec_to_lm({astro_constants::kHalfPi, 0.0}, {0.0, 0.0});
    CHECK(lm.x == doctest::Approx(1.0));
    CHECK(lm.y == doctest::Approx(0.0).epsilon(kTol));
}

// =================================================================
// Angular distance
// =================================================================

TEST_CASE("Angular distance")
{
    SUBCASE("Zero for identical points")
    {
        CHECK(Projection::angular_distance({0.7, 0.2}, {0.7, 0.2}) == doctest::Approx(0.0));
    }

    SUBCASE("Pole to equator is 90 degrees")
    {
        CHECK(Projection::angular_distance({0.0, astro_constants::kHalfPi}, {1.0, 0.0})
              == doctest::Approx(astro_constants::kHalfPi));
    }

    SUBCASE("Symmetric")
    {
        const EquatorialCoord a{0.3, 0.4};
        const EquatorialCoord b{2.1, -0.8};
        CHECK(Projection::angular_distance(a, b) == doctest::Approx(Projection::angular_distance(b, a)));
    }

    SUBCASE("Along the equator equals the RA difference")
    {
        CHECK(Projection::angular_distance({0.1, 0.0}, {0.4, 0.0}) == doctest::Approx(0.3));
    }
}

// =================================================================
// Direction of increasing declination
// =================================================================

TEST_CASE("direction_ddec is zero on the central meridian")
{
    const EquatorialCoord centre{1.5, 1.0};
    CHECK(Projection::direction_ddec({1.5, 1.2}, centre) == doctest::Approx(0.0).epsilon(kTol));
    CHECK(Projection::direction_ddec(centre, centre) == doctest::Approx(0.0).epsilon(kTol));
}

TEST_CASE("direction_ddec tilts towards the pole away from the meridian")
{
    // North of the equator, meridians converge towards the pole above the centre.
    const EquatorialCoord centre{1.0, 0.8};
    const f64 east = Projection::direction_ddec({1.2, 0.8}, centre);
    const f64 west = Projection::direction_ddec({0.8, 0.8}, centre);

    CHECK(east != doctest::Approx(0.0));
    CHECK(east == doctest::Approx(-west));
}

TEST_CASE("normalize_radians wraps into [0, 2π)")
{
    CHECK(Projection::normalize_radians(-0.5) == doctest::Approx(astro_constants::kTwoPi - 0.5));
    CHECK(Projection::normalize_radians(astro_constants::kTwoPi + 0.25) == doctest::Approx(0.25));
    CHECK(Projection::normalize_radians(1.0) == doctest::Approx(1.0));
}

// =================================================================
// FieldOfView
// =================================================================

TEST_CASE("FieldOfView scale from drawing width")
{
    const auto fov = chart::FieldOfView::from_drawing_width({1.5, 1.0}, 0.05, 180.0);

    CHECK(fov.drawing_scale == doctest::Approx(0.98 * 90.0 / std::sin(0.05)));
    CHECK(fov.field_radius_mm() == doctest::Approx(0.98 * 90.0));
}

TEST_CASE("FieldOfView maps the centre to (0, 0), east to the left")
{
    const auto fov = chart::FieldOfView::from_drawing_width({1.5, 1.0}, 0.05, 180.0);

    const Vec2d centre = fov.to_map(fov.centre);
    CHECK(centre.x == doctest::Approx(0.0).epsilon(kTol));
    CHECK(centre.y == doctest::Approx(0.0).epsilon(kTol));

    const Vec2d east = fov.to_map(1.51, 1.0);
    CHECK(east.x < 0.0);

    CHECK(fov.contains({1.5, 1.02}));
    CHECK_FALSE(fov.contains({1.5, 1.1}));
}
