#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include "doctest/doctest.h"

#include "bend/LayerFrame.h"
#include "bend/SplineCurve.h"

#include <cmath>
#include <limits>
#include <numbers>
#include <stdexcept>

DOCTEST_TEST_CASE(curve_meets_anchors_and_boundary_slopes)
{
    const bend::SplineCurve curve(bend::SplineAnchors{});

    DOCTEST_CHECK(curve.lateral(0.0) == doctest::Approx(115.5));
    DOCTEST_CHECK(curve.lateral(100.0) == doctest::Approx(205.5));
    DOCTEST_CHECK(curve.lateralOffset(0.0) == doctest::Approx(0.0));
    DOCTEST_CHECK(curve.lateralOffset(100.0) == doctest::Approx(90.0));
    DOCTEST_CHECK(curve.slope(0.0) == doctest::Approx(0.0));
    DOCTEST_CHECK(curve.slope(100.0) == doctest::Approx(2.5));

    const double endAngle = std::atan(2.5) * 180.0 / std::numbers::pi;
    DOCTEST_CHECK(curve.tangentAngleDeg(100.0) == doctest::Approx(endAngle));
    DOCTEST_CHECK(curve.tangentAngleDeg(0.0) == doctest::Approx(0.0));
}

DOCTEST_TEST_CASE(curve_midpoint_values)
{
    const bend::SplineCurve curve(bend::SplineAnchors{});

    // t = 0.05: 0.99275 * 115.5 + 0.00725 * 205.5 - 0.002375 * 250
    DOCTEST_CHECK(curve.lateral(5.0) == doctest::Approx(115.55875));
    // t = 0.5: (1.5 * 90 - 0.25 * 250) / 100
    DOCTEST_CHECK(curve.slope(50.0) == doctest::Approx(0.725));

    const bend::CurveSample sample = curve.sample(50.0);
    DOCTEST_CHECK(sample.height == doctest::Approx(50.0));
    DOCTEST_CHECK(sample.lateralOffset == doctest::Approx(curve.lateralOffset(50.0)));
    DOCTEST_CHECK(sample.tangentAngleDeg == doctest::Approx(std::atan(0.725) * 180.0 / std::numbers::pi));
}

DOCTEST_TEST_CASE(straight_curve_has_no_offset)
{
    bend::SplineAnchors anchors;
    anchors.xStart = 100.0;
    anchors.xEnd = 100.0;
    anchors.endSlope = 0.0;
    const bend::SplineCurve curve(anchors, 0.01);

    for (double z = 0.0; z <= 100.0; z += 12.5)
    {
        DOCTEST_CHECK(curve.lateralOffset(z) == doctest::Approx(0.0));
        DOCTEST_CHECK(curve.tangentAngleDeg(z) == doctest::Approx(0.0));
        DOCTEST_CHECK(curve.heightAtArcLength(z) == doctest::Approx(z));
    }
    DOCTEST_CHECK(curve.totalArcLength() == doctest::Approx(100.0));
}

DOCTEST_TEST_CASE(arc_length_mapping)
{
    const bend::SplineCurve flat(bend::SplineAnchors{});
    DOCTEST_CHECK(flat.heightAtArcLength(42.0) == 42.0);
    DOCTEST_CHECK(flat.coversArcLength(1000.0));

    const bend::SplineCurve curve(bend::SplineAnchors{}, 0.01);
    DOCTEST_CHECK(curve.totalArcLength() > 100.0);
    DOCTEST_CHECK(curve.heightAtArcLength(50.0) < 50.0);
    DOCTEST_CHECK(curve.heightAtArcLength(0.0) == doctest::Approx(0.0));
    DOCTEST_CHECK(curve.coversArcLength(curve.totalArcLength() - 1.0));
    DOCTEST_CHECK_FALSE(curve.coversArcLength(curve.totalArcLength() + 1.0));

    // Past the table the curve continues along its end tangent.
    const double beyond = curve.heightAtArcLength(curve.totalArcLength() + std::sqrt(1.0 + 2.5 * 2.5));
    DOCTEST_CHECK(beyond == doctest::Approx(101.0));
}

DOCTEST_TEST_CASE(preview_samples_include_both_ends)
{
    const bend::SplineCurve curve(bend::SplineAnchors{});

    const auto tens = curve.preview(10.0);
    DOCTEST_REQUIRE(tens.size() == 11);
    DOCTEST_CHECK(tens.front().height == doctest::Approx(0.0));
    DOCTEST_CHECK(tens.back().height == doctest::Approx(100.0));

    const auto uneven = curve.preview(30.0);
    DOCTEST_REQUIRE(uneven.size() == 5);
    DOCTEST_CHECK(uneven[3].height == doctest::Approx(90.0));
    DOCTEST_CHECK(uneven[4].height == doctest::Approx(100.0));

    for (std::size_t i = 1; i < tens.size(); ++i)
    {
        DOCTEST_CHECK(tens[i].height > tens[i - 1].height);
    }

    DOCTEST_CHECK_THROWS_AS((void)curve.preview(0.0), std::invalid_argument);
    DOCTEST_CHECK_THROWS_AS((void)curve.preview(-1.0), std::invalid_argument);
}

DOCTEST_TEST_CASE(invalid_anchors_are_rejected)
{
    bend::SplineAnchors inverted;
    inverted.zStart = 100.0;
    inverted.zEnd = 0.0;
    DOCTEST_CHECK_THROWS_AS(bend::SplineCurve{inverted}, std::invalid_argument);

    bend::SplineAnchors degenerate;
    degenerate.zEnd = degenerate.zStart;
    DOCTEST_CHECK_THROWS_AS(bend::SplineCurve{degenerate}, std::invalid_argument);

    bend::SplineAnchors infinite;
    infinite.xEnd = std::numeric_limits<double>::infinity();
    DOCTEST_CHECK_THROWS_AS(bend::SplineCurve{infinite}, std::invalid_argument);

    DOCTEST_CHECK_THROWS_AS(bend::SplineCurve(bend::SplineAnchors{}, -0.5), std::invalid_argument);
}

DOCTEST_TEST_CASE(band_marker_round_trip)
{
    bend::LayerFrame frame;
    frame.index = 17;
    frame.curveHeight = 4.98;
    frame.sample.tangentAngleDeg = 2.5;

    const std::string marker = bend::bandMarker(frame);
    DOCTEST_CHECK(marker == ";BAND 17 Z4.980 B2.500");
    DOCTEST_CHECK(bend::parseBandMarker(marker) == 17);
    DOCTEST_CHECK_FALSE(bend::parseBandMarker("; BAND 3").has_value());
    DOCTEST_CHECK_FALSE(bend::parseBandMarker(";BAND x").has_value());
}
