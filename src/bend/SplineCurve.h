#pragma once

#include <cstddef>
#include <vector>

namespace bend
{

/**
 * Control data for the bending profile x(z): the lateral position of the neutral axis as a
 * function of build height. The boundary slopes are dx/dz at the two anchors.
 */
struct SplineAnchors
{
    double xStart{115.5};
    double xEnd{205.5};
    double zStart{0.0};
    double zEnd{100.0};
    double startSlope{0.0};
    double endSlope{2.5};
};

struct CurveSample
{
    double height{0.0};
    double lateralOffset{0.0};
    double tangentAngleDeg{0.0};
};

/**
 * Clamped cubic through the two anchors. Outside [zStart, zEnd] the same cubic is extrapolated.
 * With a positive discretization an arc-length table is built so that flat heights can be mapped
 * onto the curved neutral axis.
 */
class SplineCurve
{
public:
    /// Throws std::invalid_argument for non-finite anchors, zEnd <= zStart or a negative step.
    explicit SplineCurve(const SplineAnchors& anchors, double discretization = 0.0);

    [[nodiscard]] const SplineAnchors& anchors() const noexcept { return m_anchors; }
    [[nodiscard]] double discretization() const noexcept { return m_discretization; }

    [[nodiscard]] double lateral(double z) const;
    [[nodiscard]] double slope(double z) const;
    [[nodiscard]] double lateralOffset(double z) const;
    [[nodiscard]] double tangentAngleDeg(double z) const;
    [[nodiscard]] CurveSample sample(double z) const;

    /// Height on the curve whose arc length from zStart equals flatHeight - zStart.
    [[nodiscard]] double heightAtArcLength(double flatHeight) const;
    [[nodiscard]] bool coversArcLength(double flatHeight) const;
    [[nodiscard]] double totalArcLength() const;

    /// Samples from zStart to zEnd (inclusive) in ascending height. step must be positive.
    [[nodiscard]] std::vector<CurveSample> preview(double step) const;

private:
    void buildArcTable();

    SplineAnchors m_anchors;
    double m_span{1.0};
    double m_discretization{0.0};
    std::vector<double> m_arcHeights;
    std::vector<double> m_arcLengths;
};

} // namespace bend
