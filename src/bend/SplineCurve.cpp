#include "bend/SplineCurve.h"

#include "common/Enforce.h"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>

namespace bend
{

namespace
{

constexpr double kRadToDeg = 180.0 / std::numbers::pi;
constexpr double kHeightEpsilon = 1e-9;
// Caps the arc-length table for very fine steps over tall curves.
constexpr std::size_t kMaxArcSamples = 4'000'000;

bool allFinite(const SplineAnchors& a)
{
    return std::isfinite(a.xStart) && std::isfinite(a.xEnd) && std::isfinite(a.zStart)
           && std::isfinite(a.zEnd) && std::isfinite(a.startSlope) && std::isfinite(a.endSlope);
}

} // namespace

SplineCurve::SplineCurve(const SplineAnchors& anchors, double discretization)
    : m_anchors(anchors)
    , m_discretization(discretization)
{
    if (!allFinite(anchors))
    {
        throw std::invalid_argument("spline anchors must be finite");
    }
    if (!(anchors.zEnd > anchors.zStart))
    {
        throw std::invalid_argument("spline zEnd must be greater than zStart");
    }
    if (!std::isfinite(discretization) || discretization < 0.0)
    {
        throw std::invalid_argument("spline discretization must be zero or positive");
    }

    m_span = anchors.zEnd - anchors.zStart;
    if (m_discretization > 0.0)
    {
        if (m_span / m_discretization > static_cast<double>(kMaxArcSamples))
        {
            throw std::invalid_argument("spline discretization is too fine for the curve height");
        }
        buildArcTable();
    }
}

double SplineCurve::lateral(double z) const
{
    const double t = (z - m_anchors.zStart) / m_span;
    const double t2 = t * t;
    const double t3 = t2 * t;

    const double h00 = 2.0 * t3 - 3.0 * t2 + 1.0;
    const double h10 = t3 - 2.0 * t2 + t;
    const double h01 = -2.0 * t3 + 3.0 * t2;
    const double h11 = t3 - t2;

    return h00 * m_anchors.xStart + h10 * m_span * m_anchors.startSlope + h01 * m_anchors.xEnd
           + h11 * m_span * m_anchors.endSlope;
}

double SplineCurve::slope(double z) const
{
    const double t = (z - m_anchors.zStart) / m_span;
    const double t2 = t * t;

    const double d00 = 6.0 * t2 - 6.0 * t;
    const double d10 = 3.0 * t2 - 4.0 * t + 1.0;
    const double d01 = -6.0 * t2 + 6.0 * t;
    const double d11 = 3.0 * t2 - 2.0 * t;

    return (d00 * m_anchors.xStart + d10 * m_span * m_anchors.startSlope + d01 * m_anchors.xEnd
            + d11 * m_span * m_anchors.endSlope)
           / m_span;
}

double SplineCurve::lateralOffset(double z) const
{
    return lateral(z) - m_anchors.xStart;
}

double SplineCurve::tangentAngleDeg(double z) const
{
    return std::atan(slope(z)) * kRadToDeg;
}

CurveSample SplineCurve::sample(double z) const
{
    return {z, lateralOffset(z), tangentAngleDeg(z)};
}

void SplineCurve::buildArcTable()
{
    const std::size_t steps = static_cast<std::size_t>(std::ceil(m_span / m_discretization - kHeightEpsilon));
    m_arcHeights.reserve(steps + 1);
    m_arcLengths.reserve(steps + 1);

    m_arcHeights.push_back(m_anchors.zStart);
    m_arcLengths.push_back(0.0);

    double previousHeight = m_anchors.zStart;
    double previousLateral = lateral(previousHeight);
    for (std::size_t i = 1; i <= steps; ++i)
    {
        const double height = std::min(m_anchors.zStart + static_cast<double>(i) * m_discretization, m_anchors.zEnd);
        const double current = lateral(height);
        const double dz = height - previousHeight;
        const double dx = current - previousLateral;
        m_arcHeights.push_back(height);
        m_arcLengths.push_back(m_arcLengths.back() + std::sqrt(dx * dx + dz * dz));
        previousHeight = height;
        previousLateral = current;
    }

    AXISBEND_ENFORCE(m_arcHeights.size() == m_arcLengths.size(), "arc table columns diverged");
}

double SplineCurve::heightAtArcLength(double flatHeight) const
{
    if (m_arcLengths.empty())
    {
        return flatHeight;
    }

    const double length = flatHeight - m_anchors.zStart;
    if (length <= 0.0)
    {
        return flatHeight;
    }

    const auto it = std::lower_bound(m_arcLengths.begin(), m_arcLengths.end(), length);
    if (it == m_arcLengths.end())
    {
        // Continue along the end tangent.
        const double excess = length - m_arcLengths.back();
        const double endSlope = slope(m_anchors.zEnd);
        return m_anchors.zEnd + excess / std::sqrt(1.0 + endSlope * endSlope);
    }

    const std::size_t index = static_cast<std::size_t>(std::distance(m_arcLengths.begin(), it));
    if (index == 0)
    {
        return m_arcHeights.front();
    }

    const double l0 = m_arcLengths[index - 1];
    const double l1 = m_arcLengths[index];
    const double h0 = m_arcHeights[index - 1];
    const double h1 = m_arcHeights[index];
    if (l1 - l0 <= 0.0)
    {
        return h1;
    }
    return h0 + (h1 - h0) * (length - l0) / (l1 - l0);
}

bool SplineCurve::coversArcLength(double flatHeight) const
{
    return m_arcLengths.empty() || flatHeight - m_anchors.zStart <= m_arcLengths.back();
}

double SplineCurve::totalArcLength() const
{
    return m_arcLengths.empty() ? m_span : m_arcLengths.back();
}

std::vector<CurveSample> SplineCurve::preview(double step) const
{
    if (!std::isfinite(step) || step <= 0.0)
    {
        throw std::invalid_argument("preview step must be positive");
    }

    std::vector<CurveSample> samples;
    const std::size_t count = static_cast<std::size_t>(std::floor(m_span / step + kHeightEpsilon));
    samples.reserve(count + 2);
    for (std::size_t i = 0; i <= count; ++i)
    {
        samples.push_back(sample(m_anchors.zStart + static_cast<double>(i) * step));
    }
    if (samples.back().height < m_anchors.zEnd - kHeightEpsilon)
    {
        samples.push_back(sample(m_anchors.zEnd));
    }
    return samples;
}

} // namespace bend
