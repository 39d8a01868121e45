#include "kin/Linkage.h"

#include <cmath>
#include <numbers>

namespace kin
{

namespace
{
constexpr double kDegToRad = std::numbers::pi / 180.0;

bool setError(std::string* error, const char* message)
{
    if (error)
    {
        *error = message;
    }
    return false;
}
} // namespace

bool Linkage::reachable(double aDeg, double bDeg) const noexcept
{
    if (!std::isfinite(aDeg) || !std::isfinite(bDeg))
    {
        return false;
    }
    return aDeg >= aMinDeg && aDeg <= aMaxDeg && bDeg >= bMinDeg && bDeg <= bMaxDeg;
}

std::optional<glm::dvec3> Linkage::tipOffset(double aDeg, double bDeg) const
{
    if (!reachable(aDeg, bDeg))
    {
        return std::nullopt;
    }

    const double a = aDeg * kDegToRad;
    const double b = bDeg * kDegToRad;
    const double sinA = std::sin(a);
    const double cosA = std::cos(a);
    const double sinB = std::sin(b);
    const double cosB = std::cos(b);

    const glm::dvec3 offset{la * sinA + lb * cosA * sinB,
                            la * (cosA - 1.0) - lb * sinA * sinB,
                            lb * (cosB - 1.0)};
    if (!std::isfinite(offset.x) || !std::isfinite(offset.y) || !std::isfinite(offset.z))
    {
        return std::nullopt;
    }
    return offset;
}

bool Linkage::isValid(std::string* error) const
{
    if (!std::isfinite(la) || !std::isfinite(lb) || la <= 0.0 || lb <= 0.0)
    {
        return setError(error, "linkage lengths La and Lb must be positive");
    }
    if (!std::isfinite(aMinDeg) || !std::isfinite(aMaxDeg) || aMinDeg > aMaxDeg)
    {
        return setError(error, "A joint range must be finite with min <= max");
    }
    if (!std::isfinite(bMinDeg) || !std::isfinite(bMaxDeg) || bMinDeg > bMaxDeg)
    {
        return setError(error, "B joint range must be finite with min <= max");
    }
    return true;
}

Linkage makeDefaultLinkage()
{
    return Linkage{};
}

} // namespace kin
