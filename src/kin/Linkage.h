#pragma once

#include <glm/vec3.hpp>

#include <optional>
#include <string>

namespace kin
{

/**
 * Two-link planar arm between the carriage reference point and the nozzle tip. A and B are the
 * joint angles in degrees; the ranges bound what the mechanism can physically reach.
 */
struct Linkage
{
    double la{28.4};
    double lb{47.7};
    double aMinDeg{-90.0};
    double aMaxDeg{90.0};
    double bMinDeg{-90.0};
    double bMaxDeg{90.0};

    [[nodiscard]] bool reachable(double aDeg, double bDeg) const noexcept;

    /// Forward kinematics: tip offset from the carriage, or nullopt when the pose is unreachable.
    [[nodiscard]] std::optional<glm::dvec3> tipOffset(double aDeg, double bDeg) const;

    [[nodiscard]] bool isValid(std::string* error = nullptr) const;
};

Linkage makeDefaultLinkage();

} // namespace kin
