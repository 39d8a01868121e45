#pragma once

#include "bend/LayerFrame.h"
#include "bend/SplineCurve.h"
#include "check/ValidationIssue.h"
#include "gcode/Move.h"

#include <atomic>
#include <functional>
#include <vector>

namespace bend
{

struct BendSettings
{
    double layerHeight{kDefaultLayerHeight};
    double warningAngleDeg{100.0};
    bool annotateBands{true};
};

struct BendResult
{
    gcode::Program program;
    std::vector<LayerFrame> frames;
    std::vector<check::ValidationIssue> issues;
    bool cancelled{false};
};

/**
 * Bends a flat program along a SplineCurve, one layer band at a time. Each band is rotated by the
 * curve's tangent angle about its point on the neutral axis, B carries that angle and extrusion
 * is rescaled by the change in segment length. Deterministic: the same program, curve and
 * settings always give the same output and issues.
 */
class SplineBendEngine
{
public:
    /// Throws std::invalid_argument for a non-positive layer height or negative warning angle.
    explicit SplineBendEngine(BendSettings settings);

    BendResult bend(const gcode::Program& program,
                    const SplineCurve& curve,
                    const std::atomic<bool>& cancelFlag,
                    const std::function<void(int)>& progressCallback = {},
                    const check::IssueCallback& onIssue = {}) const;

    [[nodiscard]] int bandIndex(double z) const;

private:
    BendSettings m_settings;
};

} // namespace bend
