#pragma once

#include "bend/LayerFrame.h"
#include "check/ValidationIssue.h"
#include "gcode/Move.h"
#include "kin/Linkage.h"

#include <glm/vec3.hpp>

#include <atomic>
#include <functional>
#include <vector>

namespace kin
{

struct TranslateResult
{
    gcode::Program program;
    glm::dvec3 translation{0.0};
    std::vector<check::ValidationIssue> issues;
    bool fatal{false};
    bool cancelled{false};
};

/**
 * Maps bent logical positions to physical carriage coordinates: position + tipOffset(A, B), then
 * one workspace translation for the whole file so that no coordinate is negative.
 */
class KinematicsTranslator
{
public:
    /// Throws std::invalid_argument when the linkage is not valid or the layer height is not positive.
    /// The layer height numbers the bands of programs written without ;BAND markers.
    explicit KinematicsTranslator(Linkage linkage, double layerHeight = bend::kDefaultLayerHeight);

    TranslateResult translate(const gcode::Program& program,
                              const std::atomic<bool>& cancelFlag,
                              const std::function<void(int)>& progressCallback = {},
                              const check::IssueCallback& onIssue = {}) const;

private:
    Linkage m_linkage;
    double m_layerHeight;
};

} // namespace kin
