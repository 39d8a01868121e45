#include "kin/KinematicsTranslator.h"

#include "bend/LayerFrame.h"
#include "common/log.h"
#include "gcode/GcodeWriter.h"

#include <glm/common.hpp>

#include <QtCore/QString>

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace kin
{

namespace
{

std::string unreachableMessage(const gcode::Move& move)
{
    return "no forward-kinematics solution for A=" + gcode::formatCompact(move.a) + " B=" + gcode::formatCompact(move.b);
}

} // namespace

KinematicsTranslator::KinematicsTranslator(Linkage linkage, double layerHeight)
    : m_linkage(linkage)
    , m_layerHeight(layerHeight)
{
    std::string error;
    if (!m_linkage.isValid(&error))
    {
        throw std::invalid_argument(error);
    }
    if (!std::isfinite(m_layerHeight) || m_layerHeight <= 0.0)
    {
        throw std::invalid_argument("layer height must be positive");
    }
}

TranslateResult KinematicsTranslator::translate(const gcode::Program& program,
                                                const std::atomic<bool>& cancelFlag,
                                                const std::function<void(int)>& progressCallback,
                                                const check::IssueCallback& onIssue) const
{
    TranslateResult result;

    // First pass: physical positions before translation and their per-axis minimum.
    std::vector<glm::dvec3> physical;
    physical.reserve(program.size());
    glm::dvec3 minimum{std::numeric_limits<double>::infinity()};
    bend::BandTracker bands(m_layerHeight);
    const std::size_t total = program.size();
    std::size_t lineIndex = 0;

    for (const gcode::Line& line : program)
    {
        ++lineIndex;
        if (bands.advance(line))
        {
            if (cancelFlag.load(std::memory_order_relaxed))
            {
                LOG_INFO(Kin, QStringLiteral("Translation cancelled at layer %1").arg(bands.band()));
                result.cancelled = true;
                return result;
            }
            if (progressCallback && total > 0)
            {
                progressCallback(static_cast<int>((lineIndex * 90) / total));
            }
        }

        const auto* move = std::get_if<gcode::Move>(&line);
        if (move == nullptr || !move->isPositional())
        {
            continue;
        }

        const std::optional<glm::dvec3> offset = m_linkage.tipOffset(move->a, move->b);
        if (!offset)
        {
            check::report(result.issues,
                          {check::IssueKind::AngleExceeded,
                           bands.band(),
                           check::Severity::Fatal,
                           unreachableMessage(*move),
                           move->lineNumber},
                          onIssue);
            result.fatal = true;
            return result;
        }

        const glm::dvec3 position = move->position + *offset;
        minimum = glm::min(minimum, position);
        physical.push_back(position);
    }

    if (!physical.empty())
    {
        result.translation = glm::max(glm::dvec3(0.0), -minimum);
    }
    if (result.translation != glm::dvec3(0.0))
    {
        LOG_INFO(Kin, QStringLiteral("Workspace translation X%1 Y%2 Z%3 keeps coordinates non-negative")
                          .arg(result.translation.x, 0, 'f', 3)
                          .arg(result.translation.y, 0, 'f', 3)
                          .arg(result.translation.z, 0, 'f', 3));
    }

    // Second pass: write the translated positions, everything else untouched.
    result.program.reserve(program.size());
    std::size_t next = 0;
    for (const gcode::Line& line : program)
    {
        const auto* move = std::get_if<gcode::Move>(&line);
        if (move == nullptr || !move->isPositional())
        {
            result.program.push_back(line);
            continue;
        }

        const glm::dvec3 target = physical[next++] + result.translation;
        gcode::Words words = move->words;
        words.x = target.x;
        words.y = target.y;
        words.z = target.z;
        result.program.push_back(move->withWords(words));
    }

    if (progressCallback)
    {
        progressCallback(100);
    }
    return result;
}

} // namespace kin
