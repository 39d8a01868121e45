#include "bend/SplineBendEngine.h"

#include "common/log.h"

#include <glm/geometric.hpp>
#include <glm/vec3.hpp>

#include <QtCore/QString>

#include <cmath>
#include <numbers>
#include <optional>
#include <stdexcept>
#include <utility>

namespace bend
{

namespace
{

constexpr double kDegToRad = std::numbers::pi / 180.0;
constexpr double kBandEpsilon = 1e-9;
constexpr double kOffsetTolerance = 1e-9;
constexpr double kLengthEpsilon = 1e-12;
constexpr double kRatioTolerance = 1e-9;

struct ActiveFrame
{
    LayerFrame frame;
    double cosAngle{1.0};
    double sinAngle{0.0};
    double originalExtrusion{0.0};
    double scaledExtrusion{0.0};
    bool belowPlatformReported{false};
};

// Rotates the point about the frame's curve point in the XZ plane. Written as deltas from the
// input so an unbent frame (no offset, zero angle) reproduces the input exactly.
glm::dvec3 bendPoint(const glm::dvec3& p, const ActiveFrame& active, double xStart)
{
    const double u = p.x - xStart;
    const double w = p.z - active.frame.height;
    const double c = active.cosAngle;
    const double s = active.sinAngle;

    glm::dvec3 out = p;
    out.x = p.x + active.frame.sample.lateralOffset + u * (c - 1.0) + w * s;
    out.z = p.z + (active.frame.curveHeight - active.frame.height) - u * s + w * (c - 1.0);
    return out;
}

double extrusionScale(double originalLength, double bentLength)
{
    if (originalLength <= kLengthEpsilon)
    {
        return 1.0;
    }
    const double ratio = bentLength / originalLength;
    return (std::abs(ratio - 1.0) <= kRatioTolerance) ? 1.0 : ratio;
}

// Tracks the direction of the lateral offset over strictly increasing band heights.
class MonotonicityTracker
{
public:
    bool reverses(double height, double offset)
    {
        if (m_lastHeight && height <= *m_lastHeight + kBandEpsilon)
        {
            return false;
        }

        bool reversed = false;
        if (m_lastHeight)
        {
            const double delta = offset - m_lastOffset;
            if (std::abs(delta) > kOffsetTolerance)
            {
                const int direction = delta > 0.0 ? 1 : -1;
                reversed = (m_direction != 0 && direction != m_direction);
                m_direction = direction;
            }
        }

        m_lastHeight = height;
        m_lastOffset = offset;
        return reversed;
    }

private:
    std::optional<double> m_lastHeight;
    double m_lastOffset{0.0};
    int m_direction{0};
};

} // namespace

SplineBendEngine::SplineBendEngine(BendSettings settings)
    : m_settings(settings)
{
    if (!std::isfinite(m_settings.layerHeight) || m_settings.layerHeight <= 0.0)
    {
        throw std::invalid_argument("layer height must be positive");
    }
    if (!std::isfinite(m_settings.warningAngleDeg) || m_settings.warningAngleDeg < 0.0)
    {
        throw std::invalid_argument("warning angle must be zero or positive");
    }
}

int SplineBendEngine::bandIndex(double z) const
{
    return bend::bandIndex(z, m_settings.layerHeight);
}

BendResult SplineBendEngine::bend(const gcode::Program& program,
                                  const SplineCurve& curve,
                                  const std::atomic<bool>& cancelFlag,
                                  const std::function<void(int)>& progressCallback,
                                  const check::IssueCallback& onIssue) const
{
    BendResult result;
    result.program.reserve(program.size() + program.size() / 8);

    const double xStart = curve.anchors().xStart;
    std::optional<ActiveFrame> active;
    MonotonicityTracker monotonicity;
    glm::dvec3 previousLogical{0.0};
    glm::dvec3 previousBent{0.0};
    // Difference between the rebuilt and the original absolute E since the last G92.
    double extruderCorrection = 0.0;
    bool warnedArcRange = false;

    const auto closeFrame = [&]() {
        if (!active)
        {
            return;
        }
        LayerFrame frame = active->frame;
        if (std::abs(active->originalExtrusion) > kLengthEpsilon)
        {
            frame.extrusionFactor = active->scaledExtrusion / active->originalExtrusion;
        }
        result.frames.push_back(frame);
        active.reset();
    };

    const auto openFrame = [&](int index, double height, int lineNumber) {
        ActiveFrame next;
        next.frame.index = index;
        next.frame.height = height;
        next.frame.curveHeight = curve.heightAtArcLength(height);
        next.frame.sample = curve.sample(next.frame.curveHeight);
        next.frame.firstLine = result.program.size();

        const double radians = next.frame.sample.tangentAngleDeg * kDegToRad;
        next.cosAngle = std::cos(radians);
        next.sinAngle = std::sin(radians);

        if (!warnedArcRange && !curve.coversArcLength(height))
        {
            LOG_WARN(Bend, QStringLiteral("Curve is not defined high enough for Z=%1 mm, extending along its end tangent")
                               .arg(height, 0, 'f', 3));
            warnedArcRange = true;
        }

        if (monotonicity.reverses(height, next.frame.sample.lateralOffset))
        {
            check::report(result.issues,
                          {check::IssueKind::SelfIntersection,
                           index,
                           check::Severity::Warning,
                           "bending offset reverses direction at Z=" + std::to_string(height) + " mm",
                           lineNumber},
                          onIssue);
        }

        if (std::abs(next.frame.sample.tangentAngleDeg) > m_settings.warningAngleDeg)
        {
            check::report(result.issues,
                          {check::IssueKind::AngleExceeded,
                           index,
                           check::Severity::Warning,
                           "tangent angle " + std::to_string(next.frame.sample.tangentAngleDeg)
                               + " deg exceeds the warning angle",
                           lineNumber},
                          onIssue);
        }

        if (m_settings.annotateBands)
        {
            result.program.push_back(gcode::PassThrough{bandMarker(next.frame), 0});
        }
        active = std::move(next);
    };

    const std::size_t total = program.size();
    std::size_t lineIndex = 0;
    for (const gcode::Line& line : program)
    {
        ++lineIndex;
        const auto* move = std::get_if<gcode::Move>(&line);
        if (move == nullptr)
        {
            result.program.push_back(line);
            continue;
        }

        if (move->isPositional())
        {
            const int index = bandIndex(move->position.z);
            if (!active || active->frame.index != index)
            {
                closeFrame();
                if (cancelFlag.load(std::memory_order_relaxed))
                {
                    LOG_INFO(Bend, QStringLiteral("Bending cancelled at line %1").arg(move->lineNumber));
                    result.cancelled = true;
                    return result;
                }
                if (progressCallback && total > 0)
                {
                    progressCallback(static_cast<int>((lineIndex * 100) / total));
                }
                openFrame(index, move->position.z, move->lineNumber);
            }

            const glm::dvec3 bent = bendPoint(move->position, *active, xStart);
            if (bent.z < 0.0 && !active->belowPlatformReported)
            {
                active->belowPlatformReported = true;
                check::report(result.issues,
                              {check::IssueKind::BelowPlatform,
                               index,
                               check::Severity::Warning,
                               "movement below build platform",
                               move->lineNumber},
                              onIssue);
            }

            const double originalLength = glm::length(move->position - previousLogical);
            const double bentLength = glm::length(bent - previousBent);
            const double scaled = move->extrusion * extrusionScale(originalLength, bentLength);

            gcode::Words words = move->words;
            words.x = bent.x;
            words.y = bent.y;
            words.z = bent.z;
            words.a = move->a;
            words.b = active->frame.sample.tangentAngleDeg;
            if (words.e)
            {
                if (move->relativeExtrusion)
                {
                    words.e = scaled;
                }
                else
                {
                    extruderCorrection += scaled - move->extrusion;
                    words.e = *move->words.e + extruderCorrection;
                }
            }

            active->originalExtrusion += move->extrusion;
            active->scaledExtrusion += scaled;
            ++active->frame.moveCount;

            result.program.push_back(move->withWords(words, scaled));
            previousLogical = move->position;
            previousBent = bent;
            continue;
        }

        if (move->isMotion())
        {
            // No displacement: extrusion passes unscaled, only an absolute E needs re-basing.
            if (move->words.e && !move->relativeExtrusion && extruderCorrection != 0.0)
            {
                gcode::Words words = move->words;
                words.e = *move->words.e + extruderCorrection;
                result.program.push_back(move->withWords(words));
                continue;
            }
            result.program.push_back(line);
            continue;
        }

        switch (move->kind)
        {
        case gcode::MoveKind::SetPosition:
            if (move->words.e)
            {
                extruderCorrection = 0.0;
            }
            if (move->words.hasPosition())
            {
                previousLogical = move->position;
                previousBent = active ? bendPoint(previousLogical, *active, xStart) : previousLogical;
            }
            break;
        case gcode::MoveKind::Home:
            previousLogical = move->position;
            previousBent = previousLogical;
            break;
        default:
            break;
        }
        result.program.push_back(line);
    }

    closeFrame();
    if (progressCallback)
    {
        progressCallback(100);
    }

    LOG_INFO(Bend, QStringLiteral("Bent %1 lines into %2 layer bands, %3 issue(s)")
                       .arg(program.size())
                       .arg(result.frames.size())
                       .arg(result.issues.size()));
    return result;
}

} // namespace bend
