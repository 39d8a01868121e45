#pragma once

#include <glm/vec3.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gcode
{

enum class MoveKind
{
    Rapid,             // G0
    Linear,            // G1
    Home,              // G28
    SetPosition,       // G92
    AbsoluteMode,      // G90
    RelativeMode,      // G91
    AbsoluteExtrusion, // M82
    RelativeExtrusion  // M83
};

/// Parameter words as they are written on the line. Position words are always absolute.
struct Words
{
    std::optional<double> x;
    std::optional<double> y;
    std::optional<double> z;
    std::optional<double> a;
    std::optional<double> b;
    std::optional<double> e;
    std::optional<double> f;

    [[nodiscard]] bool hasPosition() const noexcept
    {
        return x.has_value() || y.has_value() || z.has_value();
    }

    [[nodiscard]] bool hasRotary() const noexcept
    {
        return a.has_value() || b.has_value();
    }
};

/**
 * One recognized command. A Move is never modified after parsing; stages derive a new one with
 * withWords(), which marks it edited so the writer re-formats it instead of echoing the source.
 */
struct Move
{
    MoveKind kind{MoveKind::Linear};
    Words words;
    glm::dvec3 position{0.0}; // resolved absolute XYZ after the command
    double a{0.0};
    double b{0.0};
    double extrusion{0.0};         // resolved E delta of this command
    bool relativeExtrusion{false}; // E word written as a delta (M83)
    std::string comment;           // from ';' to end of line
    std::string source;
    int lineNumber{0};
    bool edited{false};

    [[nodiscard]] bool isMotion() const noexcept
    {
        return kind == MoveKind::Rapid || kind == MoveKind::Linear;
    }

    [[nodiscard]] bool isPositional() const noexcept
    {
        return isMotion() && words.hasPosition();
    }

    [[nodiscard]] Move withWords(Words replacement,
                                 std::optional<double> extrusionDelta = std::nullopt) const
    {
        Move next = *this;
        next.words = replacement;
        next.position.x = replacement.x.value_or(position.x);
        next.position.y = replacement.y.value_or(position.y);
        next.position.z = replacement.z.value_or(position.z);
        next.a = replacement.a.value_or(a);
        next.b = replacement.b.value_or(b);
        if (extrusionDelta)
        {
            next.extrusion = *extrusionDelta;
        }
        next.edited = true;
        return next;
    }
};

struct PassThrough
{
    std::string text;
    int lineNumber{0};
};

using Line = std::variant<Move, PassThrough>;
using Program = std::vector<Line>;

} // namespace gcode
