#pragma once

#include "gcode/Move.h"

#include <glm/vec3.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace gcode
{

struct ModalState
{
    bool relativePositioning{false};
    bool relativeExtrusion{false};
    glm::dvec3 position{0.0};
    double a{0.0};
    double b{0.0};
    double extruder{0.0}; // absolute E as the firmware tracks it
};

struct ParseIssue
{
    int lineNumber{0};
    std::string message;
};

/**
 * Parses a file line by line, carrying the modal context (G90/G91, M82/M83, current position)
 * from one line to the next. Malformed recognized commands are logged and returned as
 * PassThrough without touching the modal state.
 */
class LineParser
{
public:
    Line parse(std::string_view text, int lineNumber = 0);

    [[nodiscard]] const ModalState& state() const noexcept { return m_state; }
    [[nodiscard]] const std::vector<ParseIssue>& issues() const noexcept { return m_issues; }

private:
    ModalState m_state;
    std::vector<ParseIssue> m_issues;
};

/// Single line with a fresh modal state.
Line parse(std::string_view text);

Program parseProgram(const std::vector<std::string>& lines, std::vector<ParseIssue>* issues = nullptr);

} // namespace gcode
