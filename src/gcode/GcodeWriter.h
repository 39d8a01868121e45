#pragma once

#include "gcode/Move.h"

#include <string>
#include <string_view>
#include <vector>

namespace gcode
{

std::string serialize(const Move& move);
std::string serialize(const Line& line);

/// Fixed-point text, never scientific; "-0.000" is written as "0.000".
std::string formatNumber(double value, int precision = 3);

/// Fixed-point with trailing zeros (and a bare '.') removed; used for feed rates and actuation angles.
std::string formatCompact(double value, int precision = 3);

std::vector<std::string> splitLines(std::string_view text);
std::string writeProgram(const Program& program);

} // namespace gcode
