#include "gcode/GcodeWriter.h"

#include <iomanip>
#include <locale>
#include <sstream>

namespace gcode
{

namespace
{

constexpr int kAxisPrecision = 3;
constexpr int kExtrusionPrecision = 5;
constexpr int kFeedPrecision = 3;

constexpr std::string_view kRelativeMarker = "; G91 normalized to absolute";

const char* commandCode(MoveKind kind)
{
    switch (kind)
    {
    case MoveKind::Rapid: return "G0";
    case MoveKind::Linear: return "G1";
    case MoveKind::Home: return "G28";
    case MoveKind::SetPosition: return "G92";
    case MoveKind::AbsoluteMode: return "G90";
    case MoveKind::RelativeMode: return "G91";
    case MoveKind::AbsoluteExtrusion: return "M82";
    case MoveKind::RelativeExtrusion: return "M83";
    }
    return "G1";
}

void appendWord(std::string& out, char letter, const std::optional<double>& value, int precision)
{
    if (!value)
    {
        return;
    }
    out.push_back(' ');
    out.push_back(letter);
    out.append(formatNumber(*value, precision));
}

} // namespace

std::string formatNumber(double value, int precision)
{
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss.setf(std::ios::fixed);
    oss << std::setprecision(precision) << value;
    std::string text = oss.str();
    if (text.front() == '-' && text.find_first_not_of("-0.") == std::string::npos)
    {
        text.erase(0, 1);
    }
    return text;
}

std::string formatCompact(double value, int precision)
{
    std::string text = formatNumber(value, precision);
    if (text.find('.') != std::string::npos)
    {
        while (text.back() == '0')
        {
            text.pop_back();
        }
        if (text.back() == '.')
        {
            text.pop_back();
        }
    }
    return text;
}

std::string serialize(const Move& move)
{
    if (!move.edited)
    {
        return move.source;
    }

    std::string out;
    if (move.kind == MoveKind::RelativeMode)
    {
        out.append(kRelativeMarker);
    }
    else
    {
        out.append(commandCode(move.kind));
        const Words& words = move.words;
        appendWord(out, 'X', words.x, kAxisPrecision);
        appendWord(out, 'Y', words.y, kAxisPrecision);
        appendWord(out, 'Z', words.z, kAxisPrecision);
        appendWord(out, 'A', words.a, kAxisPrecision);
        appendWord(out, 'B', words.b, kAxisPrecision);
        appendWord(out, 'E', words.e, kExtrusionPrecision);
        if (words.f)
        {
            out.append(" F");
            out.append(formatCompact(*words.f, kFeedPrecision));
        }
    }

    if (!move.comment.empty())
    {
        out.push_back(' ');
        out.append(move.comment);
    }
    return out;
}

std::string serialize(const Line& line)
{
    if (const auto* move = std::get_if<Move>(&line))
    {
        return serialize(*move);
    }
    return std::get<PassThrough>(line).text;
}

std::vector<std::string> splitLines(std::string_view text)
{
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size())
    {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos)
        {
            end = text.size();
        }
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r')
        {
            line.remove_suffix(1);
        }
        lines.emplace_back(line);
        start = end + 1;
    }
    return lines;
}

std::string writeProgram(const Program& program)
{
    std::string out;
    for (const Line& line : program)
    {
        out.append(serialize(line));
        out.push_back('\n');
    }
    return out;
}

} // namespace gcode
