#include "gcode/LineParser.h"

#include "common/log.h"

#include <QtCore/QString>

#include <cctype>
#include <charconv>
#include <cmath>
#include <optional>
#include <utility>

namespace gcode
{

namespace
{

constexpr std::string_view kWhitespace = " \t\r\n";

std::string_view trim(std::string_view text)
{
    const std::size_t first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos)
    {
        return {};
    }
    const std::size_t last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

std::vector<std::string_view> splitFields(std::string_view body)
{
    std::vector<std::string_view> fields;
    std::size_t pos = 0;
    while (pos < body.size())
    {
        const std::size_t start = body.find_first_not_of(kWhitespace, pos);
        if (start == std::string_view::npos)
        {
            break;
        }
        const std::size_t end = body.find_first_of(kWhitespace, start);
        fields.push_back(body.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start));
        pos = (end == std::string_view::npos) ? body.size() : end;
    }
    return fields;
}

char upper(char ch)
{
    return static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
}

std::optional<MoveKind> commandKind(std::string_view field)
{
    if (field.size() < 2)
    {
        return std::nullopt;
    }

    const char letter = upper(field.front());
    const std::string_view digits = field.substr(1);
    int code = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), code);
    if (ec != std::errc() || ptr != digits.data() + digits.size())
    {
        return std::nullopt;
    }

    if (letter == 'G')
    {
        switch (code)
        {
        case 0: return MoveKind::Rapid;
        case 1: return MoveKind::Linear;
        case 28: return MoveKind::Home;
        case 90: return MoveKind::AbsoluteMode;
        case 91: return MoveKind::RelativeMode;
        case 92: return MoveKind::SetPosition;
        default: return std::nullopt;
        }
    }
    if (letter == 'M')
    {
        switch (code)
        {
        case 82: return MoveKind::AbsoluteExtrusion;
        case 83: return MoveKind::RelativeExtrusion;
        default: return std::nullopt;
        }
    }
    return std::nullopt;
}

std::string_view acceptedLetters(MoveKind kind)
{
    switch (kind)
    {
    case MoveKind::Rapid:
    case MoveKind::Linear: return "XYZABEF";
    case MoveKind::Home: return "XYZAB";
    case MoveKind::SetPosition: return "XYZABE";
    default: return {};
    }
}

std::optional<double>* slotFor(Words& words, char letter)
{
    switch (letter)
    {
    case 'X': return &words.x;
    case 'Y': return &words.y;
    case 'Z': return &words.z;
    case 'A': return &words.a;
    case 'B': return &words.b;
    case 'E': return &words.e;
    case 'F': return &words.f;
    default: return nullptr;
    }
}

// from_chars ignores LC_NUMERIC, so "10.5" reads the same under a comma-decimal locale.
bool parseNumber(std::string_view text, double& out)
{
    if (!text.empty() && text.front() == '+')
    {
        text.remove_prefix(1);
    }
    if (text.empty())
    {
        return false;
    }
    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || !std::isfinite(value))
    {
        return false;
    }
    out = value;
    return true;
}

bool readWords(const std::vector<std::string_view>& fields, MoveKind kind, Words& words, std::string& error)
{
    const std::string_view accepted = acceptedLetters(kind);
    for (std::size_t i = 1; i < fields.size(); ++i)
    {
        const std::string_view field = fields[i];
        const char letter = upper(field.front());
        if (accepted.find(letter) == std::string_view::npos)
        {
            error = "unexpected word '" + std::string(field) + "'";
            return false;
        }

        std::optional<double>* slot = slotFor(words, letter);
        if (slot == nullptr || slot->has_value())
        {
            error = "duplicate word '" + std::string(1, letter) + "'";
            return false;
        }

        const std::string_view number = field.substr(1);
        double value = 0.0;
        if (number.empty() && kind == MoveKind::Home)
        {
            *slot = 0.0;
            continue;
        }
        if (!parseNumber(number, value))
        {
            error = "malformed number in '" + std::string(field) + "'";
            return false;
        }
        *slot = value;
    }
    return true;
}

double resolveAxis(double current, double value, bool relative)
{
    return relative ? current + value : value;
}

void applyMotion(ModalState& state, Move& move)
{
    const bool relative = state.relativePositioning;
    Words& words = move.words;

    const auto normalize = [&](std::optional<double>& word, double& current) {
        if (!word)
        {
            return;
        }
        current = resolveAxis(current, *word, relative);
        word = current;
        if (relative)
        {
            move.edited = true;
        }
    };

    normalize(words.x, state.position.x);
    normalize(words.y, state.position.y);
    normalize(words.z, state.position.z);
    normalize(words.a, state.a);
    normalize(words.b, state.b);

    move.relativeExtrusion = state.relativeExtrusion;
    if (words.e)
    {
        // G91 puts E into relative mode as well, independent of M82/M83.
        if (state.relativeExtrusion || relative)
        {
            move.extrusion = *words.e;
            state.extruder += *words.e;
            if (!state.relativeExtrusion)
            {
                words.e = state.extruder;
                move.edited = true;
            }
        }
        else
        {
            move.extrusion = *words.e - state.extruder;
            state.extruder = *words.e;
        }
    }
}

void applyHome(ModalState& state, const Move& move)
{
    const Words& words = move.words;
    const bool all = !words.hasPosition() && !words.hasRotary();
    if (all || words.x)
    {
        state.position.x = 0.0;
    }
    if (all || words.y)
    {
        state.position.y = 0.0;
    }
    if (all || words.z)
    {
        state.position.z = 0.0;
    }
    if (words.a)
    {
        state.a = 0.0;
    }
    if (words.b)
    {
        state.b = 0.0;
    }
}

void applySetPosition(ModalState& state, const Move& move)
{
    const Words& words = move.words;
    state.position.x = words.x.value_or(state.position.x);
    state.position.y = words.y.value_or(state.position.y);
    state.position.z = words.z.value_or(state.position.z);
    state.a = words.a.value_or(state.a);
    state.b = words.b.value_or(state.b);
    state.extruder = words.e.value_or(state.extruder);
}

} // namespace

Line LineParser::parse(std::string_view text, int lineNumber)
{
    PassThrough verbatim{std::string(text), lineNumber};

    std::string_view body = text;
    std::string_view comment;
    const std::size_t semicolon = text.find(';');
    if (semicolon != std::string_view::npos)
    {
        body = text.substr(0, semicolon);
        comment = text.substr(semicolon);
    }

    const std::vector<std::string_view> fields = splitFields(trim(body));
    if (fields.empty())
    {
        return verbatim;
    }

    const std::optional<MoveKind> kind = commandKind(fields.front());
    if (!kind)
    {
        return verbatim;
    }

    Move move;
    move.kind = *kind;
    move.source = std::string(text);
    move.comment = std::string(trim(comment));
    move.lineNumber = lineNumber;

    std::string error;
    if (!readWords(fields, *kind, move.words, error))
    {
        m_issues.push_back({lineNumber, error});
        LOG_WARN(Gcode, QStringLiteral("Line %1: %2, kept verbatim")
                            .arg(lineNumber)
                            .arg(QString::fromStdString(error)));
        return verbatim;
    }

    switch (*kind)
    {
    case MoveKind::Rapid:
    case MoveKind::Linear:
        applyMotion(m_state, move);
        break;
    case MoveKind::Home:
        applyHome(m_state, move);
        break;
    case MoveKind::SetPosition:
        applySetPosition(m_state, move);
        break;
    case MoveKind::AbsoluteMode:
        m_state.relativePositioning = false;
        break;
    case MoveKind::RelativeMode:
        // Coordinates leave this parser absolute, so the directive turns into a marker.
        m_state.relativePositioning = true;
        move.edited = true;
        break;
    case MoveKind::AbsoluteExtrusion:
        m_state.relativeExtrusion = false;
        break;
    case MoveKind::RelativeExtrusion:
        m_state.relativeExtrusion = true;
        break;
    }

    move.position = m_state.position;
    move.a = m_state.a;
    move.b = m_state.b;
    return move;
}

Line parse(std::string_view text)
{
    LineParser parser;
    return parser.parse(text);
}

Program parseProgram(const std::vector<std::string>& lines, std::vector<ParseIssue>* issues)
{
    LineParser parser;
    Program program;
    program.reserve(lines.size());
    int lineNumber = 0;
    for (const std::string& line : lines)
    {
        program.push_back(parser.parse(line, ++lineNumber));
    }
    if (issues)
    {
        *issues = parser.issues();
    }
    return program;
}

} // namespace gcode
