#include "bend/LayerFrame.h"

#include "gcode/GcodeWriter.h"

#include <charconv>
#include <cmath>
#include <stdexcept>

namespace bend
{

namespace
{
constexpr std::string_view kMarkerPrefix = ";BAND ";
constexpr double kBandEpsilon = 1e-9;
}

std::string bandMarker(const LayerFrame& frame)
{
    std::string marker(kMarkerPrefix);
    marker.append(std::to_string(frame.index));
    marker.append(" Z");
    marker.append(gcode::formatNumber(frame.curveHeight));
    marker.append(" B");
    marker.append(gcode::formatNumber(frame.sample.tangentAngleDeg));
    return marker;
}

std::optional<int> parseBandMarker(std::string_view line)
{
    if (line.substr(0, kMarkerPrefix.size()) != kMarkerPrefix)
    {
        return std::nullopt;
    }

    const std::string_view rest = line.substr(kMarkerPrefix.size());
    int index = 0;
    const auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), index);
    if (ec != std::errc() || ptr == rest.data())
    {
        return std::nullopt;
    }
    return index;
}

int bandIndex(double z, double layerHeight)
{
    return static_cast<int>(std::floor(z / layerHeight + kBandEpsilon));
}

BandTracker::BandTracker(double layerHeight)
    : m_layerHeight(layerHeight)
{
    if (!std::isfinite(m_layerHeight) || m_layerHeight <= 0.0)
    {
        throw std::invalid_argument("layer height must be positive");
    }
}

bool BandTracker::advance(const gcode::Line& line)
{
    int next = m_band;
    if (const auto* passThrough = std::get_if<gcode::PassThrough>(&line))
    {
        const std::optional<int> marker = parseBandMarker(passThrough->text);
        if (!marker)
        {
            return false;
        }
        m_fromMarkers = true;
        next = *marker;
    }
    else
    {
        const gcode::Move& move = std::get<gcode::Move>(line);
        if (m_fromMarkers || !move.isPositional())
        {
            return false;
        }
        next = bandIndex(move.position.z, m_layerHeight);
    }

    if (next == m_band)
    {
        return false;
    }
    m_band = next;
    return true;
}

} // namespace bend
