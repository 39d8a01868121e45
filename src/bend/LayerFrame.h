#pragma once

#include "bend/SplineCurve.h"
#include "gcode/Move.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace bend
{

inline constexpr double kDefaultLayerHeight = 0.28;

/// Consecutive motion moves sharing one height band and therefore one curve evaluation.
struct LayerFrame
{
    int index{0};            // floor(z / layerHeight)
    double height{0.0};      // Z of the move that opened the frame
    double curveHeight{0.0}; // height on the curve after arc-length mapping
    CurveSample sample;
    std::size_t firstLine{0};
    std::size_t moveCount{0};
    double extrusionFactor{1.0};
};

/// ";BAND <index> Z<curveHeight> B<angle>", written ahead of each frame in the bent program.
std::string bandMarker(const LayerFrame& frame);
std::optional<int> parseBandMarker(std::string_view line);

/// floor(z / layerHeight), tolerant of the rounding in z values written with 3 decimals.
int bandIndex(double z, double layerHeight);

/// Follows the bands of a bent program: from ;BAND markers when the program has them, otherwise
/// from the height of each positional move.
class BandTracker
{
public:
    explicit BandTracker(double layerHeight);

    /// True when the line opens a band other than the current one.
    bool advance(const gcode::Line& line);

    [[nodiscard]] int band() const noexcept { return m_band; }

private:
    double m_layerHeight;
    int m_band{-1};
    bool m_fromMarkers{false};
};

} // namespace bend
