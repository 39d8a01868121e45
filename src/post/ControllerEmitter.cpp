#include "post/ControllerEmitter.h"

#include "bend/LayerFrame.h"
#include "common/log.h"
#include "gcode/GcodeWriter.h"

#include <QtCore/QString>

#include <cmath>
#include <optional>
#include <stdexcept>
#include <utility>

namespace post
{

ControllerEmitter::ControllerEmitter(double layerHeight)
    : m_layerHeight(layerHeight)
{
    if (!std::isfinite(m_layerHeight) || m_layerHeight <= 0.0)
    {
        throw std::invalid_argument("layer height must be positive");
    }
}

EmitResult ControllerEmitter::emitProgram(const gcode::Program& program, const std::atomic<bool>* cancelFlag) const
{
    EmitResult result;
    const std::string nl(newline());
    std::optional<double> lastAngle;
    bend::BandTracker bands(m_layerHeight);

    for (const gcode::Line& line : program)
    {
        if (bands.advance(line) && cancelFlag && cancelFlag->load(std::memory_order_relaxed))
        {
            LOG_INFO(Post, QStringLiteral("Emission cancelled at layer %1").arg(bands.band()));
            result.cancelled = true;
            return result;
        }

        const auto* move = std::get_if<gcode::Move>(&line);
        if (move == nullptr)
        {
            const std::string& text = std::get<gcode::PassThrough>(line).text;
            result.text.append(text);
            result.text.append(nl);
            continue;
        }

        if (move->isMotion() && move->words.b && (!lastAngle || *lastAngle != *move->words.b))
        {
            result.text.append(actuationLine(*move->words.b));
            result.text.append(nl);
            lastAngle = move->words.b;
            ++result.actuationCount;
        }

        if (move->words.hasRotary())
        {
            gcode::Words stripped = move->words;
            stripped.a.reset();
            stripped.b.reset();
            if (!move->isMotion() && !stripped.hasPosition() && !stripped.e)
            {
                // A bare G28/G92 would act on every axis; keep it as a comment instead.
                result.text.append("; ");
                result.text.append(gcode::serialize(*move));
            }
            else
            {
                result.text.append(gcode::serialize(move->withWords(stripped)));
            }
        }
        else
        {
            result.text.append(gcode::serialize(*move));
        }
        result.text.append(nl);
    }

    LOG_INFO(Post, QStringLiteral("%1: %2 actuation command(s)")
                       .arg(QString::fromStdString(name()))
                       .arg(result.actuationCount));
    return result;
}

KlipperEmitter::KlipperEmitter(ActuatorSettings settings, double layerHeight)
    : ControllerEmitter(layerHeight)
    , m_settings(std::move(settings))
{
}

std::string KlipperEmitter::name() const
{
    return "Klipper";
}

std::string KlipperEmitter::actuationLine(double angleDeg) const
{
    return m_settings.command + " STEPPER=" + m_settings.stepper + " MOVE=" + gcode::formatCompact(angleDeg);
}

} // namespace post
