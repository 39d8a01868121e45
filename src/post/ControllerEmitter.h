#pragma once

#include "bend/LayerFrame.h"
#include "gcode/Move.h"

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace post
{

struct EmitResult
{
    std::string text;
    std::size_t actuationCount{0};
    bool cancelled{false};
};

/**
 * Turns the B-angle timeline of a physical program into controller actuation commands. An
 * actuation line is written ahead of every motion line whose B differs from the last one sent;
 * A and B words never reach the controller. The cancel flag is checked at every band change.
 */
class ControllerEmitter
{
public:
    virtual ~ControllerEmitter() = default;

    virtual std::string name() const = 0;

    EmitResult emitProgram(const gcode::Program& program, const std::atomic<bool>* cancelFlag = nullptr) const;

protected:
    explicit ControllerEmitter(double layerHeight);

    virtual std::string actuationLine(double angleDeg) const = 0;
    virtual std::string_view newline() const { return "\n"; }

private:
    double m_layerHeight;
};

struct ActuatorSettings
{
    std::string command{"MANUAL_STEPPER"};
    std::string stepper{"b_stepper"};
};

class KlipperEmitter : public ControllerEmitter
{
public:
    /// Throws std::invalid_argument for a non-positive layer height.
    explicit KlipperEmitter(ActuatorSettings settings = {}, double layerHeight = bend::kDefaultLayerHeight);

    std::string name() const override;

protected:
    std::string actuationLine(double angleDeg) const override;

private:
    ActuatorSettings m_settings;
};

} // namespace post
