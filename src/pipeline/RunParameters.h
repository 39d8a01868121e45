#pragma once

#include "bend/LayerFrame.h"
#include "bend/SplineCurve.h"
#include "kin/Linkage.h"
#include "post/ControllerEmitter.h"

#include <QtCore/QByteArray>
#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QStringList>

namespace pipeline
{

/**
 * Every per-run setting of the three stages, typed and with the machine defaults. Validated once
 * when the run context is created; the stages take it as given.
 */
struct RunParameters
{
    bend::SplineAnchors spline{};
    double layerHeight_mm{bend::kDefaultLayerHeight};
    double warningAngleDeg{100.0};
    double discretization_mm{0.01};
    bool annotateBands{true};
    kin::Linkage linkage{kin::makeDefaultLinkage()};
    post::ActuatorSettings actuator{};

    [[nodiscard]] bool validate(QStringList& errors) const;
};

/// Overlays the keys present in the JSON document onto params. Unknown keys produce warnings.
bool loadParametersFromJson(const QByteArray& data, RunParameters& params, QStringList& warnings);
bool loadParametersFromFile(const QString& filePath, RunParameters& params, QStringList& warnings);

QJsonObject toJson(const RunParameters& params);

} // namespace pipeline
