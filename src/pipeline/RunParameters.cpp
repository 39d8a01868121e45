#include "pipeline/RunParameters.h"

#include "bend/SplineCurve.h"

#include <QtCore/QFile>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonValue>
#include <QtCore/QSet>

#include <cmath>
#include <stdexcept>
#include <string>

namespace pipeline
{

namespace
{

const QSet<QString>& knownKeys()
{
    static const QSet<QString> keys = {QStringLiteral("spline_x"),
                                       QStringLiteral("spline_z"),
                                       QStringLiteral("spline_slopes"),
                                       QStringLiteral("layer_height"),
                                       QStringLiteral("warning_angle"),
                                       QStringLiteral("discretization_length"),
                                       QStringLiteral("annotate_bands"),
                                       QStringLiteral("linkage"),
                                       QStringLiteral("controller")};
    return keys;
}

bool readPair(const QJsonObject& obj, const QString& key, double& first, double& second, QStringList& warnings)
{
    if (!obj.contains(key))
    {
        return true;
    }

    const QJsonArray pair = obj.value(key).toArray();
    if (pair.size() != 2 || !pair.at(0).isDouble() || !pair.at(1).isDouble())
    {
        warnings.push_back(QStringLiteral("\"%1\" must be an array of two numbers.").arg(key));
        return false;
    }
    first = pair.at(0).toDouble();
    second = pair.at(1).toDouble();
    return true;
}

bool readNumber(const QJsonObject& obj, const QString& key, double& value, QStringList& warnings)
{
    if (!obj.contains(key))
    {
        return true;
    }

    const QJsonValue entry = obj.value(key);
    if (!entry.isDouble())
    {
        warnings.push_back(QStringLiteral("\"%1\" must be a number.").arg(key));
        return false;
    }
    value = entry.toDouble();
    return true;
}

bool readText(const QJsonObject& obj, const QString& key, std::string& value, QStringList& warnings)
{
    if (!obj.contains(key))
    {
        return true;
    }

    const QJsonValue entry = obj.value(key);
    if (!entry.isString() || entry.toString().trimmed().isEmpty())
    {
        warnings.push_back(QStringLiteral("\"%1\" must be a non-empty string.").arg(key));
        return false;
    }
    value = entry.toString().trimmed().toStdString();
    return true;
}

QJsonArray pairToJson(double first, double second)
{
    return QJsonArray{first, second};
}

} // namespace

bool RunParameters::validate(QStringList& errors) const
{
    const qsizetype before = errors.size();

    try
    {
        const bend::SplineCurve curve(spline, discretization_mm);
        (void)curve;
    }
    catch (const std::invalid_argument& ex)
    {
        errors.push_back(QStringLiteral("Spline: %1").arg(QString::fromUtf8(ex.what())));
    }

    if (!std::isfinite(layerHeight_mm) || layerHeight_mm <= 0.0)
    {
        errors.push_back(QStringLiteral("Layer height must be positive (got %1).").arg(layerHeight_mm));
    }
    if (!std::isfinite(warningAngleDeg) || warningAngleDeg < 0.0)
    {
        errors.push_back(QStringLiteral("Warning angle must be zero or positive (got %1).").arg(warningAngleDeg));
    }

    std::string linkageError;
    if (!linkage.isValid(&linkageError))
    {
        errors.push_back(QStringLiteral("Linkage: %1").arg(QString::fromStdString(linkageError)));
    }

    if (actuator.command.empty() || actuator.stepper.empty())
    {
        errors.push_back(QStringLiteral("Controller command and stepper name must not be empty."));
    }

    return errors.size() == before;
}

bool loadParametersFromJson(const QByteArray& data, RunParameters& params, QStringList& warnings)
{
    if (data.trimmed().isEmpty())
    {
        warnings.push_back(QStringLiteral("Parameter file is empty."));
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError)
    {
        warnings.push_back(QStringLiteral("Failed to parse parameters: %1").arg(parseError.errorString()));
        return false;
    }
    if (!doc.isObject())
    {
        warnings.push_back(QStringLiteral("Parameter file must contain a JSON object."));
        return false;
    }

    const QJsonObject root = doc.object();
    for (auto it = root.begin(); it != root.end(); ++it)
    {
        if (!knownKeys().contains(it.key()))
        {
            warnings.push_back(QStringLiteral("Ignoring unknown parameter \"%1\".").arg(it.key()));
        }
    }

    RunParameters next = params;
    bool ok = true;
    ok &= readPair(root, QStringLiteral("spline_x"), next.spline.xStart, next.spline.xEnd, warnings);
    ok &= readPair(root, QStringLiteral("spline_z"), next.spline.zStart, next.spline.zEnd, warnings);
    ok &= readPair(root, QStringLiteral("spline_slopes"), next.spline.startSlope, next.spline.endSlope, warnings);
    ok &= readNumber(root, QStringLiteral("layer_height"), next.layerHeight_mm, warnings);
    ok &= readNumber(root, QStringLiteral("warning_angle"), next.warningAngleDeg, warnings);
    ok &= readNumber(root, QStringLiteral("discretization_length"), next.discretization_mm, warnings);

    if (root.contains(QStringLiteral("annotate_bands")))
    {
        const QJsonValue annotate = root.value(QStringLiteral("annotate_bands"));
        if (annotate.isBool())
        {
            next.annotateBands = annotate.toBool();
        }
        else
        {
            warnings.push_back(QStringLiteral("\"annotate_bands\" must be a boolean."));
            ok = false;
        }
    }

    if (root.contains(QStringLiteral("linkage")))
    {
        const QJsonObject linkage = root.value(QStringLiteral("linkage")).toObject();
        ok &= readNumber(linkage, QStringLiteral("la"), next.linkage.la, warnings);
        ok &= readNumber(linkage, QStringLiteral("lb"), next.linkage.lb, warnings);
        ok &= readPair(linkage, QStringLiteral("a_range"), next.linkage.aMinDeg, next.linkage.aMaxDeg, warnings);
        ok &= readPair(linkage, QStringLiteral("b_range"), next.linkage.bMinDeg, next.linkage.bMaxDeg, warnings);
    }

    if (root.contains(QStringLiteral("controller")))
    {
        const QJsonObject controller = root.value(QStringLiteral("controller")).toObject();
        ok &= readText(controller, QStringLiteral("command"), next.actuator.command, warnings);
        ok &= readText(controller, QStringLiteral("stepper"), next.actuator.stepper, warnings);
    }

    if (!ok)
    {
        return false;
    }
    params = next;
    return true;
}

bool loadParametersFromFile(const QString& filePath, RunParameters& params, QStringList& warnings)
{
    QFile file(filePath);
    if (!file.exists())
    {
        warnings.push_back(QStringLiteral("Parameter file not found: %1").arg(filePath));
        return false;
    }

    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
    {
        warnings.push_back(QStringLiteral("Unable to open parameter file: %1").arg(filePath));
        return false;
    }

    return loadParametersFromJson(file.readAll(), params, warnings);
}

QJsonObject toJson(const RunParameters& params)
{
    QJsonObject linkage;
    linkage.insert(QStringLiteral("la"), params.linkage.la);
    linkage.insert(QStringLiteral("lb"), params.linkage.lb);
    linkage.insert(QStringLiteral("a_range"), pairToJson(params.linkage.aMinDeg, params.linkage.aMaxDeg));
    linkage.insert(QStringLiteral("b_range"), pairToJson(params.linkage.bMinDeg, params.linkage.bMaxDeg));

    QJsonObject controller;
    controller.insert(QStringLiteral("command"), QString::fromStdString(params.actuator.command));
    controller.insert(QStringLiteral("stepper"), QString::fromStdString(params.actuator.stepper));

    QJsonObject root;
    root.insert(QStringLiteral("spline_x"), pairToJson(params.spline.xStart, params.spline.xEnd));
    root.insert(QStringLiteral("spline_z"), pairToJson(params.spline.zStart, params.spline.zEnd));
    root.insert(QStringLiteral("spline_slopes"), pairToJson(params.spline.startSlope, params.spline.endSlope));
    root.insert(QStringLiteral("layer_height"), params.layerHeight_mm);
    root.insert(QStringLiteral("warning_angle"), params.warningAngleDeg);
    root.insert(QStringLiteral("discretization_length"), params.discretization_mm);
    root.insert(QStringLiteral("annotate_bands"), params.annotateBands);
    root.insert(QStringLiteral("linkage"), linkage);
    root.insert(QStringLiteral("controller"), controller);
    return root;
}

} // namespace pipeline
