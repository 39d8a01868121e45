#include "pipeline/StageResult.h"

namespace pipeline
{

QString stageName(Stage stage)
{
    switch (stage)
    {
    case Stage::Raw: return QStringLiteral("Raw");
    case Stage::Bent: return QStringLiteral("Bent");
    case Stage::Translated: return QStringLiteral("Translated");
    case Stage::Ready: return QStringLiteral("Ready");
    }
    return QStringLiteral("Unknown");
}

QString stagePrefix(Stage stage)
{
    switch (stage)
    {
    case Stage::Raw: return QString();
    case Stage::Bent: return QStringLiteral("BENT_");
    case Stage::Translated: return QStringLiteral("IK_");
    case Stage::Ready: return QStringLiteral("KLIPPER_");
    }
    return QString();
}

QString stageHeader(Stage stage)
{
    return QStringLiteral("; AxisBend stage=%1").arg(stageName(stage));
}

QString errorKindName(StageErrorKind kind)
{
    switch (kind)
    {
    case StageErrorKind::StageDependency: return QStringLiteral("StageDependencyError");
    case StageErrorKind::Io: return QStringLiteral("IOError");
    case StageErrorKind::FatalValidation: return QStringLiteral("FatalValidation");
    case StageErrorKind::Cancelled: return QStringLiteral("Cancelled");
    }
    return QStringLiteral("Unknown");
}

QString StageResult::summary() const
{
    QString text = QStringLiteral("%1: ").arg(stageName(stage));
    if (ok)
    {
        text += QStringLiteral("ok, %1 issue(s)").arg(issues.size());
        if (parseErrors > 0)
        {
            text += QStringLiteral(", %1 parse error(s)").arg(parseErrors);
        }
        text += QStringLiteral(" -> %1").arg(artifactPath);
        return text;
    }

    if (!error)
    {
        return text + QStringLiteral("failed");
    }

    text += QStringLiteral("%1: %2").arg(errorKindName(error->kind), error->message);
    if (!error->path.isEmpty())
    {
        text += QStringLiteral(" [%1]").arg(error->path);
    }
    if (error->layer >= 0)
    {
        text += QStringLiteral(" (layer %1)").arg(error->layer);
    }
    if (error->line > 0)
    {
        text += QStringLiteral(" (line %1)").arg(error->line);
    }
    return text;
}

} // namespace pipeline
