#pragma once

#include "check/ValidationIssue.h"

#include <QtCore/QMetaType>
#include <QtCore/QString>

#include <optional>
#include <vector>

namespace pipeline
{

/// Artifact states of one input file. Each stage moves the file one step to the right.
enum class Stage
{
    Raw,
    Bent,
    Translated,
    Ready
};

QString stageName(Stage stage);

/// "BENT_", "IK_", "KLIPPER_"; empty for Raw.
QString stagePrefix(Stage stage);

/// First line of every artifact: "; AxisBend stage=<name>".
QString stageHeader(Stage stage);

enum class StageErrorKind
{
    StageDependency,
    Io,
    FatalValidation,
    Cancelled
};

QString errorKindName(StageErrorKind kind);

struct StageError
{
    StageErrorKind kind{StageErrorKind::Io};
    QString message;
    QString path;
    int layer{-1};
    int line{0};
};

struct StageResult
{
    Stage stage{Stage::Raw};
    bool ok{false};
    QString artifactPath;
    std::vector<check::ValidationIssue> issues;
    int parseErrors{0};
    std::optional<StageError> error;

    /// One line for logs and the command line: "Bent: ok, 3 issue(s) -> /tmp/BENT_part.gcode".
    [[nodiscard]] QString summary() const;
};

} // namespace pipeline

Q_DECLARE_METATYPE(pipeline::StageResult)
