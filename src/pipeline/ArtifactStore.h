#pragma once

#include "pipeline/StageResult.h"

#include <QtCore/QString>

#include <atomic>
#include <string>
#include <vector>

namespace pipeline
{

/// Stage artifact next to the input: <dir>/<prefix><file name>. Raw returns the input itself.
QString artifactPath(const QString& inputPath, Stage stage);

/// Reads a text file into lines without line terminators. Returns false and sets error on failure.
bool readLines(const QString& path, std::vector<std::string>& lines, QString& error);

bool hasStageHeader(const std::vector<std::string>& lines, Stage stage);

/// Removes a leading header line of any stage so an artifact can be fed to the next stage.
void stripStageHeader(std::vector<std::string>& lines);

/**
 * Writes header + body through a QSaveFile. Nothing becomes visible under path unless the write
 * completes and the cancel flag is still clear at commit time.
 */
bool writeArtifact(const QString& path,
                   Stage stage,
                   const std::string& body,
                   const std::atomic<bool>* cancelFlag,
                   QString& error);

} // namespace pipeline
