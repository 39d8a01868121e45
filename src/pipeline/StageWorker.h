#pragma once

#include <QtCore/QMetaType>
#include <QtCore/QThread>

#include "check/ValidationIssue.h"
#include "pipeline/PipelineOrchestrator.h"
#include "pipeline/StageResult.h"

#include <atomic>
#include <memory>
#include <vector>

namespace pipeline
{

/**
 * Runs stages of one orchestrator off the calling thread. With target Raw every stage is run in
 * order; otherwise only the stage producing target. One finished() per stage run.
 */
class StageWorker : public QThread
{
    Q_OBJECT

public:
    StageWorker(std::shared_ptr<PipelineOrchestrator> orchestrator, Stage target, QObject* parent = nullptr);

    void requestCancel();

    [[nodiscard]] const std::vector<StageResult>& results() const noexcept { return m_results; }

    Q_SIGNALS:
    void progress(int value);
    void issueFound(const check::ValidationIssue& issue);
    void finished(const pipeline::StageResult& result);
    void error(const QString& message);

protected:
    void run() override;

private:
    std::shared_ptr<PipelineOrchestrator> m_orchestrator;
    Stage m_target{Stage::Raw};
    std::vector<StageResult> m_results;
    std::atomic<bool> m_cancelled{false};
};

} // namespace pipeline
