#include "pipeline/StageWorker.h"

#include <QtCore/QString>

#include <exception>
#include <utility>

namespace pipeline
{

StageWorker::StageWorker(std::shared_ptr<PipelineOrchestrator> orchestrator, Stage target, QObject* parent)
    : QThread(parent)
    , m_orchestrator(std::move(orchestrator))
    , m_target(target)
{
    qRegisterMetaType<pipeline::StageResult>("pipeline::StageResult");
    qRegisterMetaType<check::ValidationIssue>("check::ValidationIssue");
}

void StageWorker::requestCancel()
{
    m_cancelled.store(true, std::memory_order_relaxed);
}

void StageWorker::run()
{
    if (!m_orchestrator)
    {
        emit error(tr("Stage aborted: no pipeline."));
        return;
    }

    emit progress(0);

    auto progressCallback = [this](int value) {
        emit progress(value);
    };
    auto issueCallback = [this](const check::ValidationIssue& issue) {
        emit issueFound(issue);
    };

    try
    {
        if (m_target == Stage::Raw)
        {
            m_results = m_orchestrator->runAll(m_cancelled, progressCallback, issueCallback);
        }
        else
        {
            m_results.push_back(m_orchestrator->runStage(m_target, m_cancelled, progressCallback, issueCallback));
        }
    }
    catch (const std::exception& ex)
    {
        emit error(tr("Stage failed: %1").arg(QString::fromUtf8(ex.what())));
        return;
    }

    for (const StageResult& result : m_results)
    {
        emit finished(result);
    }
}

} // namespace pipeline
