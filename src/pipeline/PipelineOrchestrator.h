#pragma once

#include "bend/SplineCurve.h"
#include "check/ValidationIssue.h"
#include "pipeline/RunContext.h"
#include "pipeline/StageResult.h"

#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace pipeline
{

using ProgressCallback = std::function<void(int)>;

/**
 * Runs the three stages of one file: bending (Raw -> Bent), kinematic translation
 * (Bent -> Translated) and controller emission (Translated -> Ready). A stage reads only the
 * artifact of the stage before it and refuses to run when that artifact is missing or was not
 * written by that stage. Artifacts are only promoted when the stage finished without a fatal
 * issue and was not cancelled.
 */
class PipelineOrchestrator
{
public:
    explicit PipelineOrchestrator(RunContext context);

    /// Furthest stage this orchestrator has produced. Never moves backwards.
    [[nodiscard]] Stage state() const noexcept { return m_state; }

    StageResult runBending(const std::atomic<bool>& cancelFlag,
                           const ProgressCallback& progressCallback = {},
                           const check::IssueCallback& onIssue = {});
    StageResult runTranslation(const std::atomic<bool>& cancelFlag,
                               const ProgressCallback& progressCallback = {},
                               const check::IssueCallback& onIssue = {});
    StageResult runEmission(const std::atomic<bool>& cancelFlag, const ProgressCallback& progressCallback = {});

    /// Runs the stage that produces target. Raw is rejected with a dependency error.
    StageResult runStage(Stage target,
                         const std::atomic<bool>& cancelFlag,
                         const ProgressCallback& progressCallback = {},
                         const check::IssueCallback& onIssue = {});

    /// Bending, translation and emission in order, stopping at the first failed stage.
    std::vector<StageResult> runAll(const std::atomic<bool>& cancelFlag,
                                    const ProgressCallback& progressCallback = {},
                                    const check::IssueCallback& onIssue = {});

    /// Curve samples for plotting. Pure; throws std::invalid_argument on bad anchors or step.
    static std::vector<bend::CurveSample> previewCurve(const bend::SplineAnchors& anchors, double step);

    static std::string writePreview(const std::vector<bend::CurveSample>& samples);

private:
    bool loadInput(Stage required, StageResult& result, std::vector<std::string>& lines) const;
    bool promote(StageResult& result, const std::string& body, const std::atomic<bool>& cancelFlag);
    StageResult cancelled(StageResult result) const;

    RunContext m_context;
    Stage m_state{Stage::Raw};
};

} // namespace pipeline
