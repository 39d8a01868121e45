#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include "doctest/doctest.h"

#include "bend/SplineBendEngine.h"
#include "check/ValidationIssue.h"
#include "gcode/Move.h"
#include "pipeline/StageResult.h"

DOCTEST_TEST_CASE(basic_move_defaults)
{
    gcode::Move move{};
    DOCTEST_CHECK(move.kind == gcode::MoveKind::Linear);
    DOCTEST_CHECK_FALSE(move.edited);
    DOCTEST_CHECK_FALSE(move.words.hasPosition());
    DOCTEST_CHECK(move.extrusion == 0.0);
}

DOCTEST_TEST_CASE(basic_bend_settings_defaults)
{
    bend::BendSettings settings{};
    DOCTEST_CHECK(settings.layerHeight == 0.28);
    DOCTEST_CHECK(settings.warningAngleDeg == 100.0);
    DOCTEST_CHECK(settings.annotateBands);
}

DOCTEST_TEST_CASE(basic_issue_description)
{
    const check::ValidationIssue issue{check::IssueKind::AngleExceeded, 12, check::Severity::Warning, "too steep"};
    DOCTEST_CHECK(check::describe(issue) == "[warning] AngleExceeded @ layer 12: too steep");
    DOCTEST_CHECK_FALSE(check::hasFatal({issue}));

    const check::ValidationIssue located{check::IssueKind::AngleExceeded, 3, check::Severity::Fatal, "unreachable", 40};
    DOCTEST_CHECK(check::describe(located) == "[fatal] AngleExceeded @ layer 3, line 40: unreachable");
    DOCTEST_CHECK(check::hasFatal({issue, located}));

    const check::ValidationIssue lineOnly{check::IssueKind::BelowPlatform, -1, check::Severity::Warning, {}, 7};
    DOCTEST_CHECK(check::describe(lineOnly) == "[warning] BelowPlatform @ line 7");
}

DOCTEST_TEST_CASE(basic_stage_result_defaults)
{
    pipeline::StageResult result{};
    DOCTEST_CHECK_FALSE(result.ok);
    DOCTEST_CHECK(result.issues.empty());
    DOCTEST_CHECK_FALSE(result.error.has_value());
    DOCTEST_CHECK(pipeline::stagePrefix(pipeline::Stage::Translated) == QStringLiteral("IK_"));
}
