#pragma once

#include <QtCore/QMetaType>

#include <functional>
#include <string>
#include <vector>

namespace check
{

enum class IssueKind
{
    BelowPlatform,
    AngleExceeded,
    SelfIntersection
};

enum class Severity
{
    Warning,
    Fatal
};

struct ValidationIssue
{
    IssueKind kind{IssueKind::BelowPlatform};
    int layer{-1};
    Severity severity{Severity::Warning};
    std::string message;
    int line{0}; // program line of the offending move, 0 when unknown
};

using IssueCallback = std::function<void(const ValidationIssue&)>;

const char* kindName(IssueKind kind);
const char* severityName(Severity severity);

/// "[warning] AngleExceeded @ layer 12, line 40: ..." for logs and reports.
std::string describe(const ValidationIssue& issue);

bool hasFatal(const std::vector<ValidationIssue>& issues);
std::size_t countKind(const std::vector<ValidationIssue>& issues, IssueKind kind);

/// Appends, logs and forwards one issue.
void report(std::vector<ValidationIssue>& issues, ValidationIssue issue, const IssueCallback& onIssue);

} // namespace check

Q_DECLARE_METATYPE(check::ValidationIssue)
