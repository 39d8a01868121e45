#include "check/ValidationIssue.h"

#include "common/log.h"

#include <algorithm>
#include <sstream>
#include <utility>

namespace check
{

const char* kindName(IssueKind kind)
{
    switch (kind)
    {
    case IssueKind::BelowPlatform: return "BelowPlatform";
    case IssueKind::AngleExceeded: return "AngleExceeded";
    case IssueKind::SelfIntersection: return "SelfIntersection";
    }
    return "Unknown";
}

const char* severityName(Severity severity)
{
    return severity == Severity::Fatal ? "fatal" : "warning";
}

std::string describe(const ValidationIssue& issue)
{
    std::ostringstream oss;
    oss << '[' << severityName(issue.severity) << "] " << kindName(issue.kind);
    if (issue.layer >= 0)
    {
        oss << " @ layer " << issue.layer;
    }
    if (issue.line > 0)
    {
        oss << (issue.layer >= 0 ? ", line " : " @ line ") << issue.line;
    }
    if (!issue.message.empty())
    {
        oss << ": " << issue.message;
    }
    return oss.str();
}

bool hasFatal(const std::vector<ValidationIssue>& issues)
{
    return std::any_of(issues.begin(), issues.end(), [](const ValidationIssue& issue) {
        return issue.severity == Severity::Fatal;
    });
}

std::size_t countKind(const std::vector<ValidationIssue>& issues, IssueKind kind)
{
    return static_cast<std::size_t>(std::count_if(issues.begin(), issues.end(), [kind](const ValidationIssue& issue) {
        return issue.kind == kind;
    }));
}

void report(std::vector<ValidationIssue>& issues, ValidationIssue issue, const IssueCallback& onIssue)
{
    if (issue.severity == Severity::Fatal)
    {
        LOG_ERR(Pipeline, describe(issue));
    }
    else
    {
        LOG_WARN(Pipeline, describe(issue));
    }
    if (onIssue)
    {
        onIssue(issue);
    }
    issues.push_back(std::move(issue));
}

} // namespace check
