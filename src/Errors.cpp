#include <BayesNet/Errors.h>

#include <algorithm>
#include <sstream>

using std::string;
using std::vector;

namespace BN {

string to_string(const ISSUE &kind) {
    switch (kind) {
        case CYCLIC_GRAPH: return "CyclicGraphError";
        case UNKNOWN_VARIABLE: return "UnknownVariableError";
        case MISSING_CPT: return "MissingCPTError";
        case INVALID_CPT: return "InvalidCPTError";
        case INVALID_EVIDENCE: return "InvalidEvidenceError";
        case ZERO_EVIDENCE: return "ZeroEvidenceProbabilityError";
        case INVALID_ARGUMENT: return "InvalidArgumentError";
        case CONFIG: return "ConfigError";
        case STORAGE: return "StorageError";
        default: return "UndefinedError";
    }
}

std::ostream& operator<<(std::ostream &os, const ISSUE &kind) {
    return os << to_string(kind);
}

std::ostream& operator<<(std::ostream &os, const Issue &issue) {
    os << to_string(issue.kind);
    if (not issue.variable.empty()) { os << " [" << issue.variable << "]"; }
    if (not issue.rule.empty()) { os << " (" << issue.rule << ")"; }
    return os << ": " << issue.message;
}

string BayesNetError::_summarize(const vector<Issue> &issues) {
    if (issues.empty()) { return "unspecified error"; }
    std::stringstream ss;
    ss << issues.front();
    if (issues.size() > 1) { ss << " (and " << issues.size() - 1 << " more)"; }
    return ss.str();
}

BayesNetError::BayesNetError(const Issue &issue) : BayesNetError(vector<Issue>{ issue }) {}

BayesNetError::BayesNetError(const vector<Issue> &issues) :
    std::runtime_error(_summarize(issues)), _issues(issues) {
    if (_issues.empty()) { _issues.push_back(Issue{ INVALID_ARGUMENT, "", "", "unspecified error" }); }
}

void throw_issues(const vector<Issue> &issues) {
    if (issues.empty()) { return; }
    // most fundamental first, so kind() names the thrown class
    vector<Issue> ranked(issues);
    std::stable_sort(ranked.begin(), ranked.end(),
        [](const Issue &lhs, const Issue &rhs) { return lhs.kind < rhs.kind; }
    );
    switch (ranked.front().kind) {
        case CYCLIC_GRAPH: throw CyclicGraphError(ranked);
        case UNKNOWN_VARIABLE: throw UnknownVariableError(ranked);
        case MISSING_CPT: throw MissingCPTError(ranked);
        case INVALID_CPT: throw InvalidCPTError(ranked);
        case INVALID_EVIDENCE: throw InvalidEvidenceError(ranked);
        case ZERO_EVIDENCE: throw ZeroEvidenceProbabilityError(ranked);
        case CONFIG: throw ConfigError(ranked);
        case STORAGE: throw StorageError(ranked);
        default: throw InvalidArgumentError(ranked);
    }
}

} // namespace BN
