#ifndef BAYESNET_ERRORS_H
#define BAYESNET_ERRORS_H

#include <stdexcept>
#include <string>
#include <vector>
#include <iostream>

namespace BN {

// Kinds of defect, in the order preparation ranks them: a cyclic graph
// makes every later check meaningless, so it is reported "first".
enum ISSUE { CYCLIC_GRAPH, UNKNOWN_VARIABLE, MISSING_CPT, INVALID_CPT, INVALID_EVIDENCE, ZERO_EVIDENCE, INVALID_ARGUMENT, CONFIG, STORAGE };

std::string to_string(const ISSUE &kind);
std::ostream& operator<<(std::ostream &os, const ISSUE &kind);

// One defect: which variable, which rule, and a human readable message.
struct Issue {
    ISSUE kind;
    std::string variable; // may be empty, e.g. for a cycle
    std::string rule;     // short tag, e.g. "row-sum", "parent-mismatch"
    std::string message;
};

std::ostream& operator<<(std::ostream &os, const Issue &issue);

// Root of the error taxonomy. Carries every Issue it reports; for errors
// thrown by preparation, that is the full defect list of the network.
class BayesNetError : public std::runtime_error {
    public:
        BayesNetError(const Issue &issue);
        BayesNetError(const std::vector<Issue> &issues);

        const std::vector<Issue> & issues() const { return _issues; }
        ISSUE kind() const { return _issues.front().kind; }

    private:
        std::vector<Issue> _issues;
        static std::string _summarize(const std::vector<Issue> &issues);
};

#define BN_DECLARE_ERROR(NAME, KIND) \
class NAME : public BayesNetError { \
    public: \
        NAME(const std::vector<Issue> &issues) : BayesNetError(issues) {} \
        NAME(const Issue &issue) : BayesNetError(issue) {} \
        NAME(const std::string &variable, const std::string &rule, const std::string &message) \
            : BayesNetError(Issue{ KIND, variable, rule, message }) {} \
        explicit NAME(const std::string &message) : NAME("", "", message) {} \
};

BN_DECLARE_ERROR(CyclicGraphError, CYCLIC_GRAPH)
BN_DECLARE_ERROR(UnknownVariableError, UNKNOWN_VARIABLE)
BN_DECLARE_ERROR(MissingCPTError, MISSING_CPT)
BN_DECLARE_ERROR(InvalidCPTError, INVALID_CPT)
BN_DECLARE_ERROR(InvalidEvidenceError, INVALID_EVIDENCE)
BN_DECLARE_ERROR(ZeroEvidenceProbabilityError, ZERO_EVIDENCE)
BN_DECLARE_ERROR(InvalidArgumentError, INVALID_ARGUMENT)
BN_DECLARE_ERROR(ConfigError, CONFIG)
BN_DECLARE_ERROR(StorageError, STORAGE)

#undef BN_DECLARE_ERROR

// Throws the error class matching the lowest ranked ISSUE in `issues`,
// carrying all of them, most fundamental first. No-op on an empty list.
void throw_issues(const std::vector<Issue> &issues);

} // namespace BN

#endif // BAYESNET_ERRORS_H
