#ifndef BAYESNET_IMPUTER_H
#define BAYESNET_IMPUTER_H

#include <vector>

#include <BayesNet/TypeDefs.h>
#include <BayesNet/EnumMacros.h>
#include <BayesNet/Inference.h>

namespace BN {

// SEQUENTIAL: fill missing variables one at a time, in topological order,
//             each with the argmax of P(v | observed and already imputed values)
// JOINT:      fill all missing variables with the most probable explanation,
//             argmax over their joint assignment given the observed values
#define BN_IMPUTE_MODE_ENUM(MACRO, SUBM) MACRO(IMPUTE_MODE, SUBM(SEQUENTIAL) SUBM(JOINT))
BN_CONSTRUCTENUM(BN_IMPUTE_MODE_ENUM)

// Imputer: completes partial assignments. Variables missing from the
// partial assignment, or mapped to std::nullopt, are imputed; ties go to the
// first value in domain order (SEQUENTIAL) or the first state in enumeration
// order (JOINT), so results are deterministic for deterministic engines.
class Imputer {
    public:
        // SEQUENTIAL mode answers its queries with `engine`
        Imputer(const PreparedPtr &net, const InferenceAlgorithm &engine, const IMPUTE_MODE mode = SEQUENTIAL) :
            _net(net), _engine(engine), _mode(mode) {}

        // @throws InvalidEvidenceError for unknown variables or out-of-domain observed values
        // @throws ZeroEvidenceProbabilityError if the observed values are impossible
        Assignment impute(const PartialAssignment &partial) const;
        std::vector<Assignment> impute(const std::vector<PartialAssignment> &rows) const;

        IMPUTE_MODE mode() const { return _mode; }

    private:
        PreparedPtr _net;
        const InferenceAlgorithm &_engine;
        const IMPUTE_MODE _mode;

        Assignment _sequential(const Evidence &observed) const;
        Assignment _joint(const Evidence &observed) const;
};

} // namespace BN

#endif // BAYESNET_IMPUTER_H
