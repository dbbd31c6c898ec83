#ifndef BAYESNET_INFERENCE_H
#define BAYESNET_INFERENCE_H

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <BayesNet/TypeDefs.h>
#include <BayesNet/EnumMacros.h>
#include <BayesNet/PreparedNetwork.h>
#include <BayesNet/RNG.h>

namespace BN {

// EXACT: full-joint enumeration; GIBBS: Markov chain Monte Carlo
#define BN_ALGORITHM_ENUM(MACRO, SUBM) MACRO(ALGORITHM, SUBM(EXACT) SUBM(GIBBS))
BN_CONSTRUCTENUM(BN_ALGORITHM_ENUM)

// Distribution: the answer to a query, a probability for each value of the
// target's domain (in domain order).
struct Distribution {
    Distribution(const Variable &target, const Row &probs, const size_t samples = 0);

    std::string target;
    std::vector<Value> values;
    Row probabilities;
    size_t samples; // number of counted Gibbs states; 0 for exact answers

    // @throws InvalidArgumentError if `val` is not in the target's domain
    float_type operator[](const Value &val) const;
    // most probable value; ties go to the first value in domain order
    const Value & argmax() const;
    float_type total() const { return probabilities.sum(); }
    std::map<Value, float_type> as_map() const;
};

// half the L1 distance between two distributions over the same target
// @throws InvalidArgumentError if the domains differ
float_type total_variation(const Distribution &lhs, const Distribution &rhs);

std::ostream& operator<<(std::ostream &os, const Distribution &dist);

// The capability shared by the exact and approximate engines.
class InferenceAlgorithm {
    public:
        virtual ~InferenceAlgorithm() = default;
        // P(target | evidence)
        // @throws UnknownVariableError, InvalidEvidenceError, ZeroEvidenceProbabilityError
        virtual Distribution answer(const std::string &target, const Evidence &evidence) const = 0;
        virtual ALGORITHM kind() const = 0;
};

struct GibbsOptions {
    size_t iterations = 10000; // counted sweeps, per chain
    size_t burn_in = 0;        // discarded sweeps, per chain
    size_t chains = 1;
};

// Selects the implementation for `algorithm`. The GIBBS engine keeps a
// reference to `rng`, which must outlive it; the EXACT engine ignores both
// `rng` and `options`.
std::unique_ptr<InferenceAlgorithm> make_engine(
    const ALGORITHM algorithm,
    const PreparedPtr &net,
    RNG &rng,
    const GibbsOptions &options = GibbsOptions()
);

} // namespace BN

#endif // BAYESNET_INFERENCE_H
