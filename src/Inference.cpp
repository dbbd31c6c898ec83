#include <BayesNet/Inference.h>
#include <BayesNet/ExactInference.h>
#include <BayesNet/GibbsSampler.h>

#include <iomanip>

using std::string;
using std::vector;

namespace BN {

Distribution::Distribution(const Variable &var, const Row &probs, const size_t n) :
    target(var.name()), values(var.domain()), probabilities(probs), samples(n) {
    if (static_cast<size_t>(probabilities.size()) != values.size()) {
        throw InvalidArgumentError(var.name(), "distribution-size", "distribution size does not match the domain size");
    }
}

float_type Distribution::operator[](const Value &val) const {
    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i] == val) { return probabilities[i]; }
    }
    throw InvalidArgumentError(target, "out-of-domain", "'" + val + "' is not in the domain of '" + target + "'");
}

const Value & Distribution::argmax() const {
    Eigen::Index best = 0;
    for (Eigen::Index i = 1; i < probabilities.size(); ++i) {
        if (probabilities[i] > probabilities[best]) { best = i; } // strict: first value wins ties
    }
    return values.at(best);
}

std::map<Value, float_type> Distribution::as_map() const {
    std::map<Value, float_type> result;
    for (size_t i = 0; i < values.size(); ++i) { result[values[i]] = probabilities[i]; }
    return result;
}

float_type total_variation(const Distribution &lhs, const Distribution &rhs) {
    if (lhs.values != rhs.values) {
        throw InvalidArgumentError("total variation needs distributions over the same domain");
    }
    return 0.5 * (lhs.probabilities - rhs.probabilities).cwiseAbs().sum();
}

std::ostream& operator<<(std::ostream &os, const Distribution &dist) {
    os << "P(" << dist.target << ") = {";
    for (size_t i = 0; i < dist.values.size(); ++i) {
        os << (i == 0 ? " " : ", ") << dist.values[i] << ": " << dist.probabilities[i];
    }
    return os << " }";
}

std::unique_ptr<InferenceAlgorithm> make_engine(
    const ALGORITHM algorithm,
    const PreparedPtr &net,
    RNG &rng,
    const GibbsOptions &options
) {
    switch (algorithm) {
        case EXACT: return std::make_unique<ExactInference>(net);
        case GIBBS: return std::make_unique<GibbsSampler>(net, rng, options);
        default: break;
    }
    throw InvalidArgumentError("unsupported inference algorithm: " + std::to_string(static_cast<int>(algorithm)));
}

} // namespace BN
