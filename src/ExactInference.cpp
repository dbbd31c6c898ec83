#include <BayesNet/ExactInference.h>

#include <cmath>
#include <sstream>

using std::string;
using std::vector;

namespace BN {

// non-exported helper: describe evidence for error messages
static string _describe(const Evidence &evidence) {
    std::stringstream ss;
    ss << "{";
    for (auto it = evidence.begin(); it != evidence.end(); ++it) {
        ss << (it == evidence.begin() ? " " : ", ") << it->first << "=" << it->second;
    }
    ss << " }";
    return ss.str();
}

Distribution ExactInference::answer(const string &target, const Evidence &evidence) const {
    const PreparedNetwork &net = *_net;
    const size_t tidx = net.index_of(target);
    const Variable &tvar = net.variable(tidx);
    const auto fixed = net.resolve(evidence);

    // log P(target = v, evidence) per value v
    Row log_weights = Row::Constant(tvar.size(), LOG_ZERO);
    enumerate_states(net, fixed, [&](const State &state) {
        log_weights[state[tidx]] = log_add(log_weights[state[tidx]], net.log_joint(state));
    });

    const float_type top = log_weights.maxCoeff();
    if (top == LOG_ZERO) {
        throw ZeroEvidenceProbabilityError(target, "zero-evidence",
            "evidence " + _describe(evidence) + " has zero probability under the network");
    }
    const Row weights = (log_weights.array() - top).exp().matrix();
    return Distribution(tvar, weights / weights.sum());
}

float_type ExactInference::log_evidence_probability(const Evidence &evidence) const {
    const PreparedNetwork &net = *_net;
    float_type total = LOG_ZERO;
    enumerate_states(net, net.resolve(evidence), [&](const State &state) { total = log_add(total, net.log_joint(state)); });
    return total;
}

float_type ExactInference::evidence_probability(const Evidence &evidence) const {
    return std::exp(log_evidence_probability(evidence));
}

} // namespace BN
