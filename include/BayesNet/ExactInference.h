#ifndef BAYESNET_EXACT_INFERENCE_H
#define BAYESNET_EXACT_INFERENCE_H

#include <optional>
#include <string>
#include <vector>

#include <BayesNet/Inference.h>

namespace BN {

// Calls visit(state) for every full state that agrees with `fixed`
// (one entry per variable: a value index, or nullopt if free). Free
// variables are enumerated odometer style, the last in topological order
// turning fastest. The state passed to `visit` is reused between calls.
template <typename Visitor>
void enumerate_states(
    const PreparedNetwork &net,
    const std::vector<std::optional<size_t>> &fixed,
    Visitor &&visit
) {
    State state(net.size(), 0);
    std::vector<size_t> free;
    for (size_t idx = 0; idx < net.size(); ++idx) {
        if (fixed[idx]) { state[idx] = *fixed[idx]; } else { free.push_back(idx); }
    }
    while (true) {
        visit(static_cast<const State &>(state));
        size_t k = free.size();
        while (k > 0) {
            const size_t idx = free[k - 1];
            if (++state[idx] < net.variable(idx).size()) { break; }
            state[idx] = 0;
            --k;
        }
        if (k == 0) { return; }
    }
}

// ExactInference: answers queries by enumerating the full joint over every
// variable not fixed by evidence. Cost is exponential in the number of free
// variables; use GibbsSampler for networks where that is out of reach.
class ExactInference : public InferenceAlgorithm {
    public:
        ExactInference(const PreparedPtr &net) : _net(net) {}

        Distribution answer(const std::string &target, const Evidence &evidence) const override;
        ALGORITHM kind() const override { return EXACT; }

        // P(evidence), the normalizing constant of `answer`
        float_type evidence_probability(const Evidence &evidence) const;
        // log P(evidence); LOG_ZERO for impossible evidence
        float_type log_evidence_probability(const Evidence &evidence) const;

    private:
        PreparedPtr _net;
};

} // namespace BN

#endif // BAYESNET_EXACT_INFERENCE_H
