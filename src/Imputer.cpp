#include <BayesNet/Imputer.h>
#include <BayesNet/ExactInference.h>

using std::string;
using std::vector;

namespace BN {

Assignment Imputer::impute(const PartialAssignment &partial) const {
    Evidence observed;
    for (const auto &kv : partial) {
        if (kv.second) { observed[kv.first] = *kv.second; }
    }
    // surfaces unknown names / out-of-domain values before any query runs
    _net->resolve(observed);
    for (const auto &kv : partial) {
        if (not _net->contains(kv.first)) {
            throw InvalidEvidenceError(kv.first, "unknown-variable",
                "partial assignment names '" + kv.first + "', which is not a variable of the network");
        }
    }

    switch (_mode) {
        case SEQUENTIAL: return _sequential(observed);
        case JOINT: return _joint(observed);
        default: break;
    }
    throw InvalidArgumentError("unsupported imputation mode: " + std::to_string(static_cast<int>(_mode)));
}

vector<Assignment> Imputer::impute(const vector<PartialAssignment> &rows) const {
    vector<Assignment> result;
    result.reserve(rows.size());
    for (const auto &row : rows) { result.push_back(impute(row)); }
    return result;
}

Assignment Imputer::_sequential(const Evidence &observed) const {
    const PreparedNetwork &net = *_net;
    Assignment full = observed;
    if (full.size() == net.size()) {
        // nothing missing; still reject an impossible row
        const auto fixed = net.resolve(full);
        State state(net.size(), 0);
        for (size_t idx = 0; idx < net.size(); ++idx) { state[idx] = *fixed[idx]; }
        if (net.log_joint(state) == LOG_ZERO) {
            throw ZeroEvidenceProbabilityError("", "zero-evidence", "observed values have zero probability under the network");
        }
        return full;
    }
    for (const auto &name : net.topological_order()) {
        if (full.count(name) == 1) { continue; }
        full[name] = _engine.answer(name, full).argmax();
    }
    return full;
}

Assignment Imputer::_joint(const Evidence &observed) const {
    const PreparedNetwork &net = *_net;
    const auto fixed = net.resolve(observed);

    State best;
    float_type best_lp = LOG_ZERO;
    enumerate_states(net, fixed, [&](const State &state) {
        const float_type lp = net.log_joint(state);
        if (lp > best_lp) { best_lp = lp; best = state; }
    });

    if (best.empty()) {
        throw ZeroEvidenceProbabilityError("", "zero-evidence",
            "observed values have zero probability under the network; nothing to impute from");
    }
    return net.to_assignment(best);
}

} // namespace BN
