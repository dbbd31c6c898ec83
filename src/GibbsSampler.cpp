#include <BayesNet/GibbsSampler.h>

#include <cmath>

using std::string;
using std::vector;
using std::optional;

namespace BN {

GibbsSampler::GibbsSampler(const PreparedPtr &net, RNG &rng, const GibbsOptions &options) :
    _net(net), _rng(rng), _options(options) {
    if (_options.iterations == 0) { throw InvalidArgumentError("", "iterations", "Gibbs sampling needs a positive number of iterations"); }
    if (_options.chains == 0) { throw InvalidArgumentError("", "chains", "Gibbs sampling needs at least one chain"); }
}

vector<GibbsSampler::_LocalCache> GibbsSampler::_make_caches(const vector<optional<size_t>> &fixed) const {
    const PreparedNetwork &net = *_net;
    vector<_LocalCache> caches(net.size());
    for (size_t idx = 0; idx < net.size(); ++idx) {
        if (fixed[idx]) { continue; }
        const auto &blanket = net.markov_blanket(idx);
        size_t configs = 1;
        vector<size_t> strides(blanket.size());
        bool small = true;
        for (size_t k = blanket.size(); k-- > 0;) {
            strides[k] = configs;
            configs *= net.variable(blanket[k]).size();
            if (configs > MAX_CACHED_CONFIGS) { small = false; break; }
        }
        if (small) {
            caches[idx].strides = strides;
            caches[idx].conditionals.resize(configs);
        }
    }
    return caches;
}

Row GibbsSampler::_local_conditional(const size_t idx, State &state, _LocalCache &cache) const {
    const PreparedNetwork &net = *_net;

    size_t config = 0;
    const bool memoized = not cache.conditionals.empty();
    if (memoized) {
        const auto &blanket = net.markov_blanket(idx);
        for (size_t k = 0; k < blanket.size(); ++k) { config += state[blanket[k]] * cache.strides[k]; }
        if (cache.conditionals[config].size() > 0) { return cache.conditionals[config]; }
    }

    // log space, shifted so the largest weight is 1
    const size_t current = state[idx];
    const Row prior = net.conditional(idx, state);
    Row log_weights = Row::Constant(prior.size(), LOG_ZERO);
    for (size_t val = 0; val < net.variable(idx).size(); ++val) {
        if (prior[val] == 0.0) { continue; }
        state[idx] = val;
        float_type lp = std::log(prior[val]);
        for (auto child : net.children(idx)) { lp += std::log(net.probability(child, state)); }
        log_weights[val] = lp;
    }
    state[idx] = current;

    const float_type top = log_weights.maxCoeff();
    const Row weights = top == LOG_ZERO ? Row(Row::Zero(prior.size())) : Row((log_weights.array() - top).exp().matrix());

    if (memoized) { cache.conditionals[config] = weights; }
    return weights;
}

State GibbsSampler::_initial_state(const vector<optional<size_t>> &fixed, RNG &rng) const {
    const PreparedNetwork &net = *_net;
    State state(net.size(), 0);
    for (size_t idx = 0; idx < net.size(); ++idx) {
        if (fixed[idx]) { state[idx] = *fixed[idx]; continue; }
        const Row row = net.conditional(idx, state); // parents precede idx
        state[idx] = row.sum() > 0.0 ? rng.discrete(row) : rng.uniform_int(net.variable(idx).size());
    }
    return state;
}

Row GibbsSampler::_run_chain(
    const size_t tidx,
    const vector<optional<size_t>> &fixed,
    RNG &rng,
    vector<_LocalCache> &caches
) const {
    const PreparedNetwork &net = *_net;
    vector<size_t> free;
    for (size_t idx = 0; idx < net.size(); ++idx) { if (not fixed[idx]) { free.push_back(idx); } }

    State state = _initial_state(fixed, rng);
    Row counts = Row::Zero(net.variable(tidx).size());
    const size_t sweeps = _options.burn_in + _options.iterations;
    for (size_t sweep = 0; sweep < sweeps; ++sweep) {
        for (auto idx : free) {
            const Row weights = _local_conditional(idx, state, caches[idx]);
            // a zero-mass conditional only arises in a zero-probability state; a uniform draw lets the chain leave it
            state[idx] = weights.sum() > 0.0 ? rng.discrete(weights) : rng.uniform_int(weights.size());
        }
        if (sweep >= _options.burn_in and net.log_joint(state) > LOG_ZERO) {
            counts[state[tidx]] += 1.0;
        }
    }
    return counts;
}

Distribution GibbsSampler::answer(const string &target, const Evidence &evidence) const {
    const PreparedNetwork &net = *_net;
    const size_t tidx = net.index_of(target);
    const auto fixed = net.resolve(evidence);

    auto caches = _make_caches(fixed);
    Row counts = Row::Zero(net.variable(tidx).size());
    for (size_t chain = 0; chain < _options.chains; ++chain) {
        RNG chain_rng(_rng.next_seed());
        counts += _run_chain(tidx, fixed, chain_rng, caches);
    }

    const float_type total = counts.sum();
    if (total == 0.0) {
        throw ZeroEvidenceProbabilityError(target, "zero-evidence",
            "no Gibbs state of positive probability was reached; the evidence appears to be impossible");
    }
    return Distribution(net.variable(tidx), counts / total, static_cast<size_t>(total));
}

} // namespace BN
