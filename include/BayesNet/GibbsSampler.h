#ifndef BAYESNET_GIBBS_SAMPLER_H
#define BAYESNET_GIBBS_SAMPLER_H

#include <optional>
#include <string>
#include <vector>

#include <BayesNet/Inference.h>
#include <BayesNet/RNG.h>

namespace BN {

// GibbsSampler: approximates P(target | evidence) with a Markov chain over
// full states.
//
//  - start: evidence fixed; every other variable forward-sampled in
//    topological order given the values already set
//  - one iteration: a sweep over the unobserved variables in topological
//    order, resampling each from P(v | parents) * prod_children P(c | parents(c)),
//    which only depends on v's Markov blanket (and is memoized per blanket state)
//  - after `burn_in` sweeps, every sweep that ends in a state of positive
//    probability counts one for the target's current value
//  - chains are independent, each seeded from the injected RNG; counts are summed
class GibbsSampler : public InferenceAlgorithm {
    public:
        // @throws InvalidArgumentError if options.iterations or options.chains is 0
        GibbsSampler(const PreparedPtr &net, RNG &rng, const GibbsOptions &options = GibbsOptions());

        Distribution answer(const std::string &target, const Evidence &evidence) const override;
        ALGORITHM kind() const override { return GIBBS; }

        const GibbsOptions & options() const { return _options; }

        // blankets with more configurations than this are not memoized
        inline static const size_t MAX_CACHED_CONFIGS = 4096;

    private:
        PreparedPtr _net;
        RNG &_rng;
        const GibbsOptions _options;

        struct _LocalCache {
            std::vector<size_t> strides;   // per blanket member; empty if not memoized
            std::vector<Row> conditionals; // by blanket configuration; empty Row = not yet computed
        };

        std::vector<_LocalCache> _make_caches(const std::vector<std::optional<size_t>> &fixed) const;
        Row _local_conditional(const size_t idx, State &state, _LocalCache &cache) const;
        State _initial_state(const std::vector<std::optional<size_t>> &fixed, RNG &rng) const;

        // @return per value counts of the target over counted sweeps
        Row _run_chain(
            const size_t tidx,
            const std::vector<std::optional<size_t>> &fixed,
            RNG &rng,
            std::vector<_LocalCache> &caches
        ) const;
};

} // namespace BN

#endif // BAYESNET_GIBBS_SAMPLER_H
