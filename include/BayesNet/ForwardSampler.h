#ifndef BAYESNET_FORWARD_SAMPLER_H
#define BAYESNET_FORWARD_SAMPLER_H

#include <vector>

#include <BayesNet/TypeDefs.h>
#include <BayesNet/PreparedNetwork.h>
#include <BayesNet/RNG.h>

namespace BN {

// One ancestral draw from the full joint: variables in topological order,
// each from the CPT row selected by its already drawn parents.
State draw_state(const PreparedNetwork &net, RNG &rng);
Assignment draw(const PreparedNetwork &net, RNG &rng);

// SampleStream: a lazy, finite stream of `n` independent full assignments.
//
// Draws happen on `next()`; the stream owns its random source, so it is not
// restartable except through `reseed`, which also resets it to `n` draws.
class SampleStream {
    public:
        SampleStream(const PreparedPtr &net, const size_t n, const unsigned long int seed);

        size_t size() const { return _n; }
        size_t remaining() const { return _n - _drawn; }
        bool done() const { return _drawn == _n; }

        // @throws InvalidArgumentError once the stream is exhausted
        State next_state();
        Assignment next();

        // draws everything that remains
        std::vector<Assignment> collect();
        // draws everything that remains; row = draw, col = variable (prepared order), entry = value index
        Mat2Dsz collect_states();

        void reseed(const unsigned long int seed);

    private:
        PreparedPtr _net;
        size_t _n;
        size_t _drawn = 0;
        RNG _rng;
};

} // namespace BN

#endif // BAYESNET_FORWARD_SAMPLER_H
