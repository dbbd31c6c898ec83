#ifndef BAYESNET_RNG_H
#define BAYESNET_RNG_H

#include <memory>
#include <gsl/gsl_rng.h>

#include <BayesNet/TypeDefs.h>

namespace BN {

// RNG: the explicit, seedable random source for every sampling operation.
// Must be passed around by reference; there is no process-wide generator.
//
// Wraps a GSL taus2 generator. Independent streams (e.g. one per Gibbs
// chain) are made by constructing a new RNG from `next_seed()`, which
// advances this generator.
class RNG {
    public:
        explicit RNG(const unsigned long int seed = 0);
        RNG(const RNG &) = delete;
        RNG & operator=(const RNG &) = delete;
        RNG(RNG &&) = default;
        RNG & operator=(RNG &&) = default;

        void reseed(const unsigned long int seed);
        unsigned long int seed() const { return _seed; }

        // uniform on [0, 1)
        float_type uniform() { return gsl_rng_uniform(_rng.get()); }
        // uniform on {0, ..., n-1}; n > 0
        size_t uniform_int(const size_t n);
        unsigned long int next_seed() { return gsl_rng_get(_rng.get()); }

        // draws an index with probability proportional to `weights`;
        // weights must be non-negative with a positive sum
        // @throws InvalidArgumentError otherwise
        size_t discrete(const Row &weights);

        const gsl_rng * rng() const { return _rng.get(); }

    private:
        struct _Free { void operator()(gsl_rng *r) const { gsl_rng_free(r); } };
        std::unique_ptr<gsl_rng, _Free> _rng;
        unsigned long int _seed;
};

} // namespace BN

#endif // BAYESNET_RNG_H
