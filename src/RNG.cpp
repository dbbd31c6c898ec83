#include <BayesNet/RNG.h>
#include <BayesNet/Errors.h>

#include <cmath>

namespace BN {

RNG::RNG(const unsigned long int seed) : _rng(gsl_rng_alloc(gsl_rng_taus2)), _seed(seed) {
    if (not _rng) { throw InvalidArgumentError("failed to allocate GSL random number generator"); }
    gsl_rng_set(_rng.get(), seed);
}

void RNG::reseed(const unsigned long int seed) {
    _seed = seed;
    gsl_rng_set(_rng.get(), seed);
}

size_t RNG::uniform_int(const size_t n) {
    if (n == 0) { throw InvalidArgumentError("uniform_int needs a positive range"); }
    return static_cast<size_t>(gsl_rng_uniform_int(_rng.get(), n));
}

size_t RNG::discrete(const Row &weights) {
    const float_type total = weights.sum();
    if (weights.size() == 0 or not std::isfinite(total) or total <= 0.0 or weights.minCoeff() < 0.0) {
        throw InvalidArgumentError("discrete draw needs non-negative weights with a positive sum");
    }
    // inverse CDF; the last positive weight absorbs rounding at the top end
    const float_type u = uniform() * total;
    float_type cumulative = 0.0;
    size_t last_positive = 0;
    for (Eigen::Index i = 0; i < weights.size(); ++i) {
        if (weights[i] <= 0.0) { continue; }
        cumulative += weights[i];
        last_positive = static_cast<size_t>(i);
        if (u < cumulative) { return last_positive; }
    }
    return last_positive;
}

} // namespace BN
