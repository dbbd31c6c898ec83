#ifndef BAYESNET_H
#define BAYESNET_H

#include <optional>
#include <string>
#include <vector>

#include <BayesNet/TypeDefs.h>
#include <BayesNet/Errors.h>
#include <BayesNet/Network.h>
#include <BayesNet/CPT.h>
#include <BayesNet/PreparedNetwork.h>
#include <BayesNet/Inference.h>
#include <BayesNet/ExactInference.h>
#include <BayesNet/GibbsSampler.h>
#include <BayesNet/ForwardSampler.h>
#include <BayesNet/Imputer.h>
#include <BayesNet/RNG.h>

namespace BN {

// A `BayesNet` manages a network being built (structure + CPTs), its
// prepared form, and the random source used by the sampling operations.
//
// Conventions:
//  - internal state fields: _field_name
//  - private methods: _method_name()
//  - public methods: method_name()
//
// Any change to the structure or the tables drops the prepared network;
// the next operation that needs it prepares again.
class BayesNet {
    public:
        explicit BayesNet(const unsigned long int seed = 0) : _rng(seed) {}
        BayesNet(const Network &structure, const CPTStore &tables, const unsigned long int seed = 0) :
            _structure(structure), _tables(tables), _rng(seed) {}

        // replaces the current structure; CPTs are kept
        void define_network(const std::vector<Edge> &edges);
        bool add_variable(const std::string &name);
        bool add_edge(const std::string &parent, const std::string &child);

        // @throws UnknownVariableError if `variable` is not in the structure
        void set_cpt(const std::string &variable, const CPT &table);

        const Network & structure() const { return _structure; }
        const CPTStore & tables() const { return _tables; }

        // @return the prepared network, reusing the current one if nothing changed
        // @throws the error class of the most fundamental defect, carrying every defect found
        PreparedPtr prepare(const size_t verbose = 0);
        bool is_prepared() const { return static_cast<bool>(_prepared); }

        // P(target | evidence); for GIBBS, iterations / burn_in default to GibbsOptions'
        Distribution query(
            const std::string &target,
            const Evidence &evidence = {},
            const ALGORITHM algorithm = EXACT,
            const std::optional<size_t> iterations = std::nullopt,
            const std::optional<size_t> burn_in = std::nullopt,
            const size_t verbose = 0
        );
        Distribution query(
            const std::string &target,
            const Evidence &evidence,
            const ALGORITHM algorithm,
            const GibbsOptions &options,
            const size_t verbose = 0
        );

        // one unconditional draw from the joint
        Assignment sample();
        // a stream of `n` draws; the stream is seeded from this object's RNG
        SampleStream sample(const size_t n);

        Assignment impute(
            const PartialAssignment &partial,
            const IMPUTE_MODE mode = SEQUENTIAL,
            const ALGORITHM algorithm = EXACT,
            const GibbsOptions &options = GibbsOptions()
        );

        void seed(const unsigned long int s) { _rng.reseed(s); }
        RNG & rng() { return _rng; }

    private:
        Network _structure;
        CPTStore _tables;
        PreparedPtr _prepared;
        RNG _rng;

        void _invalidate() { _prepared.reset(); }
};

} // namespace BN

#endif // BAYESNET_H
