#include <BayesNet/BayesNet.h>
#include <BayesNet/BNLog.h>

#include <iostream>

using std::string;
using std::vector;
using std::optional;

namespace BN {

void BayesNet::define_network(const vector<Edge> &edges) {
    Network structure(edges); // throws before anything is replaced
    _structure = structure;
    _invalidate();
}

bool BayesNet::add_variable(const string &name) {
    const bool added = _structure.add_variable(name);
    if (added) { _invalidate(); }
    return added;
}

bool BayesNet::add_edge(const string &parent, const string &child) {
    const bool added = _structure.add_edge(parent, child);
    if (added) { _invalidate(); }
    return added;
}

void BayesNet::set_cpt(const string &variable, const CPT &table) {
    if (not _structure.contains(variable)) {
        throw UnknownVariableError(variable, "unknown-variable", "cannot set a CPT for unknown variable '" + variable + "'");
    }
    _tables.set_cpt(variable, table);
    _invalidate();
}

PreparedPtr BayesNet::prepare(const size_t verbose) {
    if (not _prepared) { _prepared = BN::prepare(_structure, _tables, verbose); }
    return _prepared;
}

Distribution BayesNet::query(
    const string &target,
    const Evidence &evidence,
    const ALGORITHM algorithm,
    const optional<size_t> iterations,
    const optional<size_t> burn_in,
    const size_t verbose
) {
    GibbsOptions options;
    if (iterations) { options.iterations = *iterations; }
    if (burn_in) { options.burn_in = *burn_in; }
    return query(target, evidence, algorithm, options, verbose);
}

Distribution BayesNet::query(
    const string &target,
    const Evidence &evidence,
    const ALGORITHM algorithm,
    const GibbsOptions &options,
    const size_t verbose
) {
    const auto net = prepare(verbose);
    const auto engine = make_engine(algorithm, net, _rng, options);
    const Distribution dist = engine->answer(target, evidence);
    if (verbose > 0) { BNLog::report_distribution(dist, evidence, algorithm); }
    return dist;
}

Assignment BayesNet::sample() {
    return draw(*prepare(), _rng);
}

SampleStream BayesNet::sample(const size_t n) {
    return SampleStream(prepare(), n, _rng.next_seed());
}

Assignment BayesNet::impute(
    const PartialAssignment &partial,
    const IMPUTE_MODE mode,
    const ALGORITHM algorithm,
    const GibbsOptions &options
) {
    const auto net = prepare();
    const auto engine = make_engine(algorithm, net, _rng, options);
    return Imputer(net, *engine, mode).impute(partial);
}

} // namespace BN
