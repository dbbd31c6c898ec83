#include <BayesNet/Workflow.h>
#include <BayesNet/BNLog.h>

using std::string;
using std::vector;
using std::optional;
using std::endl;

namespace BN {

void Workflow::parse(const string &config_file, const optional<unsigned long int> seed, const size_t verbose) {
    if (verbose > 0) { std::cerr << "Reading configuration " << config_file << endl; }
    parse(JsonConfig(config_file), seed, verbose);
}

void Workflow::parse(const Config &config, const optional<unsigned long int> seed, const size_t verbose) {
    Network structure;
    CPTStore tables;
    config.parse_network(&structure, &tables);

    const auto configured_seed = config.seed();
    _net = BayesNet(structure, tables, seed.value_or(configured_seed.value_or(0)));
    _query = config.parse_query();
    _impute = config.parse_impute();
    _samples = config.samples();

    const auto path = config.database();
    if (path) {
        _db = std::make_unique<BayesDB>(*path);
        _db->setup(verbose);
    } else {
        _db.reset();
    }

    if (verbose > 0) {
        std::cerr << "Network with " << structure.size() << " variables and " << tables.size() << " CPTs";
        if (seed or configured_seed) { std::cerr << "; seed " << seed.value_or(configured_seed.value_or(0)); }
        std::cerr << endl;
    }
}

void Workflow::prepare(const size_t verbose) {
    _net.prepare(verbose);
    if (_db) { _db->save_network(_net.structure(), _net.tables(), verbose); }
}

Distribution Workflow::query(const size_t verbose) {
    if (not _query) { throw ConfigError("", "config", "no `query` configured"); }
    const QueryConfig &q = *_query;

    const Distribution dist = _net.query(q.target, q.evidence, q.algorithm, q.gibbs, verbose);
    if (q.algorithm == GIBBS and verbose > 1) {
        BNLog::report_convergence(_net.query(q.target, q.evidence, EXACT), dist);
    }

    for (size_t i = 0; i < dist.values.size(); ++i) {
        _out << dist.target << '\t' << dist.values[i] << '\t' << dist.probabilities[i] << endl;
    }
    return dist;
}

vector<Assignment> Workflow::sample(const optional<size_t> n, const size_t verbose) {
    const optional<size_t> count = n ? n : _samples;
    if (not count) { throw ConfigError("", "config", "no number of `samples` configured or given"); }

    const auto net = _net.prepare(verbose);
    SampleStream stream = _net.sample(*count);
    const Mat2Dsz states = stream.collect_states();
    if (verbose > 0) { BNLog::report_samples(*net, states); }

    vector<Assignment> draws;
    draws.reserve(states.rows());
    for (size_t i = 0; i < net->size(); ++i) { _out << (i == 0 ? "" : "\t") << net->variable(i).name(); }
    _out << endl;
    for (int r = 0; r < states.rows(); ++r) {
        State state(net->size());
        for (size_t c = 0; c < net->size(); ++c) {
            state[c] = states(r, c);
            _out << (c == 0 ? "" : "\t") << net->variable(c).value(state[c]);
        }
        _out << endl;
        draws.push_back(net->to_assignment(state));
    }

    if (_db) { _db->write_samples(draws, verbose); }
    return draws;
}

vector<Assignment> Workflow::impute(const size_t verbose) {
    if (not _impute or _impute->rows.empty()) { throw ConfigError("", "config", "no `impute` rows configured"); }
    const ImputeConfig &imp = *_impute;

    const auto net = _net.prepare(verbose);
    vector<Assignment> completed;
    for (size_t i = 0; i < net->size(); ++i) { _out << (i == 0 ? "" : "\t") << net->variable(i).name(); }
    _out << endl;
    for (const auto &partial : imp.rows) {
        const Assignment full = _net.impute(partial, imp.mode, imp.algorithm, imp.gibbs);
        if (verbose > 0) { BNLog::report_imputation(partial, full); }
        for (size_t i = 0; i < net->size(); ++i) { _out << (i == 0 ? "" : "\t") << full.at(net->variable(i).name()); }
        _out << endl;
        completed.push_back(full);
    }
    return completed;
}

} // namespace BN
