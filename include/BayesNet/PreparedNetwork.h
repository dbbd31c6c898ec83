#ifndef BAYESNET_PREPARED_NETWORK_H
#define BAYESNET_PREPARED_NETWORK_H

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <BayesNet/TypeDefs.h>
#include <BayesNet/Variable.h>
#include <BayesNet/Network.h>
#include <BayesNet/CPT.h>

namespace BN {

// A CPT re-keyed by the structure: one row per parent configuration, one
// column per value of the variable. The configuration of a state is the
// mixed-radix number formed by the parents' value indices, parents taken in
// the structure's (sorted) order, last parent varying fastest.
struct CompiledCPT {
    std::vector<size_t> parents; // variable indices into the prepared order
    std::vector<size_t> strides; // one per parent
    Mat2D table;                 // rows = parent configurations, cols = domain values

    size_t row(const State &state) const {
        size_t r = 0;
        for (size_t k = 0; k < parents.size(); ++k) { r += state[parents[k]] * strides[k]; }
        return r;
    }
};

// PreparedNetwork: the immutable, query-ready form of a Bayesian network.
//
// Variables are indexed 0..size()-1 in topological order, so every parent
// index is smaller than its children's. Created only by `prepare`; shared
// read-only (as a PreparedPtr) by all inference operations.
class PreparedNetwork {
    public:
        size_t size() const { return _variables.size(); }

        const std::vector<Variable> & variables() const { return _variables; }
        const Variable & variable(const size_t idx) const { return _variables.at(idx); }
        // @throws UnknownVariableError
        size_t index_of(const std::string &name) const;
        bool contains(const std::string &name) const { return _index.count(name) == 1; }

        std::vector<std::string> topological_order() const;

        const std::vector<size_t> & parents(const size_t idx) const { return _cpts.at(idx).parents; }
        const std::vector<size_t> & children(const size_t idx) const { return _children.at(idx); }
        // parents, children and children's other parents; sorted by index
        const std::vector<size_t> & markov_blanket(const size_t idx) const { return _blankets.at(idx); }
        std::vector<std::string> markov_blanket(const std::string &name) const;

        const CompiledCPT & cpt(const size_t idx) const { return _cpts.at(idx); }

        // P(variable idx = state[idx] | its parents' values in state)
        float_type probability(const size_t idx, const State &state) const {
            const CompiledCPT &c = _cpts[idx];
            return c.table(c.row(state), state[idx]);
        }
        // the CPT row selected by the parents' values in state
        Row conditional(const size_t idx, const State &state) const {
            const CompiledCPT &c = _cpts[idx];
            return c.table.row(c.row(state));
        }
        // product of all CPT entries for a full state; 0 as soon as any factor is 0
        float_type joint(const State &state) const;
        // sum of the logs of all CPT entries; LOG_ZERO as soon as any factor is 0.
        // Stays finite where `joint` underflows.
        float_type log_joint(const State &state) const;

        // Maps evidence onto the prepared order: one entry per variable,
        // holding the observed value index, or nullopt if unobserved.
        // @throws InvalidEvidenceError for unknown variables or out-of-domain values
        std::vector<std::optional<size_t>> resolve(const Evidence &evidence) const;

        Assignment to_assignment(const State &state) const;

        // the structure and tables this network was prepared from
        const Network & structure() const { return _structure; }
        const CPTStore & tables() const { return _tables; }

    private:
        friend std::shared_ptr<const PreparedNetwork> prepare(const Network &, const CPTStore &, const size_t);
        PreparedNetwork() = default;

        Network _structure;
        CPTStore _tables;
        std::vector<Variable> _variables;
        std::map<std::string, size_t> _index;
        std::vector<CompiledCPT> _cpts;
        std::vector<std::vector<size_t>> _children;
        std::vector<std::vector<size_t>> _blankets;
};

typedef std::shared_ptr<const PreparedNetwork> PreparedPtr;

// Compiles a structure and its CPTs into a PreparedNetwork:
// acyclicity check => CPT validation => domain inference =>
// topological order => CPT compilation => Markov blankets.
//
// Every defect found is collected before failing; the exception thrown is
// the class of the most fundamental defect (see ISSUE) and carries them all.
// @param verbose: if > 0, report the prepared network (or the defects) to std::cerr
PreparedPtr prepare(const Network &structure, const CPTStore &tables, const size_t verbose = 0);

} // namespace BN

#endif // BAYESNET_PREPARED_NETWORK_H
