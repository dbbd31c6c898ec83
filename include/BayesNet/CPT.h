#ifndef BAYESNET_CPT_H
#define BAYESNET_CPT_H

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <BayesNet/TypeDefs.h>
#include <BayesNet/Errors.h>
#include <BayesNet/Network.h>

namespace BN {

// (tuple of parent values, in the table's own parent order; value of the variable)
typedef std::pair<std::vector<Value>, Value> CPTKey;

// A conditional probability table as supplied by the caller: P(value | given),
// where `given` lists parent values in the order of `parents()`. The parent
// order here is only the table's key order; preparation re-keys the table in
// the structure's order. Nothing in here is normalized or completed.
class CPT {
    public:
        // unconditional distribution (no parents)
        CPT() = default;
        // @throws InvalidCPTError on duplicate or empty parent names
        CPT(const std::vector<std::string> &parents);

        static CPT prior(const std::map<Value, float_type> &probabilities);

        // set P(value | parents = given); overwrites an existing entry
        // @throws InvalidCPTError if given.size() != parents().size()
        CPT & set(const Value &value, const std::vector<Value> &given, const float_type p);
        // shorthand for tables without parents
        CPT & set(const Value &value, const float_type p) { return set(value, {}, p); }
        // set a full row: P(. | parents = given)
        CPT & set_row(const std::vector<Value> &given, const std::map<Value, float_type> &probabilities);

        const std::vector<std::string> & parents() const { return _parents; }
        const std::map<CPTKey, float_type> & entries() const { return _entries; }
        bool empty() const { return _entries.empty(); }

        std::optional<float_type> get(const Value &value, const std::vector<Value> &given = {}) const;

        // the sorted distinct values of the variable itself
        std::vector<Value> domain() const;
        // the distinct `given` tuples, sorted
        std::vector<std::vector<Value>> rows() const;
        // the sorted distinct values used for `parent` in this table
        std::vector<Value> parent_values(const std::string &parent) const;

        bool operator==(const CPT &other) const {
            return (_parents == other._parents) and (_entries == other._entries);
        }

    private:
        std::vector<std::string> _parents;
        std::map<CPTKey, float_type> _entries;
};

// Holds the CPTs of a network, by variable name, and validates them against a structure.
class CPTStore {
    public:
        void set_cpt(const std::string &variable, const CPT &table) { _tables[variable] = table; }
        bool has(const std::string &variable) const { return _tables.count(variable) == 1; }
        // @throws MissingCPTError
        const CPT & get(const std::string &variable) const;
        bool erase(const std::string &variable) { return _tables.erase(variable) == 1; }

        std::vector<std::string> variables() const;
        size_t size() const { return _tables.size(); }

        // Checks every table against `structure`, per variable:
        //  - a table exists (MISSING_CPT), and belongs to a known variable (UNKNOWN_VARIABLE)
        //  - its parents match the structure's parents, in any order
        //  - every probability is in [0, 1] and every row sums to 1
        //  - every parent value it uses is in that parent's domain
        //  - every combination of parent values has a row
        // @return every issue found; empty if the tables are valid
        std::vector<Issue> validate(const Network &structure) const;

        bool operator==(const CPTStore &other) const { return _tables == other._tables; }

    private:
        std::map<std::string, CPT> _tables;

        void _validate_table(
            const std::string &variable,
            const CPT &table,
            const Network &structure,
            std::vector<Issue> &issues
        ) const;
};

} // namespace BN

#endif // BAYESNET_CPT_H
