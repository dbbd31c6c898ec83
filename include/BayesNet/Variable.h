#ifndef BAYESNET_VARIABLE_H
#define BAYESNET_VARIABLE_H

#include <optional>
#include <string>
#include <vector>

#include <BayesNet/TypeDefs.h>

namespace BN {

// A discrete random variable: a unique name and a finite, ordered domain.
// The domain is discovered from the variable's CPT during preparation and
// is immutable afterwards; values are kept lexically sorted, so index 0 is
// the "first" domain value wherever a tie-break needs one.
class Variable {
    public:
        Variable(const std::string &name, const std::vector<Value> &values);

        const std::string & name() const { return _name; }
        const std::vector<Value> & domain() const { return _domain; }
        size_t size() const { return _domain.size(); }

        const Value & value(const size_t idx) const { return _domain.at(idx); }
        std::optional<size_t> index_of(const Value &val) const;
        bool contains(const Value &val) const { return index_of(val).has_value(); }

        bool operator==(const Variable &other) const {
            return (_name == other._name) and (_domain == other._domain);
        }

    private:
        std::string _name;
        std::vector<Value> _domain;
};

} // namespace BN

#endif // BAYESNET_VARIABLE_H
