#ifndef BAYESNET_NETWORK_H
#define BAYESNET_NETWORK_H

#include <map>
#include <set>
#include <string>
#include <vector>

#include <BayesNet/TypeDefs.h>
#include <BayesNet/Errors.h>

namespace BN {

// Network: the DAG part of a Bayesian network.
//
// Conventions:
//  - variables are identified by name; parent / child sets are sorted by name
//  - adding an edge registers any unknown endpoint as a variable
//  - the structure is acyclic at all times: `add_edge` rejects an edge that
//    would close a cycle, and `find_cycle` re-checks for preparation
class Network {
    public:
        Network() = default;
        Network(const std::vector<Edge> &edges);

        // @return true if the variable was not known before
        bool add_variable(const std::string &name);

        // @throws CyclicGraphError if the edge would create a cycle (including parent == child)
        // @return true if the edge is new
        bool add_edge(const std::string &parent, const std::string &child);

        bool contains(const std::string &name) const { return _parents.count(name) == 1; }
        bool has_edge(const std::string &parent, const std::string &child) const;

        // @throws UnknownVariableError
        const std::set<std::string> & parents_of(const std::string &name) const;
        const std::set<std::string> & children_of(const std::string &name) const;

        std::vector<std::string> variables() const;
        std::vector<Edge> edges() const;
        size_t size() const { return _parents.size(); }

        // Kahn's algorithm; among variables whose parents have all been
        // placed, the lexically smallest goes next.
        // @throws CyclicGraphError
        std::vector<std::string> topological_order() const;

        // @return the variables along one directed cycle (first == last), or empty if acyclic
        std::vector<std::string> find_cycle() const;

    private:
        std::map<std::string, std::set<std::string>> _parents;
        std::map<std::string, std::set<std::string>> _children;

        bool _reaches(const std::string &from, const std::string &to) const;
};

// convenience: build a structure from a sequence of (parent, child) edges
Network define_network(const std::vector<Edge> &edges);

} // namespace BN

#endif // BAYESNET_NETWORK_H
