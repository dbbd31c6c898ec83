#include <BayesNet/Network.h>

#include <algorithm>
#include <functional>

using std::string;
using std::vector;
using std::set;
using std::map;

namespace BN {

Network::Network(const vector<Edge> &edges) {
    for (const auto &edge : edges) { add_edge(edge.first, edge.second); }
}

Network define_network(const vector<Edge> &edges) { return Network(edges); }

bool Network::add_variable(const string &name) {
    if (name.empty()) { throw InvalidArgumentError("variable names must be non-empty"); }
    if (contains(name)) { return false; }
    _parents[name];
    _children[name];
    return true;
}

bool Network::has_edge(const string &parent, const string &child) const {
    auto it = _children.find(parent);
    return (it != _children.end()) and (it->second.count(child) == 1);
}

// depth first search along child links
bool Network::_reaches(const string &from, const string &to) const {
    set<string> visited;
    vector<string> frontier = { from };
    while (not frontier.empty()) {
        const string current = frontier.back();
        frontier.pop_back();
        if (current == to) { return true; }
        if (not visited.insert(current).second) { continue; }
        auto it = _children.find(current);
        if (it == _children.end()) { continue; }
        for (const auto &child : it->second) { frontier.push_back(child); }
    }
    return false;
}

bool Network::add_edge(const string &parent, const string &child) {
    if (parent == child) {
        throw CyclicGraphError(child, "self-loop", "edge " + parent + " -> " + child + " is a self-loop");
    }
    add_variable(parent);
    add_variable(child);
    if (has_edge(parent, child)) { return false; }
    if (_reaches(child, parent)) {
        throw CyclicGraphError(child, "cycle", "edge " + parent + " -> " + child + " would create a cycle");
    }
    _children[parent].insert(child);
    _parents[child].insert(parent);
    return true;
}

const set<string> & Network::parents_of(const string &name) const {
    auto it = _parents.find(name);
    if (it == _parents.end()) { throw UnknownVariableError(name, "unknown-variable", "no variable named '" + name + "'"); }
    return it->second;
}

const set<string> & Network::children_of(const string &name) const {
    auto it = _children.find(name);
    if (it == _children.end()) { throw UnknownVariableError(name, "unknown-variable", "no variable named '" + name + "'"); }
    return it->second;
}

vector<string> Network::variables() const {
    vector<string> names;
    for (const auto &kv : _parents) { names.push_back(kv.first); }
    return names;
}

vector<Edge> Network::edges() const {
    vector<Edge> result;
    for (const auto &kv : _children) {
        for (const auto &child : kv.second) { result.emplace_back(kv.first, child); }
    }
    return result;
}

vector<string> Network::topological_order() const {
    map<string, size_t> pending;
    set<string> ready;
    for (const auto &kv : _parents) {
        pending[kv.first] = kv.second.size();
        if (kv.second.empty()) { ready.insert(kv.first); }
    }

    vector<string> order;
    while (not ready.empty()) {
        const string next = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(next);
        for (const auto &child : _children.at(next)) {
            if (--pending[child] == 0) { ready.insert(child); }
        }
    }

    if (order.size() != _parents.size()) {
        const auto cycle = find_cycle();
        string path;
        for (const auto &v : cycle) { path += (path.empty() ? "" : " -> ") + v; }
        throw CyclicGraphError(cycle.empty() ? "" : cycle.front(), "cycle", "graph contains a cycle: " + path);
    }
    return order;
}

vector<string> Network::find_cycle() const {
    enum MARK { UNSEEN, ACTIVE, DONE };
    map<string, MARK> marks;
    for (const auto &kv : _parents) { marks[kv.first] = UNSEEN; }
    vector<string> stack;
    vector<string> cycle;

    std::function<bool(const string &)> visit = [&](const string &v) {
        marks[v] = ACTIVE;
        stack.push_back(v);
        for (const auto &child : _children.at(v)) {
            if (marks[child] == ACTIVE) {
                auto start = std::find(stack.begin(), stack.end(), child);
                cycle.assign(start, stack.end());
                cycle.push_back(child);
                return true;
            }
            if (marks[child] == UNSEEN and visit(child)) { return true; }
        }
        stack.pop_back();
        marks[v] = DONE;
        return false;
    };

    for (const auto &kv : _parents) {
        if (marks[kv.first] == UNSEEN and visit(kv.first)) { break; }
    }
    return cycle;
}

} // namespace BN
