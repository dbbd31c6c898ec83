#include <BayesNet/PreparedNetwork.h>
#include <BayesNet/BNLog.h>

#include <algorithm>
#include <cmath>
#include <set>

using std::string;
using std::vector;
using std::set;

namespace BN {

size_t PreparedNetwork::index_of(const string &name) const {
    auto it = _index.find(name);
    if (it == _index.end()) { throw UnknownVariableError(name, "unknown-variable", "no variable named '" + name + "'"); }
    return it->second;
}

vector<string> PreparedNetwork::topological_order() const {
    vector<string> names;
    for (const auto &v : _variables) { names.push_back(v.name()); }
    return names;
}

vector<string> PreparedNetwork::markov_blanket(const string &name) const {
    vector<string> names;
    for (auto idx : _blankets[index_of(name)]) { names.push_back(_variables[idx].name()); }
    return names;
}

float_type PreparedNetwork::joint(const State &state) const {
    float_type p = 1.0;
    for (size_t idx = 0; idx < size(); ++idx) {
        p *= probability(idx, state);
        if (p == 0.0) { break; }
    }
    return p;
}

float_type PreparedNetwork::log_joint(const State &state) const {
    float_type lp = 0.0;
    for (size_t idx = 0; idx < size(); ++idx) {
        const float_type p = probability(idx, state);
        if (p == 0.0) { return LOG_ZERO; }
        lp += std::log(p);
    }
    return lp;
}

vector<std::optional<size_t>> PreparedNetwork::resolve(const Evidence &evidence) const {
    vector<std::optional<size_t>> fixed(size());
    vector<Issue> issues;
    for (const auto &kv : evidence) {
        auto it = _index.find(kv.first);
        if (it == _index.end()) {
            issues.push_back(Issue{ INVALID_EVIDENCE, kv.first, "unknown-variable",
                "evidence names '" + kv.first + "', which is not a variable of the network" });
            continue;
        }
        const Variable &var = _variables[it->second];
        const auto val = var.index_of(kv.second);
        if (not val) {
            issues.push_back(Issue{ INVALID_EVIDENCE, kv.first, "out-of-domain",
                "evidence value '" + kv.second + "' is not in the domain of '" + kv.first + "'" });
            continue;
        }
        fixed[it->second] = *val;
    }
    throw_issues(issues);
    return fixed;
}

Assignment PreparedNetwork::to_assignment(const State &state) const {
    Assignment assignment;
    for (size_t idx = 0; idx < size(); ++idx) { assignment[_variables[idx].name()] = _variables[idx].value(state[idx]); }
    return assignment;
}

PreparedPtr prepare(const Network &structure, const CPTStore &tables, const size_t verbose) {
    vector<Issue> issues;

    const auto cycle = structure.find_cycle();
    if (not cycle.empty()) {
        string path;
        for (const auto &v : cycle) { path += (path.empty() ? "" : " -> ") + v; }
        issues.push_back(Issue{ CYCLIC_GRAPH, cycle.front(), "cycle", "graph contains a cycle: " + path });
    }

    const auto table_issues = tables.validate(structure);
    issues.insert(issues.end(), table_issues.begin(), table_issues.end());

    if (not issues.empty()) {
        if (verbose > 0) { BNLog::report_issues(issues); }
        throw_issues(issues);
    }

    std::shared_ptr<PreparedNetwork> net(new PreparedNetwork());
    net->_structure = structure;
    net->_tables = tables;

    // domains and order
    for (const auto &name : structure.topological_order()) {
        net->_index[name] = net->_variables.size();
        net->_variables.emplace_back(name, tables.get(name).domain());
    }

    // compile the tables, re-keyed in the structure's parent order
    const size_t n = net->_variables.size();
    net->_cpts.resize(n);
    net->_children.resize(n);
    for (size_t idx = 0; idx < n; ++idx) {
        const Variable &var = net->_variables[idx];
        const CPT &table = tables.get(var.name());
        CompiledCPT &compiled = net->_cpts[idx];

        const auto &parent_names = structure.parents_of(var.name()); // sorted
        vector<size_t> key_position; // where each structure parent sits in the table's key
        for (const auto &pname : parent_names) {
            compiled.parents.push_back(net->_index.at(pname));
            key_position.push_back(std::find(table.parents().begin(), table.parents().end(), pname) - table.parents().begin());
        }

        size_t rows = 1;
        compiled.strides.resize(compiled.parents.size());
        for (size_t k = compiled.parents.size(); k-- > 0;) {
            compiled.strides[k] = rows;
            rows *= net->_variables[compiled.parents[k]].size();
        }

        compiled.table = Mat2D::Zero(rows, var.size());
        for (const auto &entry : table.entries()) {
            const auto &given = entry.first.first;
            size_t row = 0;
            for (size_t k = 0; k < compiled.parents.size(); ++k) {
                row += net->_variables[compiled.parents[k]].index_of(given[key_position[k]]).value() * compiled.strides[k];
            }
            compiled.table(row, var.index_of(entry.first.second).value()) = entry.second;
        }

        for (auto p : compiled.parents) { net->_children[p].push_back(idx); }
    }

    // Markov blankets: parents, children, children's other parents
    net->_blankets.resize(n);
    for (size_t idx = 0; idx < n; ++idx) {
        set<size_t> blanket(net->_cpts[idx].parents.begin(), net->_cpts[idx].parents.end());
        for (auto child : net->_children[idx]) {
            blanket.insert(child);
            blanket.insert(net->_cpts[child].parents.begin(), net->_cpts[child].parents.end());
        }
        blanket.erase(idx);
        net->_blankets[idx].assign(blanket.begin(), blanket.end());
        std::sort(net->_children[idx].begin(), net->_children[idx].end());
    }

    if (verbose > 0) { BNLog::report_network(*net); }
    return net;
}

} // namespace BN
