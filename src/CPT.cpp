#include <BayesNet/CPT.h>

#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>

using std::string;
using std::vector;
using std::map;
using std::set;
using std::stringstream;

// non-exported helper for messages
static string _join(const vector<string> &items, const string &sep = ", ") {
    string result;
    for (size_t i = 0; i < items.size(); ++i) { result += (i == 0 ? "" : sep) + items[i]; }
    return result;
}

namespace BN {

CPT::CPT(const vector<string> &parents) : _parents(parents) {
    std::set<string> seen;
    for (const auto &p : _parents) {
        if (p.empty()) { throw InvalidCPTError("", "parent-mismatch", "empty parent name in table key"); }
        if (not seen.insert(p).second) {
            throw InvalidCPTError("", "parent-mismatch", "parent '" + p + "' listed twice in table key");
        }
    }
}

CPT CPT::prior(const map<Value, float_type> &probabilities) {
    CPT table;
    table.set_row({}, probabilities);
    return table;
}

CPT & CPT::set(const Value &value, const vector<Value> &given, const float_type p) {
    if (given.size() != _parents.size()) {
        stringstream ss;
        ss << "entry for value '" << value << "' gives " << given.size()
           << " parent values; table is keyed by " << _parents.size() << " parents (" << _join(_parents) << ")";
        throw InvalidCPTError("", "parent-mismatch", ss.str());
    }
    _entries[CPTKey(given, value)] = p;
    return *this;
}

CPT & CPT::set_row(const vector<Value> &given, const map<Value, float_type> &probabilities) {
    for (const auto &kv : probabilities) { set(kv.first, given, kv.second); }
    return *this;
}

std::optional<float_type> CPT::get(const Value &value, const vector<Value> &given) const {
    auto it = _entries.find(CPTKey(given, value));
    if (it == _entries.end()) { return std::nullopt; }
    return it->second;
}

vector<Value> CPT::domain() const {
    std::set<Value> values;
    for (const auto &kv : _entries) { values.insert(kv.first.second); }
    return vector<Value>(values.begin(), values.end());
}

vector<vector<Value>> CPT::rows() const {
    std::set<vector<Value>> given;
    for (const auto &kv : _entries) { given.insert(kv.first.first); }
    return vector<vector<Value>>(given.begin(), given.end());
}

vector<Value> CPT::parent_values(const string &parent) const {
    auto pos = std::find(_parents.begin(), _parents.end(), parent);
    if (pos == _parents.end()) { return {}; }
    const size_t k = pos - _parents.begin();
    std::set<Value> values;
    for (const auto &kv : _entries) { values.insert(kv.first.first[k]); }
    return vector<Value>(values.begin(), values.end());
}

const CPT & CPTStore::get(const string &variable) const {
    auto it = _tables.find(variable);
    if (it == _tables.end()) { throw MissingCPTError(variable, "missing-cpt", "no CPT for variable '" + variable + "'"); }
    return it->second;
}

vector<string> CPTStore::variables() const {
    vector<string> names;
    for (const auto &kv : _tables) { names.push_back(kv.first); }
    return names;
}

vector<Issue> CPTStore::validate(const Network &structure) const {
    vector<Issue> issues;
    for (const auto &name : structure.variables()) {
        if (not has(name)) {
            issues.push_back(Issue{ MISSING_CPT, name, "missing-cpt", "no CPT for variable '" + name + "'" });
        }
    }
    for (const auto &kv : _tables) {
        if (not structure.contains(kv.first)) {
            issues.push_back(Issue{ UNKNOWN_VARIABLE, kv.first, "unknown-variable",
                "CPT given for '" + kv.first + "', which is not a variable of the network" });
        } else {
            _validate_table(kv.first, kv.second, structure, issues);
        }
    }
    return issues;
}

void CPTStore::_validate_table(
    const string &variable,
    const CPT &table,
    const Network &structure,
    vector<Issue> &issues
) const {
    if (table.empty()) {
        issues.push_back(Issue{ INVALID_CPT, variable, "empty-table", "CPT has no entries" });
        return;
    }

    // (a) same parent set as the structure, any order
    const auto &expected = structure.parents_of(variable);
    const set<string> found(table.parents().begin(), table.parents().end());
    if (found != expected) {
        issues.push_back(Issue{ INVALID_CPT, variable, "parent-mismatch",
            "CPT is keyed by {" + _join(vector<string>(found.begin(), found.end())) +
            "} but the structure gives parents {" + _join(vector<string>(expected.begin(), expected.end())) + "}" });
        return; // further checks would only echo the mismatch
    }

    // (b) probabilities in range; each row sums to 1
    map<vector<Value>, float_type> row_sums;
    for (const auto &kv : table.entries()) {
        const float_type p = kv.second;
        if (not std::isfinite(p) or p < 0.0 or p > 1.0) {
            stringstream ss;
            ss << "P(" << variable << "=" << kv.first.second << " | " << _join(kv.first.first) << ") = " << p << " is not a probability";
            issues.push_back(Issue{ INVALID_CPT, variable, "probability-range", ss.str() });
        }
        row_sums[kv.first.first] += p;
    }
    for (const auto &kv : row_sums) {
        if (std::fabs(kv.second - 1.0) > CPT_TOLERANCE) {
            stringstream ss;
            ss << "distribution";
            if (not kv.first.empty()) {
                ss << " given ";
                for (size_t k = 0; k < kv.first.size(); ++k) {
                    ss << (k == 0 ? "" : ", ") << table.parents()[k] << "=" << kv.first[k];
                }
            }
            ss << " sums to " << kv.second << ", not 1";
            issues.push_back(Issue{ INVALID_CPT, variable, "row-sum", ss.str() });
        }
    }

    // (c) parent values are within the parents' domains
    bool domains_known = true, domains_ok = true;
    vector<vector<Value>> parent_domains;
    for (const auto &parent : table.parents()) {
        if (not has(parent)) { domains_known = false; parent_domains.push_back({}); continue; }
        const auto domain = get(parent).domain();
        for (const auto &val : table.parent_values(parent)) {
            if (not std::binary_search(domain.begin(), domain.end(), val)) {
                domains_ok = false;
                issues.push_back(Issue{ INVALID_CPT, variable, "domain-mismatch",
                    "parent '" + parent + "' takes value '" + val + "', which is not in its domain {" + _join(domain) + "}" });
            }
        }
        parent_domains.push_back(domain);
    }

    // (d) every parent combination has a row
    if (domains_known and domains_ok and not parent_domains.empty()) {
        size_t combinations = 1;
        for (const auto &d : parent_domains) { combinations *= d.size(); }
        if (row_sums.size() != combinations) {
            // find one missing combination for the message
            vector<size_t> digits(parent_domains.size(), 0);
            vector<Value> missing;
            for (size_t c = 0; c < combinations; ++c) {
                vector<Value> given;
                for (size_t k = 0; k < digits.size(); ++k) { given.push_back(parent_domains[k][digits[k]]); }
                if (row_sums.count(given) == 0) { missing = given; break; }
                for (size_t k = digits.size(); k-- > 0;) {
                    if (++digits[k] < parent_domains[k].size()) { break; }
                    digits[k] = 0;
                }
            }
            stringstream ss;
            ss << "CPT has " << row_sums.size() << " of " << combinations << " parent combinations";
            if (not missing.empty()) {
                ss << "; missing e.g. ";
                for (size_t k = 0; k < missing.size(); ++k) {
                    ss << (k == 0 ? "" : ", ") << table.parents()[k] << "=" << missing[k];
                }
            }
            issues.push_back(Issue{ INVALID_CPT, variable, "incomplete-table", ss.str() });
        }
    }
}

} // namespace BN
