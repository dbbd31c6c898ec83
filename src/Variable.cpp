#include <BayesNet/Variable.h>

#include <algorithm>

using std::string;
using std::vector;

namespace BN {

Variable::Variable(const string &name, const vector<Value> &values) : _name(name), _domain(values) {
    std::sort(_domain.begin(), _domain.end());
    _domain.erase(std::unique(_domain.begin(), _domain.end()), _domain.end());
}

std::optional<size_t> Variable::index_of(const Value &val) const {
    // domains are sorted; binary search
    auto it = std::lower_bound(_domain.begin(), _domain.end(), val);
    if (it == _domain.end() or *it != val) { return std::nullopt; }
    return static_cast<size_t>(it - _domain.begin());
}

} // namespace BN
