#include <BayesNet/BNLog.h>

#include <iomanip>

using std::string;
using std::vector;
using std::setw;
using std::endl;

namespace BN {

string BNLog::_describe(const Evidence &evidence) {
    string desc;
    for (const auto &kv : evidence) { desc += (desc.empty() ? "" : ", ") + kv.first + "=" + kv.second; }
    return desc;
}

void BNLog::report_issues(const vector<Issue> &issues, std::ostream &os) {
    os << double_bar << endl;
    os << "Network failed validation with " << issues.size() << (issues.size() == 1 ? " defect:" : " defects:") << endl;
    for (size_t i = 0; i < issues.size(); ++i) {
        os << "  " << setw(3) << i + 1 << ". " << issues[i] << endl;
    }
}

void BNLog::report_network(const PreparedNetwork &net, std::ostream &os) {
    os << double_bar << endl;
    os << "Prepared network: " << net.size() << " variables" << endl;
    for (size_t idx = 0; idx < net.size(); ++idx) {
        const Variable &var = net.variable(idx);
        os << "  " << setw(3) << idx << " \"" << var.name() << "\"" << endl;
        os << "      domain: {";
        for (size_t v = 0; v < var.size(); ++v) { os << (v == 0 ? " " : ", ") << var.value(v); }
        os << " }" << endl;
        os << "      parents:";
        for (auto p : net.parents(idx)) { os << " \"" << net.variable(p).name() << "\""; }
        os << endl << "      blanket:";
        for (auto b : net.markov_blanket(idx)) { os << " \"" << net.variable(b).name() << "\""; }
        os << endl << "      CPT rows: " << net.cpt(idx).table.rows() << endl;
    }
}

void BNLog::report_distribution(
    const Distribution &dist,
    const Evidence &evidence,
    const ALGORITHM algorithm,
    std::ostream &os
) {
    os << double_bar << endl;
    os << "P(" << dist.target << (evidence.empty() ? "" : " | " + _describe(evidence)) << ") by " << algorithm;
    if (algorithm == GIBBS) { os << " (" << dist.samples << " counted states)"; }
    os << endl;
    for (size_t i = 0; i < dist.values.size(); ++i) {
        os << setw(WIDTH) << dist.values[i] << setw(WIDTH) << dist.probabilities[i] << endl;
    }
}

void BNLog::report_convergence(const Distribution &exact, const Distribution &approx, std::ostream &os) {
    os << double_bar << endl;
    os << "Convergence for " << exact.target << " (" << approx.samples << " counted states):" << endl;
    os << setw(WIDTH) << "value" << setw(WIDTH) << "exact" << setw(WIDTH) << "approx" << setw(WIDTH) << "delta" << endl;
    for (size_t i = 0; i < exact.values.size(); ++i) {
        const float_type a = approx[exact.values[i]];
        os << setw(WIDTH) << exact.values[i] << setw(WIDTH) << exact.probabilities[i]
           << setw(WIDTH) << a << setw(WIDTH) << a - exact.probabilities[i] << endl;
    }
    os << "Total variation distance: " << total_variation(exact, approx) << endl;
}

void BNLog::report_samples(const PreparedNetwork &net, const Mat2Dsz &states, std::ostream &os) {
    os << double_bar << endl;
    os << "Sample marginals over " << states.rows() << " draws:" << endl;
    for (size_t idx = 0; idx < net.size(); ++idx) {
        const Variable &var = net.variable(idx);
        os << "  \"" << var.name() << "\"";
        for (size_t v = 0; v < var.size(); ++v) {
            const auto hits = (states.col(idx).array() == v).count();
            const float_type freq = states.rows() > 0 ? static_cast<float_type>(hits) / states.rows() : 0.0;
            os << setw(WIDTH) << var.value(v) << ": " << std::left << setw(WIDTH) << freq << std::right;
        }
        os << endl;
    }
}

void BNLog::report_imputation(const PartialAssignment &partial, const Assignment &full, std::ostream &os) {
    for (const auto &kv : full) {
        auto it = partial.find(kv.first);
        const bool imputed = (it == partial.end()) or not it->second.has_value();
        os << setw(WIDTH) << kv.first << " = " << kv.second << (imputed ? "  (imputed)" : "") << endl;
    }
    os << "---" << endl;
}

} // namespace BN
