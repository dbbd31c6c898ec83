#include <BayesNet/BayesNet.h>
#include <algorithm>

#include "testing.h"
#include "fixtures.h"

using namespace BN;
using namespace std;

void test_prepared_layout() {
    const auto net = prepare(alarm_structure(), alarm_tables());
    IS_TRUE(net->size() == 5);
    IS_TRUE(net->topological_order() == alarm_structure().topological_order());
    for (size_t idx = 0; idx < net->size(); ++idx) {
        for (auto p : net->parents(idx)) { IS_TRUE(p < idx); }
        // every compiled row is a distribution
        const Mat2D &table = net->cpt(idx).table;
        for (int r = 0; r < table.rows(); ++r) { IS_CLOSE(table.row(r).sum(), 1.0, 1e-9); }
    }
    const Variable &alarm = net->variable(net->index_of("Alarm"));
    IS_TRUE(alarm.domain() == vector<Value>({ "False", "True" }));
    IS_TRUE(net->cpt(net->index_of("Alarm")).table.rows() == 4);
}

void test_markov_blankets() {
    const auto net = prepare(alarm_structure(), alarm_tables());
    auto blanket = net->markov_blanket("Burglary");
    sort(blanket.begin(), blanket.end());
    // child Alarm, and Alarm's other parent Earthquake
    IS_TRUE(blanket == vector<string>({ "Alarm", "Earthquake" }));
    blanket = net->markov_blanket("Alarm");
    sort(blanket.begin(), blanket.end());
    IS_TRUE(blanket == vector<string>({ "Burglary", "Earthquake", "John calls", "Mary calls" }));
    blanket = net->markov_blanket("John calls");
    IS_TRUE(blanket == vector<string>({ "Alarm" }));
}

void test_compiled_lookup() {
    const auto net = prepare(alarm_structure(), alarm_tables());
    const size_t a = net->index_of("Alarm"), b = net->index_of("Burglary"), e = net->index_of("Earthquake");
    State state(net->size(), 0);
    state[b] = net->variable(b).index_of("True").value();
    state[e] = net->variable(e).index_of("False").value();
    state[a] = net->variable(a).index_of("True").value();
    IS_CLOSE(net->probability(a, state), 0.94, 1e-12);
}

void test_joint_probability() {
    const auto net = prepare(alarm_structure(), alarm_tables());
    const auto fixed = net->resolve({
        { "Burglary", "False" }, { "Earthquake", "False" }, { "Alarm", "True" },
        { "John calls", "True" }, { "Mary calls", "True" }
    });
    State state(net->size());
    for (size_t idx = 0; idx < net->size(); ++idx) { state[idx] = fixed[idx].value(); }
    IS_CLOSE(net->joint(state), 0.999 * 0.998 * 0.001 * 0.90 * 0.70, 1e-15);
}

void test_all_defects_reported() {
    CPTStore store = alarm_tables();
    store.erase("Mary calls");
    store.set_cpt("Burglary", CPT::prior({ { "True", 0.5 }, { "False", 0.6 } }));
    bool thrown = false;
    try {
        prepare(alarm_structure(), store);
    } catch (const MissingCPTError &e) {
        thrown = true;
        // the missing table outranks the bad row sum; both are attached
        IS_TRUE(e.kind() == MISSING_CPT);
        IS_TRUE(e.issues().size() == 2);
        IS_TRUE(e.issues().back().rule == "row-sum");
    }
    IS_TRUE(thrown);
}

void test_unknown_outranks_invalid() {
    CPTStore store = alarm_tables();
    store.set_cpt("Ghost", CPT::prior({ { "x", 1.0 } }));
    store.set_cpt("Burglary", CPT::prior({ { "True", 2.0 } }));
    THROWS(prepare(alarm_structure(), store), UnknownVariableError);
}

void test_short_row_rejected() {
    CPTStore store = alarm_tables();
    store.set_cpt("Burglary", CPT::prior({ { "True", 0.1 }, { "False", 0.8 } }));
    THROWS(prepare(alarm_structure(), store), InvalidCPTError);
}

void test_reprepare_identical() {
    BayesNet net = alarm_net();
    const Evidence evidence = { { "Mary calls", "True" } };
    const Distribution before = net.query("Earthquake", evidence);
    // an edit that changes nothing still drops the prepared network
    net.set_cpt("Burglary", alarm_tables().get("Burglary"));
    IS_TRUE(not net.is_prepared());
    IS_TRUE(net.query("Earthquake", evidence).probabilities == before.probabilities);
    IS_TRUE(net.prepare() == net.prepare());
}

void test_evidence_resolution() {
    const auto net = prepare(alarm_structure(), alarm_tables());
    THROWS(net->resolve({ { "Nobody", "True" } }), InvalidEvidenceError);
    THROWS(net->resolve({ { "Alarm", "Maybe" } }), InvalidEvidenceError);
    const auto fixed = net->resolve({ { "Alarm", "True" } });
    IS_TRUE(fixed[net->index_of("Alarm")].has_value());
    IS_TRUE(not fixed[net->index_of("Burglary")].has_value());
}

int main() {
    test_prepared_layout();
    test_markov_blankets();
    test_compiled_lookup();
    test_joint_probability();
    test_all_defects_reported();
    test_unknown_outranks_invalid();
    test_short_row_rejected();
    test_reprepare_identical();
    test_evidence_resolution();
    return TEST_RESULT();
}
