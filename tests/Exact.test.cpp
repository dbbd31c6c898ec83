#include <BayesNet/BayesNet.h>
#include <cmath>

#include "testing.h"
#include "fixtures.h"

using namespace BN;
using namespace std;

void test_burglary_given_calls() {
    BayesNet net = alarm_net();
    const Distribution dist = net.query("Burglary", { { "John calls", "True" }, { "Mary calls", "True" } });
    IS_TRUE(dist.values == vector<Value>({ "False", "True" }));
    IS_CLOSE(dist["True"], 0.2842, 1e-3);
    IS_CLOSE(dist["False"], 0.7158, 1e-3);
    IS_CLOSE(dist.total(), 1.0, 1e-9);
    IS_TRUE(dist.argmax() == "False");
    IS_TRUE(dist.samples == 0);
}

void test_root_prior_without_evidence() {
    BayesNet net = alarm_net();
    IS_CLOSE(net.query("Burglary")["True"], 0.001, 1e-12);
    IS_CLOSE(net.query("Earthquake")["True"], 0.002, 1e-12);
}

void test_distributions_sum_to_one() {
    BayesNet net = alarm_net();
    for (const auto &target : net.structure().variables()) {
        IS_CLOSE(net.query(target, { { "Mary calls", "False" } }).total(), 1.0, 1e-9);
    }
}

void test_target_in_evidence() {
    BayesNet net = alarm_net();
    const Distribution dist = net.query("Alarm", { { "Alarm", "True" }, { "John calls", "False" } });
    IS_TRUE(dist["True"] == 1.0);
    IS_TRUE(dist["False"] == 0.0);
}

void test_zero_probability_evidence() {
    BayesNet net = divergent_net();
    THROWS(net.query("A", { { "A", "a0" }, { "B", "b1" } }), ZeroEvidenceProbabilityError);
    ExactInference exact(net.prepare());
    IS_TRUE(exact.evidence_probability({ { "A", "a0" }, { "B", "b1" } }) == 0.0);
    IS_CLOSE(exact.evidence_probability({ { "B", "b1" } }), 0.3, 1e-12);
}

void test_underflowing_evidence() {
    BayesNet net = weak_evidence_net(60);
    const Evidence evidence = all_children_true(60);
    const Distribution dist = net.query("R", evidence);
    IS_CLOSE(dist["b"], 1.0, 1e-12);
    IS_CLOSE(dist.total(), 1.0, 1e-12);

    // 24 children keep the answer away from 1: P(R = b | e) = 2^24 / (1 + 2^24)
    BayesNet small = weak_evidence_net(24);
    IS_CLOSE(small.query("R", all_children_true(24))["a"], 1.0 / (1.0 + std::pow(2.0, 24)), 1e-15);

    ExactInference exact(net.prepare());
    IS_TRUE(exact.evidence_probability(evidence) == 0.0);
    const double expected = std::log(0.5) + 60 * std::log(1e-6) + std::log1p(std::pow(2.0, 60));
    IS_CLOSE(exact.log_evidence_probability(evidence), expected, 1e-8);
}

void test_bad_queries() {
    BayesNet net = alarm_net();
    THROWS(net.query("Nobody"), UnknownVariableError);
    THROWS(net.query("Alarm", { { "Nobody", "True" } }), InvalidEvidenceError);
    THROWS(net.query("Alarm", { { "Burglary", "Maybe" } }), InvalidEvidenceError);
}

void test_changes_drop_prepared() {
    BayesNet net = alarm_net();
    net.prepare();
    IS_TRUE(net.is_prepared());
    net.set_cpt("Burglary", CPT::prior({ { "True", 0.5 }, { "False", 0.5 } }));
    IS_TRUE(not net.is_prepared());
    IS_CLOSE(net.query("Burglary")["True"], 0.5, 1e-12);
    THROWS(net.set_cpt("Nobody", CPT::prior({ { "x", 1.0 } })), UnknownVariableError);
}

void test_deterministic() {
    BayesNet lhs = alarm_net(1), rhs = alarm_net(2);
    const Evidence evidence = { { "John calls", "True" } };
    IS_TRUE(lhs.query("Alarm", evidence).probabilities == rhs.query("Alarm", evidence).probabilities);
}

int main() {
    test_burglary_given_calls();
    test_root_prior_without_evidence();
    test_distributions_sum_to_one();
    test_target_in_evidence();
    test_zero_probability_evidence();
    test_underflowing_evidence();
    test_bad_queries();
    test_changes_drop_prepared();
    test_deterministic();
    return TEST_RESULT();
}
