#include <BayesNet/BayesNet.h>

#include "testing.h"
#include "fixtures.h"

using namespace BN;
using namespace std;

void test_converges_to_exact() {
    BayesNet net = alarm_net(20240501);
    const Evidence calls = { { "John calls", "True" }, { "Mary calls", "True" } };
    const Distribution exact = net.query("Burglary", calls, EXACT);
    GibbsOptions options;
    options.iterations = 20000;
    options.burn_in = 1000;
    options.chains = 2;
    const Distribution approx = net.query("Burglary", calls, GIBBS, options);
    IS_TRUE(total_variation(exact, approx) < 0.05);
    IS_TRUE(approx.samples > 0 and approx.samples <= 40000);
    IS_CLOSE(approx.total(), 1.0, 1e-9);
}

void test_converges_single_chain() {
    const Evidence calls = { { "John calls", "True" }, { "Mary calls", "True" } };
    for (const unsigned long int seed : { 0ul, 1ul, 42ul }) {
        BayesNet net = alarm_net(seed);
        const Distribution exact = net.query("Burglary", calls, EXACT);
        const Distribution approx = net.query("Burglary", calls, GIBBS, 10000, 0);
        IS_TRUE(total_variation(exact, approx) < 0.05);
        IS_TRUE(approx.samples <= 10000);
    }
}

void test_converges_downstream() {
    BayesNet net = alarm_net(7);
    const Evidence evidence = { { "Earthquake", "True" } };
    const Distribution exact = net.query("John calls", evidence, EXACT);
    const Distribution approx = net.query("John calls", evidence, GIBBS, 10000, 500);
    IS_TRUE(total_variation(exact, approx) < 0.03);
}

void test_seeded_runs_repeat() {
    BayesNet lhs = alarm_net(99), rhs = alarm_net(99);
    const Evidence evidence = { { "Mary calls", "True" } };
    const Distribution a = lhs.query("Alarm", evidence, GIBBS, 2000, 100);
    const Distribution b = rhs.query("Alarm", evidence, GIBBS, 2000, 100);
    IS_TRUE(a.probabilities == b.probabilities);
    IS_TRUE(a.samples == b.samples);
}

void test_target_in_evidence() {
    BayesNet net = alarm_net(3);
    const Distribution dist = net.query("Alarm", { { "Alarm", "False" } }, GIBBS, 500, 0);
    IS_TRUE(dist["False"] == 1.0);
}

void test_bad_options() {
    BayesNet net = alarm_net();
    THROWS(net.query("Alarm", {}, GIBBS, 0, 0), InvalidArgumentError);
    GibbsOptions options;
    options.chains = 0;
    THROWS(net.query("Alarm", {}, GIBBS, options), InvalidArgumentError);
}

void test_impossible_evidence() {
    BayesNet net = divergent_net();
    THROWS(net.query("A", { { "A", "a0" }, { "B", "b1" } }, GIBBS, 200, 0), ZeroEvidenceProbabilityError);
}

void test_underflowing_evidence() {
    BayesNet net = weak_evidence_net(60, 11);
    const Distribution dist = net.query("R", all_children_true(60), GIBBS, 2000, 0);
    IS_TRUE(dist.samples == 2000);
    IS_TRUE(dist["b"] > 0.99);
}

void test_engine_kinds() {
    BayesNet net = alarm_net();
    RNG rng(1);
    IS_TRUE(make_engine(EXACT, net.prepare(), rng)->kind() == EXACT);
    IS_TRUE(make_engine(GIBBS, net.prepare(), rng)->kind() == GIBBS);
    IS_TRUE(to_string(GIBBS) == "GIBBS");
    ALGORITHM alg = from_string("EXACT");
    IS_TRUE(alg == EXACT);
    THROWS(ALGORITHM bad = from_string("LOOPY"), InvalidArgumentError);
}

int main() {
    test_converges_to_exact();
    test_converges_single_chain();
    test_converges_downstream();
    test_seeded_runs_repeat();
    test_target_in_evidence();
    test_bad_options();
    test_impossible_evidence();
    test_underflowing_evidence();
    test_engine_kinds();
    return TEST_RESULT();
}
