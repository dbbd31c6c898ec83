#ifndef BAYESNET_TEST_FIXTURES_H
#define BAYESNET_TEST_FIXTURES_H

#include <BayesNet/BayesNet.h>

// The burglary / earthquake alarm network:
//   Burglary -> Alarm <- Earthquake, Alarm -> John calls, Alarm -> Mary calls
inline BN::Network alarm_structure() {
    return BN::define_network({
        { "Burglary", "Alarm" },
        { "Earthquake", "Alarm" },
        { "Alarm", "John calls" },
        { "Alarm", "Mary calls" }
    });
}

inline BN::CPT bernoulli_row(BN::CPT table, const std::vector<BN::Value> &given, const double p) {
    table.set("True", given, p);
    table.set("False", given, 1.0 - p);
    return table;
}

inline BN::CPTStore alarm_tables() {
    BN::CPTStore store;
    store.set_cpt("Burglary", BN::CPT::prior({ { "True", 0.001 }, { "False", 0.999 } }));
    store.set_cpt("Earthquake", BN::CPT::prior({ { "True", 0.002 }, { "False", 0.998 } }));

    BN::CPT alarm({ "Burglary", "Earthquake" });
    alarm = bernoulli_row(alarm, { "True", "True" }, 0.95);
    alarm = bernoulli_row(alarm, { "True", "False" }, 0.94);
    alarm = bernoulli_row(alarm, { "False", "True" }, 0.29);
    alarm = bernoulli_row(alarm, { "False", "False" }, 0.001);
    store.set_cpt("Alarm", alarm);

    BN::CPT john({ "Alarm" });
    john = bernoulli_row(john, { "True" }, 0.90);
    john = bernoulli_row(john, { "False" }, 0.05);
    store.set_cpt("John calls", john);

    BN::CPT mary({ "Alarm" });
    mary = bernoulli_row(mary, { "True" }, 0.70);
    mary = bernoulli_row(mary, { "False" }, 0.01);
    store.set_cpt("Mary calls", mary);

    return store;
}

inline BN::BayesNet alarm_net(const unsigned long int seed = 0) {
    return BN::BayesNet(alarm_structure(), alarm_tables(), seed);
}

// A two-variable network where per-variable argmax and joint MPE disagree:
//   P(A=a0) = 0.4, P(A=a1) = 0.6
//   P(B | a0): b0 = 1.0
//   P(B | a1): b0 = 0.5, b1 = 0.5
// Joint: (a0,b0) = 0.4, (a1,b0) = 0.3, (a1,b1) = 0.3.
// With both missing, per-variable argmax gives A=a1 (0.6), then B=b0 given a1
// (tie, first value), the pair (a1,b0) with probability 0.3; the MPE is (a0,b0).
inline BN::BayesNet divergent_net() {
    BN::Network structure = BN::define_network({ { "A", "B" } });
    BN::CPTStore store;
    store.set_cpt("A", BN::CPT::prior({ { "a0", 0.4 }, { "a1", 0.6 } }));
    BN::CPT b({ "A" });
    b.set_row({ "a0" }, { { "b0", 1.0 }, { "b1", 0.0 } });
    b.set_row({ "a1" }, { { "b0", 0.5 }, { "b1", 0.5 } });
    store.set_cpt("B", b);
    return BN::BayesNet(structure, store);
}

// A root R{a, b} with `n` children T1..Tn, each P(Ti = T | a) = 1e-6 and
// P(Ti = T | b) = 2e-6. With every Ti observed T the joint of either state is
// far below the smallest double, yet P(R = b | evidence) = 2^n / (1 + 2^n).
inline BN::BayesNet weak_evidence_net(const size_t n, const unsigned long int seed = 0) {
    BN::BayesNet net(seed);
    net.add_variable("R");
    net.set_cpt("R", BN::CPT::prior({ { "a", 0.5 }, { "b", 0.5 } }));
    for (size_t i = 1; i <= n; ++i) {
        const std::string child = "T" + std::to_string(i);
        net.add_variable(child);
        net.add_edge("R", child);
        BN::CPT table({ "R" });
        table = bernoulli_row(table, { "a" }, 1e-6);
        table = bernoulli_row(table, { "b" }, 2e-6);
        net.set_cpt(child, table);
    }
    return net;
}

inline BN::Evidence all_children_true(const size_t n) {
    BN::Evidence evidence;
    for (size_t i = 1; i <= n; ++i) { evidence["T" + std::to_string(i)] = "True"; }
    return evidence;
}

#endif // BAYESNET_TEST_FIXTURES_H
