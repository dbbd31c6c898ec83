#include <BayesNet/Network.h>
#include <algorithm>

#include "testing.h"

using namespace BN;
using namespace std;

void test_add_edge_registers_variables() {
    Network net;
    IS_TRUE(net.add_edge("A", "B"));
    IS_TRUE(net.contains("A") and net.contains("B"));
    IS_TRUE(net.size() == 2);
    IS_TRUE(not net.add_edge("A", "B")); // repeated edge
    IS_TRUE(net.has_edge("A", "B") and not net.has_edge("B", "A"));
    IS_TRUE(net.parents_of("B") == set<string>({ "A" }));
    IS_TRUE(net.children_of("A") == set<string>({ "B" }));
    IS_TRUE(net.parents_of("A").empty());
}

void test_isolated_variable() {
    Network net;
    IS_TRUE(net.add_variable("Lonely"));
    IS_TRUE(not net.add_variable("Lonely"));
    IS_TRUE(net.edges().empty());
    IS_TRUE(net.topological_order() == vector<string>({ "Lonely" }));
    THROWS(net.add_variable(""), InvalidArgumentError);
}

void test_cycles_rejected() {
    Network net = define_network({ { "A", "B" }, { "B", "C" } });
    THROWS(net.add_edge("C", "A"), CyclicGraphError);
    THROWS(net.add_edge("B", "B"), CyclicGraphError);
    // the rejected edge left nothing behind
    IS_TRUE(not net.has_edge("C", "A"));
    IS_TRUE(net.find_cycle().empty());
    THROWS(define_network({ { "X", "Y" }, { "Y", "X" } }), CyclicGraphError);
}

void test_topological_order() {
    const Network net = define_network({
        { "Burglary", "Alarm" }, { "Earthquake", "Alarm" },
        { "Alarm", "John calls" }, { "Alarm", "Mary calls" }
    });
    const auto order = net.topological_order();
    IS_TRUE(order.size() == 5);
    auto pos = [&](const string &v) { return find(order.begin(), order.end(), v) - order.begin(); };
    for (const auto &edge : net.edges()) { IS_TRUE(pos(edge.first) < pos(edge.second)); }
    // ties broken lexically
    IS_TRUE(order == vector<string>({ "Burglary", "Earthquake", "Alarm", "John calls", "Mary calls" }));
}

void test_unknown_variable() {
    const Network net = define_network({ { "A", "B" } });
    THROWS(net.parents_of("C"), UnknownVariableError);
    THROWS(net.children_of("C"), UnknownVariableError);
}

int main() {
    test_add_edge_registers_variables();
    test_isolated_variable();
    test_cycles_rejected();
    test_topological_order();
    test_unknown_variable();
    return TEST_RESULT();
}
