#include <BayesNet/CLI.h>
#include <string>
#include <sstream>

#include "testing.h"

using namespace BN;
using namespace std;

// Records the verbs invoked by `run`, for some object that implements them:
// - parse(a configuration file, an optional seed, a verbosity level)
// - prepare / query / impute (a verbosity level)
// - sample(an optional number of samples, a verbosity level)
struct MockWorkflow {
    vector<string> calls;
    optional<unsigned long int> seed;
    optional<size_t> samples;

    void parse(const string &config_file, const optional<unsigned long int> s, const size_t verbosity = 1) {
        calls.push_back("parse(" + config_file + ")");
        seed = s;
        if (verbosity > 0) { cout << "parse(" << config_file << ")" << endl; }
    }
    void prepare(const size_t = 0) { calls.push_back("prepare"); }
    void query(const size_t = 0) { calls.push_back("query"); }
    void sample(const optional<size_t> n, const size_t = 0) { calls.push_back("sample"); samples = n; }
    void impute(const size_t = 0) { calls.push_back("impute"); }
};

vector<string> run_with(const vector<const char*> &argv, MockWorkflow &wf) {
    const auto args = parse_args(argv.size(), const_cast<const char**>(argv.data()));
    run(&wf, args);
    return wf.calls;
}

void test_help() {
    const char* useargs[] = { "./CLI.test", "config.json", "-q", "-h" };
    const auto args = parse_args(4, useargs);
    IS_TRUE(args.help);
    IS_TRUE(args.steps.empty());
    stringstream ss;
    usage("bayesnet", "", ss);
    IS_TRUE(ss.str().find("-(-p)repare") != string::npos);
}

void test_single_steps() {
    MockWorkflow p, q, s, i;
    IS_TRUE(run_with({ "./CLI.test", "config.json", "-p" }, p) == vector<string>({ "parse(config.json)", "prepare" }));
    IS_TRUE(run_with({ "./CLI.test", "config.json", "--query" }, q) == vector<string>({ "parse(config.json)", "query" }));
    IS_TRUE(run_with({ "./CLI.test", "config.json", "-s" }, s) == vector<string>({ "parse(config.json)", "sample" }));
    IS_TRUE(not s.samples.has_value());
    IS_TRUE(run_with({ "./CLI.test", "config.json", "-i", "-v" }, i) == vector<string>({ "parse(config.json)", "impute" }));
}

void test_all_and_order() {
    MockWorkflow all, ordered;
    const vector<string> expected = { "parse(config.json)", "prepare", "query", "sample", "impute" };
    IS_TRUE(run_with({ "./CLI.test", "config.json", "-a" }, all) == expected);
    // steps run in pipeline order, whatever order they are given in
    IS_TRUE(run_with({ "./CLI.test", "config.json", "-i", "-s", "-q", "-p" }, ordered) == expected);
}

void test_counts_and_seed() {
    MockWorkflow wf;
    run_with({ "./CLI.test", "config.json", "-n", "250", "--seed", "0" }, wf);
    IS_TRUE(wf.calls == vector<string>({ "parse(config.json)", "sample" }));
    IS_TRUE(wf.samples.value() == 250);
    IS_TRUE(wf.seed.value() == 0);

    const char* vargs[] = { "./CLI.test", "config.json", "-v", "--verbose", "-v" };
    IS_TRUE(parse_args(5, vargs).verbose == 3);
}

void test_bad_arguments() {
    const char* none[] = { "./CLI.test" };
    THROWS(parse_args(1, none), InvalidArgumentError);
    const char* flag_first[] = { "./CLI.test", "-p" };
    THROWS(parse_args(2, flag_first), InvalidArgumentError);
    const char* dangling[] = { "./CLI.test", "config.json", "-n" };
    THROWS(parse_args(3, dangling), InvalidArgumentError);
    const char* zero[] = { "./CLI.test", "config.json", "-n", "0" };
    THROWS(parse_args(4, zero), InvalidArgumentError);
    const char* negative[] = { "./CLI.test", "config.json", "--seed", "-5" };
    THROWS(parse_args(4, negative), InvalidArgumentError);
    const char* unknown[] = { "./CLI.test", "config.json", "--build" };
    THROWS(parse_args(3, unknown), InvalidArgumentError);
    const char* late_all[] = { "./CLI.test", "config.json", "-p", "-a" };
    THROWS(parse_args(4, late_all), InvalidArgumentError);
}

void test_step_names() {
    IS_TRUE(to_string(PREPARE) == "PREPARE");
    STEP step = from_string("IMPUTE");
    IS_TRUE(step == IMPUTE);
}

int main() {
    test_help();
    test_single_steps();
    test_all_and_order();
    test_counts_and_seed();
    test_bad_arguments();
    test_step_names();
    return TEST_RESULT();
}
