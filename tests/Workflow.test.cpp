#include <BayesNet/Workflow.h>
#include <BayesNet/CLI.h>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "testing.h"
#include "fixtures.h"

using namespace BN;
using namespace std;

// network from the fixtures, plus every optional section
Json::Value alarm_config(const string &database) {
    Json::Value root(Json::objectValue);
    root["network"] = network_to_json(alarm_structure(), alarm_tables());
    root["query"]["target"] = "Burglary";
    root["query"]["evidence"]["John calls"] = true;
    root["query"]["evidence"]["Mary calls"] = true;
    root["samples"] = 40;
    root["seed"] = 1234;
    Json::Value row(Json::objectValue);
    row["Alarm"] = Json::Value(Json::nullValue);
    row["John calls"] = "True";
    root["impute"]["rows"].append(row);
    root["database"] = database;
    return root;
}

size_t count_lines(const string &text) {
    size_t n = 0;
    string line;
    stringstream ss(text);
    while (getline(ss, line)) { ++n; }
    return n;
}

void test_full_run(const string &db_path) {
    stringstream out;
    Workflow wf(out);
    wf.parse(JsonConfig(alarm_config(db_path)));
    wf.prepare();
    IS_TRUE(wf.net().is_prepared());

    const Distribution dist = wf.query();
    IS_CLOSE(dist["True"], 0.2842, 1e-3);
    IS_TRUE(out.str().find("Burglary\tTrue\t") != string::npos);

    out.str("");
    const auto draws = wf.sample();
    IS_TRUE(draws.size() == 40);
    IS_TRUE(count_lines(out.str()) == 41); // header + draws

    out.str("");
    const auto filled = wf.impute();
    IS_TRUE(filled.size() == 1 and filled[0].size() == 5);
    IS_TRUE(filled[0].at("John calls") == "True");

    // the database holds the prepared network and the draws
    Network structure;
    CPTStore tables;
    IS_TRUE(wf.database() != nullptr);
    IS_TRUE(wf.database()->load_network(structure, tables));
    IS_TRUE(tables == alarm_tables());
    IS_TRUE(wf.database()->read_samples() == draws);
}

void test_seed_override(const string &db_path) {
    stringstream a_out, b_out, c_out;
    Workflow a(a_out), b(b_out), c(c_out);
    a.parse(JsonConfig(alarm_config(db_path)), 5);
    b.parse(JsonConfig(alarm_config(db_path)), 5);
    c.parse(JsonConfig(alarm_config(db_path)), 6);
    const auto da = a.sample(100), db = b.sample(100), dc = c.sample(100);
    IS_TRUE(da == db);
    IS_TRUE(da != dc);
}

void test_missing_sections() {
    Json::Value root(Json::objectValue);
    root["network"] = network_to_json(alarm_structure(), alarm_tables());
    stringstream out;
    Workflow wf(out);
    wf.parse(JsonConfig(root));
    IS_TRUE(wf.database() == nullptr);
    THROWS(wf.query(), ConfigError);
    THROWS(wf.sample(), ConfigError);
    THROWS(wf.impute(), ConfigError);
    IS_TRUE(wf.sample(3).size() == 3);
}

void test_invalid_network() {
    Json::Value root(Json::objectValue);
    CPTStore tables = alarm_tables();
    tables.erase("Alarm");
    root["network"] = network_to_json(alarm_structure(), tables);
    Workflow wf;
    wf.parse(JsonConfig(root));
    THROWS(wf.prepare(), MissingCPTError);
}

void test_run_from_file(const string &base) {
    const string config_path = base + ".json", db_path = base + ".run.sqlite";
    filesystem::remove(db_path);
    {
        ofstream ofs(config_path);
        Json::StreamWriterBuilder builder;
        ofs << Json::writeString(builder, alarm_config(db_path));
    }
    const char* argv[] = { "./Workflow.test", config_path.c_str(), "-a" };
    stringstream out;
    Workflow wf(out);
    run(&wf, parse_args(3, argv));
    IS_TRUE(wf.database()->read_samples().size() == 40);
    filesystem::remove(config_path);
    filesystem::remove(db_path);
}

int main(int argc, char* argv[]) {
    const string base = (argc > 1) ? argv[1] : "Workflow.test";
    const string db_path = base + ".sqlite";
    filesystem::remove(db_path);

    test_full_run(db_path);
    test_seed_override(db_path);
    test_missing_sections();
    test_invalid_network();
    test_run_from_file(base);

    filesystem::remove(db_path);
    return TEST_RESULT();
}
