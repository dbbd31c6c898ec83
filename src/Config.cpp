#include <BayesNet/Config.h>

#include <fstream>
#include <iomanip>
#include <sstream>
#include <memory>

using std::string;
using std::vector;
using std::optional;

// non-exported helper: every malformed-configuration path ends here
static void _require(const bool condition, const string &message) {
    if (not condition) { throw BN::ConfigError("", "config", message); }
}

static size_t _as_count(const Json::Value &val, const string &key) {
    _require(val.isUInt64(), "`" + key + "` must be a non-negative integer");
    return static_cast<size_t>(val.asUInt64());
}

namespace BN {

Value as_label(const Json::Value &val) {
    if (val.isString()) { return val.asString(); }
    if (val.isBool()) { return val.asBool() ? "True" : "False"; }
    if (val.isIntegral()) { return val.isUInt64() ? std::to_string(val.asUInt64()) : std::to_string(val.asInt64()); }
    if (val.isDouble()) {
        // shortest of 15 or 17 significant digits that reads back as the same double
        const double x = val.asDouble();
        for (const int digits : { 15, 17 }) {
            std::stringstream ss;
            ss << std::setprecision(digits) << x;
            if (digits == 17 or std::stod(ss.str()) == x) { return ss.str(); }
        }
    }
    throw ConfigError("", "config", "values must be strings, booleans or numbers");
}

Json::Value parse_json(const string &text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    string errors;
    _require(reader->parse(text.data(), text.data() + text.size(), &root, &errors), "malformed JSON: " + errors);
    return root;
}

static Json::Value _read_json_file(const string &filename) {
    std::ifstream ifs(filename);
    _require(ifs.good(), "cannot read configuration file: " + filename);
    std::stringstream sstr;
    sstr << ifs.rdbuf();
    return parse_json(sstr.str());
}

JsonConfig::JsonConfig(const string &filename) : _root(_read_json_file(filename)) {
    _require(_root.isObject(), "configuration file must hold a JSON object: " + filename);
}

static GibbsOptions _parse_gibbs(const Json::Value &obj) {
    GibbsOptions options;
    if (obj.isMember("iterations")) { options.iterations = _as_count(obj["iterations"], "iterations"); }
    if (obj.isMember("burn_in")) { options.burn_in = _as_count(obj["burn_in"], "burn_in"); }
    if (obj.isMember("chains")) { options.chains = _as_count(obj["chains"], "chains"); }
    return options;
}

template <typename ET>
static ET _parse_enum(const Json::Value &obj, const string &key, const ET fallback) {
    if (not obj.isMember(key)) { return fallback; }
    _require(obj[key].isString(), "`" + key + "` must be a string");
    try {
        return static_cast<ET>(from_string(obj[key].asString()));
    } catch (const InvalidArgumentError &e) {
        throw ConfigError("", "config", "`" + key + "`: " + e.what());
    }
}

void parse_network_json(const Json::Value &network, Network * structure, CPTStore * tables) {
    _require(network.isObject(), "`network` must be an object");
    Network parsed;
    CPTStore parsed_tables;

    if (network.isMember("variables")) {
        _require(network["variables"].isArray(), "`network.variables` must be an array of names");
        for (const Json::Value &name : network["variables"]) {
            _require(name.isString(), "variable names must be strings");
            parsed.add_variable(name.asString());
        }
    }

    if (network.isMember("edges")) {
        _require(network["edges"].isArray(), "`network.edges` must be an array of [parent, child] pairs");
        for (const Json::Value &edge : network["edges"]) {
            _require(edge.isArray() and edge.size() == 2 and edge[0].isString() and edge[1].isString(),
                "each edge must be a [parent, child] pair of names");
            parsed.add_edge(edge[0].asString(), edge[1].asString());
        }
    }

    if (network.isMember("cpts")) {
        _require(network["cpts"].isArray(), "`network.cpts` must be an array");
        for (const Json::Value &jcpt : network["cpts"]) {
            _require(jcpt.isObject() and jcpt["variable"].isString(), "each CPT needs a `variable` name");
            const string variable = jcpt["variable"].asString();

            vector<string> parents;
            if (jcpt.isMember("parents")) {
                _require(jcpt["parents"].isArray(), "CPT parents must be an array: " + variable);
                for (const Json::Value &p : jcpt["parents"]) {
                    _require(p.isString(), "CPT parents must be names: " + variable);
                    parents.push_back(p.asString());
                }
            }
            CPT table(parents);

            auto read_row = [&](const vector<Value> &given, const Json::Value &probs) {
                _require(probs.isObject(), "CPT probabilities must be an object of value: probability: " + variable);
                for (const auto &val : probs.getMemberNames()) {
                    _require(probs[val].isNumeric(), "CPT probabilities must be numbers: " + variable);
                    table.set(val, given, probs[val].asDouble());
                }
            };

            if (jcpt.isMember("probabilities")) { read_row({}, jcpt["probabilities"]); }
            if (jcpt.isMember("rows")) {
                _require(jcpt["rows"].isArray(), "CPT rows must be an array: " + variable);
                for (const Json::Value &row : jcpt["rows"]) {
                    vector<Value> given;
                    if (row.isMember("given")) {
                        _require(row["given"].isArray(), "CPT `given` must be an array: " + variable);
                        for (const Json::Value &g : row["given"]) { given.push_back(as_label(g)); }
                    }
                    read_row(given, row["probabilities"]);
                }
            }
            parsed_tables.set_cpt(variable, table);
        }
    }

    *structure = parsed;
    *tables = parsed_tables;
}

void JsonConfig::parse_network(Network * structure, CPTStore * tables) const {
    _require(_root.isMember("network"), "configuration has no `network`");
    parse_network_json(_root["network"], structure, tables);
}

optional<QueryConfig> JsonConfig::parse_query() const {
    if (not _root.isMember("query")) { return std::nullopt; }
    const Json::Value &q = _root["query"];
    _require(q.isObject() and q["target"].isString(), "`query` needs a `target` name");

    QueryConfig config;
    config.target = q["target"].asString();
    if (q.isMember("evidence")) {
        _require(q["evidence"].isObject(), "`query.evidence` must be an object of name: value");
        for (const auto &name : q["evidence"].getMemberNames()) { config.evidence[name] = as_label(q["evidence"][name]); }
    }
    config.algorithm = _parse_enum<ALGORITHM>(q, "algorithm", EXACT);
    config.gibbs = _parse_gibbs(q);
    return config;
}

optional<ImputeConfig> JsonConfig::parse_impute() const {
    if (not _root.isMember("impute")) { return std::nullopt; }
    const Json::Value &imp = _root["impute"];
    _require(imp.isObject(), "`impute` must be an object");

    ImputeConfig config;
    config.mode = _parse_enum<IMPUTE_MODE>(imp, "mode", SEQUENTIAL);
    config.algorithm = _parse_enum<ALGORITHM>(imp, "algorithm", EXACT);
    config.gibbs = _parse_gibbs(imp);
    if (imp.isMember("rows")) {
        _require(imp["rows"].isArray(), "`impute.rows` must be an array");
        for (const Json::Value &row : imp["rows"]) {
            _require(row.isObject(), "each row to impute must be an object of name: value (or null)");
            PartialAssignment partial;
            for (const auto &name : row.getMemberNames()) {
                if (row[name].isNull()) {
                    partial[name] = std::nullopt;
                } else {
                    partial[name] = as_label(row[name]);
                }
            }
            config.rows.push_back(partial);
        }
    }
    return config;
}

optional<size_t> JsonConfig::samples() const {
    if (not _root.isMember("samples")) { return std::nullopt; }
    return _as_count(_root["samples"], "samples");
}

optional<unsigned long int> JsonConfig::seed() const {
    if (not _root.isMember("seed")) { return std::nullopt; }
    return static_cast<unsigned long int>(_as_count(_root["seed"], "seed"));
}

optional<string> JsonConfig::database() const {
    if (not _root.isMember("database")) { return std::nullopt; }
    _require(_root["database"].isString(), "`database` must be a path");
    return _root["database"].asString();
}

Json::Value network_to_json(const Network &structure, const CPTStore &tables) {
    Json::Value network(Json::objectValue);

    network["variables"] = Json::Value(Json::arrayValue);
    for (const auto &name : structure.variables()) { network["variables"].append(name); }

    network["edges"] = Json::Value(Json::arrayValue);
    for (const auto &edge : structure.edges()) {
        Json::Value jedge(Json::arrayValue);
        jedge.append(edge.first);
        jedge.append(edge.second);
        network["edges"].append(jedge);
    }

    network["cpts"] = Json::Value(Json::arrayValue);
    for (const auto &name : tables.variables()) {
        const CPT &table = tables.get(name);
        Json::Value jcpt(Json::objectValue);
        jcpt["variable"] = name;
        if (table.parents().empty()) {
            jcpt["probabilities"] = Json::Value(Json::objectValue);
            for (const auto &entry : table.entries()) { jcpt["probabilities"][entry.first.second] = entry.second; }
        } else {
            jcpt["parents"] = Json::Value(Json::arrayValue);
            for (const auto &p : table.parents()) { jcpt["parents"].append(p); }
            jcpt["rows"] = Json::Value(Json::arrayValue);
            for (const auto &given : table.rows()) {
                Json::Value row(Json::objectValue);
                row["given"] = Json::Value(Json::arrayValue);
                for (const auto &g : given) { row["given"].append(g); }
                row["probabilities"] = Json::Value(Json::objectValue);
                for (const auto &val : table.domain()) {
                    const auto p = table.get(val, given);
                    if (p) { row["probabilities"][val] = *p; }
                }
                jcpt["rows"].append(row);
            }
        }
        network["cpts"].append(jcpt);
    }
    return network;
}

void write_network_json(const string &filename, const Network &structure, const CPTStore &tables) {
    Json::Value root(Json::objectValue);
    root["network"] = network_to_json(structure, tables);

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["precision"] = 17;
    std::ofstream ofs(filename);
    _require(ofs.good(), "cannot write network file: " + filename);
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(root, &ofs);
    ofs << std::endl;
}

} // namespace BN
