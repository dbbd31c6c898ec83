#ifndef BAYESNET_CONFIG_H
#define BAYESNET_CONFIG_H

#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

#include <BayesNet/TypeDefs.h>
#include <BayesNet/Network.h>
#include <BayesNet/CPT.h>
#include <BayesNet/Inference.h>
#include <BayesNet/Imputer.h>

namespace BN {

// JSON scalars as domain values: strings as-is, booleans as True / False,
// numbers as their decimal text
// @throws ConfigError for anything else
Value as_label(const Json::Value &val);

struct QueryConfig {
    std::string target;
    Evidence evidence;
    ALGORITHM algorithm = EXACT;
    GibbsOptions gibbs;
};

struct ImputeConfig {
    IMPUTE_MODE mode = SEQUENTIAL;
    ALGORITHM algorithm = EXACT;
    GibbsOptions gibbs;
    std::vector<PartialAssignment> rows;
};

struct Config {
    virtual ~Config() = default;
    virtual void parse_network(Network * structure, CPTStore * tables) const = 0;
    virtual std::optional<QueryConfig> parse_query() const = 0;
    virtual std::optional<ImputeConfig> parse_impute() const = 0;
    virtual std::optional<size_t> samples() const = 0;
    virtual std::optional<unsigned long int> seed() const = 0;
    virtual std::optional<std::string> database() const = 0;
};

// Reads the configuration file format:
//   "network": { "variables": [...], "edges": [[parent, child], ...], "cpts": [...] }
//   "query", "impute", "samples", "seed", "database": all optional
// @throws ConfigError on unreadable files, malformed JSON, or wrongly typed members
struct JsonConfig : public Config {
    JsonConfig(const std::string &filename);
    JsonConfig(const Json::Value &root) : _root(root) {}

    void parse_network(Network * structure, CPTStore * tables) const override;
    std::optional<QueryConfig> parse_query() const override;
    std::optional<ImputeConfig> parse_impute() const override;
    std::optional<size_t> samples() const override;
    std::optional<unsigned long int> seed() const override;
    std::optional<std::string> database() const override;

    const Json::Value & root() const { return _root; }

    private:
        const Json::Value _root;
};

Json::Value parse_json(const std::string &text);

// the "network" object; reading it back with parse_network_json reproduces structure and tables
Json::Value network_to_json(const Network &structure, const CPTStore &tables);
void parse_network_json(const Json::Value &network, Network * structure, CPTStore * tables);
// writes { "network": ... } to `filename`
void write_network_json(const std::string &filename, const Network &structure, const CPTStore &tables);

} // namespace BN

#endif // BAYESNET_CONFIG_H
