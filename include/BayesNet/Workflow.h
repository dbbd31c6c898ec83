#ifndef BAYESNET_WORKFLOW_H
#define BAYESNET_WORKFLOW_H

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <BayesNet/BayesNet.h>
#include <BayesNet/BayesDB.h>
#include <BayesNet/Config.h>

namespace BN {

// The command line front end's view of a configuration file: a network,
// plus whichever query / samples / imputation rows it asks for. Results go
// to `out` (tab separated), reports to std::cerr.
class Workflow {
    public:
        Workflow(std::ostream &out = std::cout) : _out(out) {}

        // reads the configuration; opens (and sets up) the database, if one is named
        // @param seed: overrides the configured seed
        void parse(const std::string &config_file, const std::optional<unsigned long int> seed = std::nullopt, const size_t verbose = 0);
        void parse(const Config &config, const std::optional<unsigned long int> seed = std::nullopt, const size_t verbose = 0);

        void prepare(const size_t verbose = 0);
        // @throws ConfigError if nothing to query is configured
        Distribution query(const size_t verbose = 0);
        // @param n: overrides the configured number of samples
        // @throws ConfigError if neither gives a number of samples
        std::vector<Assignment> sample(const std::optional<size_t> n = std::nullopt, const size_t verbose = 0);
        // @throws ConfigError if there are no rows to impute
        std::vector<Assignment> impute(const size_t verbose = 0);

        BayesNet & net() { return _net; }
        BayesDB * database() { return _db.get(); }

    private:
        std::ostream &_out;
        BayesNet _net;
        std::optional<QueryConfig> _query;
        std::optional<ImputeConfig> _impute;
        std::optional<size_t> _samples;
        std::unique_ptr<BayesDB> _db;
};

} // namespace BN

#endif // BAYESNET_WORKFLOW_H
