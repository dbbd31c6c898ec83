#ifndef BAYESNET_CLI_H
#define BAYESNET_CLI_H

#include <iostream>
#include <vector>
#include <optional>
#include <string>

#include <BayesNet/EnumMacros.h>

namespace BN {

// A "usage" function for the built-in bayesnet CLI
// @param cmd the name of the executable
// @param msg an optional message to print before the usage
void usage(
    const std::string &cmd,
    const std::string &msg = "",
    std::ostream &os = std::cerr
);

// Steps of a bayesnet run
// PREPARE: validate and compile the configured network; store it, if there is a database
// QUERY: answer the configured query
// SAMPLE: draw forward samples; store them, if there is a database
// IMPUTE: complete the configured partial rows
#define BN_STEP_ENUM(MACRO, SUBM) MACRO(STEP, SUBM(PREPARE) SUBM(QUERY) SUBM(SAMPLE) SUBM(IMPUTE))
BN_CONSTRUCTENUM(BN_STEP_ENUM)

// Container for the parsed command line arguments
// @var config_file the path to the configuration file
// @var steps the `STEP`s to perform
// @var samples the number of samples to draw (if not present, as configured)
// @var verbose the verbosity level (0 = quiet, 1 = normal, 2 = also report diagnostics)
struct CLIArgs {
    CLIArgs() = delete;
    CLIArgs(const std::string &cf) : config_file(cf) {}

    std::string config_file;                 // based on config file ...
    std::vector<STEP> steps = {};            // ... do nothing by default
    std::optional<unsigned long int> seed;   // ... with the configured seed
    std::optional<size_t> samples;           // ... and the configured number of samples
    size_t verbose = 0;                      // ... quietly
    bool help = false;
};

// parses the args passed to main()
// @throws InvalidArgumentError on unrecognized or malformed arguments
CLIArgs parse_args(const size_t argc, const char * argv[]);

// Runs the steps, for some object that implements the workflow *verbs*:
// - parse(a string [configuration file path], an optional seed override, a verbosity level)
// - prepare(a verbosity level)
// - query(a verbosity level)
// - sample(an optional number of samples, a verbosity level)
// - impute(a verbosity level)
template<typename WF>
inline void run(
    WF* wf, const CLIArgs &args
) {

    wf->parse(args.config_file, args.seed, args.verbose);

    if (args.verbose > 0) {
        std::cerr << "Running bayesnet as: " << std::endl;
        for (auto it = args.steps.begin(); it != args.steps.end(); it++) {
            if (it != args.steps.begin()) { std::cerr << " => "; }
            std::cerr << *it;
        }
        std::cerr << std::endl;
    }

    for (auto step : args.steps) {
        switch(step) {
            case PREPARE: wf->prepare(args.verbose); break;
            case QUERY: wf->query(args.verbose); break;
            case SAMPLE: wf->sample(args.samples, args.verbose); break;
            case IMPUTE: wf->impute(args.verbose); break;
            default:
                throw InvalidArgumentError("unimplemented STEP: " + to_string(step));
        }
    }

};

} // namespace BN

#endif // BAYESNET_CLI_H
