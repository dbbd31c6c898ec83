#include <BayesNet/CLI.h>

#include <cctype>
#include <cstring>
#include <stdexcept>
#include <algorithm>

using std::endl;
using std::string;

namespace BN {

void usage(
    const string &cmd,
    const string &msg,
    std::ostream &os
) {
    const string ident = "\t";
    if (not msg.empty()) { os << msg << endl; }
    os << "Usage: " << cmd << " config.json [-option|--option (each space separated)]" << endl << endl;
    os << "Core options:" << endl;
    os << ident << "-(-p)repare  : validate and compile the network; store it if the configuration names a database." << endl;
    os << ident << "-(-q)uery    : answer the configured query, exactly or by Gibbs sampling." << endl;
    os << ident << "-(-s)ample   : draw forward samples, as many as configured or given by -n." << endl;
    os << ident << "-(-i)mpute   : fill in the missing values of the configured rows." << endl;
    os << ident << "-n 1234      : number of samples to draw; implies -s." << endl;
    os << ident << "--seed 1234  : seed for the random source; overrides the configured seed." << endl;
    os << endl;
    os << "Auxilary options:" << endl;
    os << ident << "-(-h)elp     : print this message; ignore all other options." << endl;
    os << ident << "-(-v)erbose  : when working, be effusive; repeat for diagnostics." << endl;
    os << endl;
    os << "Streamlined combination options:" << endl;
    os << ident << "-(-a)ll      : implies prepare, query, sample, impute." << endl;
    os << endl;
    os << "Example uses:" << endl;
    os << endl;
    os << "$ " << cmd << " alarm.json -p -v # check a network, and see what it compiles to" << endl;
    os << "$ " << cmd << " alarm.json -q # answer the configured query" << endl;
    os << "$ " << cmd << " alarm.json -n 1000 --seed 42 # draw 1000 samples, reproducibly" << endl;
    os << "$ " << cmd << " alarm.json -a # everything the configuration asks for" << endl;
}

// non-exported helper function for finding argument flags
static bool argcheck(const char * arg, const char * short_arg, const char * long_arg) {
    return (strcmp(arg, short_arg) == 0) or (strcmp(arg, long_arg) == 0);
}

// non-exported helper: the integer following a flag
static unsigned long int _integer(const size_t argc, const char * argv[], const size_t i, const string &flag, const bool positive) {
    const string msg = flag + " must be followed by a " + (positive ? "positive" : "non-negative") + " integer.";
    if (i == (argc - 1)) { throw InvalidArgumentError("", "cli", msg); }
    const string num(argv[i + 1]);
    if (num.empty() or not std::all_of(num.begin(), num.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) { throw InvalidArgumentError("", "cli", msg); }
    unsigned long int val = 0;
    try {
        val = std::stoul(num);
    } catch (const std::out_of_range &) {
        throw InvalidArgumentError("", "cli", flag + " value out of range: " + num);
    }
    if (positive and val < 1) { throw InvalidArgumentError("", "cli", msg); }
    return val;
}

static void _add_step(CLIArgs &args, const STEP step) {
    if (std::find(args.steps.begin(), args.steps.end(), step) != args.steps.end()) {
        std::cerr << "WARNING: " << step << " specified multiple times; ignoring redundant invocation." << endl;
    } else {
        args.steps.push_back(step);
    }
}

CLIArgs parse_args(const size_t argc, const char * argv[]) {

    // check for help requested
    for (size_t i = 1; i < argc; i++) {
        if (argcheck(argv[i], "-h", "--help")) {
            auto args = CLIArgs("");
            args.help = true;
            return args;
        }
    }

    if (argc < 2) { throw InvalidArgumentError("", "cli", "a configuration file is required."); }
    if (argv[1][0] == '-') { throw InvalidArgumentError("", "cli", "the configuration file must be the first argument."); }

    auto args = CLIArgs(string(argv[1]));

    for (size_t i = 2; i < argc; i++) {

        if (argcheck(argv[i], "-p", "--prepare")) {
            _add_step(args, PREPARE);
        } else if (argcheck(argv[i], "-q", "--query")) {
            _add_step(args, QUERY);
        } else if (argcheck(argv[i], "-s", "--sample")) {
            _add_step(args, SAMPLE);
        } else if (argcheck(argv[i], "-i", "--impute")) {
            _add_step(args, IMPUTE);
        } else if (strcmp(argv[i], "-n") == 0) {
            args.samples.emplace(_integer(argc, argv, i++, "-n", true));
            _add_step(args, SAMPLE);
        } else if (strcmp(argv[i], "--seed") == 0) {
            args.seed.emplace(_integer(argc, argv, i++, "--seed", false));
        } else if (argcheck(argv[i], "-a", "--all")) {
            if (args.steps.size() > 0) { throw InvalidArgumentError("", "cli", "-(-a)ll must be the first step."); }
            args.steps = { PREPARE, QUERY, SAMPLE, IMPUTE };
        } else if (argcheck(argv[i], "-v", "--verbose")) {
            args.verbose += 1;
        } else {
            throw InvalidArgumentError("", "cli", "unrecognized argument: " + string(argv[i]));
        }
    }

    // steps always run in pipeline order
    std::sort(args.steps.begin(), args.steps.end());

    return args;
};

} // namespace BN
