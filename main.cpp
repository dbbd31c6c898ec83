#include <BayesNet/CLI.h>
#include <BayesNet/Workflow.h>

// exit status per error class: 1 for bad arguments, then 10 + ISSUE
int main(int argc, char* argv[]) {
    const std::string cmd = argc > 0 ? argv[0] : "bayesnet";
    try {
        const BN::CLIArgs args = BN::parse_args(argc, const_cast<const char**>(argv));
        if (args.help) {
            BN::usage(cmd);
            return 0;
        }
        BN::Workflow workflow;
        BN::run(&workflow, args);
    } catch (const BN::BayesNetError &e) {
        if (e.kind() == BN::INVALID_ARGUMENT and e.issues().front().rule == "cli") {
            BN::usage(cmd, std::string("Error: ") + e.issues().front().message);
            return 1;
        }
        std::cerr << "Error: " << e.what() << std::endl;
        for (const auto &issue : e.issues()) { std::cerr << "  " << issue << std::endl; }
        return 10 + static_cast<int>(e.kind());
    }
    return 0;
}
