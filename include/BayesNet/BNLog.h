#ifndef BAYESNET_BNLOG_H
#define BAYESNET_BNLOG_H

#include <iostream>
#include <string>
#include <vector>

#include <BayesNet/Errors.h>
#include <BayesNet/PreparedNetwork.h>
#include <BayesNet/Inference.h>

namespace BN {

struct BNLog {

    static void report_issues(
        const std::vector<Issue> &issues,
        std::ostream &os = std::cerr
    );

    // order, domains, parents and Markov blankets of a prepared network
    static void report_network(
        const PreparedNetwork &net,
        std::ostream &os = std::cerr
    );

    static void report_distribution(
        const Distribution &dist,
        const Evidence &evidence,
        const ALGORITHM algorithm,
        std::ostream &os = std::cerr
    );

    // per value: exact, approximate, delta; then the total variation distance
    static void report_convergence(
        const Distribution &exact,
        const Distribution &approx,
        std::ostream &os = std::cerr
    );

    // empirical marginal of every variable over the drawn states
    // (rows = draws, cols = variables in prepared order)
    static void report_samples(
        const PreparedNetwork &net,
        const Mat2Dsz &states,
        std::ostream &os = std::cerr
    );

    static void report_imputation(
        const PartialAssignment &partial,
        const Assignment &full,
        std::ostream &os = std::cerr
    );

    inline static const int WIDTH = 12;
    inline static const std::string double_bar = "=========================================================================================";

    private:
        BNLog() {};

        static std::string _describe(const Evidence &evidence);
};

} // namespace BN

#endif // BAYESNET_BNLOG_H
