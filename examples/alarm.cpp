#include <BayesNet/BayesNet.h>
#include <BayesNet/BNLog.h>

#include <iostream>

using namespace std;
using namespace BN;

// builds the burglary alarm network by hand, then compares the two
// engines on P(Burglary | John calls, Mary calls)
int main(int argc, char* argv[]) {

    const unsigned long int seed = (argc > 1) ? stoul(argv[1]) : 1234;

    BayesNet net(seed);
    net.define_network({
        { "Burglary", "Alarm" },
        { "Earthquake", "Alarm" },
        { "Alarm", "John calls" },
        { "Alarm", "Mary calls" }
    });

    net.set_cpt("Burglary", CPT::prior({ { "True", 0.001 }, { "False", 0.999 } }));
    net.set_cpt("Earthquake", CPT::prior({ { "True", 0.002 }, { "False", 0.998 } }));
    net.set_cpt("Alarm", CPT({ "Burglary", "Earthquake" })
        .set_row({ "True", "True" },   { { "True", 0.95 },  { "False", 0.05 } })
        .set_row({ "True", "False" },  { { "True", 0.94 },  { "False", 0.06 } })
        .set_row({ "False", "True" },  { { "True", 0.29 },  { "False", 0.71 } })
        .set_row({ "False", "False" }, { { "True", 0.001 }, { "False", 0.999 } }));
    net.set_cpt("John calls", CPT({ "Alarm" })
        .set_row({ "True" },  { { "True", 0.90 }, { "False", 0.10 } })
        .set_row({ "False" }, { { "True", 0.05 }, { "False", 0.95 } }));
    net.set_cpt("Mary calls", CPT({ "Alarm" })
        .set_row({ "True" },  { { "True", 0.70 }, { "False", 0.30 } })
        .set_row({ "False" }, { { "True", 0.01 }, { "False", 0.99 } }));

    try {
        const Evidence calls = { { "John calls", "True" }, { "Mary calls", "True" } };
        const Distribution exact = net.query("Burglary", calls, EXACT, nullopt, nullopt, 1);

        GibbsOptions options;
        options.iterations = 50000;
        options.burn_in = 1000;
        options.chains = 4;
        const Distribution approx = net.query("Burglary", calls, GIBBS, options, 1);
        BNLog::report_convergence(exact, approx);

        auto stream = net.sample(1000);
        BNLog::report_samples(*net.prepare(), stream.collect_states());

        const Assignment filled = net.impute({ { "John calls", "True" }, { "Alarm", nullopt } });
        BNLog::report_imputation({ { "John calls", "True" }, { "Alarm", nullopt } }, filled);
    } catch (const BayesNetError &e) {
        cerr << e.what() << endl;
        return 1;
    }

    return 0;
}
