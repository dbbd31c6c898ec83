#include <BayesNet/ForwardSampler.h>

using std::vector;

namespace BN {

State draw_state(const PreparedNetwork &net, RNG &rng) {
    State state(net.size(), 0);
    for (size_t idx = 0; idx < net.size(); ++idx) {
        state[idx] = rng.discrete(net.conditional(idx, state));
    }
    return state;
}

Assignment draw(const PreparedNetwork &net, RNG &rng) {
    return net.to_assignment(draw_state(net, rng));
}

SampleStream::SampleStream(const PreparedPtr &net, const size_t n, const unsigned long int seed) :
    _net(net), _n(n), _rng(seed) {}

State SampleStream::next_state() {
    if (done()) {
        throw InvalidArgumentError("", "exhausted", "sample stream of " + std::to_string(_n) + " draws is exhausted; reseed to restart");
    }
    ++_drawn;
    return draw_state(*_net, _rng);
}

Assignment SampleStream::next() { return _net->to_assignment(next_state()); }

vector<Assignment> SampleStream::collect() {
    vector<Assignment> result;
    result.reserve(remaining());
    while (not done()) { result.push_back(next()); }
    return result;
}

Mat2Dsz SampleStream::collect_states() {
    Mat2Dsz result(remaining(), _net->size());
    for (Eigen::Index row = 0; not done(); ++row) {
        const State state = next_state();
        for (size_t col = 0; col < state.size(); ++col) { result(row, col) = state[col]; }
    }
    return result;
}

void SampleStream::reseed(const unsigned long int seed) {
    _rng.reseed(seed);
    _drawn = 0;
}

} // namespace BN
