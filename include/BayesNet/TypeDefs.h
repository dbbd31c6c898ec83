#ifndef BAYESNET_TYPEDEFS_H
#define BAYESNET_TYPEDEFS_H

#include <cmath>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <Eigen/Dense>

namespace BN {

typedef double float_type;

typedef Eigen::Matrix<float_type, Eigen::Dynamic, Eigen::Dynamic> Mat2D;
typedef Eigen::Matrix<float_type, Eigen::Dynamic, 1> Col;
typedef Eigen::Matrix<float_type, 1, Eigen::Dynamic> Row;
typedef Eigen::Matrix<size_t, Eigen::Dynamic, Eigen::Dynamic> Mat2Dsz; // rows = draws, cols = variables (value indices)

// a value in a variable's domain; values are labels, compared as strings
typedef std::string Value;

// (parent, child)
typedef std::pair<std::string, std::string> Edge;

// full or partial assignment of values to variables, by name
typedef std::map<std::string, Value> Assignment;
// observed values used to condition a query
typedef Assignment Evidence;
// std::nullopt marks a missing value
typedef std::map<std::string, std::optional<Value>> PartialAssignment;

// internal representation of an assignment: one domain index per variable,
// in topological order of the prepared network
typedef std::vector<size_t> State;

// rows of a CPT must sum to 1 within this tolerance
inline const float_type CPT_TOLERANCE = 1e-6;
// log of a zero probability
inline const float_type LOG_ZERO = -std::numeric_limits<float_type>::infinity();

// log(exp(a) + exp(b)) without leaving log space
inline float_type log_add(const float_type a, const float_type b) {
    if (a == LOG_ZERO) { return b; }
    if (b == LOG_ZERO) { return a; }
    return a > b ? a + std::log1p(std::exp(b - a)) : b + std::log1p(std::exp(a - b));
}

} // namespace BN

#endif // BAYESNET_TYPEDEFS_H
