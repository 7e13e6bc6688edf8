#pragma once

#include <cstddef>
#include <random>
#include <string>
#include <vector>

#include "features.hpp"
#include "frame.hpp"
#include "globals.hpp"
#include "table.hpp"

enum class SelectionPolicy {
  // always the nearest row
  Best,
  // uniform choice among the k nearest rows
  RandomAmongTopK,
};

struct MatchPolicy {
  SelectionPolicy selection{SelectionPolicy::RandomAmongTopK};
  size_t k{DEFAULT_NEIGHBOURS};
};

struct Candidate {
  size_t row;
  float distance;
};

struct MatchDecision {
  size_t row;
  Frame frame;
  // the k nearest rows by ascending distance
  std::vector<Candidate> candidates;
};

namespace Matcher {

// Euclidean distances between `query` and every row of `table`, restricted
// to `features`; the k nearest by ascending distance, ties in row order.
// Throws InvalidQueryError for an empty or unknown feature list, k == 0 or
// k larger than the table.
std::vector<Candidate> nearest(const FeatureVector &query,
                               const FeatureTable &table, size_t k,
                               const std::vector<std::string> &features);

MatchDecision match(const FeatureVector &query, const FeatureTable &table,
                    const std::vector<std::string> &features,
                    const MatchPolicy &policy, std::mt19937 &rng);

SelectionPolicy parsePolicy(const std::string &name);

} // namespace Matcher
