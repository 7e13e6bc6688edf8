#include "matcher.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

std::vector<Candidate>
Matcher::nearest(const FeatureVector &query, const FeatureTable &table,
                 size_t k, const std::vector<std::string> &features) {
  const std::vector<float> point = query.project(features);
  const std::vector<std::vector<float>> rows = table.select(features);

  if (k == 0) {
    throw InvalidQueryError("at least one neighbour must be requested");
  }
  if (k > rows.size()) {
    throw InvalidQueryError("requested " + std::to_string(k) +
                            " neighbours from a table of " +
                            std::to_string(rows.size()) + " rows");
  }

  for (float value : point) {
    if (!std::isfinite(value)) {
      throw InvalidQueryError("query has a non-finite feature value");
    }
  }

  std::vector<float> distances(rows.size());
  for (size_t r = 0; r < rows.size(); ++r) {
    double sum = 0.0;
    for (size_t c = 0; c < point.size(); ++c) {
      double diff = static_cast<double>(rows[r][c]) - point[c];
      sum += diff * diff;
    }
    distances[r] = static_cast<float>(std::sqrt(sum));
  }

  std::vector<size_t> order(rows.size());
  std::iota(order.begin(), order.end(), 0);
  std::partial_sort(order.begin(), order.begin() + k, order.end(),
                    [&distances](size_t a, size_t b) {
                      if (distances[a] != distances[b]) {
                        return distances[a] < distances[b];
                      }
                      return a < b;
                    });

  std::vector<Candidate> candidates;
  candidates.reserve(k);
  for (size_t i = 0; i < k; ++i) {
    candidates.push_back({order[i], distances[order[i]]});
  }
  return candidates;
}

MatchDecision Matcher::match(const FeatureVector &query,
                             const FeatureTable &table,
                             const std::vector<std::string> &features,
                             const MatchPolicy &policy, std::mt19937 &rng) {
  MatchDecision decision;
  decision.candidates = nearest(query, table, policy.k, features);

  size_t pick = 0;
  if (policy.selection == SelectionPolicy::RandomAmongTopK) {
    std::uniform_int_distribution<size_t> dist(0,
                                               decision.candidates.size() - 1);
    pick = dist(rng);
  }
  decision.row = decision.candidates[pick].row;
  decision.frame = table.frame(decision.row);
  return decision;
}

SelectionPolicy Matcher::parsePolicy(const std::string &name) {
  if (name == "best") {
    return SelectionPolicy::Best;
  }
  if (name == "random") {
    return SelectionPolicy::RandomAmongTopK;
  }
  throw std::invalid_argument("Invalid choice: " + name);
}
