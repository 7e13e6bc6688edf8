#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "features.hpp"
#include "frame.hpp"

// Frames of one collection (or one target file) with their feature vectors.
// Row order is insertion order; for a target table it is the output order.
class FeatureTable {
  std::vector<std::string> schema;
  std::vector<Frame> frames;
  // one row per frame, columns in schema order
  std::vector<std::vector<float>> features;

public:
  FeatureTable();
  explicit FeatureTable(std::vector<std::string> schema);

  // Rejects vectors whose feature names differ from the table's schema
  void addRow(const Frame &frame, const FeatureVector &vector);

  // Append every row of a table with the same schema
  void append(const FeatureTable &other);

  // Rows in table order, columns in the order of `featureNames`. Throws
  // InvalidQueryError for an empty list or an unknown feature.
  std::vector<std::vector<float>>
  select(const std::vector<std::string> &featureNames) const;

  size_t rowCount() const;
  bool empty() const;
  const std::vector<std::string> &getSchema() const;
  const Frame &frame(size_t row) const;
  FeatureVector vector(size_t row) const;

  // Row oriented CSV: collection_id, frame_id, path, start_sample,
  // end_sample, then one column per feature
  void saveCsv(const std::string &path) const;
  static FeatureTable loadCsv(const std::string &path);
};
