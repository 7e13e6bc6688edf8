#include "table.hpp"
#include "csv.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace {

const std::vector<std::string> metadataColumns = {
    "collection_id", "frame_id", "path", "start_sample", "end_sample"};

std::string formatFloat(float value) {
  std::ostringstream out;
  out.precision(std::numeric_limits<float>::max_digits10);
  out << value;
  return out.str();
}

size_t parseSample(const std::string &text, size_t line) {
  try {
    size_t consumed = 0;
    unsigned long long value = std::stoull(text, &consumed);
    if (consumed != text.size()) {
      throw std::invalid_argument(text);
    }
    return static_cast<size_t>(value);
  } catch (const std::logic_error &) {
    throw TableFormatError("invalid sample position '" + text + "' on line " +
                           std::to_string(line));
  }
}

float parseFeature(const std::string &text, size_t line) {
  try {
    size_t consumed = 0;
    float value = std::stof(text, &consumed);
    if (consumed != text.size() || !std::isfinite(value)) {
      throw std::invalid_argument(text);
    }
    return value;
  } catch (const std::logic_error &) {
    throw TableFormatError("invalid feature value '" + text + "' on line " +
                           std::to_string(line));
  }
}

// frame_id is "{collection_id}_f{index}"
size_t frameIndexFromId(const std::string &frameId, size_t line) {
  size_t marker = frameId.rfind("_f");
  if (marker == std::string::npos) {
    throw TableFormatError("invalid frame id '" + frameId + "' on line " +
                           std::to_string(line));
  }
  return parseSample(frameId.substr(marker + 2), line);
}

} // namespace

FeatureTable::FeatureTable() : schema(featureSchema()) {}

FeatureTable::FeatureTable(std::vector<std::string> schema)
    : schema(std::move(schema)) {}

void FeatureTable::addRow(const Frame &frame, const FeatureVector &vector) {
  if (vector.names != schema || vector.values.size() != schema.size()) {
    throw std::invalid_argument("feature vector for " + frame.id() +
                                " does not match the table schema");
  }
  for (float value : vector.values) {
    if (!std::isfinite(value)) {
      throw std::invalid_argument("feature vector for " + frame.id() +
                                  " has a non-finite value");
    }
  }
  frames.push_back(frame);
  features.push_back(vector.values);
}

void FeatureTable::append(const FeatureTable &other) {
  if (other.schema != schema) {
    throw std::invalid_argument("cannot append a table with another schema");
  }
  frames.insert(frames.end(), other.frames.begin(), other.frames.end());
  features.insert(features.end(), other.features.begin(),
                  other.features.end());
}

std::vector<std::vector<float>>
FeatureTable::select(const std::vector<std::string> &featureNames) const {
  const std::vector<size_t> columns = resolveColumns(schema, featureNames);

  std::vector<std::vector<float>> matrix;
  matrix.reserve(features.size());
  for (const auto &row : features) {
    std::vector<float> selected;
    selected.reserve(columns.size());
    for (size_t column : columns) {
      selected.push_back(row[column]);
    }
    matrix.push_back(std::move(selected));
  }
  return matrix;
}

size_t FeatureTable::rowCount() const { return frames.size(); }

bool FeatureTable::empty() const { return frames.empty(); }

const std::vector<std::string> &FeatureTable::getSchema() const {
  return schema;
}

const Frame &FeatureTable::frame(size_t row) const { return frames.at(row); }

FeatureVector FeatureTable::vector(size_t row) const {
  return FeatureVector{schema, features.at(row)};
}

void FeatureTable::saveCsv(const std::string &path) const {
  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error("Failed to open " + path + " for writing");
  }

  Csv::Row header = metadataColumns;
  header.insert(header.end(), schema.begin(), schema.end());
  Csv::writeRow(out, header);

  for (size_t i = 0; i < frames.size(); ++i) {
    const Frame &f = frames[i];
    Csv::Row row = {f.collectionId, f.id(), f.sourcePath,
                    std::to_string(f.startSample),
                    std::to_string(f.endSample)};
    for (float value : features[i]) {
      row.push_back(formatFloat(value));
    }
    Csv::writeRow(out, row);
  }

  if (!out) {
    throw std::runtime_error("Failed to write " + path);
  }
}

FeatureTable FeatureTable::loadCsv(const std::string &path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Failed to open " + path);
  }

  Csv::Row header;
  if (!Csv::readRow(in, header)) {
    throw TableFormatError(path + " is empty");
  }
  if (header.size() < metadataColumns.size() ||
      !std::equal(metadataColumns.begin(), metadataColumns.end(),
                  header.begin())) {
    throw TableFormatError(path + " does not start with the frame columns");
  }

  FeatureTable table(std::vector<std::string>(
      header.begin() + metadataColumns.size(), header.end()));

  Csv::Row row;
  size_t line = 1;
  while (Csv::readRow(in, row)) {
    ++line;
    if (row.size() == 1 && row[0].empty()) {
      continue;
    }
    if (row.size() != header.size()) {
      throw TableFormatError("expected " + std::to_string(header.size()) +
                             " fields on line " + std::to_string(line) +
                             " of " + path);
    }

    Frame frame;
    frame.collectionId = row[0];
    frame.frameIndex = frameIndexFromId(row[1], line);
    frame.sourcePath = row[2];
    frame.startSample = parseSample(row[3], line);
    frame.endSample = parseSample(row[4], line);
    if (frame.startSample >= frame.endSample) {
      throw TableFormatError("empty frame on line " + std::to_string(line));
    }

    FeatureVector vector;
    vector.names = table.schema;
    for (size_t i = metadataColumns.size(); i < row.size(); ++i) {
      vector.values.push_back(parseFeature(row[i], line));
    }
    table.addRow(frame, vector);
  }
  return table;
}
