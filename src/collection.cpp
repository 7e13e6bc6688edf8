#include "collection.hpp"
#include "csv.hpp"
#include "errors.hpp"

#include <algorithm>
#include <fstream>
#include <set>

std::vector<CollectionEntry> Collection::loadManifest(const std::string &path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Failed to open collection manifest " + path);
  }

  Csv::Row header;
  if (!Csv::readRow(in, header)) {
    throw TableFormatError(path + " is empty");
  }

  auto columnOf = [&header](const std::string &name) {
    auto it = std::find(header.begin(), header.end(), name);
    return it == header.end() ? header.size()
                              : static_cast<size_t>(it - header.begin());
  };
  const size_t pathColumn = columnOf("path");
  size_t idColumn = columnOf("collection_id");
  if (idColumn == header.size()) {
    idColumn = columnOf("freesound_id");
  }
  if (pathColumn == header.size() || idColumn == header.size()) {
    throw TableFormatError(path +
                           " needs 'path' and 'collection_id' columns");
  }

  std::vector<CollectionEntry> entries;
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

    CollectionEntry entry;
    entry.collectionId = row[idColumn];
    entry.path = row[pathColumn];
    for (size_t i = 0; i < row.size(); ++i) {
      if (i != idColumn && i != pathColumn) {
        entry.metadata.emplace_back(header[i], row[i]);
      }
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

std::vector<CollectionEntry>
Collection::entriesUsed(const std::vector<CollectionEntry> &entries,
                        const std::vector<std::string> &ids) {
  const std::set<std::string> wanted(ids.begin(), ids.end());
  std::vector<CollectionEntry> used;
  for (const auto &entry : entries) {
    if (wanted.count(entry.collectionId) > 0) {
      used.push_back(entry);
    }
  }
  return used;
}
