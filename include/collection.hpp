#pragma once

#include <string>
#include <utility>
#include <vector>

// One downloaded sound of the source collection. Metadata (name, license,
// tags, ...) is carried along for reporting only.
struct CollectionEntry {
  std::string collectionId;
  std::string path;
  std::vector<std::pair<std::string, std::string>> metadata;
};

namespace Collection {

// Manifest CSV with a `path` column and a `collection_id` (or
// `freesound_id`) column; every other column is kept as metadata
std::vector<CollectionEntry> loadManifest(const std::string &path);

// Entries whose id appears in `ids`, in manifest order
std::vector<CollectionEntry>
entriesUsed(const std::vector<CollectionEntry> &entries,
            const std::vector<std::string> &ids);

} // namespace Collection
