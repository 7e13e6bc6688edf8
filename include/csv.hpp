#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace Csv {

using Row = std::vector<std::string>;

// Quote a field if it contains a comma, quote or line break
std::string escape(const std::string &field);

void writeRow(std::ostream &out, const Row &row);

// Read one record, honoring quoted fields that span lines. Returns false at
// end of input.
bool readRow(std::istream &in, Row &row);

} // namespace Csv
