#include "csv.hpp"
#include "errors.hpp"

std::string Csv::escape(const std::string &field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos) {
    return field;
  }
  std::string quoted = "\"";
  for (char c : field) {
    if (c == '"') {
      quoted += '"';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

void Csv::writeRow(std::ostream &out, const Row &row) {
  for (size_t i = 0; i < row.size(); ++i) {
    if (i > 0) {
      out << ',';
    }
    out << escape(row[i]);
  }
  out << '\n';
}

bool Csv::readRow(std::istream &in, Row &row) {
  row.clear();
  std::string line;
  if (!std::getline(in, line)) {
    return false;
  }

  std::string field;
  bool quoted = false;
  size_t i = 0;
  while (true) {
    if (i == line.size()) {
      if (quoted) {
        // Quoted field continues on the next line
        std::string next;
        if (!std::getline(in, next)) {
          throw TableFormatError("unterminated quoted field");
        }
        field += '\n';
        line = next;
        i = 0;
        continue;
      }
      break;
    }

    char c = line[i++];
    if (quoted) {
      if (c == '"') {
        if (i < line.size() && line[i] == '"') {
          field += '"';
          ++i;
        } else {
          quoted = false;
        }
      } else {
        field += c;
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      row.push_back(field);
      field.clear();
    } else if (c != '\r') {
      field += c;
    }
  }
  row.push_back(field);
  return true;
}
