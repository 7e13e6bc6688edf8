#pragma once

#include <stdexcept>
#include <string>

// A file or frame cannot be feature-extracted
class AnalysisError : public std::runtime_error {
public:
  explicit AnalysisError(const std::string &what) : std::runtime_error(what) {}
};

// Malformed similarity request
class InvalidQueryError : public std::invalid_argument {
public:
  explicit InvalidQueryError(const std::string &what)
      : std::invalid_argument(what) {}
};

class AudioFileError : public std::runtime_error {
public:
  explicit AudioFileError(const std::string &what)
      : std::runtime_error(what) {}
};

class TableFormatError : public std::runtime_error {
public:
  explicit TableFormatError(const std::string &what)
      : std::runtime_error(what) {}
};
