#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace intent {

// Input that cannot be parsed even with error recovery.
class ParseError : public std::runtime_error {
public:
  ParseError(const std::string &message, int line, int column)
      : std::runtime_error(message + " (" + std::to_string(line) + ":" +
                           std::to_string(column) + ")"),
        line_(line), column_(column) {}

  int line() const { return line_; }
  int column() const { return column_; }

private:
  int line_;
  int column_;
};

// Raised by a single extractor; the orchestrator degrades that facet only.
class ExtractorError : public std::runtime_error {
public:
  ExtractorError(std::string facet, const std::string &message)
      : std::runtime_error(message), facet_(std::move(facet)) {}

  const std::string &facet() const { return facet_; }

private:
  std::string facet_;
};

// Raised by telemetry or insight collaborators. Never surfaced to callers.
class CollaboratorError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace intent
