#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace kr {

// Base of every error raised by the reader. `offset` is the absolute byte
// offset in the source where the problem was detected.
class ReportError : public std::runtime_error {
public:
  ReportError(const std::string& what, std::uint64_t offset)
    : std::runtime_error(what), offset_(offset) {}
  std::uint64_t offset() const noexcept { return offset_; }

private:
  std::uint64_t offset_;
};

// Lexical / byte-level failure (bad token, invalid UTF-8, truncated input, I/O).
class MalformedInputError : public ReportError {
public:
  MalformedInputError(const std::string& msg, std::uint64_t offset)
    : ReportError("malformed input at byte " + std::to_string(offset) + ": " + msg, offset) {}
};

// Structural expectation violated (missing Rank/Summary, duplicate rank, ...).
class SchemaViolationError : public ReportError {
public:
  SchemaViolationError(std::string expected, std::string found, std::uint64_t offset)
    : ReportError("schema violation at byte " + std::to_string(offset) +
                  ": expected " + expected + ", found " + found, offset),
      expected_(std::move(expected)), found_(std::move(found)) {}

  const std::string& expected() const noexcept { return expected_; }
  const std::string& found() const noexcept { return found_; }

private:
  std::string expected_;
  std::string found_;
};

// The rank has no detailed entry. Expected condition, not a fault.
class NoDetailError : public ReportError {
public:
  explicit NoDetailError(std::string rank)
    : ReportError("no detail for rank '" + rank + "'", 0), rank_(std::move(rank)) {}
  const std::string& rank() const noexcept { return rank_; }

private:
  std::string rank_;
};

class CancelledError : public ReportError {
public:
  explicit CancelledError(std::uint64_t offset)
    : ReportError("detail resolution cancelled at byte " + std::to_string(offset), offset) {}
};

class ReportClosedError : public ReportError {
public:
  ReportClosedError() : ReportError("report handle is closed", 0) {}
};

}
