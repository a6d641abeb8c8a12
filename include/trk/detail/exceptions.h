#ifndef TRK_DETAIL_EXCEPTIONS_H
#define TRK_DETAIL_EXCEPTIONS_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace trk {

/// Base exception for all TRK library errors.
class TrkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// I/O errors: file not found, mmap errors, failed reads.
class TrkIOError : public TrkError {
public:
  using TrkError::TrkError;
};

/// Format errors: bad magic, unsupported version, inconsistent header fields.
class TrkFormatError : public TrkError {
public:
  using TrkError::TrkError;
};

/// Argument errors: invalid API arguments or options.
class TrkArgumentError : public TrkError {
public:
  using TrkError::TrkError;
};

/// The streamline data ended before a record (or the declared number of records) was complete.
class TrkTruncatedStreamError : public TrkError {
public:
  TrkTruncatedStreamError(const std::string &what, uint64_t offset, uint64_t expected, uint64_t found)
      : TrkError(what + " (offset=" + std::to_string(offset) + ", expected=" + std::to_string(expected) +
                 ", found=" + std::to_string(found) + ")"),
        offset_(offset), expected_(expected), found_(found) {}

  uint64_t offset() const { return offset_; }
  uint64_t expected() const { return expected_; }
  uint64_t found() const { return found_; }

private:
  uint64_t offset_;
  uint64_t expected_;
  uint64_t found_;
};

/// A requested streamline id is outside [0, count).
class TrkIndexOutOfRange : public TrkError {
public:
  TrkIndexOutOfRange(uint64_t id, uint64_t count)
      : TrkError("Streamline index " + std::to_string(id) + " out of range [0, " + std::to_string(count) + ")"),
        id_(id), count_(count) {}

  uint64_t id() const { return id_; }
  uint64_t count() const { return count_; }

private:
  uint64_t id_;
  uint64_t count_;
};

/// The heuristic length scan did not find exactly one candidate per streamline.
/// Recovered by the sequential fallback unless the strict heuristic was requested.
class TrkHeuristicMismatch : public TrkError {
public:
  TrkHeuristicMismatch(const std::string &what, uint64_t expected, uint64_t found)
      : TrkError(what + " (expected=" + std::to_string(expected) + ", found=" + std::to_string(found) + ")"),
        expected_(expected), found_(found) {}

  uint64_t expected() const { return expected_; }
  uint64_t found() const { return found_; }

private:
  uint64_t expected_;
  uint64_t found_;
};

} // namespace trk

#endif // TRK_DETAIL_EXCEPTIONS_H
