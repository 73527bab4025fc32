#pragma once

#include <stdexcept>
#include <string>

namespace docvec::core {

// DocvecError is the root of every failure the document store reports.
// Callers that do not care about the category can catch this one type.
class DocvecError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A metadata value, key or embedding does not fit the declared row schema.
class SchemaMismatch : public DocvecError {
 public:
  using DocvecError::DocvecError;
};

// An identifier collided with a stored (or earlier in-batch) document under the fail policy.
class DuplicateDocumentError : public DocvecError {
 public:
  using DocvecError::DocvecError;
};

// A filter names an unknown field, is malformed, or pairs an operator with a field
// type it is not defined for.
class UnsupportedFilterError : public DocvecError {
 public:
  using DocvecError::DocvecError;
};

// Full-text search was requested on a field that has no full-text index.
class IndexNotReadyError : public DocvecError {
 public:
  using DocvecError::DocvecError;
};

// The embedded engine failed (I/O, corruption, locking, constraint).
// engine_code() is the SQLite primary result code, or -1 when none applies.
class StorageError : public DocvecError {
 public:
  explicit StorageError(const std::string& message, int engine_code = -1)
      : DocvecError(message), engine_code_(engine_code) {}

  [[nodiscard]] int engine_code() const noexcept { return engine_code_; }

 private:
  int engine_code_;
};

// An existing table cannot be opened under the requested exists policy.
class StoreInitError : public DocvecError {
 public:
  using DocvecError::DocvecError;
};

}  // namespace docvec::core
