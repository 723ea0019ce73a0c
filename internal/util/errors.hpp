#pragma once

#include <stdexcept>
#include <string>

namespace pmm::util {

/*
  Central error types.

  Every error raised by the metadata core derives from PmmError so callers
  can catch the whole family at once. Arrow failures are unwrapped into
  std::runtime_error and are not part of this hierarchy.
*/

class PmmError : public std::runtime_error {
 public:
  explicit PmmError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ------------------------------------------------------------
// Construction-time
// ------------------------------------------------------------

class UnknownAttribute : public PmmError {
 public:
  explicit UnknownAttribute(const std::string& msg) : PmmError(msg) {
  }
};

class TooManyArguments : public PmmError {
 public:
  explicit TooManyArguments(const std::string& msg) : PmmError(msg) {
  }
};

class MissingRequiredAttribute : public PmmError {
 public:
  explicit MissingRequiredAttribute(const std::string& msg) : PmmError(msg) {
  }
};

class TypeMismatch : public PmmError {
 public:
  explicit TypeMismatch(const std::string& msg) : PmmError(msg) {
  }
};

// ------------------------------------------------------------
// Validation-time
// ------------------------------------------------------------

class FieldCountMismatch : public PmmError {
 public:
  explicit FieldCountMismatch(const std::string& msg) : PmmError(msg) {
  }
};

class UnsupportedFormatVersion : public PmmError {
 public:
  explicit UnsupportedFormatVersion(const std::string& msg) : PmmError(msg) {
  }
};

class DuplicateFieldName : public PmmError {
 public:
  explicit DuplicateFieldName(const std::string& msg) : PmmError(msg) {
  }
};

class UnknownCanonicalType : public PmmError {
 public:
  explicit UnknownCanonicalType(const std::string& msg) : PmmError(msg) {
  }
};

class UnknownRole : public PmmError {
 public:
  explicit UnknownRole(const std::string& msg) : PmmError(msg) {
  }
};

class FieldNotFound : public PmmError {
 public:
  explicit FieldNotFound(const std::string& msg) : PmmError(msg) {
  }
};

// ------------------------------------------------------------
// Inference-time
// ------------------------------------------------------------

class UnknownStorageType : public PmmError {
 public:
  explicit UnknownStorageType(const std::string& msg) : PmmError(msg) {
  }
};

class UnknownType : public PmmError {
 public:
  explicit UnknownType(const std::string& msg) : PmmError(msg) {
  }
};

// ------------------------------------------------------------
// Boundary
// ------------------------------------------------------------

class TableUnavailable : public PmmError {
 public:
  explicit TableUnavailable(const std::string& msg) : PmmError(msg) {
  }
};

} // namespace pmm::util
