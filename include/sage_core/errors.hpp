#pragma once

#include <exception>
#include <string>

namespace sage_core {

class SageError : public std::exception {
 public:
  explicit SageError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Rejected before any I/O happens
class ValidationError : public SageError {
 public:
  using SageError::SageError;
};

// A named collection or document does not exist
class NotFoundError : public SageError {
 public:
  using SageError::SageError;
};

class EmbeddingError : public SageError {
 public:
  using SageError::SageError;
};

class RetrievalError : public SageError {
 public:
  using SageError::SageError;
};

class GenerationError : public SageError {
 public:
  using SageError::SageError;
};

class QueryTimeoutError : public SageError {
 public:
  using SageError::SageError;
};

}  // namespace sage_core
