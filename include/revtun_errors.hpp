#pragma once

#include <ostream>
#include <stdexcept>
#include <string>

#include "my_error_codes.hpp"

namespace revtun {

struct Error {
  int code{0};
  std::string what;

  friend std::ostream &operator<<(std::ostream &os, const Error &e) {
    os << "[" << e.code << "] " << e.what;
    return os;
  }
};

// Root of the failure taxonomy. `step` names the pipeline step that failed so
// the operator knows which remote state may be partially applied.
class RevtunError : public std::runtime_error {
  int code_;
  std::string step_;

public:
  RevtunError(int code, const std::string &what, std::string step = {})
      : std::runtime_error(what), code_(code), step_(std::move(step)) {}

  int code() const noexcept { return code_; }
  const std::string &step() const noexcept { return step_; }

  Error to_error() const {
    if (step_.empty()) {
      return Error{code_, what()};
    }
    return Error{code_, step_ + ": " + what()};
  }
};

// Missing configuration or tooling. Raised before any work is attempted.
class PreconditionError : public RevtunError {
public:
  using RevtunError::RevtunError;
};

class KeyRetrievalError : public RevtunError {
public:
  using RevtunError::RevtunError;
};

// Unreachable with validated inputs; seeing one is a programming defect.
class RenderError : public RevtunError {
public:
  using RevtunError::RevtunError;
};

class TransferError : public RevtunError {
public:
  using RevtunError::RevtunError;
};

class RemoteExecError : public RevtunError {
public:
  using RevtunError::RevtunError;
};

class OperationCancelled : public RevtunError {
public:
  explicit OperationCancelled(std::string step = {})
      : RevtunError(my_errors::CONTROL::CANCELLED, "operation cancelled",
                    std::move(step)) {}
};

} // namespace revtun
