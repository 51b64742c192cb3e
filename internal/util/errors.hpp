#pragma once

#include <stdexcept>
#include <string>

namespace acquisition::util {

/*
  Central error types.

  Service layers translate these to gRPC status codes. The orchestrator
  translates them to job failure reasons, callers never see them raw.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unsupported : public std::runtime_error {
 public:
  explicit Unsupported(const std::string& msg) : std::runtime_error(msg) {
  }
};

// No usable credential and no way to obtain one.
class AuthExpired : public std::runtime_error {
 public:
  explicit AuthExpired(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Backend rejected the presented credential (HTTP 401).
class AuthDenied : public std::runtime_error {
 public:
  explicit AuthDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Network failure or 5xx.
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// HTTP 429.
class RateLimited : public TransportError {
 public:
  explicit RateLimited(const std::string& msg) : TransportError(msg) {
  }
};

// A backend call was still running when the job's time limit passed.
class DeadlineExceeded : public std::runtime_error {
 public:
  explicit DeadlineExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AdmissionCancelled : public std::runtime_error {
 public:
  explicit AdmissionCancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

class OutOfSequenceChunk : public std::runtime_error {
 public:
  explicit OutOfSequenceChunk(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DecryptionContextMisuse : public std::runtime_error {
 public:
  explicit DecryptionContextMisuse(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace acquisition::util
