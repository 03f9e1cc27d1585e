#pragma once

#include <stdexcept>
#include <string>

namespace convintel::util {

/*
  Central error types.

  The learning path catches these per (tenant, pattern type); the admin
  surface translates them to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A caller demanded a stored pattern but the sample floors were never met.
class InsufficientData : public std::runtime_error {
 public:
  explicit InsufficientData(const std::string& msg) : std::runtime_error(msg) {
  }
};

class OptimizerNonConvergence : public std::runtime_error {
 public:
  explicit OptimizerNonConvergence(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DetectorFailure : public std::runtime_error {
 public:
  explicit DetectorFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MalformedContent : public std::runtime_error {
 public:
  explicit MalformedContent(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreWriteFailure : public std::runtime_error {
 public:
  explicit StoreWriteFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace convintel::util
