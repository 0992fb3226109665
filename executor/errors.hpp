#ifndef EXECUTOR_ERRORS_HPP
#define EXECUTOR_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace executor {

// The sandbox is misconfigured for the request: a missing proxy command, a
// runtime outside the allow-list, and so on. Raised before anything runs.
class config_error : public std::runtime_error {
 public:
  explicit config_error(const std::string& msg) : std::runtime_error(msg) {}
};

// The request itself is malformed. Raised before anything is staged.
class invalid_request : public std::runtime_error {
 public:
  explicit invalid_request(const std::string& msg) : std::runtime_error(msg) {}
};

class unsupported_language : public invalid_request {
 public:
  explicit unsupported_language(const std::string& language)
      : invalid_request("unsupported language: " + language) {}
};

// The container runtime, the host filesystem or the isolation proxy failed.
class infrastructure_error : public std::runtime_error {
 public:
  explicit infrastructure_error(const std::string& msg)
      : std::runtime_error(msg) {}
};

class execution_not_found : public std::runtime_error {
 public:
  explicit execution_not_found(const std::string& id)
      : std::runtime_error("execution " + id + " not found") {}
};

}  // namespace executor

#endif
