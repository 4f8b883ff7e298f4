#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace digiplayer::util {

/*
  Central error types.

  Transient categories are absorbed at component boundaries and turned
  into state or backoff changes. Only a StorageError raised while
  bootstrapping the device identity terminates the agent.
*/

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg, std::optional<long> http_status = std::nullopt)
      : std::runtime_error(msg), http_status_(http_status) {
  }

  // Set when the server answered with a non-2xx status.
  std::optional<long> HttpStatus() const {
    return http_status_;
  }

 private:
  std::optional<long> http_status_;
};

class ExecutionError : public std::runtime_error {
 public:
  ExecutionError(std::string kind, std::string cause)
      : std::runtime_error(kind + ": " + cause), kind_(std::move(kind)), cause_(std::move(cause)) {
  }

  const std::string& Kind() const {
    return kind_;
  }

  const std::string& Cause() const {
    return cause_;
  }

 private:
  std::string kind_;
  std::string cause_;
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace digiplayer::util
