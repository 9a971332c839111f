#pragma once

#include <stdexcept>
#include <string>

// Configuration problems are detected before any child process is spawned.
// LaunchError means the transfer client never ran, which callers must be able
// to tell apart from a client that ran and exited non-zero.

class BulkfetchError : public std::runtime_error {
public:
  explicit BulkfetchError(const std::string& message) : std::runtime_error(message) {}
};

class ConfigError : public BulkfetchError {
public:
  explicit ConfigError(const std::string& message) : BulkfetchError(message) {}
};

class LaunchError : public BulkfetchError {
public:
  explicit LaunchError(const std::string& message) : BulkfetchError(message) {}
};

class IoError : public BulkfetchError {
public:
  explicit IoError(const std::string& message) : BulkfetchError(message) {}
};
