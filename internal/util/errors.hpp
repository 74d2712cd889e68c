#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace piecework::util {

/*
  Central error types.

  Reported synchronously to the caller; the core never retries.
  The CLI maps them to exit codes through ErrorKind().
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// day closed, task already paid, settlement claim lost
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Validation : public std::runtime_error {
 public:
  explicit Validation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Forbidden : public std::runtime_error {
 public:
  explicit Forbidden(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Stable short name: not_found|conflict|validation|forbidden|internal
const char* ErrorKind(const std::exception& e);

// Process exit code for the CLI.
int ExitCode(const std::exception& e);

} // namespace piecework::util
