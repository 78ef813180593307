#pragma once

#include <stdexcept>
#include <string>

namespace hub_rules {

// Base of every error raised by hub-rules components
class Error : public std::runtime_error {
public:
  explicit Error(const std::string &message) : std::runtime_error(message) {}
};

// Operation on an unknown or already-removed condition, rule or scene
class NotFoundError : public Error {
public:
  using Error::Error;
};

// Registration of a condition, rule or scene id that is already active
class DuplicateError : public Error {
public:
  using Error::Error;
};

// Trigger/timer/action definition failed to compile or raised while running
class ScriptError : public Error {
public:
  using Error::Error;
};

// Timer could not be scheduled
class TimerError : public Error {
public:
  using Error::Error;
};

// Hub collaborator failed while serving a device call
class DeviceCommunicationError : public Error {
public:
  using Error::Error;
};

// Configuration file could not be read, parsed or validated
class ConfigError : public Error {
public:
  using Error::Error;
};

// Raised at a suspension point once the owning rule task was cancelled.
// Not derived from Error so script-level handlers never swallow it.
class TaskCancelled : public std::exception {
public:
  const char *what() const noexcept override { return "rule task cancelled"; }
};

} // namespace hub_rules
