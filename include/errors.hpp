#pragma once
#include <stdexcept>
#include <string>

// Bad user input (frame count, policy name, mode, config values).
// Raised before any simulation starts.
class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(const std::string &what) : std::runtime_error(what) {}
};

// Unreadable, malformed or empty trace.
class TraceError : public std::runtime_error {
public:
  explicit TraceError(const std::string &what) : std::runtime_error(what) {}
};

// Internal bug: the frame table or a policy was driven out of contract.
class InvariantViolation : public std::logic_error {
public:
  explicit InvariantViolation(const std::string &what) : std::logic_error(what) {}
};
