#pragma once
#include <stdexcept>
#include <string>

// Bad command line. Reported as "Problem parsing arguments: ..."
class ConfigError : public std::runtime_error {
public:
  enum class Kind { MissingArguments };

  ConfigError(Kind kind, const std::string& msg)
    : std::runtime_error(msg), kind_(kind) {}

  Kind kind() const { return kind_; }

private:
  Kind kind_;
};

// Failure while running a search. Reported as "Application error: ..."
class RuntimeError : public std::runtime_error {
public:
  enum class Kind { FileReadFailure, OutputFailure };

  RuntimeError(Kind kind, const std::string& msg)
    : std::runtime_error(msg), kind_(kind) {}

  Kind kind() const { return kind_; }

private:
  Kind kind_;
};
