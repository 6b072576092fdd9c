#pragma once
#include <cstdlib>
#include <functional>
#include <string>
#include <vector>

struct Config {
  std::string query;
  std::string filename;
  bool case_sensitive = true;   // false when CASE_INSENSITIVE is set
};

// Returns the variable's value, or nullptr when it is not set.
using EnvLookup = std::function<const char*(const char*)>;

std::vector<std::string> collect_args(int argc, char** argv);

// args[0] is the program path, args[1] the query, args[2] the file.
// Throws ConfigError when the query or the file is missing.
// Only the presence of CASE_INSENSITIVE matters, not its value.
Config build_config(const std::vector<std::string>& args,
                    const EnvLookup& env = std::getenv);
