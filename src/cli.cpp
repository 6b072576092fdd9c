#include "cli.hpp"
#include "errors.hpp"

std::vector<std::string> collect_args(int argc, char** argv) {
  std::vector<std::string> args;
  args.reserve(argc > 0 ? (size_t)argc : 0);
  for (int i = 0; i < argc; ++i) args.emplace_back(argv[i]);
  return args;
}

Config build_config(const std::vector<std::string>& args, const EnvLookup& env) {
  // program path, query, file
  if (args.size() < 3) {
    throw ConfigError(ConfigError::Kind::MissingArguments,
                      "Some arguments appear to be missing");
  }

  Config c;
  c.query = args[1];
  c.filename = args[2];
  c.case_sensitive = env("CASE_INSENSITIVE") == nullptr;
  return c;
}
