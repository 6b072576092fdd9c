#include "runner.hpp"
#include "errors.hpp"
#include "loader.hpp"
#include "search.hpp"
#include <string>

void print_banner(const Config& config, std::ostream& out) {
  out << "Searching for " << config.query << "\n";
  out << "In file " << config.filename << "\n";
}

void run(const Config& config, std::ostream& out) {
  const std::string contents = read_file(config.filename);

  for (std::string_view line : ::search(config.query, contents, config.case_sensitive)) {
    if (!(out << line << '\n')) break;
  }
  if (!out.flush()) {
    throw RuntimeError(RuntimeError::Kind::OutputFailure, "Failed to write results");
  }
}
