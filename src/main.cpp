#include "cli.hpp"
#include "errors.hpp"
#include "runner.hpp"

#include <iostream>
#include <utility>

int main(int argc, char** argv) {
  Config parsed;
  try {
    parsed = build_config(collect_args(argc, argv));
  } catch (const ConfigError& e) {
    std::cerr << "Problem parsing arguments: " << e.what() << "\n";
    return 1;
  }
  const Config config = std::move(parsed);

  print_banner(config, std::cout);

  try {
    run(config, std::cout);
  } catch (const std::exception& e) {
    std::cerr << "Application error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
