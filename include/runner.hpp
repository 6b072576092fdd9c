#pragma once
#include "cli.hpp"
#include <ostream>

void print_banner(const Config& config, std::ostream& out);

// Load config.filename, search it and write one matching line per line.
void run(const Config& config, std::ostream& out);
