#pragma once

#include "config.hpp"
#include <ostream>
#include <string>

// Parses 'input' and re-serializes it to cfg.outputPath, or to 'out' followed
// by a newline when no output path is set. Everything written to 'out' is in
// cfg.encoding.
void reformat(Config const& cfg, std::string const& input, std::ostream& out);
