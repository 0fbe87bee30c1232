#ifndef OPTIONS_H
#define OPTIONS_H

#include <cstdint>
#include <ostream>

#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include "guess_input.hpp"

namespace options {

struct settings {
  bool help = false;
  guess_input::bounds range{1, 100};
  // Unset means a fresh secret every run.
  boost::optional<uint64_t> seed;
};

boost::program_options::options_description description();

// Throws boost::program_options::error for unknown or malformed options and
// std::invalid_argument if --min is above --max.  --seed must be a
// non-negative integer that fits in 64 bits.
settings parse(int argc, const char* const argv[]);

void print_usage(std::ostream& out, const char* argv0);

} // namespace options
#endif //OPTIONS_H
