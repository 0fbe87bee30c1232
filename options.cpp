#include <string>

#include <boost/lexical_cast.hpp>

#include "options.hpp"

namespace options {

namespace po = boost::program_options;

po::options_description description() {
  po::options_description desc("Options");
  desc.add_options()
      ("help", "produce help message")
      ("min", po::value<int>()->default_value(1), "smallest possible secret")
      ("max", po::value<int>()->default_value(100), "largest possible secret")
      ("seed", po::value<std::string>(),
       "seed for the secret, for a repeatable game (0 to 2^64-1)");
  return desc;
}

// lexical_cast wraps "-1" around to the largest value, so the sign is checked
// here.
static uint64_t parse_seed(const std::string& text) {
  uint64_t seed;
  if (text.empty() || text[0] == '-' ||
      !boost::conversion::try_lexical_convert(text, seed)) {
    throw po::invalid_option_value(text);
  }
  return seed;
}

settings parse(int argc, const char* const argv[]) {
  po::variables_map vm;
  po::store(po::parse_command_line(argc, argv, description()), vm);
  po::notify(vm);

  settings result;
  result.help = vm.count("help") > 0;
  result.range = guess_input::make_bounds(vm["min"].as<int>(), vm["max"].as<int>());
  if (vm.count("seed")) {
    result.seed = parse_seed(vm["seed"].as<std::string>());
  }
  return result;
}

void print_usage(std::ostream& out, const char* argv0) {
  out << "Usage: " << argv0 << " [options]" << std::endl
      << description() << std::endl;
}

} // namespace options
