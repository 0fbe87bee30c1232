#include <stdexcept>
#include <system_error>

#include <boost/program_options.hpp>

#include "app.hpp"
#include "guess_input.hpp"
#include "guessing_game.hpp"
#include "options.hpp"
#include "secret_rand.hpp"

namespace app {

int run(int argc, const char* const argv[], std::istream& in, std::ostream& out,
        std::ostream& err, seed_source entropy) {
  options::settings settings;
  try {
    settings = options::parse(argc, argv);
  } catch (const boost::program_options::error& e) {
    err << "Error: " << e.what() << std::endl;
    options::print_usage(err, argv[0]);
    return 1;
  } catch (const std::invalid_argument& e) {
    err << "Error: " << e.what() << std::endl;
    options::print_usage(err, argv[0]);
    return 1;
  }
  if (settings.help) {
    options::print_usage(out, argv[0]);
    return 0;
  }

  uint64_t seed;
  if (settings.seed) {
    seed = *settings.seed;
  } else {
    try {
      seed = entropy();
    } catch (const std::system_error& e) {
      err << "No entropy source for the secret: " << e.what() << std::endl;
      return 1;
    }
  }
  SecretRand::generator rng(seed);
  guessing_game::game game(settings.range, rng.between(settings.range.min, settings.range.max));
  try {
    game.play(in, out);
  } catch (const guess_input::input_closed& e) {
    err << "Failed to read line: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}

} // namespace app
