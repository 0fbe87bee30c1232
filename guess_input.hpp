#ifndef GUESS_INPUT_H
#define GUESS_INPUT_H

#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>

#include <boost/optional.hpp>

namespace guess_input {

// Thrown when no more lines can be read.  Bad input is retried, so this is the
// only failure that leaves the reader.
class input_closed : public std::runtime_error {
 public:
  explicit input_closed(const std::string& what) : std::runtime_error(what) {}
};

// Inclusive range.  Build with make_bounds so that min <= max holds.
struct bounds {
  int min;
  int max;
  bool contains(int value) const {
    return min <= value && value <= max;
  }
};

bounds make_bounds(int min, int max);

// Parses a base 10 signed integer, ignoring whitespace around it.
boost::optional<int> parse_guess(const std::string& line);

// Reads lines until one holds a number, complaining about each one that
// doesn't.
int read_number(std::istream& in, std::ostream& out);

// Like read_number but also retries until the number is within range.
int read_number_between(std::istream& in, std::ostream& out, const bounds& range);

} // namespace guess_input
#endif //GUESS_INPUT_H
