#include <string>

#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

#include "guess_input.hpp"

namespace guess_input {

using std::string;

bounds make_bounds(int min, int max) {
  if (min > max) {
    throw std::invalid_argument("minimum " + std::to_string(min) +
                                " is larger than maximum " + std::to_string(max));
  }
  return bounds{min, max};
}

boost::optional<int> parse_guess(const string& line) {
  const string trimmed = boost::algorithm::trim_copy(line);
  int value;
  if (trimmed.empty() || !boost::conversion::try_lexical_convert(trimmed, value)) {
    return boost::none;
  }
  return value;
}

int read_number(std::istream& in, std::ostream& out) {
  string line;
  while (true) {
    if (!std::getline(in, line)) {
      throw input_closed(in.eof() ? "end of input" : "input stream error");
    }
    const auto number = parse_guess(line);
    if (!number) {
      out << "Please input a number." << std::endl;
      continue;
    }
    return *number;
  }
}

int read_number_between(std::istream& in, std::ostream& out, const bounds& range) {
  while (true) {
    const int number = read_number(in, out);
    if (number < range.min) {
      out << "Please input a number no smaller than " << range.min << "." << std::endl;
      continue;
    }
    if (number > range.max) {
      out << "Please input a number no larger than " << range.max << "." << std::endl;
      continue;
    }
    return number;
  }
}

} // namespace guess_input
