#ifndef GUESSING_GAME_H
#define GUESSING_GAME_H

#include <istream>
#include <ostream>

#include "guess_input.hpp"

namespace guessing_game {

enum struct State {
  awaiting_guess,
  evaluating,
  won,
};

enum struct Verdict {
  too_small,
  too_big,
  correct,
};

std::ostream& operator<<(std::ostream& out, const State& s);
std::ostream& operator<<(std::ostream& out, const Verdict& v);

Verdict judge(int guess, int secret);

/* One round of the game.  The secret is fixed at construction and the game
 * ends at the first correct guess. */
class game {
 public:
  // Throws std::invalid_argument if the secret is out of range.
  game(const guess_input::bounds& range, int secret);

  // Compares one guess against the secret.  Throws std::logic_error once the
  // game is won.
  Verdict evaluate(int guess);

  // Prompts on out and reads guesses from in until one is right.  Returns the
  // number of guesses that were in range.  guess_input::input_closed escapes
  // if in runs dry first.
  unsigned play(std::istream& in, std::ostream& out);

  State state() const { return current; }
  unsigned guesses() const { return guess_count; }
  const guess_input::bounds& range() const { return limits; }

 private:
  const guess_input::bounds limits;
  const int secret;
  State current = State::awaiting_guess;
  unsigned guess_count = 0;
};

} // namespace guessing_game
#endif //GUESSING_GAME_H
