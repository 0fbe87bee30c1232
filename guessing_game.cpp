#include <stdexcept>
#include <string>

#include "guessing_game.hpp"

namespace guessing_game {

std::ostream& operator<<(std::ostream& out, const State& s) {
  switch(s) {
   case State::awaiting_guess:
     out << "awaiting_guess";
     break;
   case State::evaluating:
     out << "evaluating";
     break;
   case State::won:
     out << "won";
     break;
  }
  return out;
}

std::ostream& operator<<(std::ostream& out, const Verdict& v) {
  switch(v) {
   case Verdict::too_small:
     out << "Too small!";
     break;
   case Verdict::too_big:
     out << "Too big!";
     break;
   case Verdict::correct:
     out << "You win!";
     break;
  }
  return out;
}

Verdict judge(int guess, int secret) {
  if (guess < secret) {
    return Verdict::too_small;
  } else if (guess > secret) {
    return Verdict::too_big;
  } else {
    return Verdict::correct;
  }
}

game::game(const guess_input::bounds& range, int secret) : limits(range), secret(secret) {
  if (!limits.contains(secret)) {
    throw std::invalid_argument("secret " + std::to_string(secret) + " is outside [" +
                                std::to_string(limits.min) + ", " +
                                std::to_string(limits.max) + "]");
  }
}

Verdict game::evaluate(int guess) {
  if (current == State::won) {
    throw std::logic_error("the game is already won");
  }
  current = State::evaluating;
  guess_count++;
  const Verdict verdict = judge(guess, secret);
  current = verdict == Verdict::correct ? State::won : State::awaiting_guess;
  return verdict;
}

unsigned game::play(std::istream& in, std::ostream& out) {
  out << "Guess the number!" << std::endl;
  while (current != State::won) {
    out << "Please input your guess, between " << limits.min << " and " << limits.max
        << "." << std::endl;
    const int guess = guess_input::read_number_between(in, out, limits);
    out << "You guessed: " << guess << std::endl;
    out << evaluate(guess) << std::endl;
  }
  return guess_count;
}

} // namespace guessing_game
