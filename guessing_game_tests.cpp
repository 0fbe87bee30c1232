#define BOOST_TEST_MODULE guessing game tests
#include <boost/test/unit_test.hpp>

#include <sstream>
#include <stdexcept>
#include <string>

#include "guessing_game.hpp"

using std::string;
using std::istringstream;
using std::ostringstream;
using guess_input::make_bounds;
using namespace guessing_game;

BOOST_AUTO_TEST_SUITE(guessing_game_tests)

// Checks that each of the lines shows up in output, in order.
static void check_in_order(const string& output, std::initializer_list<string> lines) {
  size_t pos = 0;
  for (const auto& line : lines) {
    size_t found = output.find(line, pos);
    BOOST_CHECK_MESSAGE(found != string::npos, "missing \"" << line << "\" after offset " << pos);
    if (found == string::npos) {
      return;
    }
    pos = found + line.size();
  }
}

BOOST_AUTO_TEST_CASE(judge_compares) {
  BOOST_CHECK_EQUAL(judge(3, 7), Verdict::too_small);
  BOOST_CHECK_EQUAL(judge(9, 7), Verdict::too_big);
  BOOST_CHECK_EQUAL(judge(7, 7), Verdict::correct);
  BOOST_CHECK_EQUAL(judge(-1, 0), Verdict::too_small);
}

BOOST_AUTO_TEST_CASE(secret_must_be_in_range) {
  BOOST_CHECK_THROW(game(make_bounds(1, 10), 0), std::invalid_argument);
  BOOST_CHECK_THROW(game(make_bounds(1, 10), 11), std::invalid_argument);
  BOOST_CHECK_NO_THROW(game(make_bounds(1, 10), 10));
}

BOOST_AUTO_TEST_CASE(keeps_its_range) {
  game g(make_bounds(-3, 4), 0);
  BOOST_CHECK_EQUAL(g.range().min, -3);
  BOOST_CHECK_EQUAL(g.range().max, 4);
  g.evaluate(4);
  BOOST_CHECK_EQUAL(g.range().min, -3);
  BOOST_CHECK_EQUAL(g.range().max, 4);
}

BOOST_AUTO_TEST_CASE(state_transitions) {
  game g(make_bounds(1, 10), 7);
  BOOST_CHECK_EQUAL(g.state(), State::awaiting_guess);
  BOOST_CHECK_EQUAL(g.evaluate(3), Verdict::too_small);
  BOOST_CHECK_EQUAL(g.state(), State::awaiting_guess);
  BOOST_CHECK_EQUAL(g.evaluate(9), Verdict::too_big);
  BOOST_CHECK_EQUAL(g.state(), State::awaiting_guess);
  BOOST_CHECK_EQUAL(g.evaluate(7), Verdict::correct);
  BOOST_CHECK_EQUAL(g.state(), State::won);
  BOOST_CHECK_EQUAL(g.guesses(), 3u);
  BOOST_CHECK_THROW(g.evaluate(7), std::logic_error);
}

// Misses never move the target: the same guesses give the same answers.
BOOST_AUTO_TEST_CASE(secret_does_not_move) {
  game g(make_bounds(1, 100), 50);
  for (int i = 0; i < 20; i++) {
    BOOST_CHECK_EQUAL(g.evaluate(49), Verdict::too_small);
    BOOST_CHECK_EQUAL(g.evaluate(51), Verdict::too_big);
  }
  BOOST_CHECK_EQUAL(g.evaluate(50), Verdict::correct);
}

BOOST_AUTO_TEST_CASE(full_scenario) {
  istringstream in("abc\n15\n0\n3\n9\n7\n");
  ostringstream out;
  game g(make_bounds(1, 10), 7);
  BOOST_CHECK_EQUAL(g.play(in, out), 3u);
  BOOST_CHECK_EQUAL(g.state(), State::won);
  check_in_order(out.str(), {
      "Guess the number!\n",
      "Please input your guess, between 1 and 10.\n",
      "Please input a number.\n",
      "Please input a number no larger than 10.\n",
      "Please input a number no smaller than 1.\n",
      "You guessed: 3\n",
      "Too small!\n",
      "You guessed: 9\n",
      "Too big!\n",
      "You guessed: 7\n",
      "You win!\n",
    });
}

BOOST_AUTO_TEST_CASE(stops_reading_after_win) {
  istringstream in("7\n8\n");
  ostringstream out;
  game g(make_bounds(1, 10), 7);
  BOOST_CHECK_EQUAL(g.play(in, out), 1u);
  string rest;
  BOOST_REQUIRE(std::getline(in, rest));
  BOOST_CHECK_EQUAL(rest, "8");
}

BOOST_AUTO_TEST_CASE(end_of_input_mid_game) {
  istringstream in("3\n9\n");
  ostringstream out;
  game g(make_bounds(1, 10), 7);
  BOOST_CHECK_THROW(g.play(in, out), guess_input::input_closed);
  BOOST_CHECK_EQUAL(g.state(), State::awaiting_guess);
  BOOST_CHECK_EQUAL(g.guesses(), 2u);
}

BOOST_AUTO_TEST_CASE(end_of_input_at_first_prompt) {
  istringstream in("");
  ostringstream out;
  game g(make_bounds(1, 10), 7);
  BOOST_CHECK_THROW(g.play(in, out), guess_input::input_closed);
  BOOST_CHECK_EQUAL(g.guesses(), 0u);
}

BOOST_AUTO_TEST_CASE(verdict_text) {
  ostringstream out;
  out << Verdict::too_small << "|" << Verdict::too_big << "|" << Verdict::correct;
  BOOST_CHECK_EQUAL(out.str(), "Too small!|Too big!|You win!");
}

BOOST_AUTO_TEST_SUITE_END()
