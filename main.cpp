#include <iostream>

#include "app.hpp"
#include "secret_rand.hpp"

int main(int argc, char* argv[]) {
  return app::run(argc, argv, std::cin, std::cout, std::cerr, SecretRand::random_seed);
}
