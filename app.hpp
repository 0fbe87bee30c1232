#ifndef APP_H
#define APP_H

#include <cstdint>
#include <istream>
#include <ostream>

namespace app {

typedef uint64_t (*seed_source)();

// Everything main does, with the streams and the entropy source passed in.
// Returns the process exit status: 0 after a win or --help, 1 when options are
// bad, input runs out or no seed can be had.
int run(int argc, const char* const argv[], std::istream& in, std::ostream& out,
        std::ostream& err, seed_source entropy);

} // namespace app
#endif //APP_H
