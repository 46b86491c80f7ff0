#ifndef MARKOV_CONFIG__
#define MARKOV_CONFIG__

/* Configuration for walks and for the generate driver. */

#include <cstddef>
#include <iosfwd>
#include <string>

#include <stdint.h>

namespace markov {

struct WalkConfig {
  // Stop after sampling this many tokens even if no terminal was sampled.
  // 0 means no limit, which is the default: a walk then runs until it samples
  // the terminal token or hits a prefix it has never seen.
  std::size_t max_steps;

  // Where to log messages.  Set to NULL for silence.
  std::ostream *messages;

  WalkConfig();
};

struct DriverConfig {
  std::size_t order;

  // Corpus file.  Empty means stdin.
  std::string text;

  // 0 seeds from the clock.
  uint32_t seed;

  // Number of sequences to generate.
  std::size_t count;

  WalkConfig walk;

  DriverConfig();
};

// Strict base-10 parse of an n-gram order.  Throws InvalidArgumentException
// for anything that is not an integer (e.g. "2.0") or is less than 2.
std::size_t ParseOrder(const std::string &text);

// Throws ConfigException if config cannot drive a run.
void ValidateConfig(const DriverConfig &config);

} // namespace markov

#endif // MARKOV_CONFIG__
