#ifndef MARKOV_EXCEPTION__
#define MARKOV_EXCEPTION__

#include "util/exception.hh"

namespace markov {

// Wrong number of tokens, a token that will not convert to a string, or an
// order below 2.
class InvalidArgumentException : public util::Exception {
  public:
    InvalidArgumentException() throw();
    ~InvalidArgumentException() throw();
};

// Update() between models of different order.
class OrderMismatchException : public util::Exception {
  public:
    OrderMismatchException() throw();
    ~OrderMismatchException() throw();
};

/* A random walk reached a window that was never observed as a prefix, so there
 * is nothing to sample.  Walks only stop on a trained terminal token.
 */
class DeadEndException : public util::Exception {
  public:
    DeadEndException() throw();
    ~DeadEndException() throw();
};

class ConfigException : public util::Exception {
  public:
    ConfigException() throw();
    ~ConfigException() throw();
};

} // namespace markov

#endif // MARKOV_EXCEPTION__
