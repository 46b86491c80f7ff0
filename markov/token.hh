#ifndef MARKOV_TOKEN__
#define MARKOV_TOKEN__

#include "markov/exception.hh"

#include <boost/lexical_cast.hpp>

#include <string>
#include <vector>

namespace markov {

/* Tokens are stored as strings.  Anything boost::lexical_cast can turn into a
 * std::string may be passed in; the string form is what the graph sees, so two
 * tokens are the same token iff their strings are equal.
 */
typedef std::vector<std::string> Sequence;

// Marks the end of a sequence.  A walk stops after sampling it.
extern const char kTerminal[];

template <class T> std::string ToToken(const T &value) {
  try {
    return boost::lexical_cast<std::string>(value);
  } catch (const boost::bad_lexical_cast &e) {
    UTIL_THROW(InvalidArgumentException, "Token cannot be represented as a string: " << e.what());
  }
}

inline std::string ToToken(const std::string &value) { return value; }

inline std::string ToToken(const char *value) {
  UTIL_THROW_IF(!value, InvalidArgumentException, "Null token.");
  return std::string(value);
}

// Convert [begin, end) to tokens.  Throws before returning anything if any
// element fails to convert.
template <class Iterator> Sequence ToSequence(Iterator begin, Iterator end) {
  Sequence ret;
  for (; begin != end; ++begin) {
    ret.push_back(ToToken(*begin));
  }
  return ret;
}

} // namespace markov

#endif // MARKOV_TOKEN__
