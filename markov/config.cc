#include "markov/config.hh"

#include "markov/exception.hh"

#include <boost/lexical_cast.hpp>

#include <iostream>

namespace markov {

WalkConfig::WalkConfig() :
  max_steps(0),
  messages(&std::cerr) {}

DriverConfig::DriverConfig() :
  order(0),
  seed(0),
  count(1) {}

std::size_t ParseOrder(const std::string &text) {
  // lexical_cast happily wraps "-1" into an unsigned.
  UTIL_THROW_IF(!text.empty() && text[0] == '-', InvalidArgumentException, "N-gram order must be at least 2, not " << text << ".");
  std::size_t order = 0;
  try {
    order = boost::lexical_cast<std::size_t>(text);
  } catch (const boost::bad_lexical_cast &) {
    UTIL_THROW(InvalidArgumentException, "N-gram order must be an integer, not \"" << text << "\".");
  }
  UTIL_THROW_IF(order < 2, InvalidArgumentException, "N-gram order must be at least 2, not " << order << ".");
  return order;
}

void ValidateConfig(const DriverConfig &config) {
  UTIL_THROW_IF(config.order < 2, ConfigException, "N-gram order must be at least 2, not " << config.order << ".");
  UTIL_THROW_IF(!config.count, ConfigException, "Asked to generate zero sequences.");
}

} // namespace markov
