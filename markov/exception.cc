#include "markov/exception.hh"

namespace markov {

InvalidArgumentException::InvalidArgumentException() throw() {}
InvalidArgumentException::~InvalidArgumentException() throw() {}

OrderMismatchException::OrderMismatchException() throw() {}
OrderMismatchException::~OrderMismatchException() throw() {}

DeadEndException::DeadEndException() throw() {}
DeadEndException::~DeadEndException() throw() {}

ConfigException::ConfigException() throw() {}
ConfigException::~ConfigException() throw() {}

} // namespace markov
