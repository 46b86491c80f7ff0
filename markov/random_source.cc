#include "markov/random_source.hh"

namespace markov {

RandomSource::~RandomSource() {}

MersenneSource::MersenneSource(uint32_t seed) : generator_(seed) {}

MersenneSource::~MersenneSource() {}

double MersenneSource::Uniform() {
  return distribution_(generator_);
}

} // namespace markov
