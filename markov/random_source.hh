#ifndef MARKOV_RANDOM_SOURCE__
#define MARKOV_RANDOM_SOURCE__

#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_01.hpp>

#include <stdint.h>

namespace markov {

// Uniform draws in [0, 1).  Sampling takes one of these so tests can script it.
class RandomSource {
  public:
    virtual ~RandomSource();

    virtual double Uniform() = 0;
};

class MersenneSource : public RandomSource {
  public:
    explicit MersenneSource(uint32_t seed);

    ~MersenneSource();

    double Uniform();

  private:
    boost::random::mt19937 generator_;
    boost::random::uniform_01<double> distribution_;
};

} // namespace markov

#endif // MARKOV_RANDOM_SOURCE__
