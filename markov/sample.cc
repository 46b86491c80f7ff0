#include "markov/sample.hh"

#include "markov/exception.hh"
#include "markov/random_source.hh"

#include <ostream>
#include <sstream>

namespace markov {
namespace {

std::string WindowString(const Sequence &window) {
  std::ostringstream to;
  to << '[';
  for (Sequence::const_iterator i = window.begin(); i != window.end(); ++i) {
    if (i != window.begin()) to << ", ";
    to << '"' << *i << '"';
  }
  to << ']';
  return to.str();
}

} // namespace

boost::optional<std::string> RandomSuffix(const Model &model, const Sequence &prefix, RandomSource &random) {
  SuffixDistribution distribution(model.GetSuffixes(prefix));
  if (distribution.empty()) return boost::none;
  const double threshold = random.Uniform();
  double upto = 0.0;
  for (SuffixDistribution::const_iterator i = distribution.begin(); i != distribution.end(); ++i) {
    upto += i->second;
    if (upto >= threshold) return i->first;
  }
  // The probabilities sum to 1 but rounding can leave upto just under threshold.
  return distribution.back().first;
}

boost::optional<Sequence> RandomNGram(const Model &model, const Sequence &prefix, RandomSource &random) {
  boost::optional<std::string> suffix(RandomSuffix(model, prefix, random));
  if (!suffix) return boost::none;
  Sequence ret(prefix);
  ret.push_back(*suffix);
  return ret;
}

Sequence RandomSequence(const Model &model, const Sequence &prefix, RandomSource &random, const WalkConfig &config) {
  UTIL_THROW_IF(prefix.size() != model.Order() - 1, InvalidArgumentException, "Bad prefix length: " << prefix.size() << " tokens for a model of order " << model.Order() << ".");
  Sequence window(prefix);
  Sequence sequence(prefix);
  for (std::size_t steps = 0; !config.max_steps || steps < config.max_steps; ++steps) {
    boost::optional<std::string> suffix(RandomSuffix(model, window, random));
    UTIL_THROW_IF(!suffix, DeadEndException, "Nothing was ever observed after " << WindowString(window) << ".  Generated " << (sequence.size() - prefix.size()) << " tokens before getting stuck.  Was the model trained with a terminal token?");
    sequence.push_back(*suffix);
    if (*suffix == kTerminal) return sequence;
    window.erase(window.begin());
    window.push_back(*suffix);
  }
  if (config.messages) {
    *config.messages << "Stopped walk at " << config.max_steps << " steps without a terminal token." << std::endl;
  }
  return sequence;
}

} // namespace markov
