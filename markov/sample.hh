#ifndef MARKOV_SAMPLE__
#define MARKOV_SAMPLE__

#include "markov/config.hh"
#include "markov/model.hh"

#include <boost/optional.hpp>

#include <string>

namespace markov {

class RandomSource;

/* Draw t uniformly from [0, 1) and return the first suffix, in first-observed
 * order, whose cumulative probability reaches t.  boost::none if prefix was
 * never observed.  Throws InvalidArgumentException if prefix does not have
 * model.Order() - 1 tokens.
 */
boost::optional<std::string> RandomSuffix(const Model &model, const Sequence &prefix, RandomSource &random);

/* prefix followed by RandomSuffix.  If prefix was never observed the whole
 * n-gram is boost::none; there is no n-gram with a missing last token.
 */
boost::optional<Sequence> RandomNGram(const Model &model, const Sequence &prefix, RandomSource &random);

/* Walk the model from prefix.  The returned sequence starts with prefix and
 * ends with the terminal token.  Each step samples a suffix for the last
 * Order() - 1 tokens.
 *
 * The walk only stops on a sampled terminal token, so the model must have
 * been trained with one.  Reaching a window that was never observed throws
 * DeadEndException.  config.max_steps, when nonzero, returns early with
 * whatever was generated and no terminal.
 */
Sequence RandomSequence(const Model &model, const Sequence &prefix, RandomSource &random, const WalkConfig &config = WalkConfig());

} // namespace markov

#endif // MARKOV_SAMPLE__
