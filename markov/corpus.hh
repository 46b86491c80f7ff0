#ifndef MARKOV_CORPUS__
#define MARKOV_CORPUS__

#include "markov/token.hh"

#include <cstddef>
#include <iosfwd>
#include <string>

#include <stdint.h>

namespace markov {

class Model;

// Padding before each sentence so the first tokens have a prefix to follow.
extern const char kBeginSentence[];

// Order() - 1 begin markers: where generation of a new sentence starts.
Sequence BeginContext(const Model &model);

/* Pad tokens with Order() - 1 begin markers in front and the terminal token
 * at the end, then add every window of Order() tokens.  An empty sentence
 * still teaches the model that a sentence can end immediately.
 */
void AddSentence(Model &model, const Sequence &tokens);

/* One sentence per line, tokens separated by spaces.  Returns the number of
 * lines read.  Progress goes to messages unless it is NULL.
 */
uint64_t ReadCorpus(std::istream &in, Model &model, std::ostream *messages = NULL);

// Drop begin markers and the terminal token and join with spaces.  A corpus
// token spelled "<s>" is indistinguishable from a begin marker and is dropped
// too.
std::string JoinSentence(const Sequence &sequence);

} // namespace markov

#endif // MARKOV_CORPUS__
