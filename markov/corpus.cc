#include "markov/corpus.hh"

#include "markov/model.hh"
#include "util/exception.hh"
#include "util/tokenize_piece.hh"

#include <istream>
#include <ostream>
#include <string>

namespace markov {

const char kBeginSentence[] = "<s>";

Sequence BeginContext(const Model &model) {
  return Sequence(model.Order() - 1, kBeginSentence);
}

void AddSentence(Model &model, const Sequence &tokens) {
  Sequence padded(BeginContext(model));
  padded.insert(padded.end(), tokens.begin(), tokens.end());
  padded.push_back(kTerminal);
  for (std::size_t i = 0; i + model.Order() <= padded.size(); ++i) {
    model.AddNGram(Sequence(padded.begin() + i, padded.begin() + i + model.Order()));
  }
}

uint64_t ReadCorpus(std::istream &in, Model &model, std::ostream *messages) {
  std::string line;
  Sequence tokens;
  uint64_t lines = 0;
  while (std::getline(in, line)) {
    if (!line.empty() && line[line.size() - 1] == '\r') line.resize(line.size() - 1);
    tokens.clear();
    for (util::PieceIterator<' '> i((boost::string_ref(line))); i; ++i) {
      tokens.push_back(std::string(i->data(), i->size()));
    }
    AddSentence(model, tokens);
    ++lines;
    if (messages && !(lines % 100000)) {
      *messages << "Read " << lines << " lines." << std::endl;
    }
  }
  UTIL_THROW_IF(in.bad(), util::Exception, "Reading the corpus failed after " << lines << " lines.");
  if (messages) {
    *messages << "Read " << lines << " lines into " << model.PrefixCount() << " distinct prefixes." << std::endl;
  }
  return lines;
}

std::string JoinSentence(const Sequence &sequence) {
  std::string ret;
  for (Sequence::const_iterator i = sequence.begin(); i != sequence.end(); ++i) {
    if (*i == kBeginSentence || *i == kTerminal) continue;
    if (!ret.empty()) ret += ' ';
    ret += *i;
  }
  return ret;
}

} // namespace markov
