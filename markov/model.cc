#include "markov/model.hh"

#include "markov/exception.hh"

namespace markov {

const char kTerminal[] = "";

void SuffixCounts::Add(const std::string &suffix, uint64_t count) {
  std::pair<boost::unordered_map<std::string, std::size_t>::iterator, bool> ret(index_.insert(std::make_pair(suffix, entries_.size())));
  if (ret.second) {
    entries_.push_back(Entry(suffix, count));
  } else {
    entries_[ret.first->second].second += count;
  }
  total_ += count;
}

void SuffixCounts::Add(const SuffixCounts &other) {
  if (&other == this) {
    for (std::vector<Entry>::iterator i = entries_.begin(); i != entries_.end(); ++i) {
      i->second *= 2;
    }
    total_ *= 2;
    return;
  }
  for (const_iterator i = other.begin(); i != other.end(); ++i) {
    Add(i->first, i->second);
  }
}

uint64_t SuffixCounts::Count(const std::string &suffix) const {
  boost::unordered_map<std::string, std::size_t>::const_iterator i = index_.find(suffix);
  if (i == index_.end()) return 0;
  return entries_[i->second].second;
}

Model::Model(std::size_t order) : order_(order) {
  UTIL_THROW_IF(order < 2, InvalidArgumentException, "N-gram order must be at least 2, not " << order << ".");
}

std::string Model::PrefixKey(Sequence::const_iterator begin, Sequence::const_iterator end) {
  std::string ret;
  for (; begin != end; ++begin) {
    ret += *begin;
  }
  return ret;
}

void Model::AddNGram(const Sequence &ngram) {
  UTIL_THROW_IF(ngram.size() != order_, InvalidArgumentException, "N-gram has " << ngram.size() << " tokens but the model has order " << order_ << ".");
  graph_[PrefixKey(ngram.begin(), ngram.end() - 1)].Add(ngram.back(), 1);
}

void Model::CheckPrefix(const Sequence &prefix) const {
  UTIL_THROW_IF(prefix.size() != order_ - 1, InvalidArgumentException, "Prefix has " << prefix.size() << " tokens but should have " << (order_ - 1) << ".");
}

const SuffixCounts *Model::Find(const Sequence &prefix) const {
  CheckPrefix(prefix);
  Graph::const_iterator i = graph_.find(PrefixKey(prefix.begin(), prefix.end()));
  return i == graph_.end() ? NULL : &i->second;
}

SuffixDistribution Model::GetSuffixes(const Sequence &prefix) const {
  SuffixDistribution ret;
  const SuffixCounts *counts = Find(prefix);
  if (!counts) return ret;
  const double total = static_cast<double>(counts->Total());
  ret.reserve(counts->size());
  for (SuffixCounts::const_iterator i = counts->begin(); i != counts->end(); ++i) {
    ret.push_back(std::make_pair(i->first, static_cast<double>(i->second) / total));
  }
  return ret;
}

NGramDistribution Model::GetNGrams(const Sequence &prefix) const {
  SuffixDistribution suffixes(GetSuffixes(prefix));
  NGramDistribution ret;
  ret.reserve(suffixes.size());
  for (SuffixDistribution::const_iterator i = suffixes.begin(); i != suffixes.end(); ++i) {
    Sequence ngram(prefix);
    ngram.push_back(i->first);
    ret.push_back(std::make_pair(ngram, i->second));
  }
  return ret;
}

uint64_t Model::Count(const Sequence &prefix, const std::string &suffix) const {
  const SuffixCounts *counts = Find(prefix);
  return counts ? counts->Count(suffix) : 0;
}

uint64_t Model::Total(const Sequence &prefix) const {
  const SuffixCounts *counts = Find(prefix);
  return counts ? counts->Total() : 0;
}

void Model::Update(const Model &other) {
  UTIL_THROW_IF(order_ != other.order_, OrderMismatchException, "N-gram orders " << order_ << " and " << other.order_ << " do not match.");
  if (&other == this) {
    for (Graph::iterator i = graph_.begin(); i != graph_.end(); ++i) {
      i->second.Add(i->second);
    }
    return;
  }
  for (Graph::const_iterator i = other.graph_.begin(); i != other.graph_.end(); ++i) {
    Graph::iterator found = graph_.find(i->first);
    if (found == graph_.end()) {
      graph_.insert(*i);
    } else {
      found->second.Add(i->second);
    }
  }
}

} // namespace markov
