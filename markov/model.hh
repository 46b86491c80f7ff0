#ifndef MARKOV_MODEL__
#define MARKOV_MODEL__

#include "markov/token.hh"

#include <boost/unordered_map.hpp>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <stdint.h>

namespace markov {

/* Counts of the suffixes observed after one prefix.  Iteration is in the order
 * suffixes were first observed, which is what makes sampling reproducible
 * under a fixed random source.  The total is maintained on every increment.
 */
class SuffixCounts {
  public:
    typedef std::pair<std::string, uint64_t> Entry;
    typedef std::vector<Entry>::const_iterator const_iterator;

    SuffixCounts() : total_(0) {}

    // count must be positive.
    void Add(const std::string &suffix, uint64_t count);

    // Add every count in other, appending unseen suffixes in other's order.
    void Add(const SuffixCounts &other);

    // 0 if suffix was never observed.
    uint64_t Count(const std::string &suffix) const;

    uint64_t Total() const { return total_; }

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

  private:
    std::vector<Entry> entries_;
    // suffix -> position in entries_
    boost::unordered_map<std::string, std::size_t> index_;
    uint64_t total_;
};

// Probabilities in first-observed order.
typedef std::vector<std::pair<std::string, double> > SuffixDistribution;
typedef std::vector<std::pair<Sequence, double> > NGramDistribution;

/* Counts of n-grams of a fixed order, stored as a graph from prefix key to
 * suffix counts.
 *
 * The prefix key is the first Order() - 1 tokens concatenated with no
 * separator.  This keeps the graph a plain string-keyed nested mapping that
 * any structured format can hold, at the price of collisions: ("a", "bc") and
 * ("ab", "c") are the same prefix.
 *
 * Counts only grow.  Every mutator validates before changing anything.
 */
class Model {
  public:
    typedef boost::unordered_map<std::string, SuffixCounts> Graph;

    // Throws InvalidArgumentException if order < 2.
    explicit Model(std::size_t order);

    std::size_t Order() const { return order_; }

    // ngram must have exactly Order() tokens.
    void AddNGram(const Sequence &ngram);

    template <class Iterator> void AddNGram(Iterator begin, Iterator end) {
      AddNGram(ToSequence(begin, end));
    }

    // prefix must have exactly Order() - 1 tokens.  Empty if unseen.
    SuffixDistribution GetSuffixes(const Sequence &prefix) const;

    template <class Iterator> SuffixDistribution GetSuffixes(Iterator begin, Iterator end) const {
      return GetSuffixes(ToSequence(begin, end));
    }

    // GetSuffixes with prefix prepended to each suffix.
    NGramDistribution GetNGrams(const Sequence &prefix) const;

    uint64_t Count(const Sequence &prefix, const std::string &suffix) const;

    uint64_t Total(const Sequence &prefix) const;

    // Add all of other's counts to this model.  Not idempotent: updating
    // twice with the same model counts it twice.
    void Update(const Model &other);

    // Number of distinct prefix keys.
    std::size_t PrefixCount() const { return graph_.size(); }

    // For serialization by callers.
    const Graph &GetGraph() const { return graph_; }

    static std::string PrefixKey(Sequence::const_iterator begin, Sequence::const_iterator end);

  private:
    void CheckPrefix(const Sequence &prefix) const;

    // NULL if the prefix key was never observed.
    const SuffixCounts *Find(const Sequence &prefix) const;

    std::size_t order_;

    Graph graph_;
};

} // namespace markov

#endif // MARKOV_MODEL__
