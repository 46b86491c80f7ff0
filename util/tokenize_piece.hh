#ifndef UTIL_TOKENIZE_PIECE__
#define UTIL_TOKENIZE_PIECE__

#include <boost/iterator/iterator_facade.hpp>
#include <boost/utility/string_ref.hpp>

/* Usage:
 *
 * for (PieceIterator<' '> i(" foo \r\n bar "); i; ++i) {
 *   std::cout << *i << "\n";
 * }
 *
 * Pieces point into the input, which must outlive the iterator.  To split a
 * std::string, wrap a named string in boost::string_ref; never a temporary.
 */

namespace util {

// Split on a single delimiter character, skipping runs of it.
template <char d> class PieceIterator : public boost::iterator_facade<PieceIterator<d>, const boost::string_ref, boost::forward_traversal_tag> {
  public:
    // Default construct is end.
    PieceIterator() {}

    explicit PieceIterator(const boost::string_ref &str)
      : after_(str) {
        increment();
      }

    explicit PieceIterator(const char *str)
      : after_(str) {
        increment();
      }

    bool operator!() const {
      return after_.data() == 0;
    }
    operator bool() const {
      return after_.data() != 0;
    }

  private:
    friend class boost::iterator_core_access;

    void increment() {
      const char *start = after_.data();
      for (; (start != after_.data() + after_.size()) && (d == *start); ++start) {}
      if (start == after_.data() + after_.size()) {
        // End condition.
        after_ = boost::string_ref();
        return;
      }
      const char *finish = start;
      for (; (finish != after_.data() + after_.size()) && (d != *finish); ++finish) {}
      current_ = boost::string_ref(start, finish - start);
      after_ = boost::string_ref(finish, after_.data() + after_.size() - finish);
    }

    bool equal(const PieceIterator &other) const {
      return after_.data() == other.after_.data();
    }

    const boost::string_ref &dereference() const { return current_; }

    boost::string_ref current_;
    boost::string_ref after_;
};

} // namespace util

#endif // UTIL_TOKENIZE_PIECE__
