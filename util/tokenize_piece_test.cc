#include "util/tokenize_piece.hh"

#define BOOST_TEST_MODULE TokenIteratorTest
#include <boost/test/unit_test.hpp>

#include <string>

namespace util {
namespace {

BOOST_AUTO_TEST_CASE(simple) {
  PieceIterator<' '> it("single spaced words.");
  BOOST_REQUIRE(it);
  BOOST_CHECK_EQUAL(boost::string_ref("single"), *it);
  ++it;
  BOOST_REQUIRE(it);
  BOOST_CHECK_EQUAL(boost::string_ref("spaced"), *it);
  ++it;
  BOOST_REQUIRE(it);
  BOOST_CHECK_EQUAL(boost::string_ref("words."), *it);
  ++it;
  BOOST_CHECK(!it);
}

BOOST_AUTO_TEST_CASE(repeated_delimiters) {
  std::string line("  the   cat sat ");
  PieceIterator<' '> it((boost::string_ref(line)));
  BOOST_REQUIRE(it);
  BOOST_CHECK_EQUAL(boost::string_ref("the"), *it);
  ++it;
  BOOST_REQUIRE(it);
  BOOST_CHECK_EQUAL(boost::string_ref("cat"), *it);
  ++it;
  BOOST_REQUIRE(it);
  BOOST_CHECK_EQUAL(boost::string_ref("sat"), *it);
  ++it;
  BOOST_CHECK(!it);
}

BOOST_AUTO_TEST_CASE(only_delimiters) {
  BOOST_CHECK(!PieceIterator<' '>("    "));
  BOOST_CHECK(!PieceIterator<' '>(""));
  BOOST_CHECK(!PieceIterator<' '>());
}

BOOST_AUTO_TEST_CASE(null_delimiter) {
  const char str[] = "\0first\0\0second\0";
  PieceIterator<'\0'> it(boost::string_ref(str, sizeof(str) - 1));
  BOOST_REQUIRE(it);
  BOOST_CHECK_EQUAL(boost::string_ref("first"), *it);
  ++it;
  BOOST_REQUIRE(it);
  BOOST_CHECK_EQUAL(boost::string_ref("second"), *it);
  ++it;
  BOOST_CHECK(!it);
}

} // namespace
} // namespace util
