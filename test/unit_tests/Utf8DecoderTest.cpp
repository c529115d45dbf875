#include "Utf8Decoder.hpp"

#include "TestHeaders.hpp"

using namespace specter;

namespace {
const string REPLACEMENT = "\xEF\xBF\xBD";
// U+20AC EURO SIGN
const string EURO = "\xE2\x82\xAC";
}  // namespace

TEST_CASE("Utf8Decoder passes valid text through", "[Utf8Decoder]") {
  Utf8Decoder decoder;
  string text = "plain ascii, " + EURO + " and \xF0\x9F\x98\x80";
  REQUIRE(decoder.decode(text) == text);
  REQUIRE_FALSE(decoder.hasPartialSequence());
  REQUIRE(decoder.finish().empty());
}

TEST_CASE("Utf8Decoder carries split sequences", "[Utf8Decoder]") {
  Utf8Decoder decoder;
  REQUIRE(decoder.decode("a" + EURO.substr(0, 1)) == "a");
  REQUIRE(decoder.hasPartialSequence());
  REQUIRE(decoder.decode(EURO.substr(1, 1)) == "");
  REQUIRE(decoder.decode(EURO.substr(2) + "b") == EURO + "b");
  REQUIRE_FALSE(decoder.hasPartialSequence());
}

TEST_CASE("Utf8Decoder is independent of chunk boundaries",
          "[Utf8Decoder]") {
  string text = "x" + EURO + "y\xF0\x9F\x98\x80z" + EURO;
  for (size_t split = 0; split <= text.size(); split++) {
    Utf8Decoder decoder;
    string out = decoder.decode(text.substr(0, split));
    out += decoder.decode(text.substr(split));
    out += decoder.finish();
    REQUIRE(out == text);
  }
}

TEST_CASE("Utf8Decoder replaces invalid bytes", "[Utf8Decoder]") {
  SECTION("Stray continuation byte") {
    REQUIRE(Utf8Decoder::decodeLossy("a\x80z") == "a" + REPLACEMENT + "z");
  }

  SECTION("Invalid lead bytes") {
    REQUIRE(Utf8Decoder::decodeLossy("\xC0\xFF") == REPLACEMENT + REPLACEMENT);
  }

  SECTION("Broken sequence collapses to one replacement") {
    REQUIRE(Utf8Decoder::decodeLossy("\xE2\x82x") == REPLACEMENT + "x");
  }

  SECTION("Encoded surrogates are rejected") {
    REQUIRE(Utf8Decoder::decodeLossy("\xED\xA0\x80") ==
            REPLACEMENT + REPLACEMENT + REPLACEMENT);
  }

  SECTION("Truncated sequence at end of stream") {
    Utf8Decoder decoder;
    REQUIRE(decoder.decode(EURO.substr(0, 2)) == "");
    REQUIRE(decoder.finish() == REPLACEMENT);
    REQUIRE_FALSE(decoder.hasPartialSequence());
  }
}

TEST_CASE("Utf8Decoder validates complete buffers", "[Utf8Decoder]") {
  REQUIRE(Utf8Decoder::isValid("plain"));
  REQUIRE(Utf8Decoder::isValid(string("\x00\x01", 2)));
  REQUIRE(Utf8Decoder::isValid("\xE2\x82\xAC"));
  REQUIRE(Utf8Decoder::isValid(REPLACEMENT));
  REQUIRE_FALSE(Utf8Decoder::isValid("\xFF"));
  REQUIRE_FALSE(Utf8Decoder::isValid("\xE2\x82"));
}
