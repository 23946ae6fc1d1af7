#include "../src/text/grapheme.hpp"
#include "../src/text/strings.hpp"
#include "test_framework.hpp"

using namespace glyph;
using namespace glyph::test;

void registerGraphemeTests(glyph::test::TestRunner& runner) {
  auto* suite = new TestSuite("Grapheme Segmentation Tests");

  suite->addTest("Empty text has no clusters", []() {
    assertTrue(segment("").empty());
  });

  suite->addTest("ASCII splits per character", []() {
    auto clusters = segment("abc");
    assertEqual(3, clusters.size());
    assertEqual("a", clusters[0]);
    assertEqual("c", clusters[2]);
  });

  suite->addTest("Variation selector stays with its emoji", []() {
    // U+1F5E3 U+FE0F
    auto clusters = segment("🗣️Hi");
    assertEqual(3, clusters.size());
    assertEqual("🗣️", clusters[0]);
    assertEqual("H", clusters[1]);
  });

  suite->addTest("Every language symbol is one cluster", []() {
    for (const char* symbol : {"👉", "🗣️", "❓", "▶️", "🟰", "➕", "🔧", "🫷"}) {
      auto clusters = segment(symbol);
      assertEqual(1, clusters.size(), std::string("Symbol split: ") + symbol);
    }
  });

  suite->addTest("ZWJ sequence is one cluster", []() {
    auto clusters = segment("👩‍💻x");
    assertEqual(2, clusters.size());
    assertEqual("👩‍💻", clusters[0]);
  });

  suite->addTest("Flag is one cluster", []() {
    auto clusters = segment("🇯🇵🇫🇷");
    assertEqual(2, clusters.size());
    assertEqual("🇯🇵", clusters[0]);
  });

  suite->addTest("Combining mark stays with its base", []() {
    auto clusters = segment("e\xCC\x81t");  // e + U+0301
    assertEqual(2, clusters.size());
    assertEqual("e\xCC\x81", clusters[0]);
  });

  suite->addTest("Join reproduces the input", []() {
    for (const char* text : {"", " ", "plain text", "😡👉🔧🔍▶️☹️👉🔍🫷🗣️Set ☹️ to ➕☹️",
                             "  ❓A🟰B▶️🗣️Yes  ", "👩‍👩‍👧‍👦🇯🇵\t\r\n", "\xFF\xFE broken"}) {
      assertEqual(std::string(text), join(segment(text)));
    }
  });

  suite->addTest("Join a sub-range", []() {
    auto clusters = segment("a👉b");
    assertEqual("a", join(clusters, 0, 1));
    assertEqual("👉b", join(clusters, 1));
    assertEqual("", join(clusters, 2, 1));
  });

  suite->addTest("findSymbol returns the leftmost match", []() {
    auto clusters = segment("a▶️b▶️c");
    auto index = findSymbol(clusters, "▶️");
    assertTrue(index.has_value());
    assertEqual(1, *index);
    auto next = findSymbol(clusters, "▶️", 2);
    assertTrue(next.has_value());
    assertEqual(3, *next);
    assertFalse(findSymbol(clusters, "🟰").has_value());
  });

  suite->addTest("Symbol without selector does not match", []() {
    // U+25B6 alone is not ▶️ (U+25B6 U+FE0F)
    auto clusters = segment("a\xE2\x96\xB6" "b");
    assertFalse(findSymbol(clusters, "▶️").has_value());
  });

  runner.addSuite(suite);
}

void registerStringTests(glyph::test::TestRunner& runner) {
  auto* suite = new TestSuite("String Helper Tests");

  suite->addTest("Trim strips ASCII whitespace", []() {
    assertEqual("a b", trim(" \t a b \r\n"));
    assertEqual("", trim("   "));
    assertEqual("", trim(""));
  });

  suite->addTest("Split keeps empty parts", []() {
    auto parts = split("a➕➕b", "➕");
    assertEqual(3, parts.size());
    assertEqual("a", parts[0]);
    assertEqual("", parts[1]);
    assertEqual("b", parts[2]);
  });

  suite->addTest("Split without delimiter yields the text", []() {
    auto parts = split("abc", "🫷");
    assertEqual(1, parts.size());
    assertEqual("abc", parts[0]);
    assertEqual(1, split("", "🫷").size());
  });

  suite->addTest("Split on trailing delimiter", []() {
    auto parts = split("x🫷", "🫷");
    assertEqual(2, parts.size());
    assertEqual("", parts[1]);
  });

  suite->addTest("startsWith", []() {
    assertTrue(startsWith(":help", ":he"));
    assertTrue(startsWith("abc", ""));
    assertFalse(startsWith("ab", "abc"));
  });

  suite->addTest("isWhitespace", []() {
    assertTrue(isWhitespace(" "));
    assertTrue(isWhitespace("\r\n"));
    assertFalse(isWhitespace(""));
    assertFalse(isWhitespace("a"));
  });

  runner.addSuite(suite);
}
