#include "../src/error/errors.hpp"
#include "test_framework.hpp"

using namespace glyph;
using namespace glyph::test;

void registerErrorTests(glyph::test::TestRunner& runner) {
  auto* suite = new TestSuite("Error Reporting Tests");

  suite->addTest("what() is the title", []() {
    GlyphError error(ErrorCategory::ArityMismatch, "Function 'F' takes no args but got some");
    assertEqual("Function 'F' takes no args but got some", std::string(error.what()));
    assertEqual(0, error.location().line);
  });

  suite->addTest("Builder accumulates details", []() {
    GlyphError error(ErrorCategory::UnresolvedStatement, "Unknown syntax or function call: x");
    error.setExplanation("nothing bound")
        .setSourceCode("x")
        .setLocation(SourceLocation(4, 1))
        .addSuggestion("Define it", "x👉🔧▶️🗣️...")
        .addRelatedInfo("in function 'F'");

    assertEqual("nothing bound", error.explanation());
    assertEqual(4, error.location().line);
    assertEqual(1, error.suggestions().size());
    assertEqual("x👉🔧▶️🗣️...", error.suggestions()[0].code);
    assertEqual(1, error.relatedInfo().size());
  });

  suite->addTest("Category names", []() {
    assertEqual("Malformed Function Literal", categoryName(ErrorCategory::MalformedFunctionLiteral));
    assertEqual("Malformed Conditional", categoryName(ErrorCategory::MalformedConditional));
    assertEqual("Resource Exhausted", categoryName(ErrorCategory::ResourceExhausted));
  });

  suite->addTest("Display shows every part", []() {
    GlyphError error(ErrorCategory::MalformedConditional, "Missing 🟰 in conditional");
    error.setExplanation("does not compare")
        .setSourceCode("❓A▶️🗣️B")
        .setLocation(SourceLocation(12, 1))
        .addSuggestion("Compare two values with 🟰", "❓A🟰...▶️🗣️B")
        .addRelatedInfo("in conditional block");

    std::string text = error.display();
    assertTrue(text.find("Malformed Conditional") != std::string::npos);
    assertTrue(text.find("Missing 🟰 in conditional") != std::string::npos);
    assertTrue(text.find("12 | ") != std::string::npos);
    assertTrue(text.find("❓A▶️🗣️B") != std::string::npos);
    assertTrue(text.find("does not compare") != std::string::npos);
    assertTrue(text.find("1. Compare two values with 🟰") != std::string::npos);
    assertTrue(text.find("- in conditional block") != std::string::npos);
  });

  suite->addTest("Display truncates a long call chain", []() {
    GlyphError error(ErrorCategory::ResourceExhausted, "Maximum call depth exceeded (20)");
    for (int i = 0; i < 20; ++i) {
      error.addRelatedInfo("in function 'F'");
    }
    std::string text = error.display();
    assertTrue(text.find("... and 12 more") != std::string::npos, text);
  });

  runner.addSuite(suite);
}
