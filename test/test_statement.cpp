#include "../src/parser/statement.hpp"
#include "../src/parser/symbols.hpp"
#include "test_framework.hpp"

using namespace glyph;
using namespace glyph::test;

void registerStatementTests(glyph::test::TestRunner& runner) {
  auto* suite = new TestSuite("Statement Dispatcher Tests");

  suite->addTest("Symbol table lookups", []() {
    assertTrue(lookupSymbol("➕") == SymbolKind::Concat);
    assertTrue(lookupSymbol("🫷") == SymbolKind::StatementSeparator);
    assertFalse(lookupSymbol("x").has_value());
    assertEqual("👉", std::string(symbolToken(SymbolKind::Assign)));
    assertEqual("COND", std::string(symbolName(SymbolKind::Conditional)));
  });

  suite->addTest("Only assignment, print and conditional start statements", []() {
    assertTrue(lookupStatementSymbol("👉").has_value());
    assertTrue(lookupStatementSymbol("🗣️").has_value());
    assertTrue(lookupStatementSymbol("❓").has_value());
    assertFalse(lookupStatementSymbol("▶️").has_value());
    assertFalse(lookupStatementSymbol("➕").has_value());
  });

  suite->addTest("Assignment yields trimmed name and value", []() {
    auto stmt = parseLine(" 😃 👉 Happy ");
    assertTrue(stmt.has_value());
    assertTrue(stmt->kind == SymbolKind::Assign);
    assertEqual("👉", stmt->token);
    assertEqual(2, stmt->args.size());
    assertEqual("😃", stmt->args[0]);
    assertEqual("Happy", stmt->args[1]);
  });

  suite->addTest("Assignment with empty sides", []() {
    auto stmt = parseLine("👉");
    assertTrue(stmt.has_value());
    assertEqual("", stmt->args[0]);
    assertEqual("", stmt->args[1]);
  });

  suite->addTest("Print yields the clusters after the symbol", []() {
    auto stmt = parseLine("🗣️Hi ☹️");
    assertTrue(stmt.has_value());
    assertTrue(stmt->kind == SymbolKind::Print);
    assertEqual(4, stmt->args.size());
    assertEqual("H", stmt->args[0]);
    assertEqual(" ", stmt->args[2]);
    assertEqual("☹️", stmt->args[3]);
  });

  suite->addTest("Leftmost statement symbol wins", []() {
    auto stmt = parseLine("F👉🔧P▶️🗣️P");
    assertTrue(stmt->kind == SymbolKind::Assign);
    assertEqual("F", stmt->args[0]);
    assertEqual("🔧P▶️🗣️P", stmt->args[1]);

    auto cond = parseLine("❓A🟰B▶️X👉Y");
    assertTrue(cond->kind == SymbolKind::Conditional);
  });

  suite->addTest("Lines without a statement symbol are calls", []() {
    assertFalse(parseLine("😡😃").has_value());
    assertFalse(parseLine("F Hello").has_value());
    assertFalse(parseLine("▶️➕🟰").has_value());
  });

  runner.addSuite(suite);
}
