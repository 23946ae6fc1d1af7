#include "../src/cli/repl/session.hpp"
#include "test_framework.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace glyph;
using namespace glyph::test;

namespace {

// Interpreter and session wired to in-memory streams
struct SessionFixture {
  std::ostringstream out;
  std::ostringstream err;
  std::ostringstream trace;
  Interpreter interp;
  REPLSession session;

  SessionFixture()
      : interp(InterpreterOptions(), out, trace)
      , session(interp, out, err) {}
};

bool contains(const std::vector<std::string>& items, const std::string& item) {
  return std::find(items.begin(), items.end(), item) != items.end();
}

}  // namespace

void registerREPLTests(glyph::test::TestRunner& runner) {
  auto* suite = new TestSuite("REPL Session Tests");

  suite->addTest("Statements share one environment", []() {
    SessionFixture f;
    f.session.processLine("😃👉Happy");
    f.session.processLine("🗣️😃");
    assertEqual("Happy\n", f.out.str());
    assertTrue(f.err.str().empty());
  });

  suite->addTest("Errors are reported and the session continues", []() {
    SessionFixture f;
    f.session.processLine("X👉kept");
    f.session.processLine("nonsense");
    assertTrue(f.err.str().find("Unknown syntax or function call: nonsense") != std::string::npos);
    f.session.processLine("🗣️X");
    assertEqual("kept\n", f.out.str());
  });

  suite->addTest("Blank input is ignored", []() {
    SessionFixture f;
    f.session.processLine("   ");
    assertEqual(0, f.session.context().inputCount);
    assertTrue(f.out.str().empty());
  });

  suite->addTest("Quit stops the session", []() {
    SessionFixture f;
    f.session.start();
    f.session.processLine(":q");
    assertFalse(f.session.running());
    assertTrue(f.out.str().find("Goodbye!") != std::string::npos);
  });

  suite->addTest("Help lists commands with aliases", []() {
    SessionFixture f;
    f.session.processLine(":help");
    std::string text = f.out.str();
    assertTrue(text.find(":load FILE") != std::string::npos);
    assertTrue(text.find(":trace [on|off]") != std::string::npos);
    assertTrue(text.find(":q, :exit") != std::string::npos);
    assertTrue(f.session.registry().hasCommand("?"));
    assertFalse(f.session.registry().hasCommand("compile"));
  });

  suite->addTest("Unknown command", []() {
    SessionFixture f;
    f.session.processLine(":frobnicate");
    assertTrue(f.err.str().find("Unknown command:") != std::string::npos);
  });

  suite->addTest("Browse lists bindings", []() {
    SessionFixture f;
    f.session.processLine("A👉one");
    f.session.processLine("F👉🔧P▶️🗣️P");
    f.session.processLine(":browse");
    std::string text = f.out.str();
    assertTrue(text.find("one") != std::string::npos);
    assertTrue(text.find("🔧P▶️🗣️P") != std::string::npos);
    assertTrue(text.find("Total: 2 binding(s)") != std::string::npos);
  });

  suite->addTest("Info shows one binding", []() {
    SessionFixture f;
    f.session.processLine("F👉🔧PQ▶️🗣️P🫷🗣️Q");
    f.session.processLine(":info F");
    std::string text = f.out.str();
    assertTrue(text.find("function") != std::string::npos);
    assertTrue(text.find("Parameters: 2") != std::string::npos);

    f.session.processLine(":i missing");
    assertTrue(f.err.str().find("Binding 'missing' not found.") != std::string::npos);
  });

  suite->addTest("Clear drops bindings", []() {
    SessionFixture f;
    f.session.processLine("A👉one");
    f.session.processLine(":clear");
    assertFalse(f.interp.globals().has("A"));
  });

  suite->addTest("Trace toggles", []() {
    SessionFixture f;
    f.session.processLine(":trace on");
    assertTrue(f.interp.options().traceEnabled);
    f.session.processLine("🗣️x");
    assertFalse(f.trace.str().empty());
    f.session.processLine(":trace");
    assertFalse(f.interp.options().traceEnabled);
  });

  suite->addTest("Load and reload a file", []() {
    SessionFixture f;
    std::string path = "glyph_repl_test.glyph";
    {
      std::ofstream file(path);
      file << "// greeting\n🗣️loaded\nG👉hi\n";
    }
    f.session.processLine(":load " + path);
    f.session.processLine(":r");
    std::remove(path.c_str());

    assertEqual(path, f.session.context().lastLoadedFile);
    assertTrue(f.interp.globals().has("G"));
    std::string text = f.out.str();
    assertTrue(text.find("loaded\n") != std::string::npos);
    assertTrue(text.find("loaded\n", text.find("loaded\n") + 1) != std::string::npos,
               "Reload did not run the file again");
  });

  suite->addTest("Load reports missing files", []() {
    SessionFixture f;
    f.session.processLine(":load /nonexistent/nothing.glyph");
    assertTrue(f.err.str().find("Could not open file") != std::string::npos);
  });

  suite->addTest("Reload without load warns", []() {
    SessionFixture f;
    f.session.processLine(":reload");
    assertTrue(f.err.str().find("No file has been loaded yet") != std::string::npos);
  });

  suite->addTest("Completion of commands", []() {
    SessionFixture f;
    auto matches = f.session.getCompletions(":re");
    assertEqual(1, matches.size());
    assertEqual(":reload", matches[0]);
    assertTrue(f.session.getCompletions(":").size() >= 8);
  });

  suite->addTest("Completion of bound names", []() {
    SessionFixture f;
    f.session.processLine("apple👉1");
    f.session.processLine("apricot👉2");
    f.session.processLine("banana👉3");
    auto matches = f.session.getCompletions("ap");
    assertEqual(2, matches.size());
    assertTrue(contains(matches, "apple"));
    assertTrue(contains(matches, "apricot"));
    assertTrue(f.session.getCompletions("").empty());
  });

  suite->addTest("Input lines are numbered", []() {
    SessionFixture f;
    f.session.processLine("🗣️a");
    f.session.processLine("oops");
    assertEqual(2, f.session.context().inputCount);
    assertTrue(f.err.str().find(" 2 | ") != std::string::npos);
  });

  runner.addSuite(suite);
}
