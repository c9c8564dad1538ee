#include "scoring/log_parsers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

namespace {

using sweval::scoring::TestStatus;

const sweval::scoring::LogParser& ParserNamed(const sweval::scoring::LogParserRegistry& registry,
                                              const std::string& name) {
  const auto* parser = registry.ByName(name);
  REQUIRE(parser != nullptr);
  return *parser;
}

} // namespace

TEST_CASE("Test status names are stable", "[scoring][parsers]") {
  REQUIRE(std::string(sweval::scoring::ToString(TestStatus::kPassed)) == "PASSED");
  REQUIRE(std::string(sweval::scoring::ToString(TestStatus::kXfail)) == "XFAIL");

  TestStatus status = TestStatus::kPassed;
  REQUIRE(sweval::scoring::ParseTestStatus("ERROR", status));
  REQUIRE(status == TestStatus::kError);
  REQUIRE_FALSE(sweval::scoring::ParseTestStatus("passed", status));
}

TEST_CASE("Pytest parser reads the short test summary", "[scoring][parsers]") {
  const auto registry = sweval::scoring::LogParserRegistry::WithDefaults();
  const auto outcomes = ParserNamed(registry, "pytest").Parse(
      "============ short test summary info ============\n"
      "PASSED tests/test_a.py::test_one\n"
      "FAILED tests/test_a.py::test_two - AssertionError: boom\n"
      "SKIPPED [1] tests/test_a.py:10: needs network\n"
      "ERROR tests/test_b.py::test_three\n"
      "XFAIL tests/test_b.py::test_four\n"
      "collected 4 items\n");

  REQUIRE(outcomes.at("tests/test_a.py::test_one") == TestStatus::kPassed);
  REQUIRE(outcomes.at("tests/test_a.py::test_two") == TestStatus::kFailed);
  REQUIRE(outcomes.at("tests/test_b.py::test_three") == TestStatus::kError);
  REQUIRE(outcomes.at("tests/test_b.py::test_four") == TestStatus::kXfail);
  REQUIRE(outcomes.count("collected") == 0U);
}

TEST_CASE("Pytest options parser trims absolute option paths", "[scoring][parsers]") {
  const auto registry = sweval::scoring::LogParserRegistry::WithDefaults();
  const auto outcomes = ParserNamed(registry, "pytest_options")
                            .Parse("PASSED tests/test_x.py::test_path[/tmp/build/data.txt]\n"
                                   "PASSED tests/test_x.py::test_plain[abc]\n");
  REQUIRE(outcomes.count("tests/test_x.py::test_path[/data.txt]") == 1U);
  REQUIRE(outcomes.count("tests/test_x.py::test_plain[abc]") == 1U);
}

TEST_CASE("Pytest v2 parser strips color codes and reads verbose lines", "[scoring][parsers]") {
  const auto registry = sweval::scoring::LogParserRegistry::WithDefaults();
  const auto outcomes = ParserNamed(registry, "pytest_v2")
                            .Parse("\x1b[32mPASSED\x1b[0m tests/test_c.py::test_ok\n"
                                   "tests/test_c.py::test_old PASSED\n");
  REQUIRE(outcomes.at("tests/test_c.py::test_ok") == TestStatus::kPassed);
  REQUIRE(outcomes.at("tests/test_c.py::test_old") == TestStatus::kPassed);
}

TEST_CASE("Django parser reads runner verdict lines", "[scoring][parsers]") {
  const auto registry = sweval::scoring::LogParserRegistry::WithDefaults();
  const auto outcomes =
      ParserNamed(registry, "django")
          .Parse("test_add (admin.tests.AddTests) ... ok\n"
                 "test_skip (admin.tests.AddTests) ... skipped 'no db'\n"
                 "test_bad (admin.tests.AddTests) ... FAIL\n"
                 "test_err (admin.tests.AddTests) ... ERROR\n"
                 "test_noisy (admin.tests.AddTests) ... captured output\n"
                 "ok\n");
  REQUIRE(outcomes.at("test_add (admin.tests.AddTests)") == TestStatus::kPassed);
  REQUIRE(outcomes.at("test_skip (admin.tests.AddTests)") == TestStatus::kSkipped);
  REQUIRE(outcomes.at("test_bad (admin.tests.AddTests)") == TestStatus::kFailed);
  REQUIRE(outcomes.at("test_err (admin.tests.AddTests)") == TestStatus::kError);
  REQUIRE(outcomes.at("test_noisy (admin.tests.AddTests)") == TestStatus::kPassed);
}

TEST_CASE("Sympy parser reads progress lines and failure banners", "[scoring][parsers]") {
  const auto registry = sweval::scoring::LogParserRegistry::WithDefaults();
  const auto outcomes =
      ParserNamed(registry, "sympy")
          .Parse("test_equality ok\n"
                 "test_broken F\n"
                 "test_crash E\n"
                 "________ sympy/core/tests/test_basic.py:test_broken ________\n");
  REQUIRE(outcomes.at("test_equality") == TestStatus::kPassed);
  REQUIRE(outcomes.at("test_broken") == TestStatus::kFailed);
  REQUIRE(outcomes.at("test_crash") == TestStatus::kError);
  REQUIRE(outcomes.at("sympy/core/tests/test_basic.py:test_broken") == TestStatus::kFailed);
}

TEST_CASE("Seaborn and matplotlib parsers handle their quirks", "[scoring][parsers]") {
  const auto registry = sweval::scoring::LogParserRegistry::WithDefaults();
  const auto seaborn = ParserNamed(registry, "seaborn")
                           .Parse("tests/test_core.py::test_plot PASSED [ 50%]\n"
                                  "FAILED tests/test_core.py::test_hue - ValueError\n");
  REQUIRE(seaborn.at("tests/test_core.py::test_plot") == TestStatus::kPassed);
  REQUIRE(seaborn.at("tests/test_core.py::test_hue") == TestStatus::kFailed);

  const auto matplotlib =
      ParserNamed(registry, "matplotlib")
          .Parse("PASSED lib/matplotlib/tests/test_widgets.py::test_click[MouseButton.LEFT]\n");
  REQUIRE(matplotlib.count("lib/matplotlib/tests/test_widgets.py::test_click[1]") == 1U);
}

TEST_CASE("Registry binds repositories to parser kinds", "[scoring][parsers]") {
  auto registry = sweval::scoring::LogParserRegistry::WithDefaults();
  REQUIRE(registry.KindNames().size() == 7U);
  REQUIRE(registry.ForRepo("django/django")->Name() == "django");
  REQUIRE(registry.ForRepo("sympy/sympy")->Name() == "sympy");
  REQUIRE(registry.ForRepo("acme/widgets") == nullptr);

  std::string error;
  REQUIRE(registry.Bind("acme/widgets", "pytest", error));
  REQUIRE(registry.ForRepo("acme/widgets")->Name() == "pytest");
  REQUIRE_FALSE(registry.Bind("acme/widgets", "nose", error));
  REQUIRE(error.find("nose") != std::string::npos);
}
