#include "../common/dataset_fixtures.hpp"
#include "scoring/outcome_classifier.hpp"
#include "scoring/signatures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

namespace {

sweval::dataset::BenchmarkInstance PytestInstance() {
  auto instance = sweval::tests::common::MakeInstance("acme__widgets-7");
  instance.pass_to_pass = {"tests/test_a.py::test_keep"};
  instance.fail_to_pass = {"tests/test_a.py::test_fix"};
  return instance;
}

sweval::scoring::LogParserRegistry Parsers() {
  auto parsers = sweval::scoring::LogParserRegistry::WithDefaults();
  std::string error;
  REQUIRE(parsers.Bind("acme/widgets", "pytest", error));
  return parsers;
}

} // namespace

TEST_CASE("All expected tests passing resolves the instance", "[scoring][classifier]") {
  const auto parsers = Parsers();
  const auto score = sweval::scoring::ScoreEvalOutput(
      PytestInstance(),
      "PASSED tests/test_a.py::test_keep\nPASSED tests/test_a.py::test_fix\n", "diff --git",
      parsers);

  REQUIRE(score.value == 1.0);
  REQUIRE(score.Resolved());
  REQUIRE_FALSE(score.infrastructure_failure);
  REQUIRE(score.model_patch == "diff --git");
  REQUIRE(score.log_parser == "pytest");
  REQUIRE(score.explanation == "PASS_TO_PASS:\n\n{\n  \"tests/test_a.py::test_keep\": \"PASSED\"\n}"
                               "\n\nFAIL_TO_PASS:\n\n{\n  \"tests/test_a.py::test_fix\": "
                               "\"PASSED\"\n}\n\n");
}

TEST_CASE("A failing expected test scores zero", "[scoring][classifier]") {
  const auto parsers = Parsers();
  const auto score = sweval::scoring::ScoreEvalOutput(
      PytestInstance(),
      "PASSED tests/test_a.py::test_keep\nFAILED tests/test_a.py::test_fix - assert 1 == 2\n", "",
      parsers);

  REQUIRE(score.value == 0.0);
  REQUIRE_FALSE(score.infrastructure_failure);
  REQUIRE(score.fail_to_pass.size() == 1U);
  REQUIRE(score.fail_to_pass[0].status_text == "FAILED");
  REQUIRE_FALSE(score.fail_to_pass[0].passed);
}

TEST_CASE("Infrastructure signatures win over passing tests", "[scoring][classifier]") {
  const auto parsers = Parsers();
  const std::string stdout_text = "PASSED tests/test_a.py::test_keep\n"
                                  "PASSED tests/test_a.py::test_fix\n" +
                                  std::string(sweval::scoring::kTestsTimeout) + "\n";
  const auto score =
      sweval::scoring::ScoreEvalOutput(PytestInstance(), stdout_text, "", parsers);

  REQUIRE(score.value == 0.0);
  REQUIRE(score.infrastructure_failure);
  REQUIRE_FALSE(score.malformed_output);
  REQUIRE(score.pass_to_pass.empty());
  REQUIRE(score.signatures.size() == sweval::scoring::kInfrastructureSignatures.size());
  REQUIRE(score.explanation.rfind("The tests did not run correctly.", 0) == 0U);
  REQUIRE(score.explanation.find("\"" + std::string(sweval::scoring::kTestsTimeout) +
                                 "\": true") != std::string::npos);
  REQUIRE(score.explanation.find("\"" + std::string(sweval::scoring::kApplyPatchFail) +
                                 "\": false") != std::string::npos);
  REQUIRE(score.explanation.find("Output from tests:\n\n" + stdout_text) != std::string::npos);
}

TEST_CASE("Signature scan reports every signature in order", "[scoring][classifier]") {
  std::vector<sweval::scoring::SignatureMatch> matches;
  REQUIRE_FALSE(sweval::scoring::ScanForInfrastructureFailures("all good\n", matches));
  REQUIRE(matches.size() == 5U);
  REQUIRE(matches[0].signature == sweval::scoring::kApplyPatchFail);
  REQUIRE(matches[4].signature == sweval::scoring::kTaskEnvResetFailed);

  REQUIRE(sweval::scoring::ScanForInfrastructureFailures(
      std::string("x\n") + std::string(sweval::scoring::kResetFailed), matches));
  REQUIRE(matches[1].matched);
  REQUIRE_FALSE(matches[0].matched);
}

TEST_CASE("Tests absent from the output are MISSING and fail", "[scoring][classifier]") {
  auto instance = PytestInstance();
  instance.pass_to_pass = {"tests/test_a.py::test_keep", "tests/test_a.py::test_gone",
                           "tests/test_a.py::test_keep"};
  const auto parsers = Parsers();
  const auto score = sweval::scoring::ScoreEvalOutput(
      instance, "PASSED tests/test_a.py::test_keep\nPASSED tests/test_a.py::test_fix\n", "",
      parsers);

  REQUIRE(score.value == 0.0);
  REQUIRE_FALSE(score.infrastructure_failure);
  // Duplicates collapse and failing entries sort first.
  REQUIRE(score.pass_to_pass.size() == 2U);
  REQUIRE(score.pass_to_pass[0].test_id == "tests/test_a.py::test_gone");
  REQUIRE(score.pass_to_pass[0].status_text == "MISSING");
  REQUIRE(score.pass_to_pass[1].passed);
  REQUIRE(score.explanation.find("\"tests/test_a.py::test_gone\": \"MISSING\"") !=
          std::string::npos);
}

TEST_CASE("Empty partitions render as empty objects", "[scoring][classifier]") {
  auto instance = PytestInstance();
  instance.pass_to_pass.clear();
  const auto parsers = Parsers();
  const auto score = sweval::scoring::ScoreEvalOutput(
      instance, "PASSED tests/test_a.py::test_fix\n", "", parsers);
  REQUIRE(score.Resolved());
  REQUIRE(score.explanation.rfind("PASS_TO_PASS:\n\n{}\n\nFAIL_TO_PASS:", 0) == 0U);
}

TEST_CASE("Unparseable output is malformed, not a wrong patch", "[scoring][classifier]") {
  const auto parsers = Parsers();
  const auto score = sweval::scoring::ScoreEvalOutput(PytestInstance(),
                                                      "Traceback (most recent call last):\n",
                                                      "", parsers);
  REQUIRE(score.value == 0.0);
  REQUIRE(score.malformed_output);
  REQUIRE(score.infrastructure_failure);
  REQUIRE(score.explanation.find("found no test results") != std::string::npos);
}

TEST_CASE("Parser override and unbound repos", "[scoring][classifier]") {
  const auto defaults = sweval::scoring::LogParserRegistry::WithDefaults();
  const auto instance = PytestInstance();

  const auto unbound = sweval::scoring::ScoreEvalOutput(
      instance, "PASSED tests/test_a.py::test_keep\n", "", defaults);
  REQUIRE(unbound.malformed_output);
  REQUIRE(unbound.explanation.find("acme/widgets") != std::string::npos);

  const auto overridden = sweval::scoring::ScoreEvalOutput(
      instance, "PASSED tests/test_a.py::test_keep\nPASSED tests/test_a.py::test_fix\n", "",
      defaults, "pytest");
  REQUIRE(overridden.Resolved());
  REQUIRE(overridden.log_parser == "pytest");

  const auto unknown = sweval::scoring::ScoreEvalOutput(instance, "", "", defaults, "nose");
  REQUIRE(unknown.malformed_output);
  REQUIRE(unknown.explanation.find("unknown log parser 'nose'") != std::string::npos);
}

TEST_CASE("A regressed PASS_TO_PASS test is listed first", "[scoring][classifier]") {
  // Default fixture: PASS_TO_PASS {t1, t2}, FAIL_TO_PASS {t3}.
  const auto instance = sweval::tests::common::MakeInstance("acme__widgets-8");
  const auto parsers = Parsers();
  const auto score = sweval::scoring::ScoreEvalOutput(
      instance, "PASSED t1\nFAILED t2\nPASSED t3\n", "", parsers);

  REQUIRE(score.value == 0.0);
  REQUIRE_FALSE(score.infrastructure_failure);
  REQUIRE(score.pass_to_pass.size() == 2U);
  REQUIRE(score.pass_to_pass[0].test_id == "t2");
  REQUIRE(score.pass_to_pass[0].status_text == "FAILED");
  REQUIRE(score.pass_to_pass[1].test_id == "t1");
  REQUIRE(score.fail_to_pass.size() == 1U);
  REQUIRE(score.fail_to_pass[0].passed);

  const auto p2p_at = score.explanation.find("PASS_TO_PASS:");
  const auto t2_at = score.explanation.find("\"t2\": \"FAILED\"");
  const auto t1_at = score.explanation.find("\"t1\": \"PASSED\"");
  const auto f2p_at = score.explanation.find("FAIL_TO_PASS:");
  REQUIRE(p2p_at != std::string::npos);
  REQUIRE(t2_at != std::string::npos);
  REQUIRE(t1_at != std::string::npos);
  REQUIRE(p2p_at < t2_at);
  REQUIRE(t2_at < t1_at);
  REQUIRE(t1_at < f2p_at);
}

TEST_CASE("A failed patch apply scores zero despite passing tests", "[scoring][classifier]") {
  const auto instance = sweval::tests::common::MakeInstance("acme__widgets-9");
  const auto parsers = Parsers();
  const std::string stdout_text = "error: patch failed: tests/test_core.py:3\n" +
                                  std::string(sweval::scoring::kApplyPatchFail) +
                                  "\nPASSED t1\nPASSED t2\nPASSED t3\n";
  const auto score = sweval::scoring::ScoreEvalOutput(instance, stdout_text, "", parsers);

  REQUIRE(score.value == 0.0);
  REQUIRE_FALSE(score.Resolved());
  REQUIRE(score.infrastructure_failure);
  REQUIRE(score.signatures[0].matched);
  REQUIRE(score.explanation.find("\"" + std::string(sweval::scoring::kApplyPatchFail) +
                                 "\": true") != std::string::npos);
}
