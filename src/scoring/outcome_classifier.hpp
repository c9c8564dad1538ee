#pragma once

#include "dataset/instance.hpp"
#include "scoring/log_parsers.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sweval::scoring {

// Verdict for one expected test. `status_text` is a TestStatus name, or
// "MISSING" when the test never appeared in the runner output.
struct TestVerdict {
  std::string test_id;
  std::string status_text;
  bool passed = false;
};

struct SignatureMatch {
  std::string signature;
  bool matched = false;
};

// Outcome of scoring one eval run.
//
// `value` is 1.0 only when every PASS_TO_PASS and FAIL_TO_PASS test passed.
// Infrastructure failures and malformed output both score 0.0; the flags let
// callers tell them apart from a genuinely wrong patch.
struct Score {
  double value = 0.0;
  std::string explanation;
  // Raw agent patch, kept verbatim as metadata.
  std::string model_patch;

  std::vector<SignatureMatch> signatures;
  bool infrastructure_failure = false;
  bool malformed_output = false;
  std::string log_parser;

  // Failing-first, then by test id.
  std::vector<TestVerdict> pass_to_pass;
  std::vector<TestVerdict> fail_to_pass;

  bool Resolved() const {
    return value >= 1.0;
  }
};

// Checks `stdout_text` for every infrastructure-failure signature, in the
// fixed scan order. Returns true when at least one matched.
bool ScanForInfrastructureFailures(std::string_view stdout_text,
                                   std::vector<SignatureMatch>& matches);

// Scores raw eval stdout for `instance`.
//
// Phases run strictly in order and never go back:
// 1) signature scan: any match scores 0.0 and the parsed tests are ignored,
// 2) log parsing with `parser_override` when non-empty, else the parser
//    bound to the instance repo. No parser or no parseable test line is
//    malformed output (0.0),
// 3) partition into PASS_TO_PASS / FAIL_TO_PASS and reduce.
//
// Always returns a Score with a human-readable explanation.
Score ScoreEvalOutput(const dataset::BenchmarkInstance& instance, std::string_view stdout_text,
                      std::string_view agent_patch, const LogParserRegistry& parsers,
                      std::string_view parser_override = {});

} // namespace sweval::scoring
