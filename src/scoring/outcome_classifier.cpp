#include "scoring/outcome_classifier.hpp"

#include "core/json_utils.hpp"
#include "scoring/signatures.hpp"

#include <algorithm>
#include <sstream>

namespace sweval::scoring {

namespace {

constexpr std::string_view kMissingStatus = "MISSING";

// Partition for one expected-test list. Expected ids that the runner never
// reported are kept as MISSING so a silently skipped test cannot pass.
std::vector<TestVerdict> BuildPartition(const std::vector<std::string>& expected,
                                        const TestOutcomes& outcomes) {
  std::vector<TestVerdict> verdicts;
  verdicts.reserve(expected.size());
  for (const auto& test_id : expected) {
    const bool duplicate = std::any_of(verdicts.begin(), verdicts.end(),
                                       [&](const TestVerdict& v) { return v.test_id == test_id; });
    if (duplicate) {
      continue;
    }

    TestVerdict verdict;
    verdict.test_id = test_id;
    const auto it = outcomes.find(test_id);
    if (it == outcomes.end()) {
      verdict.status_text = std::string(kMissingStatus);
    } else {
      verdict.status_text = ToString(it->second);
      verdict.passed = it->second == TestStatus::kPassed;
    }
    verdicts.push_back(std::move(verdict));
  }

  std::stable_sort(verdicts.begin(), verdicts.end(),
                   [](const TestVerdict& lhs, const TestVerdict& rhs) {
                     if (lhs.passed != rhs.passed) {
                       return !lhs.passed;
                     }
                     return lhs.test_id < rhs.test_id;
                   });
  return verdicts;
}

bool AllPassed(const std::vector<TestVerdict>& verdicts) {
  return std::all_of(verdicts.begin(), verdicts.end(),
                     [](const TestVerdict& verdict) { return verdict.passed; });
}

// Hand-rendered so entries keep partition order instead of key order.
void AppendPartitionJson(std::ostringstream& out, const std::vector<TestVerdict>& verdicts) {
  if (verdicts.empty()) {
    out << "{}";
    return;
  }
  out << "{\n";
  for (std::size_t i = 0; i < verdicts.size(); ++i) {
    out << "  " << core::QuoteJson(verdicts[i].test_id) << ": "
        << core::QuoteJson(verdicts[i].status_text);
    if (i + 1U < verdicts.size()) {
      out << ',';
    }
    out << '\n';
  }
  out << '}';
}

void AppendSignatureJson(std::ostringstream& out, const std::vector<SignatureMatch>& matches) {
  out << "{\n";
  for (std::size_t i = 0; i < matches.size(); ++i) {
    out << "  " << core::QuoteJson(matches[i].signature) << ": "
        << (matches[i].matched ? "true" : "false");
    if (i + 1U < matches.size()) {
      out << ',';
    }
    out << '\n';
  }
  out << '}';
}

Score MalformedOutput(Score score, std::string_view reason, std::string_view stdout_text) {
  score.value = 0.0;
  score.malformed_output = true;
  score.infrastructure_failure = true;

  std::ostringstream out;
  out << "The test output could not be parsed: " << reason << ".\n\nOutput from tests:\n\n"
      << stdout_text;
  score.explanation = out.str();
  return score;
}

} // namespace

bool ScanForInfrastructureFailures(std::string_view stdout_text,
                                   std::vector<SignatureMatch>& matches) {
  matches.clear();
  bool any_matched = false;
  for (const auto signature : kInfrastructureSignatures) {
    SignatureMatch match;
    match.signature = std::string(signature);
    match.matched = stdout_text.find(signature) != std::string_view::npos;
    any_matched = any_matched || match.matched;
    matches.push_back(std::move(match));
  }
  return any_matched;
}

Score ScoreEvalOutput(const dataset::BenchmarkInstance& instance, std::string_view stdout_text,
                      std::string_view agent_patch, const LogParserRegistry& parsers,
                      std::string_view parser_override) {
  Score score;
  score.model_patch = std::string(agent_patch);

  if (ScanForInfrastructureFailures(stdout_text, score.signatures)) {
    score.value = 0.0;
    score.infrastructure_failure = true;

    std::ostringstream out;
    out << "The tests did not run correctly. Output from searching for error strings:\n\n";
    AppendSignatureJson(out, score.signatures);
    out << "\n\nOutput from tests:\n\n" << stdout_text;
    score.explanation = out.str();
    return score;
  }

  const LogParser* parser =
      parser_override.empty() ? parsers.ForRepo(instance.repo) : parsers.ByName(parser_override);
  if (parser == nullptr) {
    const std::string reason =
        parser_override.empty()
            ? "no log parser registered for repo '" + instance.repo + "'"
            : "unknown log parser '" + std::string(parser_override) + "'";
    return MalformedOutput(std::move(score), reason, stdout_text);
  }
  score.log_parser = std::string(parser->Name());

  const TestOutcomes outcomes = parser->Parse(stdout_text);
  if (outcomes.empty()) {
    return MalformedOutput(std::move(score),
                           "log parser '" + score.log_parser + "' found no test results",
                           stdout_text);
  }

  score.pass_to_pass = BuildPartition(instance.pass_to_pass, outcomes);
  score.fail_to_pass = BuildPartition(instance.fail_to_pass, outcomes);
  score.value = AllPassed(score.pass_to_pass) && AllPassed(score.fail_to_pass) ? 1.0 : 0.0;

  std::ostringstream out;
  out << "PASS_TO_PASS:\n\n";
  AppendPartitionJson(out, score.pass_to_pass);
  out << "\n\nFAIL_TO_PASS:\n\n";
  AppendPartitionJson(out, score.fail_to_pass);
  out << "\n\n";
  score.explanation = out.str();
  return score;
}

} // namespace sweval::scoring
