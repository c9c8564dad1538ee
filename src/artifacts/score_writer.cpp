#include "artifacts/score_writer.hpp"

#include "artifacts/output_dir_utils.hpp"
#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/time_utils.hpp"

#include <cmath>

namespace fs = std::filesystem;

namespace sweval::artifacts {

namespace {

using JsonValue = core::json::Value;

JsonValue PartitionJson(const std::vector<scoring::TestVerdict>& verdicts) {
  JsonValue array = JsonValue::MakeArray();
  for (const auto& verdict : verdicts) {
    JsonValue row = JsonValue::MakeObject();
    row.object_value.emplace("test_id", JsonValue::MakeString(verdict.test_id));
    row.object_value.emplace("status", JsonValue::MakeString(verdict.status_text));
    row.object_value.emplace("passed", JsonValue::MakeBool(verdict.passed));
    array.array_value.push_back(std::move(row));
  }
  return array;
}

} // namespace

ScoreSummary ComputeSummary(const std::vector<ScoreRecord>& records) {
  ScoreSummary summary;
  summary.count = records.size();
  if (records.empty()) {
    return summary;
  }

  double total = 0.0;
  for (const auto& record : records) {
    total += record.value;
    if (record.value >= 1.0) {
      ++summary.resolved;
    }
  }
  summary.mean = total / static_cast<double>(records.size());

  double squared = 0.0;
  for (const auto& record : records) {
    const double delta = record.value - summary.mean;
    squared += delta * delta;
  }
  summary.stddev = std::sqrt(squared / static_cast<double>(records.size()));
  return summary;
}

bool WriteScoreJson(const std::string& instance_id, const scoring::Score& score,
                    std::chrono::system_clock::time_point scored_at, const fs::path& output_dir,
                    fs::path& written_path, std::string& error) {
  if (!EnsureOutputDir(output_dir, error)) {
    return false;
  }

  JsonValue signatures = JsonValue::MakeObject();
  for (const auto& match : score.signatures) {
    signatures.object_value.emplace(match.signature, JsonValue::MakeBool(match.matched));
  }

  JsonValue root = JsonValue::MakeObject();
  root.object_value.emplace("instance_id", JsonValue::MakeString(instance_id));
  root.object_value.emplace("scored_at_utc",
                            JsonValue::MakeString(core::FormatUtcTimestamp(scored_at)));
  root.object_value.emplace("value", JsonValue::MakeNumber(score.value));
  root.object_value.emplace("resolved", JsonValue::MakeBool(score.Resolved()));
  root.object_value.emplace("infrastructure_failure",
                            JsonValue::MakeBool(score.infrastructure_failure));
  root.object_value.emplace("malformed_output", JsonValue::MakeBool(score.malformed_output));
  root.object_value.emplace("log_parser", JsonValue::MakeString(score.log_parser));
  root.object_value.emplace("signatures", std::move(signatures));
  root.object_value.emplace("PASS_TO_PASS", PartitionJson(score.pass_to_pass));
  root.object_value.emplace("FAIL_TO_PASS", PartitionJson(score.fail_to_pass));
  root.object_value.emplace("explanation", JsonValue::MakeString(score.explanation));

  JsonValue metadata = JsonValue::MakeObject();
  metadata.object_value.emplace("model_patch", JsonValue::MakeString(score.model_patch));
  root.object_value.emplace("metadata", std::move(metadata));

  written_path = output_dir / "score.json";
  return core::WriteTextFileAtomic(written_path, core::json::Serialize(root, 2) + "\n", error);
}

bool WriteSummaryJson(const std::vector<ScoreRecord>& records, const fs::path& output_dir,
                      fs::path& written_path, std::string& error) {
  if (!EnsureOutputDir(output_dir, error)) {
    return false;
  }

  const ScoreSummary summary = ComputeSummary(records);

  JsonValue rows = JsonValue::MakeArray();
  for (const auto& record : records) {
    JsonValue row = JsonValue::MakeObject();
    row.object_value.emplace("instance_id", JsonValue::MakeString(record.instance_id));
    row.object_value.emplace("value", JsonValue::MakeNumber(record.value));
    row.object_value.emplace("infrastructure_failure",
                             JsonValue::MakeBool(record.infrastructure_failure));
    row.object_value.emplace("malformed_output", JsonValue::MakeBool(record.malformed_output));
    rows.array_value.push_back(std::move(row));
  }

  JsonValue root = JsonValue::MakeObject();
  root.object_value.emplace("count", JsonValue::MakeNumber(static_cast<double>(summary.count)));
  root.object_value.emplace("resolved",
                            JsonValue::MakeNumber(static_cast<double>(summary.resolved)));
  root.object_value.emplace("mean", JsonValue::MakeNumber(summary.mean));
  root.object_value.emplace("std", JsonValue::MakeNumber(summary.stddev));
  root.object_value.emplace("instances", std::move(rows));

  written_path = output_dir / "summary.json";
  return core::WriteTextFileAtomic(written_path, core::json::Serialize(root, 2) + "\n", error);
}

} // namespace sweval::artifacts
