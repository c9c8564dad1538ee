#pragma once

#include "scoring/outcome_classifier.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace sweval::artifacts {

// Compact per-instance row used by summary.json.
struct ScoreRecord {
  std::string instance_id;
  double value = 0.0;
  bool infrastructure_failure = false;
  bool malformed_output = false;
};

// Aggregate metrics over a set of scores. `stddev` is the population
// standard deviation.
struct ScoreSummary {
  std::size_t count = 0;
  std::size_t resolved = 0;
  double mean = 0.0;
  double stddev = 0.0;
};

ScoreSummary ComputeSummary(const std::vector<ScoreRecord>& records);

// Writes `<output_dir>/score.json`: value, flags, matched signatures, both
// partitions in explanation order, the explanation text and the model patch.
bool WriteScoreJson(const std::string& instance_id, const scoring::Score& score,
                    std::chrono::system_clock::time_point scored_at,
                    const std::filesystem::path& output_dir,
                    std::filesystem::path& written_path, std::string& error);

// Writes `<output_dir>/summary.json` with the aggregate metrics and one row
// per instance in input order.
bool WriteSummaryJson(const std::vector<ScoreRecord>& records,
                      const std::filesystem::path& output_dir,
                      std::filesystem::path& written_path, std::string& error);

} // namespace sweval::artifacts
