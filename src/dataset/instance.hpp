#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace sweval::dataset {

// One benchmark task: a real repository issue with a known reference fix.
// Loaded once from the dataset file and treated as immutable afterwards.
struct BenchmarkInstance {
  std::string instance_id;
  std::string repo;
  std::string version;
  std::string base_commit;
  std::string environment_setup_commit;
  std::string test_patch;
  // Reference solution. Only used when evaluating the gold patch itself.
  std::string patch;
  std::string problem_statement;
  // Ordered; tests expected to pass before and after a correct fix.
  std::vector<std::string> pass_to_pass;
  // Ordered; tests expected to fail before and pass after a correct fix.
  std::vector<std::string> fail_to_pass;
};

// Loads a dataset split exported as either:
// - one JSON array of row objects, or
// - JSONL (one row object per line).
//
// PASS_TO_PASS / FAIL_TO_PASS may be JSON arrays or strings holding a JSON
// array (the form produced by the published parquet/HF exports).
//
// Contract:
// - true: `instances` holds every row in file order; `error` is cleared.
// - false: `instances` is cleared and `error` names the row and field.
bool LoadDataset(const std::filesystem::path& dataset_path,
                 std::vector<BenchmarkInstance>& instances, std::string& error);

// Same as LoadDataset but from in-memory text. `source_label` is used in
// error messages.
bool ParseDatasetText(std::string_view text, std::string_view source_label,
                      std::vector<BenchmarkInstance>& instances, std::string& error);

// Returns nullptr when no instance has `instance_id`.
const BenchmarkInstance* FindInstance(const std::vector<BenchmarkInstance>& instances,
                                      std::string_view instance_id);

} // namespace sweval::dataset
