#include "dataset/instance.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <cctype>
#include <sstream>

namespace fs = std::filesystem;

namespace sweval::dataset {

namespace {

using JsonValue = core::json::Value;

bool ParseRequiredString(const JsonValue& row, std::string_view key, std::string& value,
                         std::string& error) {
  const JsonValue* field = row.Find(key);
  if (field == nullptr) {
    error = "missing required field '" + std::string(key) + "'";
    return false;
  }
  if (!field->IsString()) {
    error = "field '" + std::string(key) + "' must be a string";
    return false;
  }
  if (field->string_value.empty()) {
    error = "field '" + std::string(key) + "' cannot be empty";
    return false;
  }
  value = field->string_value;
  return true;
}

void ParseOptionalString(const JsonValue& row, std::string_view key, std::string& value) {
  value.clear();
  const JsonValue* field = row.Find(key);
  if (field != nullptr && field->IsString()) {
    value = field->string_value;
  }
}

bool CollectStringArray(const JsonValue& array, std::string_view key,
                        std::vector<std::string>& values, std::string& error) {
  for (const auto& item : array.array_value) {
    if (!item.IsString()) {
      error = "field '" + std::string(key) + "' must only contain strings";
      return false;
    }
    values.push_back(item.string_value);
  }
  return true;
}

// Test lists arrive either as real arrays or as JSON-encoded strings.
bool ParseTestList(const JsonValue& row, std::string_view key, std::vector<std::string>& values,
                   std::string& error) {
  values.clear();
  const JsonValue* field = row.Find(key);
  if (field == nullptr || field->type == JsonValue::Type::kNull) {
    return true;
  }
  if (field->IsArray()) {
    return CollectStringArray(*field, key, values, error);
  }
  if (!field->IsString()) {
    error = "field '" + std::string(key) + "' must be an array or a JSON-encoded array string";
    return false;
  }

  JsonValue decoded;
  std::string parse_error;
  if (!core::json::Parse(field->string_value, decoded, parse_error)) {
    error = "field '" + std::string(key) + "' holds invalid JSON: " + parse_error;
    return false;
  }
  if (!decoded.IsArray()) {
    error = "field '" + std::string(key) + "' must decode to a JSON array";
    return false;
  }
  return CollectStringArray(decoded, key, values, error);
}

bool ParseRow(const JsonValue& row, BenchmarkInstance& instance, std::string& error) {
  instance = BenchmarkInstance{};
  if (!row.IsObject()) {
    error = "row must be a JSON object";
    return false;
  }

  if (!ParseRequiredString(row, "instance_id", instance.instance_id, error) ||
      !ParseRequiredString(row, "repo", instance.repo, error) ||
      !ParseRequiredString(row, "version", instance.version, error) ||
      !ParseRequiredString(row, "base_commit", instance.base_commit, error) ||
      !ParseRequiredString(row, "environment_setup_commit", instance.environment_setup_commit,
                           error) ||
      !ParseRequiredString(row, "test_patch", instance.test_patch, error)) {
    return false;
  }
  ParseOptionalString(row, "patch", instance.patch);
  ParseOptionalString(row, "problem_statement", instance.problem_statement);

  if (!ParseTestList(row, "PASS_TO_PASS", instance.pass_to_pass, error) ||
      !ParseTestList(row, "FAIL_TO_PASS", instance.fail_to_pass, error)) {
    return false;
  }
  return true;
}

bool StartsWithArray(std::string_view text) {
  for (const char c : text) {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      continue;
    }
    return c == '[';
  }
  return false;
}

} // namespace

bool ParseDatasetText(std::string_view text, std::string_view source_label,
                      std::vector<BenchmarkInstance>& instances, std::string& error) {
  instances.clear();
  error.clear();

  const std::string label(source_label);
  if (StartsWithArray(text)) {
    JsonValue root;
    std::string parse_error;
    if (!core::json::Parse(text, root, parse_error)) {
      error = "invalid dataset JSON '" + label + "': " + parse_error;
      return false;
    }
    for (std::size_t i = 0; i < root.array_value.size(); ++i) {
      BenchmarkInstance instance;
      if (!ParseRow(root.array_value[i], instance, error)) {
        error = "dataset '" + label + "' row " + std::to_string(i) + ": " + error;
        instances.clear();
        return false;
      }
      instances.push_back(std::move(instance));
    }
    return true;
  }

  std::istringstream lines{std::string(text)};
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(lines, line)) {
    ++line_number;
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }

    JsonValue row;
    std::string parse_error;
    if (!core::json::Parse(line, row, parse_error)) {
      error = "dataset '" + label + "' line " + std::to_string(line_number) + ": " + parse_error;
      instances.clear();
      return false;
    }
    BenchmarkInstance instance;
    if (!ParseRow(row, instance, error)) {
      error = "dataset '" + label + "' line " + std::to_string(line_number) + ": " + error;
      instances.clear();
      return false;
    }
    instances.push_back(std::move(instance));
  }
  return true;
}

bool LoadDataset(const fs::path& dataset_path, std::vector<BenchmarkInstance>& instances,
                 std::string& error) {
  instances.clear();
  std::string text;
  if (!core::ReadTextFile(dataset_path, text, error)) {
    return false;
  }
  return ParseDatasetText(text, dataset_path.string(), instances, error);
}

const BenchmarkInstance* FindInstance(const std::vector<BenchmarkInstance>& instances,
                                      std::string_view instance_id) {
  for (const auto& instance : instances) {
    if (instance.instance_id == instance_id) {
      return &instance;
    }
  }
  return nullptr;
}

} // namespace sweval::dataset
