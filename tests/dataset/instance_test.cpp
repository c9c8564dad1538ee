#include "dataset/instance.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace {

constexpr const char* kRowA =
    R"({"instance_id":"acme__widgets-1","repo":"acme/widgets","version":"1.0",)"
    R"("base_commit":"aaa","environment_setup_commit":"eee","test_patch":"diff --git a/t b/t\n",)"
    R"("patch":"gold","PASS_TO_PASS":["t1","t2"],"FAIL_TO_PASS":"[\"t3\"]"})";

constexpr const char* kRowB =
    R"({"instance_id":"acme__widgets-2","repo":"acme/widgets","version":"2.0",)"
    R"("base_commit":"bbb","environment_setup_commit":"fff","test_patch":"diff",)"
    R"("PASS_TO_PASS":[],"FAIL_TO_PASS":["t4"]})";

} // namespace

TEST_CASE("Dataset rows load from a JSON array", "[dataset]") {
  const std::string text = std::string("[") + kRowA + ",\n" + kRowB + "]";
  std::vector<sweval::dataset::BenchmarkInstance> instances;
  std::string error;
  REQUIRE(sweval::dataset::ParseDatasetText(text, "array", instances, error));
  REQUIRE(error.empty());
  REQUIRE(instances.size() == 2U);

  const auto& first = instances[0];
  REQUIRE(first.instance_id == "acme__widgets-1");
  REQUIRE(first.environment_setup_commit == "eee");
  REQUIRE(first.test_patch == "diff --git a/t b/t\n");
  REQUIRE(first.patch == "gold");
  REQUIRE(first.pass_to_pass == std::vector<std::string>{"t1", "t2"});
  // JSON-encoded string lists decode the same as real arrays.
  REQUIRE(first.fail_to_pass == std::vector<std::string>{"t3"});
  REQUIRE(instances[1].pass_to_pass.empty());
}

TEST_CASE("Dataset rows load from JSONL and skip blank lines", "[dataset]") {
  const std::string text = std::string(kRowA) + "\n\n" + kRowB + "\n";
  std::vector<sweval::dataset::BenchmarkInstance> instances;
  std::string error;
  REQUIRE(sweval::dataset::ParseDatasetText(text, "jsonl", instances, error));
  REQUIRE(instances.size() == 2U);

  const auto* found = sweval::dataset::FindInstance(instances, "acme__widgets-2");
  REQUIRE(found != nullptr);
  REQUIRE(found->version == "2.0");
  REQUIRE(sweval::dataset::FindInstance(instances, "nope") == nullptr);
}

TEST_CASE("Dataset rejects rows missing required fields", "[dataset]") {
  const std::string text =
      R"({"instance_id":"x","repo":"acme/widgets","version":"1.0","base_commit":"a",)"
      R"("test_patch":"d","PASS_TO_PASS":[],"FAIL_TO_PASS":[]})";
  std::vector<sweval::dataset::BenchmarkInstance> instances;
  std::string error;
  REQUIRE_FALSE(sweval::dataset::ParseDatasetText(text, "broken", instances, error));
  REQUIRE(instances.empty());
  REQUIRE(error.find("line 1") != std::string::npos);
  REQUIRE(error.find("environment_setup_commit") != std::string::npos);
}

TEST_CASE("Dataset rejects test lists that are not arrays", "[dataset]") {
  const std::string text =
      R"({"instance_id":"x","repo":"acme/widgets","version":"1.0","base_commit":"a",)"
      R"("environment_setup_commit":"e","test_patch":"d","PASS_TO_PASS":"t1",)"
      R"("FAIL_TO_PASS":[]})";
  std::vector<sweval::dataset::BenchmarkInstance> instances;
  std::string error;
  REQUIRE_FALSE(sweval::dataset::ParseDatasetText(text, "broken", instances, error));
  REQUIRE(error.find("PASS_TO_PASS") != std::string::npos);
}
