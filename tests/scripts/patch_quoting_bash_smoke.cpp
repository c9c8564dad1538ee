#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "core/process/process_runner.hpp"
#include "repos/repo_spec.hpp"
#include "scripts/script_generator.hpp"
#include "scripts/shell_quote.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

// Cuts the patch-writing command out of a generated eval script and points
// it at `target` instead of the in-sandbox path.
std::string WriteCommandFromEvalScript(const std::string& script, const fs::path& target) {
  const std::size_t start = script.find("printf '%s' ");
  const std::string tail = " > " + std::string(sweval::scripts::kTestPatchPath) + "\ngit apply";
  const std::size_t end = script.find(tail, start);
  sweval::tests::common::Assert(start != std::string::npos && end != std::string::npos,
                                "eval script should contain the patch write command");
  return script.substr(start, end - start) + " > " +
         sweval::scripts::QuoteShellArg(target.string());
}

void RunThroughBash(const std::string& command, const fs::path& target,
                    const std::string& expected, const std::string& label) {
  using sweval::tests::common::Assert;
  sweval::core::process::ProcessResult result;
  std::string error;
  Assert(sweval::core::process::RunProcess({"bash", "-c", command}, {}, result, error),
         "bash should spawn: " + error);
  Assert(result.exit_code == 0, "write command failed: " + result.stderr_text);
  Assert(sweval::tests::common::ReadFileToString(target) == expected,
         "patch bytes changed through the shell for " + label);
}

} // namespace

// Runs the generated write command through a real bash and checks the file
// holds the original bytes, for patches full of shell metacharacters.
int main() {
  const fs::path root = sweval::tests::common::CreateUniqueTempDir("sweval-patch-quoting-smoke");
  const std::vector<std::string> patches = {
      "diff --git a/x.py b/x.py\n+print('it''s')\n+s = \"$HOME `id` \\n\"\n",
      "no trailing newline",
      "+%s %d %% \\\\ \t tabs\n+!history !! ${var:-default} $(echo hi)\n",
      "'\n'\n''\n",
      "+unicode: \xc3\xa9\xe2\x82\xac\n",
  };

  for (std::size_t i = 0; i < patches.size(); ++i) {
    const fs::path target = root / ("patch_" + std::to_string(i) + ".diff");
    RunThroughBash(sweval::scripts::RenderWriteFileCommand(patches[i], target.string()), target,
                   patches[i], "case " + std::to_string(i));
  }

  // The same bytes must survive when taken from a full eval script.
  sweval::repos::RepoSpec spec;
  spec.test_cmd = "pytest -rA";
  for (std::size_t i = 0; i < patches.size(); ++i) {
    const fs::path target = root / ("eval_patch_" + std::to_string(i) + ".diff");
    const std::string script =
        sweval::scripts::GenerateEvalScript(patches[i], spec, "0123456789abcdef");
    RunThroughBash(WriteCommandFromEvalScript(script, target), target, patches[i],
                   "eval script case " + std::to_string(i));
  }

  sweval::tests::common::RemovePathBestEffort(root);
  std::cout << "patch_quoting_bash_smoke: ok\n";
  return 0;
}
