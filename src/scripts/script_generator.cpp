#include "scripts/script_generator.hpp"

#include "repos/test_directives.hpp"
#include "scoring/signatures.hpp"
#include "scripts/shell_quote.hpp"

#include <sstream>

namespace sweval::scripts {

namespace {

// Conda's activate scripts are noisy under xtrace, so tracing is paused
// around them. Re-emitted after every `cd`: some images reset shell state on
// directory changes.
void AppendEnterTestbed(std::ostringstream& out) {
  out << "cd " << kTestbedDir << '\n'
      << "set +x\n"
      << "source " << kCondaActivatePath << '\n'
      << "conda activate " << kCondaEnvName << '\n'
      << "set -x\n";
}

void AppendLines(std::ostringstream& out, const std::vector<std::string>& lines) {
  for (const auto& line : lines) {
    if (!line.empty()) {
      out << line << '\n';
    }
  }
}

std::string JoinQuoted(const std::vector<std::string>& values) {
  std::string joined;
  for (const auto& value : values) {
    if (!joined.empty()) {
      joined.push_back(' ');
    }
    joined += QuoteShellArg(value);
  }
  return joined;
}

} // namespace

std::string GenerateSetupScript(const repos::RepoSpec& spec, std::string_view base_commit) {
  const std::string testbed = std::string(kTestbedDir) + "/";

  std::ostringstream out;
  out << "#!/bin/bash\n"
      << "set -euxo pipefail\n"
      << '\n'
      << "# Clone the repository; open permissions so the non-root sandbox user can run tests\n"
      << "git clone -o origin " << QuoteShellArg("https://github.com/" + spec.repo) << ' '
      << testbed << '\n'
      << "chmod -R 777 " << testbed << '\n'
      << "cd " << testbed << '\n'
      << "git reset --hard " << QuoteShellArg(base_commit) << '\n'
      << "git remote remove origin\n"
      << '\n'
      << "# Install: generic repository step, version pre-install steps, version install\n"
      << "set +x\n"
      << "source " << kCondaActivatePath << '\n'
      << "conda activate " << kCondaEnvName << '\n'
      << "set -x\n";
  if (!spec.install_repo.empty()) {
    out << spec.install_repo << '\n';
  }
  AppendLines(out, spec.pre_install);
  if (!spec.install.empty()) {
    out << spec.install << '\n';
  }
  return out.str();
}

std::string GenerateEvalScript(std::string_view test_patch, const repos::RepoSpec& spec,
                               std::string_view base_commit) {
  const std::vector<std::string> patched_files = repos::ExtractPatchedFiles(test_patch);
  const std::vector<std::string> directives =
      repos::ExtractTestDirectives(test_patch, spec.directive_style);
  const std::string apply_fail_echo =
      "echo " + QuoteShellArg(scoring::kApplyPatchFail);

  std::ostringstream out;
  out << "#!/bin/bash\n"
      << "set -uox pipefail\n"
      << '\n'
      << "# Enter the repository and activate the test environment\n";
  AppendEnterTestbed(out);

  out << '\n' << "# Repository-specific evaluation setup\n";
  AppendLines(out, spec.eval_commands);

  out << '\n' << "# Re-assert working directory and environment after the setup commands\n";
  AppendEnterTestbed(out);

  out << '\n' << "# Restore the files touched by the test patch to the base commit\n";
  if (!patched_files.empty()) {
    out << "git checkout " << QuoteShellArg(base_commit) << ' ' << JoinQuoted(patched_files)
        << '\n';
  }

  out << '\n'
      << "# Write and apply the hidden test patch\n"
      << RenderWriteFileCommand(test_patch, kTestPatchPath) << '\n'
      << "git apply --check " << kTestPatchPath << " || " << apply_fail_echo << '\n'
      << "git apply " << kTestPatchPath << " || " << apply_fail_echo << '\n';

  out << '\n' << "# Run the test targets touched by the test patch\n" << spec.test_cmd;
  if (!directives.empty()) {
    out << ' ' << JoinQuoted(directives);
  }
  out << '\n';
  return out.str();
}

std::string RenderWriteFileCommand(std::string_view text, std::string_view path) {
  return "printf '%s' " + QuoteShellArg(text) + " > " + QuoteShellArg(path);
}

std::string GenerateCapturePatchScript(std::string_view base_commit) {
  std::ostringstream out;
  out << "cd " << kTestbedDir << '\n'
      << "git add -A >/dev/null\n"
      << "git diff --cached " << QuoteShellArg(base_commit) << '\n';
  return out.str();
}

std::string GenerateApplyPatchScript(std::string_view patch) {
  constexpr std::string_view kCandidatePatchPath = "/tmp/candidate.patch";
  std::ostringstream out;
  out << "set -euo pipefail\n"
      << "cd " << kTestbedDir << '\n'
      << RenderWriteFileCommand(patch, kCandidatePatchPath) << '\n'
      << "git apply --verbose " << kCandidatePatchPath << '\n';
  return out.str();
}

} // namespace sweval::scripts
