#pragma once

#include "repos/repo_spec.hpp"

#include <string>
#include <string_view>

namespace sweval::scripts {

// Fixed sandbox layout shared by the image builder, the provisioner and both
// scripts.
inline constexpr std::string_view kTestbedDir = "/testbed";
inline constexpr std::string_view kCondaActivatePath = "/opt/miniconda3/bin/activate";
inline constexpr std::string_view kCondaEnvName = "testbed";
inline constexpr std::string_view kTestPatchPath = "/tmp/test_patch.diff";

// Setup script run once in a fresh sandbox before the agent starts:
// clone, open permissions, hard-reset to `base_commit`, drop the remote, then
// the install steps in fixed order (generic, pre-install, install).
// `set -euxo pipefail`: the first failing step aborts the script.
std::string GenerateSetupScript(const repos::RepoSpec& spec, std::string_view base_commit);

// Eval script run after the agent finishes. Restores the files the test
// patch touches, applies the hidden test patch and runs the test command on
// the patch's test targets.
// `set -uox pipefail`: later steps still run after a failure, so failure
// signatures reach stdout for classification.
std::string GenerateEvalScript(std::string_view test_patch, const repos::RepoSpec& spec,
                               std::string_view base_commit);

// `printf '%s' <quoted text> > <path>`: reproduces `text` exactly in `path`.
std::string RenderWriteFileCommand(std::string_view text, std::string_view path);

// Commands that stage every change in the checkout and print the resulting
// diff against `base_commit`. This is the patch the agent produced.
std::string GenerateCapturePatchScript(std::string_view base_commit);

// Writes `patch` into the checkout and applies it; used to evaluate a
// candidate patch (for example the reference solution) without an agent.
std::string GenerateApplyPatchScript(std::string_view patch);

} // namespace sweval::scripts
