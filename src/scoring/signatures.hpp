#pragma once

#include <array>
#include <string_view>

namespace sweval::scoring {

// Markers written into eval stdout when the run itself, rather than the code
// under test, went wrong. The exact text is shared with the public SWE-bench
// harness so captured logs stay comparable.
inline constexpr std::string_view kApplyPatchFail = ">>>>> Patch Apply Failed";
inline constexpr std::string_view kResetFailed = ">>>>> Reset Failed";
inline constexpr std::string_view kTestsError = ">>>>> Tests Errored";
inline constexpr std::string_view kTestsTimeout = ">>>>> Tests Timed Out";
inline constexpr std::string_view kTaskEnvResetFailed = "Failed to reset task environment";

// Scan order is also the order signatures are listed in explanations.
inline constexpr std::array<std::string_view, 5> kInfrastructureSignatures = {
    kApplyPatchFail, kResetFailed, kTestsError, kTestsTimeout, kTaskEnvResetFailed,
};

} // namespace sweval::scoring
