#pragma once

#include <string>

#include "app/config_types.hpp"
#include "bindbench/core/expected.hpp"
#include "bindbench/core/types.hpp"

int run_cli_impl(int argc, char** argv);

namespace bindbench::app {

inline constexpr int kExitOk = 0;
inline constexpr int kExitRuntimeError = 1;
inline constexpr int kExitUsage = 2;
inline constexpr int kExitCancelled = 130;

bindbench::Expected<Config> parse_args(int argc, char** argv);

// Setup problems (arguments, profile, missing dependencies) map to kExitUsage.
int exit_code_for(ErrorCode code) noexcept;

// "OK", "curl failed with code 6", ... plus " (terminated by user)".
std::string describe_run_state(TransferProgram program, const RunRecord& record);

}  // namespace bindbench::app
