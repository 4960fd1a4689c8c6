#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "bindbench/core/expected.hpp"
#include "bindbench/core/types.hpp"

namespace bindbench {

inline constexpr std::string_view kBindAddressEnv = "BIND_ADDRESS";
inline constexpr std::string_view kPreloadEnv = "LD_PRELOAD";

struct ProgramTraits {
  TransferProgram program{};
  TransferKind kind{};
  std::string_view executable{};
  bool native_bind{false};
  Destination destination{Destination::File};
  TerminationPolicy termination{TerminationPolicy::GracefulThenKill};
};

struct TransferCommand {
  std::string executable{};
  std::vector<std::string> args{};
  std::vector<std::pair<std::string, std::string>> env{};
  Destination destination{Destination::File};
};

const ProgramTraits& program_traits(TransferProgram program) noexcept;
std::string_view program_name(TransferProgram program) noexcept;

Expected<TransferProgram> parse_program(std::string_view name);

// Picks a program from the upstream's scheme when none was given explicitly.
Expected<TransferProgram> detect_program(std::string_view upstream);

TransferCommand build_transfer_command(TransferProgram program,
                                       std::string_view upstream,
                                       std::string_view destination,
                                       std::span<const std::string> extra_args,
                                       std::optional<std::string_view> bind_address);

// POSIX shell word splitting for user-supplied extra arguments.
Expected<std::vector<std::string>> split_extra_args(std::string_view text);

}  // namespace bindbench
