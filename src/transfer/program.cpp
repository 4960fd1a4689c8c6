#include "bindbench/transfer/program.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace bindbench {
namespace {

constexpr std::array<ProgramTraits, 4> kTraits{{
    {TransferProgram::Rsync, TransferKind::FileSync, "rsync", true, Destination::File,
     TerminationPolicy::GracefulThenKill},
    {TransferProgram::Curl, TransferKind::HttpFetch, "curl", true, Destination::File,
     TerminationPolicy::GracefulThenKill},
    {TransferProgram::Wget, TransferKind::HttpFetch, "wget", true, Destination::File,
     TerminationPolicy::GracefulThenKill},
    // git spawns git-remote-* helpers that clean up on SIGTERM and leave
    // nothing to measure, so the whole group is killed at once.
    {TransferProgram::Git, TransferKind::VersionControlClone, "git", false,
     Destination::Directory, TerminationPolicy::KillGroup},
}};

std::string to_lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

}  // namespace

const ProgramTraits& program_traits(TransferProgram program) noexcept {
  return kTraits[static_cast<size_t>(program)];
}

std::string_view program_name(TransferProgram program) noexcept {
  return program_traits(program).executable;
}

Expected<TransferProgram> parse_program(std::string_view name) {
  const auto lowered = to_lower(name);
  for (const auto& t : kTraits) {
    if (lowered == t.executable) {
      return t.program;
    }
  }
  return fail(ErrorCode::InvalidArgument,
              "unknown program '" + std::string(name) + "' (expected rsync, curl, wget or git)");
}

Expected<TransferProgram> detect_program(std::string_view upstream) {
  const auto u = to_lower(upstream);
  if (u.starts_with("http://") || u.starts_with("https://")) {
    if (u.ends_with(".git")) {
      return TransferProgram::Git;
    }
    return TransferProgram::Curl;
  }
  if (u.starts_with("git://")) {
    return TransferProgram::Git;
  }
  if (u.starts_with("rsync://") || u.find("::") != std::string::npos) {
    return TransferProgram::Rsync;
  }
  return fail(ErrorCode::InvalidArgument,
              "cannot detect upstream program, please specify it with --program");
}

TransferCommand build_transfer_command(TransferProgram program,
                                       std::string_view upstream,
                                       std::string_view destination,
                                       std::span<const std::string> extra_args,
                                       std::optional<std::string_view> bind_address) {
  const auto& traits = program_traits(program);

  TransferCommand cmd{};
  cmd.executable = std::string(traits.executable);
  cmd.destination = traits.destination;
  auto& a = cmd.args;

  switch (program) {
    case TransferProgram::Rsync:
      a.emplace_back("-vP");
      a.emplace_back("-rLptgoD");
      a.emplace_back("--inplace");
      if (bind_address) {
        a.emplace_back("--address");
        a.emplace_back(*bind_address);
      }
      a.emplace_back(upstream);
      a.emplace_back(destination);
      break;
    case TransferProgram::Curl:
      a.emplace_back("-o");
      a.emplace_back(destination);
      if (bind_address) {
        a.emplace_back("--interface");
        a.emplace_back(*bind_address);
      }
      a.emplace_back(upstream);
      break;
    case TransferProgram::Wget:
      a.emplace_back("-O");
      a.emplace_back(destination);
      if (bind_address) {
        a.emplace_back("--bind-address");
        a.emplace_back(*bind_address);
      }
      a.emplace_back(upstream);
      break;
    case TransferProgram::Git:
      a.emplace_back("clone");
      a.emplace_back("--bare");
      a.emplace_back(upstream);
      a.emplace_back(destination);
      // No native bind option; the runner preloads the binder library which
      // reads this variable.
      if (bind_address) {
        cmd.env.emplace_back(std::string(kBindAddressEnv), std::string(*bind_address));
      }
      break;
  }

  a.insert(a.end(), extra_args.begin(), extra_args.end());
  return cmd;
}

Expected<std::vector<std::string>> split_extra_args(std::string_view text) {
  enum class State { Normal, Single, Double };

  std::vector<std::string> words;
  std::string current;
  bool in_word = false;
  State state = State::Normal;

  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    switch (state) {
      case State::Normal:
        if (std::isspace(static_cast<unsigned char>(c))) {
          if (in_word) {
            words.push_back(std::move(current));
            current.clear();
            in_word = false;
          }
        } else if (c == '\'') {
          state = State::Single;
          in_word = true;
        } else if (c == '"') {
          state = State::Double;
          in_word = true;
        } else if (c == '\\') {
          if (i + 1 >= text.size()) {
            return fail(ErrorCode::InvalidConfig,
                        "failed to parse extra arguments: trailing backslash");
          }
          const char next = text[++i];
          // An escaped newline is a line continuation.
          if (next != '\n') {
            current.push_back(next);
            in_word = true;
          }
        } else {
          current.push_back(c);
          in_word = true;
        }
        break;
      case State::Single:
        if (c == '\'') {
          state = State::Normal;
        } else {
          current.push_back(c);
        }
        break;
      case State::Double:
        if (c == '"') {
          state = State::Normal;
        } else if (c == '\\' && i + 1 < text.size() &&
                   (text[i + 1] == '"' || text[i + 1] == '\\' || text[i + 1] == '$' ||
                    text[i + 1] == '`' || text[i + 1] == '\n')) {
          const char next = text[++i];
          if (next != '\n') {
            current.push_back(next);
          }
        } else {
          current.push_back(c);
        }
        break;
    }
  }

  if (state != State::Normal) {
    return fail(ErrorCode::InvalidConfig, "failed to parse extra arguments: unbalanced quotes");
  }
  if (in_word) {
    words.push_back(std::move(current));
  }
  return words;
}

}  // namespace bindbench
