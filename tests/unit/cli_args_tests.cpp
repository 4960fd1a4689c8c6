#include <csignal>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

#include "app/cli_runner.hpp"

namespace {

bindbench::Expected<bindbench::app::Config> parse(std::vector<std::string> args) {
  std::vector<char*> argv;
  for (auto& a : args) {
    argv.push_back(a.data());
  }
  argv.push_back(nullptr);
  return bindbench::app::parse_args(static_cast<int>(args.size()), argv.data());
}

bool test_defaults() {
  auto cfg = parse({"bindbench", "https://example.org/file.iso"});
  if (!cfg) {
    std::cerr << std::format("parse failed: {}\n", cfg.error().message());
    return false;
  }
  if (cfg->upstream != "https://example.org/file.iso" || cfg->profile != "default" ||
      cfg->passes != 3 || cfg->timeout_sec != 30 || cfg->log_path != "/dev/null" ||
      cfg->program || cfg->config_path || cfg->tmp_dir || !cfg->extra_args.empty()) {
    std::cerr << "default config mismatch\n";
    return false;
  }
  return true;
}

bool test_all_options() {
  auto cfg = parse({"bindbench", "-p", "5", "-t", "10", "--profile", "lab", "-c", "/tmp/b.conf",
                    "--tmp-dir", "/var/tmp", "--log", "/tmp/bindbench.log", "--program", "Git",
                    "--extra=-c core.compression=0", "--extra", "--depth 1",
                    "git://example.org/repo"});
  if (!cfg) {
    std::cerr << std::format("parse failed: {}\n", cfg.error().message());
    return false;
  }
  if (cfg->passes != 5 || cfg->timeout_sec != 10 || cfg->profile != "lab" ||
      cfg->config_path != std::filesystem::path("/tmp/b.conf") ||
      cfg->tmp_dir != std::filesystem::path("/var/tmp") ||
      cfg->log_path != "/tmp/bindbench.log" || cfg->program != bindbench::TransferProgram::Git ||
      cfg->upstream != "git://example.org/repo") {
    std::cerr << "option values mismatch\n";
    return false;
  }
  const std::vector<std::string> want{"-c", "core.compression=0", "--depth", "1"};
  if (cfg->extra_args != want) {
    std::cerr << std::format("extra args mismatch ({} words)\n", cfg->extra_args.size());
    return false;
  }
  return true;
}

bool test_rejections() {
  struct Case {
    std::vector<std::string> args;
    bindbench::ErrorCode code;
  };
  const std::vector<Case> cases{
      {{"bindbench", "-p", "0", "http://h/f"}, bindbench::ErrorCode::InvalidArgument},
      {{"bindbench", "-t", "0", "http://h/f"}, bindbench::ErrorCode::InvalidArgument},
      {{"bindbench", "--program", "scp", "http://h/f"}, bindbench::ErrorCode::InvalidArgument},
      {{"bindbench", "--extra='unbalanced", "http://h/f"}, bindbench::ErrorCode::InvalidConfig},
      {{"bindbench", "http://h/f", "--extra"}, bindbench::ErrorCode::InvalidArgument},
      {{"bindbench"}, bindbench::ErrorCode::InvalidArgument},
  };
  for (const auto& c : cases) {
    auto cfg = parse(c.args);
    if (cfg || cfg.error().code() != c.code) {
      std::cerr << std::format("expected {} for {} args\n", bindbench::error_code_name(c.code),
                               c.args.size());
      return false;
    }
  }
  return true;
}

bool test_exit_codes() {
  using bindbench::ErrorCode;
  using bindbench::app::exit_code_for;
  if (exit_code_for(ErrorCode::InvalidConfig) != bindbench::app::kExitUsage ||
      exit_code_for(ErrorCode::MissingDependency) != bindbench::app::kExitUsage ||
      exit_code_for(ErrorCode::InvalidArgument) != bindbench::app::kExitUsage ||
      exit_code_for(ErrorCode::LaunchFailed) != bindbench::app::kExitRuntimeError ||
      exit_code_for(ErrorCode::TerminationFailed) != bindbench::app::kExitRuntimeError) {
    std::cerr << "exit code mapping mismatch\n";
    return false;
  }
  return true;
}

bool test_run_state_text() {
  bindbench::RunRecord rec{};
  rec.outcome = bindbench::RunOutcome::Ok;
  if (bindbench::app::describe_run_state(bindbench::TransferProgram::Curl, rec) != "OK") {
    std::cerr << "ok text mismatch\n";
    return false;
  }

  rec.outcome = bindbench::RunOutcome::ExitFailure;
  rec.result.exit_status.exit_code = 6;
  if (bindbench::app::describe_run_state(bindbench::TransferProgram::Curl, rec) !=
      "curl failed with code 6") {
    std::cerr << "exit failure text mismatch\n";
    return false;
  }

  rec.outcome = bindbench::RunOutcome::ExpectedTimeout;
  rec.cancelled = true;
  if (bindbench::app::describe_run_state(bindbench::TransferProgram::Rsync, rec) !=
      "rsync timeout as expected (terminated by user)") {
    std::cerr << "timeout text mismatch\n";
    return false;
  }

  rec = bindbench::RunRecord{};
  rec.outcome = bindbench::RunOutcome::SignalFailure;
  rec.result.exit_status.signal = SIGKILL;
  if (bindbench::app::describe_run_state(bindbench::TransferProgram::Git, rec) !=
      std::format("git killed by signal {}", SIGKILL)) {
    std::cerr << "signal text mismatch\n";
    return false;
  }
  return true;
}

// The fake pull interrupts bindbench and then keeps working for a while.
bool test_interrupt_during_image_pull_is_cancelled() {
  const auto dir = std::filesystem::temp_directory_path() /
                   std::format("bindbench_cli_pull_{}", ::getpid());
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir, ec);

  const auto docker = dir / "docker";
  {
    std::ofstream out(docker);
    out << "#!/bin/sh\n"
        << "case \"$1\" in\n"
        << "  image) exit 1 ;;\n"
        << "  pull) kill -INT $PPID; sleep 0.3; touch '" << (dir / "pulled").string() << "' ;;\n"
        << "  *) exit 2 ;;\n"
        << "esac\n";
  }
  std::filesystem::permissions(docker, std::filesystem::perms::owner_all);

  const auto conf = dir / "bindbench.conf";
  {
    std::ofstream out(conf);
    out << "[lab]\nformat = \"docker\"\nimage = \"bench/image\"\n"
        << "docker = \"" << docker.string() << "\"\n"
        << "[lab.uses]\nnet1 = \"first\"\n";
  }

  std::vector<std::string> args{"bindbench", "-c", conf.string(), "--profile", "lab",
                                "--program", "curl", "http://upstream.invalid/file"};
  std::vector<char*> argv;
  for (auto& a : args) {
    argv.push_back(a.data());
  }
  argv.push_back(nullptr);

  const int rc = run_cli_impl(static_cast<int>(args.size()), argv.data());
  const bool pulled = std::filesystem::exists(dir / "pulled");
  std::filesystem::remove_all(dir, ec);

  if (rc != bindbench::app::kExitCancelled) {
    std::cerr << std::format("interrupted pull should exit {}, got {}\n",
                             bindbench::app::kExitCancelled, rc);
    return false;
  }
  if (!pulled) {
    std::cerr << "pull was abandoned instead of awaited\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!test_defaults()) {
    return 1;
  }
  if (!test_all_options()) {
    return 1;
  }
  if (!test_rejections()) {
    return 1;
  }
  if (!test_exit_codes()) {
    return 1;
  }
  if (!test_run_state_text()) {
    return 1;
  }
  if (!test_interrupt_during_image_pull_is_cancelled()) {
    return 1;
  }
  return 0;
}
