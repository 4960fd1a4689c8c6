#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

#include "bindbench/bench/orchestrator.hpp"
#include "bindbench/core/cancel.hpp"
#include "bindbench/core/log_sink.hpp"
#include "bindbench/runner/runner.hpp"

namespace {

using namespace std::chrono_literals;

class TempDir {
 public:
  explicit TempDir(const std::string& tag) {
    path_ = std::filesystem::temp_directory_path() /
            std::format("bindbench_{}_{}", tag, ::getpid());
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::create_directories(path_, ec);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

void write_file(const std::filesystem::path& p, const std::string& text) {
  std::ofstream out(p, std::ios::trunc);
  out << text;
}

std::string read_file(const std::filesystem::path& p) {
  std::ifstream in(p);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_script(const std::filesystem::path& p, const std::string& body) {
  write_file(p, "#!/bin/sh\n" + body);
  std::filesystem::permissions(p, std::filesystem::perms::owner_all);
}

// Fake transfer programs shadow the real ones for the rest of the process.
void prepend_to_path(const std::filesystem::path& dir) {
  const char* old = std::getenv("PATH");
  const std::string value = dir.string() + ":" + (old ? old : "/usr/bin:/bin");
  ::setenv("PATH", value.c_str(), 1);
}

bindbench::RunnerOptions options_for(bindbench::TransferProgram program,
                                     std::vector<bindbench::Binding> bindings) {
  bindbench::RunnerOptions opts{};
  opts.program = program;
  opts.upstream = "http://upstream.invalid/file";
  opts.bindings = std::move(bindings);
  return opts;
}

bool test_invalid_address_rejected() {
  auto runner = bindbench::make_local_bind_runner(
      options_for(bindbench::TransferProgram::Curl,
                  {{"127.0.0.1", "lo"}, {"not-an-ip", "broken"}, {"::1", "lo6"}}),
      {});
  if (runner || runner.error().code() != bindbench::ErrorCode::InvalidConfig) {
    std::cerr << "malformed address must be rejected with InvalidConfig\n";
    return false;
  }
  if (runner.error().message().find("not-an-ip") == std::string::npos) {
    std::cerr << std::format("error should name the entry: {}\n", runner.error().message());
    return false;
  }

  auto empty = bindbench::make_local_bind_runner(options_for(bindbench::TransferProgram::Curl, {}), {});
  if (empty || empty.error().code() != bindbench::ErrorCode::InvalidConfig) {
    std::cerr << "empty binding list must be rejected\n";
    return false;
  }
  return true;
}

bool test_address_validation() {
  for (const char* ok : {"192.168.1.10", "0.0.0.0", "::1", "fe80::1", "2001:db8::42"}) {
    if (!bindbench::is_valid_bind_address(ok)) {
      std::cerr << std::format("{} should be valid\n", ok);
      return false;
    }
  }
  for (const char* bad : {"", "eth0", "300.1.1.1", "1.2.3", "example.org"}) {
    if (bindbench::is_valid_bind_address(bad)) {
      std::cerr << std::format("{} should be invalid\n", bad);
      return false;
    }
  }
  return true;
}

bool test_binder_lookup() {
  TempDir dir("binder");
  const auto exe_dir = dir.path() / "bin";
  std::filesystem::create_directories(exe_dir);
  write_file(exe_dir / "libbinder.so", "");

  bindbench::LocalBindOptions local{};
  local.executable_dir = exe_dir;
  auto found = bindbench::locate_binder_library(local);
  if (!found || found->filename() != "libbinder.so" || found->parent_path().filename() != "bin") {
    std::cerr << "binder next to the executable should be found\n";
    return false;
  }

  local.binder_override = dir.path() / "missing.so";
  auto missing = bindbench::locate_binder_library(local);
  if (missing || missing.error().code() != bindbench::ErrorCode::MissingDependency) {
    std::cerr << "missing override must be MissingDependency\n";
    return false;
  }

  auto git = bindbench::make_local_bind_runner(
      options_for(bindbench::TransferProgram::Git, {{"127.0.0.1", "lo"}}), local);
  if (git || git.error().code() != bindbench::ErrorCode::MissingDependency) {
    std::cerr << "git runner without binder must fail\n";
    return false;
  }

  // Programs with native binding never look for the library.
  auto curl = bindbench::make_local_bind_runner(
      options_for(bindbench::TransferProgram::Curl, {{"127.0.0.1", "lo"}}), local);
  if (!curl) {
    std::cerr << std::format("curl runner failed: {}\n", curl.error().message());
    return false;
  }
  return true;
}

bool test_curl_run_uses_bind_argument(const std::filesystem::path& tools) {
  write_script(tools / "curl", "printf '%s\\n' \"$@\" > \"$2.args\"\nprintf 'hello' > \"$2\"\n");

  auto runner = bindbench::make_local_bind_runner(
      options_for(bindbench::TransferProgram::Curl, {{"127.0.0.1", "lo"}}), {});
  if (!runner) {
    std::cerr << std::format("runner: {}\n", runner.error().message());
    return false;
  }

  TempDir scratch("curl_run");
  const auto dest = scratch.path() / "out";
  bindbench::LogSink log;
  auto handle = (*runner)->run("127.0.0.1", dest, log);
  if (!handle) {
    std::cerr << std::format("run: {}\n", handle.error().message());
    return false;
  }
  bindbench::CancellationToken cancel;
  auto r = (*handle)->wait_with_timeout(10000ms, cancel);
  if (!r || r->state != bindbench::HandleState::NaturallyExited || !r->exit_status.success()) {
    std::cerr << "fake curl should exit cleanly\n";
    return false;
  }

  const auto args = read_file(dest.string() + ".args");
  const auto want = std::format("-o\n{}\n--interface\n127.0.0.1\nhttp://upstream.invalid/file\n",
                                dest.string());
  if (args != want) {
    std::cerr << std::format("curl args mismatch:\n{}\n", args);
    return false;
  }
  if (read_file(dest) != "hello") {
    std::cerr << "fake curl output missing\n";
    return false;
  }
  return true;
}

bool test_git_run_preloads_binder(const std::filesystem::path& tools) {
  write_script(tools / "git", "printf '%s|%s' \"$BIND_ADDRESS\" \"$LD_PRELOAD\" > \"$4/env\"\n");

  TempDir scratch("git_run");
  const auto binder = scratch.path() / "libbinder.so";
  write_file(binder, "");
  const auto dest = scratch.path() / "repo";
  std::filesystem::create_directories(dest);

  bindbench::LocalBindOptions local{};
  local.binder_override = binder;
  auto runner = bindbench::make_local_bind_runner(
      options_for(bindbench::TransferProgram::Git, {{"10.1.2.3", "uplink"}}), local);
  if (!runner) {
    std::cerr << std::format("git runner: {}\n", runner.error().message());
    return false;
  }

  bindbench::LogSink log;
  auto handle = (*runner)->run("10.1.2.3", dest, log);
  if (!handle) {
    std::cerr << std::format("run: {}\n", handle.error().message());
    return false;
  }
  bindbench::CancellationToken cancel;
  auto r = (*handle)->wait_with_timeout(10000ms, cancel);
  if (!r || !r->exit_status.success()) {
    std::cerr << "fake git should exit cleanly\n";
    return false;
  }

  const auto env = read_file(dest / "env");
  const auto want = std::format("10.1.2.3|{}", std::filesystem::absolute(binder).string());
  if (env != want) {
    std::cerr << std::format("git env mismatch: '{}' want '{}'\n", env, want);
    return false;
  }
  return true;
}

bool test_benchmark_end_to_end(const std::filesystem::path& tools) {
  write_script(tools / "curl", "printf 'payload' > \"$2\"\n");

  auto runner = bindbench::make_local_bind_runner(
      options_for(bindbench::TransferProgram::Curl, {{"127.0.0.1", "v4"}, {"::1", "v6"}}), {});
  if (!runner) {
    std::cerr << std::format("runner: {}\n", runner.error().message());
    return false;
  }

  TempDir scratch("e2e");
  bindbench::BenchmarkOptions opts{};
  opts.pass_count = 2;
  opts.timeout = 10s;
  opts.scratch_root = scratch.path();

  bindbench::LogSink log;
  bindbench::CancellationToken cancel;
  auto report = bindbench::run_benchmark(**runner, opts, log, cancel);
  if (!report) {
    std::cerr << std::format("benchmark: {}\n", report.error().message());
    return false;
  }
  if (report->cancelled || report->passes.size() != 2 || report->scores.size() != 2) {
    std::cerr << "unexpected report shape\n";
    return false;
  }
  for (const auto& pass : report->passes) {
    for (const auto& rec : pass) {
      if (rec.outcome != bindbench::RunOutcome::Ok || rec.result.transferred_bytes != 7 ||
          rec.kbps <= 0.0) {
        std::cerr << std::format("run record mismatch: bytes={} kbps={}\n",
                                 rec.result.transferred_bytes, rec.kbps);
        return false;
      }
    }
  }
  if (!std::filesystem::is_empty(scratch.path())) {
    std::cerr << "scratch files should be removed after each run\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!test_invalid_address_rejected()) {
    return 1;
  }
  if (!test_address_validation()) {
    return 1;
  }
  if (!test_binder_lookup()) {
    return 1;
  }

  TempDir tools("tools");
  prepend_to_path(tools.path());
  if (!test_curl_run_uses_bind_argument(tools.path())) {
    return 1;
  }
  if (!test_git_run_preloads_binder(tools.path())) {
    return 1;
  }
  if (!test_benchmark_end_to_end(tools.path())) {
    return 1;
  }
  return 0;
}
