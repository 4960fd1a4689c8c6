#include "app/cli_runner.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <argparse/argparse.hpp>

#include <signal.h>
#include <unistd.h>

#include "app/profile_config.hpp"
#include "bindbench/bench/orchestrator.hpp"
#include "bindbench/core/cancel.hpp"
#include "bindbench/core/log_sink.hpp"
#include "bindbench/process/process_group.hpp"
#include "bindbench/runner/runner.hpp"
#include "bindbench/transfer/program.hpp"

namespace {

std::atomic<bindbench::CancellationToken*> g_cancel_token{nullptr};

extern "C" void on_terminate_signal(int) {
  if (auto* token = g_cancel_token.load(std::memory_order_acquire)) {
    token->request();
  }
}

// SIGINT/SIGTERM set the token for as long as this object lives.
class ScopedSignalHandlers {
 public:
  explicit ScopedSignalHandlers(bindbench::CancellationToken& token) {
    g_cancel_token.store(&token, std::memory_order_release);
    struct sigaction sa {};
    sa.sa_handler = on_terminate_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    installed_int_ = ::sigaction(SIGINT, &sa, &old_int_) == 0;
    installed_term_ = ::sigaction(SIGTERM, &sa, &old_term_) == 0;
    if (!installed_int_ || !installed_term_) {
      std::cerr << "[warn] cannot install signal handlers; Ctrl-C will not stop cleanly\n";
    }
  }

  ~ScopedSignalHandlers() {
    if (installed_int_) {
      ::sigaction(SIGINT, &old_int_, nullptr);
    }
    if (installed_term_) {
      ::sigaction(SIGTERM, &old_term_, nullptr);
    }
    g_cancel_token.store(nullptr, std::memory_order_release);
  }

  ScopedSignalHandlers(const ScopedSignalHandlers&) = delete;
  ScopedSignalHandlers& operator=(const ScopedSignalHandlers&) = delete;

 private:
  struct sigaction old_int_ {};
  struct sigaction old_term_ {};
  bool installed_int_{false};
  bool installed_term_{false};
};

class ConsoleReporter final : public bindbench::IBenchmarkObserver {
 public:
  explicit ConsoleReporter(bindbench::TransferProgram program) : program_(program) {}

  void on_pass_begin(uint32_t pass) override { std::cout << std::format("Pass {}:\n", pass); }

  void on_run_complete(uint32_t, const bindbench::Binding& binding,
                       const bindbench::RunRecord& record) override {
    std::cout << std::format("{} ({}): {:.2f} KB/s ({})\n", binding.identifier, binding.label,
                             record.kbps, bindbench::app::describe_run_state(program_, record))
              << std::flush;
  }

  void on_pass_complete(uint32_t) override {}

  void on_cancelled() override { std::cout << "Terminated by user.\n"; }

 private:
  bindbench::TransferProgram program_;
};

void print_scores(const std::vector<bindbench::AggregatedScore>& scores) {
  std::cout << "Final Results (remove min and max if feasible, and take average):\n";
  for (const auto& s : scores) {
    std::cout << std::format("{} ({}): {:.2f} KB/s (min {:.2f}, max {:.2f}, failures {})\n",
                             s.binding.identifier, s.binding.label, s.score_kbps, s.min_kbps,
                             s.max_kbps, s.failures);
  }
}

std::optional<std::filesystem::path> executable_dir(const std::string& argv0) {
  std::error_code ec;
  auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (!ec) {
    return self.parent_path();
  }
  if (argv0.find('/') != std::string::npos) {
    auto abs = std::filesystem::absolute(argv0, ec);
    if (!ec) {
      return abs.parent_path();
    }
  }
  return std::nullopt;
}

std::optional<std::filesystem::path> binder_override() {
  const std::string name(bindbench::kBinderOverrideEnv);
  if (const char* v = std::getenv(name.c_str()); v != nullptr && *v != '\0') {
    return std::filesystem::path(v);
  }
  return std::nullopt;
}

struct LiftedArgs {
  std::vector<std::string> rest;
  std::vector<std::string> extras;
};

// argparse rejects option values that start with '-', the usual shape of
// --extra, so its values are taken out before parsing.
bindbench::Expected<LiftedArgs> lift_extra_args(int argc, char** argv) {
  constexpr std::string_view kFlag = "--extra";
  LiftedArgs out;
  for (int i = 0; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    if (i > 0 && arg == kFlag) {
      if (i + 1 >= argc) {
        return bindbench::fail(bindbench::ErrorCode::InvalidArgument, "--extra requires a value");
      }
      out.extras.emplace_back(argv[++i]);
    } else if (i > 0 && arg.starts_with(kFlag) && arg.size() > kFlag.size() &&
               arg[kFlag.size()] == '=') {
      out.extras.emplace_back(arg.substr(kFlag.size() + 1));
    } else {
      out.rest.emplace_back(arg);
    }
  }
  return out;
}

int report_error(std::string_view stage, const bindbench::Error& err) {
  std::cerr << std::format("{} error ({}): {}\n", stage, bindbench::error_code_name(err.code()),
                           err.message());
  return bindbench::app::exit_code_for(err.code());
}

}  // namespace

namespace bindbench::app {

bindbench::Expected<Config> parse_args(int argc, char** argv) {
  Config cfg{};
  if (argc > 0) {
    cfg.executable_path = argv[0];
  }

  argparse::ArgumentParser program("bindbench", "0.1.0");
  program.add_description("Rank local addresses or container networks by transfer bandwidth.");
  program.add_argument("upstream").help("upstream path given to the transfer program");
  program.add_argument("--profile")
      .default_value(std::string("default"))
      .help("profile name in the config file");
  program.add_argument("-c", "--config")
      .help("config file; defaults to bindbench.conf in XDG config, ~/.bindbench.conf, /etc/bindbench.conf");
  program.add_argument("-p", "--pass")
      .scan<'u', uint32_t>()
      .default_value(static_cast<uint32_t>(3))
      .help("number of passes");
  program.add_argument("-t", "--timeout")
      .scan<'u', uint32_t>()
      .default_value(static_cast<uint32_t>(30))
      .help("per-run timeout in seconds");
  program.add_argument("--tmp-dir").help("directory for scratch files (default: system temp)");
  program.add_argument("--log")
      .default_value(std::string("/dev/null"))
      .help("file receiving the transfer programs' output");
  program.add_argument("--program").help("rsync, curl, wget or git (default: detect from upstream)");
  program.add_argument("--extra")
      .append()
      .help("extra program arguments, shell-split; use --extra='-a -b'");

  auto lifted = lift_extra_args(argc, argv);
  if (!lifted) {
    return std::unexpected(lifted.error());
  }

  try {
    program.parse_args(lifted->rest);
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << "\n";
    std::cerr << program;
    return fail(ErrorCode::InvalidArgument, "argument parsing failed");
  }

  cfg.upstream = program.get<std::string>("upstream");
  cfg.profile = program.get<std::string>("--profile");
  if (auto c = program.present<std::string>("--config")) {
    cfg.config_path = std::filesystem::path(*c);
  }

  cfg.passes = program.get<uint32_t>("--pass");
  if (cfg.passes == 0) {
    return fail(ErrorCode::InvalidArgument, "--pass must be at least 1");
  }
  cfg.timeout_sec = program.get<uint32_t>("--timeout");
  if (cfg.timeout_sec == 0) {
    return fail(ErrorCode::InvalidArgument, "--timeout must be at least 1 second");
  }

  if (auto dir = program.present<std::string>("--tmp-dir")) {
    cfg.tmp_dir = std::filesystem::path(*dir);
  }
  cfg.log_path = program.get<std::string>("--log");

  if (auto name = program.present<std::string>("--program")) {
    auto prog = parse_program(*name);
    if (!prog) {
      return std::unexpected(prog.error());
    }
    cfg.program = *prog;
  }

  for (const auto& text : lifted->extras) {
    auto words = split_extra_args(text);
    if (!words) {
      return std::unexpected(words.error());
    }
    cfg.extra_args.insert(cfg.extra_args.end(), words->begin(), words->end());
  }
  return cfg;
}

int exit_code_for(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::InvalidArgument:
    case ErrorCode::InvalidConfig:
    case ErrorCode::MissingDependency:
      return kExitUsage;
    case ErrorCode::LaunchFailed:
    case ErrorCode::TerminationFailed:
    case ErrorCode::IoError:
    case ErrorCode::Internal:
      return kExitRuntimeError;
  }
  return kExitRuntimeError;
}

std::string describe_run_state(TransferProgram program, const RunRecord& record) {
  const auto name = program_name(program);
  std::string state;
  switch (record.outcome) {
    case RunOutcome::Ok:
      state = "OK";
      break;
    case RunOutcome::ExpectedTimeout:
      state = std::format("{} timeout as expected", name);
      break;
    case RunOutcome::ExitFailure:
      state = std::format("{} failed with code {}", name,
                          record.result.exit_status.exit_code.value_or(-1));
      break;
    case RunOutcome::SignalFailure:
      state = std::format("{} killed by signal {}", name,
                          record.result.exit_status.signal.value_or(0));
      break;
  }
  if (record.cancelled) {
    state += " (terminated by user)";
  }
  return state;
}

}  // namespace bindbench::app

int run_cli_impl(int argc, char** argv) {
  using namespace bindbench;

  auto cfg = app::parse_args(argc, argv);
  if (!cfg) {
    std::cerr << "error: " << cfg.error().message() << "\n";
    return app::kExitUsage;
  }

  TransferProgram prog{};
  if (cfg->program) {
    prog = *cfg->program;
  } else {
    auto detected = detect_program(cfg->upstream);
    if (!detected) {
      return report_error("argument", detected.error());
    }
    prog = *detected;
  }

  auto reader = app::load_first_config(
      app::config_search_paths(cfg->config_path, app::ConfigEnv::from_process()));
  if (!reader) {
    return report_error("config", reader.error());
  }
  auto profile = app::load_profile(*reader, cfg->profile);
  if (!profile) {
    return report_error("config", profile.error());
  }

  auto log = LogSink::open(cfg->log_path);
  if (!log) {
    return report_error("log", log.error());
  }

  if (auto sub = become_child_subreaper(); !sub) {
    std::cerr << std::format("[warn] {}; orphaned helpers may linger\n", sub.error().message());
  }

  // Armed before the runner exists: a docker pull runs in its own process
  // group and must not outlive an interrupted bindbench.
  CancellationToken cancel;
  ScopedSignalHandlers handlers(cancel);

  RunnerOptions opts{};
  opts.program = prog;
  opts.upstream = cfg->upstream;
  opts.extra_args = cfg->extra_args;
  opts.bindings = profile->uses;
  opts.controller = make_posix_process_group_controller();

  LocalBindOptions local{};
  local.binder_override = binder_override();
  local.executable_dir = executable_dir(cfg->executable_path);

  IsolatedNetworkOptions isolated{};
  isolated.image = profile->image;
  isolated.runtime_binary = profile->runtime_binary;
  isolated.pull_output_fd = STDERR_FILENO;

  auto runner = make_runner(profile->format, std::move(opts), std::move(local), std::move(isolated));
  if (!runner) {
    return report_error("setup", runner.error());
  }

  BenchmarkOptions bench{};
  bench.pass_count = cfg->passes;
  bench.timeout = std::chrono::seconds(cfg->timeout_sec);
  bench.scratch_root = cfg->tmp_dir;

  ConsoleReporter reporter(prog);

  auto report = run_benchmark(**runner, bench, *log, cancel, &reporter);
  if (!report) {
    return report_error("run", report.error());
  }
  if (report->cancelled) {
    return app::kExitCancelled;
  }
  print_scores(report->scores);
  return app::kExitOk;
}
