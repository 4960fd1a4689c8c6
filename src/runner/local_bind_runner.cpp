#include <format>
#include <string>
#include <system_error>
#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>

#include "bindbench/runner/runner.hpp"
#include "bindbench/transfer/program.hpp"

namespace bindbench {
namespace {

std::vector<std::filesystem::path> binder_candidates(const LocalBindOptions& local) {
  std::vector<std::filesystem::path> out;
  if (local.executable_dir) {
    out.push_back(*local.executable_dir / kBinderFileName);
    out.push_back(*local.executable_dir / "deps" / kBinderFileName);
    out.push_back(*local.executable_dir / ".." / "lib" / "bindbench" / kBinderFileName);
  }
  out.emplace_back(std::filesystem::path("/usr/local/lib/bindbench") / kBinderFileName);
  out.emplace_back(std::filesystem::path("/usr/lib/bindbench") / kBinderFileName);
  return out;
}

class LocalBindRunner final : public IRunner {
 public:
  LocalBindRunner(RunnerOptions opts, std::optional<std::filesystem::path> binder)
      : opts_(std::move(opts)), binder_(std::move(binder)) {}

  RunnerFormat format() const noexcept override { return RunnerFormat::LocalBind; }
  TransferProgram program() const noexcept override { return opts_.program; }
  const std::vector<Binding>& bindings() const noexcept override { return opts_.bindings; }

  Expected<std::unique_ptr<IProcessHandle>> run(std::string_view binding_identifier,
                                                const std::filesystem::path& scratch_path,
                                                const LogSink& log) override {
    auto cmd = build_transfer_command(opts_.program, opts_.upstream, scratch_path.string(),
                                      opts_.extra_args, binding_identifier);

    SpawnRequest req{};
    req.executable = std::move(cmd.executable);
    req.args = std::move(cmd.args);
    req.env = std::move(cmd.env);
    if (!program_traits(opts_.program).native_bind) {
      req.env.emplace_back(std::string(kPreloadEnv), binder_->string());
    }
    req.output_fd = log.fd();
    req.new_process_group = true;

    auto child = ChildProcess::spawn(req);
    if (!child) {
      return std::unexpected(child.error());
    }
    return make_local_process_handle(std::move(*child), program_traits(opts_.program).termination,
                                     opts_.controller);
  }

 private:
  RunnerOptions opts_;
  std::optional<std::filesystem::path> binder_;
};

}  // namespace

bool is_valid_bind_address(std::string_view address) {
  const std::string s(address);
  in_addr v4{};
  in6_addr v6{};
  return ::inet_pton(AF_INET, s.c_str(), &v4) == 1 || ::inet_pton(AF_INET6, s.c_str(), &v6) == 1;
}

Expected<std::filesystem::path> locate_binder_library(const LocalBindOptions& local) noexcept {
  std::error_code ec;
  if (local.binder_override) {
    if (std::filesystem::is_regular_file(*local.binder_override, ec)) {
      return std::filesystem::absolute(*local.binder_override, ec);
    }
    return fail(ErrorCode::MissingDependency,
                std::format("{}={} does not point to a file", kBinderOverrideEnv,
                            local.binder_override->string()));
  }

  std::string tried;
  for (const auto& candidate : binder_candidates(local)) {
    if (std::filesystem::is_regular_file(candidate, ec)) {
      auto canonical = std::filesystem::weakly_canonical(candidate, ec);
      return ec ? candidate : canonical;
    }
    tried += "\n  " + candidate.string();
  }
  return fail(ErrorCode::MissingDependency,
              std::format("{} not found; git cannot bind to an address without it.\n"
                          "Put it next to the bindbench executable or set {}. Tried:{}",
                          kBinderFileName, kBinderOverrideEnv, tried));
}

Expected<std::unique_ptr<IRunner>> make_local_bind_runner(RunnerOptions opts,
                                                          LocalBindOptions local) {
  if (opts.bindings.empty()) {
    return fail(ErrorCode::InvalidConfig, "no bindings configured");
  }
  for (const auto& b : opts.bindings) {
    if (!is_valid_bind_address(b.identifier)) {
      return fail(ErrorCode::InvalidConfig,
                  std::format("invalid IP address '{}' ({})", b.identifier, b.label));
    }
  }
  if (!opts.controller) {
    opts.controller = make_posix_process_group_controller();
  }

  std::optional<std::filesystem::path> binder;
  if (!program_traits(opts.program).native_bind) {
    auto found = locate_binder_library(local);
    if (!found) {
      return std::unexpected(found.error());
    }
    binder = std::move(*found);
  }

  return std::make_unique<LocalBindRunner>(std::move(opts), std::move(binder));
}

}  // namespace bindbench
