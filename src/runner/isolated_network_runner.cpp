#include <format>
#include <iostream>
#include <string>
#include <utility>

#include "bindbench/runner/container_runtime.hpp"
#include "bindbench/runner/runner.hpp"
#include "bindbench/transfer/program.hpp"

namespace bindbench {
namespace {

class IsolatedNetworkRunner final : public IRunner {
 public:
  IsolatedNetworkRunner(RunnerOptions opts,
                        std::string image,
                        std::shared_ptr<const ContainerRuntime> runtime)
      : opts_(std::move(opts)), image_(std::move(image)), runtime_(std::move(runtime)) {}

  RunnerFormat format() const noexcept override { return RunnerFormat::IsolatedNetwork; }
  TransferProgram program() const noexcept override { return opts_.program; }
  const std::vector<Binding>& bindings() const noexcept override { return opts_.bindings; }

  Expected<std::unique_ptr<IProcessHandle>> run(std::string_view binding_identifier,
                                                const std::filesystem::path& scratch_path,
                                                const LogSink& log) override {
    // The network namespace is what is under test, so no address binding.
    auto cmd = build_transfer_command(opts_.program, opts_.upstream, kContainerDataPath,
                                      opts_.extra_args, std::nullopt);

    ContainerRunSpec spec{};
    spec.name = make_container_name();
    spec.network = std::string(binding_identifier);
    spec.mount_source = scratch_path.string();
    spec.image = image_;
    spec.program = std::move(cmd.executable);
    spec.program_args = std::move(cmd.args);

    auto client = runtime_->start(spec, log.fd());
    if (!client) {
      return std::unexpected(client.error());
    }
    return make_container_process_handle(std::move(*client), std::move(spec.name), runtime_,
                                         opts_.controller);
  }

 private:
  RunnerOptions opts_;
  std::string image_;
  std::shared_ptr<const ContainerRuntime> runtime_;
};

}  // namespace

Expected<std::unique_ptr<IRunner>> make_isolated_network_runner(
    RunnerOptions opts, IsolatedNetworkOptions isolated) {
  if (isolated.image.empty()) {
    return fail(ErrorCode::InvalidConfig, "isolated network mode requires a container image");
  }
  if (opts.bindings.empty()) {
    return fail(ErrorCode::InvalidConfig, "no networks configured");
  }
  for (const auto& b : opts.bindings) {
    if (b.identifier.empty()) {
      return fail(ErrorCode::InvalidConfig, std::format("empty network name ({})", b.label));
    }
  }
  if (!opts.controller) {
    opts.controller = make_posix_process_group_controller();
  }

  auto runtime = std::make_shared<const ContainerRuntime>(isolated.runtime_binary);

  auto present = runtime->image_exists(isolated.image);
  if (!present) {
    return std::unexpected(present.error());
  }
  if (!*present) {
    std::cerr << std::format("image {} not found locally, pulling it...\n", isolated.image);
    auto pulled = runtime->pull_image(isolated.image, isolated.pull_output_fd);
    if (!pulled) {
      return std::unexpected(pulled.error());
    }
  }

  return std::make_unique<IsolatedNetworkRunner>(std::move(opts), std::move(isolated.image),
                                                 std::move(runtime));
}

}  // namespace bindbench
