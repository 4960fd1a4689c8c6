#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "bindbench/core/expected.hpp"
#include "bindbench/core/log_sink.hpp"
#include "bindbench/core/types.hpp"
#include "bindbench/process/process_group.hpp"
#include "bindbench/process/process_handle.hpp"

namespace bindbench {

inline constexpr std::string_view kBinderOverrideEnv = "BINDBENCH_BINDER";
inline constexpr std::string_view kBinderFileName = "libbinder.so";

struct RunnerOptions {
  TransferProgram program{TransferProgram::Curl};
  std::string upstream{};
  std::vector<std::string> extra_args{};
  std::vector<Binding> bindings{};
  std::shared_ptr<IProcessGroupController> controller{};
};

struct LocalBindOptions {
  // Value of BINDBENCH_BINDER, if set.
  std::optional<std::filesystem::path> binder_override{};
  // Directory of the running executable; searched first.
  std::optional<std::filesystem::path> executable_dir{};
};

struct IsolatedNetworkOptions {
  std::string image{};
  std::string runtime_binary{"docker"};
  // Where `pull` output goes; -1 discards it.
  int pull_output_fd{-1};
};

class IRunner {
 public:
  virtual ~IRunner() = default;

  virtual RunnerFormat format() const noexcept = 0;
  virtual TransferProgram program() const noexcept = 0;
  virtual const std::vector<Binding>& bindings() const noexcept = 0;

  // Starts one transfer for `binding_identifier` writing into `scratch_path`.
  virtual Expected<std::unique_ptr<IProcessHandle>> run(
      std::string_view binding_identifier,
      const std::filesystem::path& scratch_path,
      const LogSink& log) = 0;
};

Expected<std::unique_ptr<IRunner>> make_local_bind_runner(RunnerOptions opts,
                                                          LocalBindOptions local);
Expected<std::unique_ptr<IRunner>> make_isolated_network_runner(
    RunnerOptions opts, IsolatedNetworkOptions isolated);

// Picks the strategy once; the unused option block is ignored.
Expected<std::unique_ptr<IRunner>> make_runner(RunnerFormat format,
                                               RunnerOptions opts,
                                               LocalBindOptions local,
                                               IsolatedNetworkOptions isolated);

// Checks the override first, then the fixed install locations.
Expected<std::filesystem::path> locate_binder_library(const LocalBindOptions& local) noexcept;

bool is_valid_bind_address(std::string_view address);

}  // namespace bindbench
