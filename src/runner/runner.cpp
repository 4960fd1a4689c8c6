#include "bindbench/runner/runner.hpp"

#include <utility>

namespace bindbench {

Expected<std::unique_ptr<IRunner>> make_runner(RunnerFormat format,
                                               RunnerOptions opts,
                                               LocalBindOptions local,
                                               IsolatedNetworkOptions isolated) {
  switch (format) {
    case RunnerFormat::LocalBind:
      return make_local_bind_runner(std::move(opts), std::move(local));
    case RunnerFormat::IsolatedNetwork:
      return make_isolated_network_runner(std::move(opts), std::move(isolated));
  }
  return fail(ErrorCode::Internal, "unknown runner format");
}

}  // namespace bindbench
