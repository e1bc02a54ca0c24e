#ifndef WASMBRIDGE_SRC_EXECUTION_EXIT_OUTCOME_HPP
#define WASMBRIDGE_SRC_EXECUTION_EXIT_OUTCOME_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <boost/variant.hpp>

namespace wasmbridge::execution {

  /// exit code of a call that could not run the guest at all
  constexpr int32_t kFailureExitCode = -1;
  /// exit code of a guest that trapped without calling proc_exit
  constexpr int32_t kTrapExitCode = 1;

  /// the entry point returned
  struct NormalReturn {
    int32_t code;
  };

  /// the guest called proc_exit
  struct ExplicitExit {
    int32_t code;
  };

  /// the guest trapped
  struct Trap {
    std::string message;
    /// recent host calls, oldest first
    std::vector<std::string> frames;
  };

  using ExitOutcome = boost::variant<NormalReturn, ExplicitExit, Trap>;

  int32_t toExitCode(const ExitOutcome &outcome);

}  // namespace wasmbridge::execution

#endif  // WASMBRIDGE_SRC_EXECUTION_EXIT_OUTCOME_HPP
