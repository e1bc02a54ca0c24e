#include "execution/exit_outcome.hpp"

#include "base/visitor.hpp"

namespace wasmbridge::execution {

  int32_t toExitCode(const ExitOutcome &outcome) {
    return visit_in_place(
        outcome,
        [](const NormalReturn &r) { return r.code; },
        [](const ExplicitExit &e) { return e.code; },
        [](const Trap &) { return kTrapExitCode; });
  }

}  // namespace wasmbridge::execution
