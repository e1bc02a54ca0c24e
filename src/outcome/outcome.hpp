
#ifndef WASMBRIDGE_OUTCOME_HPP
#define WASMBRIDGE_OUTCOME_HPP

#include <libp2p/outcome/outcome.hpp>

namespace outcome {
  using libp2p::outcome::failure;
  using libp2p::outcome::result;
  using libp2p::outcome::success;
}  // namespace outcome

#endif  // WASMBRIDGE_OUTCOME_HPP
