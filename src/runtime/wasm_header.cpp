#include "runtime/wasm_header.hpp"

#include <algorithm>

OUTCOME_CPP_DEFINE_CATEGORY_3(wasmbridge::runtime, WasmHeaderError, e) {
  using E = wasmbridge::runtime::WasmHeaderError;
  switch (e) {
    case E::TOO_SMALL:
      return "Invalid WASM binary: too small";
    case E::BAD_MAGIC:
      return "Invalid WASM binary: missing magic number";
    case E::UNSUPPORTED_VERSION:
      return "Invalid WASM binary: unsupported version";
  }
  return "unknown error";
}

namespace wasmbridge::runtime {

  outcome::result<void> validateWasmHeader(gsl::span<const uint8_t> binary) {
    if (static_cast<size_t>(binary.size()) < kWasmHeaderSize) {
      return WasmHeaderError::TOO_SMALL;
    }
    if (!std::equal(kWasmMagic.begin(), kWasmMagic.end(), binary.begin())) {
      return WasmHeaderError::BAD_MAGIC;
    }
    if (!std::equal(kWasmVersion.begin(),
                    kWasmVersion.end(),
                    binary.begin() + kWasmMagic.size())) {
      return WasmHeaderError::UNSUPPORTED_VERSION;
    }
    return outcome::success();
  }

}  // namespace wasmbridge::runtime
