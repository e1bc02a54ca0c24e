#ifndef WASMBRIDGE_SRC_RUNTIME_WASM_HEADER_HPP
#define WASMBRIDGE_SRC_RUNTIME_WASM_HEADER_HPP

#include <array>
#include <cstdint>

#include <gsl/span>

#include "outcome/outcome.hpp"

namespace wasmbridge::runtime {

  /// "\0asm"
  constexpr std::array<uint8_t, 4> kWasmMagic{0x00, 0x61, 0x73, 0x6D};
  /// binary format version 1, little endian
  constexpr std::array<uint8_t, 4> kWasmVersion{0x01, 0x00, 0x00, 0x00};
  constexpr size_t kWasmHeaderSize = kWasmMagic.size() + kWasmVersion.size();

  enum class WasmHeaderError {
    TOO_SMALL = 1,
    BAD_MAGIC,
    UNSUPPORTED_VERSION
  };

  /**
   * Checks the preamble of a guest binary. Nothing past the first eight bytes
   * is inspected, the interpreter validates the rest.
   */
  outcome::result<void> validateWasmHeader(gsl::span<const uint8_t> binary);

}  // namespace wasmbridge::runtime

OUTCOME_HPP_DECLARE_ERROR_2(wasmbridge::runtime, WasmHeaderError);

#endif  // WASMBRIDGE_SRC_RUNTIME_WASM_HEADER_HPP
