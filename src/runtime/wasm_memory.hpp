#ifndef WASMBRIDGE_SRC_RUNTIME_WASM_MEMORY_HPP
#define WASMBRIDGE_SRC_RUNTIME_WASM_MEMORY_HPP

#include <cstdint>
#include <vector>

#include <gsl/span>

#include "outcome/outcome.hpp"

namespace wasmbridge::runtime {

  /// guest address in a 32-bit linear memory
  using WasmPointer = uint32_t;
  using WasmSize = uint32_t;

  /**
   * @brief Host view of the guest's linear memory. All accesses are
   * little-endian and checked against the current memory size.
   */
  class WasmMemory {
   public:
    enum class Error { OUT_OF_BOUNDS = 1 };

    virtual ~WasmMemory() = default;

    /// current size in bytes
    virtual uint64_t size() const = 0;

    /// OUT_OF_BOUNDS unless [addr, addr + length) lies inside the memory
    outcome::result<void> checkRange(WasmPointer addr, uint64_t length) const;

    outcome::result<uint32_t> load32(WasmPointer addr) const;
    outcome::result<std::vector<uint8_t>> loadBytes(WasmPointer addr,
                                                    WasmSize length) const;

    outcome::result<void> store8(WasmPointer addr, uint8_t value);
    outcome::result<void> store16(WasmPointer addr, uint16_t value);
    outcome::result<void> store32(WasmPointer addr, uint32_t value);
    outcome::result<void> store64(WasmPointer addr, uint64_t value);
    outcome::result<void> storeBytes(WasmPointer addr,
                                     gsl::span<const uint8_t> bytes);

   protected:
    virtual uint8_t loadByte(uint64_t addr) const = 0;
    virtual void storeByte(uint64_t addr, uint8_t value) = 0;

   private:
    outcome::result<void> storeLittleEndian(WasmPointer addr,
                                            uint64_t value,
                                            size_t width);
  };

}  // namespace wasmbridge::runtime

OUTCOME_HPP_DECLARE_ERROR_2(wasmbridge::runtime, WasmMemory::Error);

#endif  // WASMBRIDGE_SRC_RUNTIME_WASM_MEMORY_HPP
