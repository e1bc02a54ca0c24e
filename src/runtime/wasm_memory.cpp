#include "runtime/wasm_memory.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(wasmbridge::runtime, WasmMemory::Error, e) {
  using E = wasmbridge::runtime::WasmMemory::Error;
  switch (e) {
    case E::OUT_OF_BOUNDS:
      return "access outside of the guest memory";
  }
  return "unknown error";
}

namespace wasmbridge::runtime {

  outcome::result<void> WasmMemory::checkRange(WasmPointer addr,
                                               uint64_t length) const {
    if (static_cast<uint64_t>(addr) + length > size()) {
      return Error::OUT_OF_BOUNDS;
    }
    return outcome::success();
  }

  outcome::result<uint32_t> WasmMemory::load32(WasmPointer addr) const {
    OUTCOME_TRY(checkRange(addr, sizeof(uint32_t)));
    uint32_t value = 0;
    for (size_t i = 0; i < sizeof(uint32_t); ++i) {
      value |= static_cast<uint32_t>(loadByte(addr + i)) << (8 * i);
    }
    return value;
  }

  outcome::result<std::vector<uint8_t>> WasmMemory::loadBytes(
      WasmPointer addr, WasmSize length) const {
    OUTCOME_TRY(checkRange(addr, length));
    std::vector<uint8_t> bytes(length);
    for (WasmSize i = 0; i < length; ++i) {
      bytes[i] = loadByte(static_cast<uint64_t>(addr) + i);
    }
    return bytes;
  }

  outcome::result<void> WasmMemory::storeLittleEndian(WasmPointer addr,
                                                      uint64_t value,
                                                      size_t width) {
    OUTCOME_TRY(checkRange(addr, width));
    for (size_t i = 0; i < width; ++i) {
      storeByte(static_cast<uint64_t>(addr) + i,
                static_cast<uint8_t>(value >> (8 * i)));
    }
    return outcome::success();
  }

  outcome::result<void> WasmMemory::store8(WasmPointer addr, uint8_t value) {
    return storeLittleEndian(addr, value, sizeof(value));
  }

  outcome::result<void> WasmMemory::store16(WasmPointer addr, uint16_t value) {
    return storeLittleEndian(addr, value, sizeof(value));
  }

  outcome::result<void> WasmMemory::store32(WasmPointer addr, uint32_t value) {
    return storeLittleEndian(addr, value, sizeof(value));
  }

  outcome::result<void> WasmMemory::store64(WasmPointer addr, uint64_t value) {
    return storeLittleEndian(addr, value, sizeof(value));
  }

  outcome::result<void> WasmMemory::storeBytes(
      WasmPointer addr, gsl::span<const uint8_t> bytes) {
    OUTCOME_TRY(checkRange(addr, bytes.size()));
    uint64_t offset = addr;
    for (auto byte : bytes) {
      storeByte(offset++, byte);
    }
    return outcome::success();
  }

}  // namespace wasmbridge::runtime
