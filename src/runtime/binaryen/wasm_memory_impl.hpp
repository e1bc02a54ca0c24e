#ifndef WASMBRIDGE_SRC_RUNTIME_BINARYEN_WASM_MEMORY_IMPL_HPP
#define WASMBRIDGE_SRC_RUNTIME_BINARYEN_WASM_MEMORY_IMPL_HPP

#include <binaryen/shell-interface.h>

#include "runtime/wasm_memory.hpp"

namespace wasmbridge::runtime::binaryen {

  /**
   * Memory of a binaryen module instance. The size is kept in sync by the
   * external interface that owns \arg memory.
   */
  class WasmMemoryImpl final : public WasmMemory {
   public:
    explicit WasmMemoryImpl(wasm::ShellExternalInterface::Memory *memory);

    WasmMemoryImpl(const WasmMemoryImpl &) = delete;
    WasmMemoryImpl &operator=(const WasmMemoryImpl &) = delete;

    ~WasmMemoryImpl() override = default;

    uint64_t size() const override {
      return size_;
    }

    void setSize(uint64_t size) {
      size_ = size;
    }

   protected:
    uint8_t loadByte(uint64_t addr) const override;
    void storeByte(uint64_t addr, uint8_t value) override;

   private:
    wasm::ShellExternalInterface::Memory *memory_;
    uint64_t size_ = 0;
  };

}  // namespace wasmbridge::runtime::binaryen

#endif  // WASMBRIDGE_SRC_RUNTIME_BINARYEN_WASM_MEMORY_IMPL_HPP
