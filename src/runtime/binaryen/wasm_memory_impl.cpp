#include "runtime/binaryen/wasm_memory_impl.hpp"

#include <boost/assert.hpp>

namespace wasmbridge::runtime::binaryen {

  WasmMemoryImpl::WasmMemoryImpl(wasm::ShellExternalInterface::Memory *memory)
      : memory_{memory} {
    BOOST_ASSERT(memory_ != nullptr);
  }

  uint8_t WasmMemoryImpl::loadByte(uint64_t addr) const {
    return memory_->get<uint8_t>(addr);
  }

  void WasmMemoryImpl::storeByte(uint64_t addr, uint8_t value) {
    memory_->set<uint8_t>(addr, value);
  }

}  // namespace wasmbridge::runtime::binaryen
