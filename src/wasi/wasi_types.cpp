#include "wasi/wasi_types.hpp"

#include "io/fs_error.hpp"
#include "runtime/wasm_memory.hpp"

namespace wasmbridge::wasi {

  Errno toWasiErrno(const std::error_code &ec) {
    using io::FsError;
    if (!ec) {
      return Errno::SUCCESS;
    }
    if (ec == runtime::WasmMemory::Error::OUT_OF_BOUNDS) {
      return Errno::FAULT;
    }
    if (ec == FsError::PERMISSION_DENIED) {
      return Errno::PERM;
    }
    if (ec == FsError::BAD_DESCRIPTOR) {
      return Errno::BADF;
    }
    if (ec == FsError::INVALID_SEEK) {
      return Errno::SPIPE;
    }
    if (ec == FsError::UNSUPPORTED) {
      return Errno::NOTSUP;
    }
    return Errno::IO;
  }

}  // namespace wasmbridge::wasi
