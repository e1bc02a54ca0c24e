#ifndef WASMBRIDGE_SRC_WASI_WASI_HOST_HPP
#define WASMBRIDGE_SRC_WASI_WASI_HOST_HPP

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <boost/circular_buffer.hpp>

#include "base/logger.hpp"
#include "wasi/wasi_env.hpp"

namespace wasmbridge::wasi {

  /**
   * @brief wasi_snapshot_preview1 calls over a WasiEnv.
   *
   * Only the standard streams and the argument and environment
   * pass-through are emulated. Every other preview1 function answers
   * Errno::NOSYS. Guest pointers are checked against the attached memory,
   * an access outside of it answers Errno::FAULT.
   */
  class WasiHost {
   public:
    static constexpr std::string_view kModuleName = "wasi_snapshot_preview1";
    static constexpr std::string_view kLegacyModuleName = "wasi_unstable";

    /// largest host buffer used by one read from a stream
    static constexpr size_t kReadChunkSize = 64 * 1024;

    /**
     * @param trail_depth number of recent calls kept by callTrail()
     */
    WasiHost(std::shared_ptr<WasiEnv> env, size_t trail_depth);

    /// true for the import module names served by this host
    static bool isWasiModule(std::string_view module_name);

    const std::shared_ptr<WasiEnv> &env() const {
      return env_;
    }

    Errno argsSizesGet(runtime::WasmPointer argc_ptr,
                       runtime::WasmPointer buf_size_ptr);
    Errno argsGet(runtime::WasmPointer argv_ptr, runtime::WasmPointer buf_ptr);

    Errno environSizesGet(runtime::WasmPointer count_ptr,
                          runtime::WasmPointer buf_size_ptr);
    Errno environGet(runtime::WasmPointer environ_ptr,
                     runtime::WasmPointer buf_ptr);

    Errno fdWrite(uint32_t fd,
                  runtime::WasmPointer iovs,
                  runtime::WasmSize iovs_len,
                  runtime::WasmPointer nwritten_ptr);
    Errno fdRead(uint32_t fd,
                 runtime::WasmPointer iovs,
                 runtime::WasmSize iovs_len,
                 runtime::WasmPointer nread_ptr);

    /**
     * @param whence 0 = SET, 1 = CUR, 2 = END, anything else is INVAL
     */
    Errno fdSeek(uint32_t fd,
                 int64_t offset,
                 uint32_t whence,
                 runtime::WasmPointer newoffset_ptr);
    Errno fdTell(uint32_t fd, runtime::WasmPointer offset_ptr);

    Errno fdClose(uint32_t fd);
    Errno fdSync(uint32_t fd);

    Errno fdFdstatGet(uint32_t fd, runtime::WasmPointer stat_ptr);
    Errno fdFilestatGet(uint32_t fd, runtime::WasmPointer stat_ptr);
    Errno fdFilestatSetSize(uint32_t fd, uint64_t size);

    /// there are no pre-opened directories
    Errno fdPrestatGet(uint32_t fd, runtime::WasmPointer prestat_ptr);
    Errno fdPrestatDirName(uint32_t fd,
                           runtime::WasmPointer path_ptr,
                           runtime::WasmSize path_len);

    Errno schedYield();

    /**
     * Records \arg code in the session's exit-code cell. Unwinding the guest
     * is up to the caller.
     */
    void procExit(int32_t code);

    /// answer of every preview1 function not listed above
    Errno unsupported(std::string_view name);

    /// recent calls, oldest first
    std::vector<std::string> callTrail() const;

   private:
    void record(std::string call);

    Errno toErrno(const outcome::result<void> &res) const;

    /**
     * Stores the number of bytes moved by fd_read or fd_write. A failure
     * after some bytes were moved still reports them.
     */
    Errno finishTransfer(runtime::WasmMemory &memory,
                         const outcome::result<void> &res,
                         uint64_t total,
                         runtime::WasmPointer count_ptr);

    /// the attached memory, or a FAULT-mapped error
    outcome::result<std::shared_ptr<runtime::WasmMemory>> memory() const;

    outcome::result<void> writeStrings(const std::vector<std::string> &strings,
                                       runtime::WasmPointer pointers,
                                       runtime::WasmPointer buffer);
    outcome::result<void> writeSizes(const std::vector<std::string> &strings,
                                     runtime::WasmPointer count_ptr,
                                     runtime::WasmPointer buf_size_ptr);

    std::vector<std::string> environmentStrings() const;

    std::shared_ptr<WasiEnv> env_;
    boost::circular_buffer<std::string> trail_;
    base::Logger logger_ = base::createLogger("WasiHost");
  };

}  // namespace wasmbridge::wasi

#endif  // WASMBRIDGE_SRC_WASI_WASI_HOST_HPP
