#ifndef WASMBRIDGE_SRC_WASI_WASI_ENV_HPP
#define WASMBRIDGE_SRC_WASI_WASI_ENV_HPP

#include <array>
#include <memory>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "base/logger.hpp"
#include "io/virtual_file.hpp"
#include "runtime/execution_runtime.hpp"
#include "runtime/wasm_memory.hpp"
#include "wasi/wasi_types.hpp"

namespace wasmbridge::runtime::binaryen {
  class WasmModule;
}

namespace wasmbridge::wasi {

  /**
   * @brief Execution session of one guest run: arguments, environment, the
   * three standard streams, the compiled module and the exit-code cell.
   *
   * Created by WasiEnvBuilder, consumed once by the execution driver.
   * release() closes every stream binding exactly once, the destructor calls
   * it for the paths that never reach finalization.
   */
  class WasiEnv {
   public:
    using Files = std::array<std::shared_ptr<io::VirtualFile>, kStdioStreamCount>;
    using BoundFlags = std::array<bool, kStdioStreamCount>;

    WasiEnv(std::vector<std::string> args,
            Environment environment,
            Files files,
            BoundFlags bound,
            std::shared_ptr<runtime::ExecutionRuntime> runtime,
            std::shared_ptr<runtime::binaryen::WasmModule> module);

    WasiEnv(const WasiEnv &) = delete;
    WasiEnv &operator=(const WasiEnv &) = delete;

    ~WasiEnv();

    /// guest argv, argv[0] included
    const std::vector<std::string> &args() const {
      return args_;
    }

    const Environment &environment() const {
      return environment_;
    }

    /**
     * @return the open file behind guest descriptor \arg fd, nullptr if the
     * descriptor is unknown or closed
     */
    std::shared_ptr<io::VirtualFile> file(uint32_t fd) const;

    /// true if the stream is a duplicate of a host descriptor passed in
    bool isBound(StdioStream stream) const;

    /**
     * Closes guest descriptor \arg fd, later lookups yield nullptr
     */
    outcome::result<void> closeFile(uint32_t fd);

    const std::shared_ptr<runtime::ExecutionRuntime> &runtime() const {
      return runtime_;
    }

    const std::shared_ptr<runtime::binaryen::WasmModule> &module() const {
      return module_;
    }

    /// binds the linear memory of the instantiated module
    void attachMemory(std::shared_ptr<runtime::WasmMemory> memory);

    /// nullptr until attachMemory()
    const std::shared_ptr<runtime::WasmMemory> &memory() const {
      return memory_;
    }

    /**
     * Records the status passed to proc_exit. The first recorded code wins.
     */
    void setExitCode(int32_t code);

    const boost::optional<int32_t> &exitCode() const {
      return exit_code_;
    }

    /**
     * Closes all stream bindings. Failures are logged, never reported.
     * Idempotent.
     */
    void release();

    bool isReleased() const {
      return released_;
    }

   private:
    std::vector<std::string> args_;
    Environment environment_;
    Files files_;
    BoundFlags bound_;
    std::shared_ptr<runtime::ExecutionRuntime> runtime_;
    std::shared_ptr<runtime::binaryen::WasmModule> module_;
    std::shared_ptr<runtime::WasmMemory> memory_;
    boost::optional<int32_t> exit_code_;
    bool released_ = false;
    base::Logger logger_ = base::createLogger("WasiEnv");
  };

}  // namespace wasmbridge::wasi

#endif  // WASMBRIDGE_SRC_WASI_WASI_ENV_HPP
