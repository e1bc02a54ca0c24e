#include "wasi/wasi_host.hpp"

#include <algorithm>
#include <limits>

#include <boost/assert.hpp>

namespace wasmbridge::wasi {

  using runtime::WasmMemory;
  using runtime::WasmPointer;
  using runtime::WasmSize;

  namespace {
    /// guest address of element \arg index of an array at \arg base
    outcome::result<WasmPointer> elementAddress(WasmPointer base,
                                                uint64_t index,
                                                uint64_t element_size) {
      uint64_t addr = base + index * element_size;
      if (addr > std::numeric_limits<WasmPointer>::max()) {
        return WasmMemory::Error::OUT_OF_BOUNDS;
      }
      return static_cast<WasmPointer>(addr);
    }

    struct Iovec {
      WasmPointer buf;
      WasmSize len;
    };

    outcome::result<Iovec> loadIovec(const WasmMemory &memory,
                                     WasmPointer iovs,
                                     uint32_t index) {
      OUTCOME_TRY(addr, elementAddress(iovs, index, kIovecSize));
      OUTCOME_TRY(buf, memory.load32(addr));
      OUTCOME_TRY(len, memory.load32(addr + 4));
      return Iovec{buf, len};
    }
  }  // namespace

  WasiHost::WasiHost(std::shared_ptr<WasiEnv> env, size_t trail_depth)
      : env_{std::move(env)}, trail_{trail_depth} {
    BOOST_ASSERT(env_);
  }

  bool WasiHost::isWasiModule(std::string_view module_name) {
    return module_name == kModuleName || module_name == kLegacyModuleName;
  }

  void WasiHost::record(std::string call) {
    logger_->trace("{}", call);
    trail_.push_back(std::move(call));
  }

  std::vector<std::string> WasiHost::callTrail() const {
    return {trail_.begin(), trail_.end()};
  }

  Errno WasiHost::toErrno(const outcome::result<void> &res) const {
    if (res) {
      return Errno::SUCCESS;
    }
    auto errno_value = toWasiErrno(res.error());
    logger_->debug("Host call failed: {}", res.error().message());
    return errno_value;
  }

  outcome::result<std::shared_ptr<WasmMemory>> WasiHost::memory() const {
    const auto &memory = env_->memory();
    if (!memory) {
      return WasmMemory::Error::OUT_OF_BOUNDS;
    }
    return memory;
  }

  std::vector<std::string> WasiHost::environmentStrings() const {
    std::vector<std::string> strings;
    strings.reserve(env_->environment().size());
    for (const auto &[name, value] : env_->environment()) {
      strings.push_back(name + "=" + value);
    }
    return strings;
  }

  outcome::result<void> WasiHost::writeSizes(
      const std::vector<std::string> &strings,
      WasmPointer count_ptr,
      WasmPointer buf_size_ptr) {
    OUTCOME_TRY(mem, memory());
    uint64_t buf_size = 0;
    for (const auto &s : strings) {
      buf_size += s.size() + 1;
    }
    OUTCOME_TRY(mem->store32(count_ptr, static_cast<uint32_t>(strings.size())));
    OUTCOME_TRY(mem->store32(buf_size_ptr, static_cast<uint32_t>(buf_size)));
    return outcome::success();
  }

  outcome::result<void> WasiHost::writeStrings(
      const std::vector<std::string> &strings,
      WasmPointer pointers,
      WasmPointer buffer) {
    OUTCOME_TRY(mem, memory());
    uint64_t offset = buffer;
    for (size_t i = 0; i < strings.size(); ++i) {
      if (offset > std::numeric_limits<WasmPointer>::max()) {
        return WasmMemory::Error::OUT_OF_BOUNDS;
      }
      auto str_ptr = static_cast<WasmPointer>(offset);
      OUTCOME_TRY(slot, elementAddress(pointers, i, sizeof(WasmPointer)));
      OUTCOME_TRY(mem->store32(slot, str_ptr));
      const auto &s = strings[i];
      std::vector<uint8_t> bytes(s.begin(), s.end());
      bytes.push_back(0);
      OUTCOME_TRY(mem->storeBytes(str_ptr, bytes));
      offset += bytes.size();
    }
    return outcome::success();
  }

  Errno WasiHost::argsSizesGet(WasmPointer argc_ptr, WasmPointer buf_size_ptr) {
    record(fmt::format("args_sizes_get({:#x}, {:#x})", argc_ptr, buf_size_ptr));
    return toErrno(writeSizes(env_->args(), argc_ptr, buf_size_ptr));
  }

  Errno WasiHost::argsGet(WasmPointer argv_ptr, WasmPointer buf_ptr) {
    record(fmt::format("args_get({:#x}, {:#x})", argv_ptr, buf_ptr));
    return toErrno(writeStrings(env_->args(), argv_ptr, buf_ptr));
  }

  Errno WasiHost::environSizesGet(WasmPointer count_ptr,
                                  WasmPointer buf_size_ptr) {
    record(fmt::format(
        "environ_sizes_get({:#x}, {:#x})", count_ptr, buf_size_ptr));
    return toErrno(writeSizes(environmentStrings(), count_ptr, buf_size_ptr));
  }

  Errno WasiHost::environGet(WasmPointer environ_ptr, WasmPointer buf_ptr) {
    record(fmt::format("environ_get({:#x}, {:#x})", environ_ptr, buf_ptr));
    return toErrno(writeStrings(environmentStrings(), environ_ptr, buf_ptr));
  }

  Errno WasiHost::fdWrite(uint32_t fd,
                          WasmPointer iovs,
                          WasmSize iovs_len,
                          WasmPointer nwritten_ptr) {
    record(fmt::format("fd_write({}, {:#x}, {})", fd, iovs, iovs_len));
    auto file = env_->file(fd);
    if (!file) {
      return Errno::BADF;
    }
    auto mem = memory();
    if (!mem) {
      return toErrno(mem.error());
    }
    uint64_t total = 0;
    auto res = [&]() -> outcome::result<void> {
      for (uint32_t i = 0; i < iovs_len; ++i) {
        OUTCOME_TRY(iov, loadIovec(*mem.value(), iovs, i));
        OUTCOME_TRY(bytes, mem.value()->loadBytes(iov.buf, iov.len));
        OUTCOME_TRY(written, file->write(bytes));
        total += written;
        if (written < iov.len) {
          break;
        }
      }
      return outcome::success();
    }();
    return finishTransfer(*mem.value(), res, total, nwritten_ptr);
  }

  Errno WasiHost::fdRead(uint32_t fd,
                         WasmPointer iovs,
                         WasmSize iovs_len,
                         WasmPointer nread_ptr) {
    record(fmt::format("fd_read({}, {:#x}, {})", fd, iovs, iovs_len));
    auto file = env_->file(fd);
    if (!file) {
      return Errno::BADF;
    }
    auto mem = memory();
    if (!mem) {
      return toErrno(mem.error());
    }
    uint64_t total = 0;
    auto res = [&]() -> outcome::result<void> {
      std::vector<uint8_t> buffer;
      for (uint32_t i = 0; i < iovs_len; ++i) {
        OUTCOME_TRY(iov, loadIovec(*mem.value(), iovs, i));
        // nothing is taken from the stream for a destination outside memory
        OUTCOME_TRY(mem.value()->checkRange(iov.buf, iov.len));
        uint64_t filled = 0;
        bool short_read = false;
        while (filled < iov.len) {
          buffer.resize(
              std::min<uint64_t>(iov.len - filled, kReadChunkSize));
          OUTCOME_TRY(count, file->read(buffer));
          OUTCOME_TRY(mem.value()->storeBytes(
              static_cast<WasmPointer>(iov.buf + filled),
              gsl::span<const uint8_t>(buffer.data(), count)));
          filled += count;
          total += count;
          if (count < buffer.size()) {
            short_read = true;
            break;
          }
        }
        if (short_read) {
          break;
        }
      }
      return outcome::success();
    }();
    return finishTransfer(*mem.value(), res, total, nread_ptr);
  }

  Errno WasiHost::finishTransfer(WasmMemory &memory,
                                 const outcome::result<void> &res,
                                 uint64_t total,
                                 WasmPointer count_ptr) {
    // bytes already moved are reported even if a later iovec failed
    if (!res && total == 0) {
      return toErrno(res);
    }
    if (!res) {
      logger_->debug("Transfer stopped after {} bytes: {}",
                     total,
                     res.error().message());
    }
    return toErrno(memory.store32(count_ptr, static_cast<uint32_t>(total)));
  }

  Errno WasiHost::fdSeek(uint32_t fd,
                         int64_t offset,
                         uint32_t whence,
                         WasmPointer newoffset_ptr) {
    record(fmt::format("fd_seek({}, {}, {})", fd, offset, whence));
    auto file = env_->file(fd);
    if (!file) {
      return Errno::BADF;
    }
    if (whence > static_cast<uint32_t>(io::SeekWhence::END)) {
      return Errno::INVAL;
    }
    auto res = [&]() -> outcome::result<void> {
      OUTCOME_TRY(mem, memory());
      OUTCOME_TRY(position,
                  file->seek(offset, static_cast<io::SeekWhence>(whence)));
      return mem->store64(newoffset_ptr, position);
    }();
    return toErrno(res);
  }

  Errno WasiHost::fdTell(uint32_t fd, WasmPointer offset_ptr) {
    record(fmt::format("fd_tell({})", fd));
    auto file = env_->file(fd);
    if (!file) {
      return Errno::BADF;
    }
    auto res = [&]() -> outcome::result<void> {
      OUTCOME_TRY(mem, memory());
      OUTCOME_TRY(position, file->seek(0, io::SeekWhence::CURRENT));
      return mem->store64(offset_ptr, position);
    }();
    return toErrno(res);
  }

  Errno WasiHost::fdClose(uint32_t fd) {
    record(fmt::format("fd_close({})", fd));
    return toErrno(env_->closeFile(fd));
  }

  Errno WasiHost::fdSync(uint32_t fd) {
    record(fmt::format("fd_sync({})", fd));
    auto file = env_->file(fd);
    if (!file) {
      return Errno::BADF;
    }
    return toErrno(file->flush());
  }

  Errno WasiHost::fdFdstatGet(uint32_t fd, WasmPointer stat_ptr) {
    record(fmt::format("fd_fdstat_get({}, {:#x})", fd, stat_ptr));
    auto file = env_->file(fd);
    if (!file) {
      return Errno::BADF;
    }
    auto res = [&]() -> outcome::result<void> {
      OUTCOME_TRY(mem, memory());
      std::vector<uint8_t> zeros(kFdstatSize, 0);
      OUTCOME_TRY(mem->storeBytes(stat_ptr, zeros));
      OUTCOME_TRY(mem->store8(
          stat_ptr, static_cast<uint8_t>(FileType::CHARACTER_DEVICE)));
      OUTCOME_TRY(mem->store16(stat_ptr + 2, 0));
      OUTCOME_TRY(mem->store64(stat_ptr + 8, rights::kStdio));
      return mem->store64(stat_ptr + 16, 0);
    }();
    return toErrno(res);
  }

  Errno WasiHost::fdFilestatGet(uint32_t fd, WasmPointer stat_ptr) {
    record(fmt::format("fd_filestat_get({}, {:#x})", fd, stat_ptr));
    auto file = env_->file(fd);
    if (!file) {
      return Errno::BADF;
    }
    auto res = [&]() -> outcome::result<void> {
      OUTCOME_TRY(mem, memory());
      std::vector<uint8_t> zeros(kFilestatSize, 0);
      OUTCOME_TRY(mem->storeBytes(stat_ptr, zeros));
      OUTCOME_TRY(mem->store8(
          stat_ptr + 16, static_cast<uint8_t>(FileType::CHARACTER_DEVICE)));
      OUTCOME_TRY(mem->store64(stat_ptr + 24, 1));
      OUTCOME_TRY(mem->store64(stat_ptr + 32, file->size()));
      OUTCOME_TRY(mem->store64(stat_ptr + 40, file->lastAccessed()));
      OUTCOME_TRY(mem->store64(stat_ptr + 48, file->lastModified()));
      return mem->store64(stat_ptr + 56, file->createdTime());
    }();
    return toErrno(res);
  }

  Errno WasiHost::fdFilestatSetSize(uint32_t fd, uint64_t size) {
    record(fmt::format("fd_filestat_set_size({}, {})", fd, size));
    auto file = env_->file(fd);
    if (!file) {
      return Errno::BADF;
    }
    return toErrno(file->setLength(size));
  }

  Errno WasiHost::fdPrestatGet(uint32_t fd, WasmPointer prestat_ptr) {
    record(fmt::format("fd_prestat_get({}, {:#x})", fd, prestat_ptr));
    return Errno::BADF;
  }

  Errno WasiHost::fdPrestatDirName(uint32_t fd,
                                   WasmPointer path_ptr,
                                   WasmSize path_len) {
    record(fmt::format(
        "fd_prestat_dir_name({}, {:#x}, {})", fd, path_ptr, path_len));
    return Errno::BADF;
  }

  Errno WasiHost::schedYield() {
    record("sched_yield()");
    return Errno::SUCCESS;
  }

  void WasiHost::procExit(int32_t code) {
    record(fmt::format("proc_exit({})", code));
    env_->setExitCode(code);
  }

  Errno WasiHost::unsupported(std::string_view name) {
    record(fmt::format("{}() unsupported", name));
    return Errno::NOSYS;
  }

}  // namespace wasmbridge::wasi
