#ifndef WASMBRIDGE_SRC_IO_VIRTUAL_FILE_HPP
#define WASMBRIDGE_SRC_IO_VIRTUAL_FILE_HPP

#include <cstdint>
#include <functional>

#include <gsl/span>

#include "io/fs_error.hpp"

namespace wasmbridge::io {

  enum class SeekWhence { SET = 0, CURRENT = 1, END = 2 };

  /**
   * @brief A stream the guest sees behind one of its file descriptors
   */
  class VirtualFile {
   public:
    /// Completion of an asynchronous transfer: bytes moved or the failure
    using IoHandler = std::function<void(outcome::result<size_t>)>;

    virtual ~VirtualFile() = default;

    /// timestamps in nanoseconds since the epoch, 0 when unknown
    virtual uint64_t lastAccessed() const = 0;
    virtual uint64_t lastModified() const = 0;
    virtual uint64_t createdTime() const = 0;

    /// size in bytes, 0 when unknown
    virtual uint64_t size() const = 0;

    virtual outcome::result<void> setLength(uint64_t new_size) = 0;

    virtual outcome::result<void> unlink() = 0;

    /**
     * @return number of bytes that can be read without waiting
     */
    virtual outcome::result<size_t> pollReadReady() = 0;

    /**
     * @return number of bytes that can be written without waiting
     */
    virtual outcome::result<size_t> pollWriteReady() = 0;

    /**
     * Reads at most buffer.size() bytes
     * @return bytes read, 0 at end of stream
     */
    virtual outcome::result<size_t> read(gsl::span<uint8_t> buffer) = 0;

    /**
     * Writes at most buffer.size() bytes
     * @return bytes written
     */
    virtual outcome::result<size_t> write(gsl::span<const uint8_t> buffer) = 0;

    /**
     * @return the resulting offset from the start of the stream
     */
    virtual outcome::result<uint64_t> seek(int64_t offset,
                                           SeekWhence whence) = 0;

    virtual outcome::result<void> flush() = 0;

    /**
     * Schedules a read on the owning io_context. \arg buffer must stay valid
     * until \arg handler runs.
     */
    virtual void asyncRead(gsl::span<uint8_t> buffer, IoHandler handler) = 0;

    /**
     * Schedules a write on the owning io_context. \arg buffer must stay valid
     * until \arg handler runs.
     */
    virtual void asyncWrite(gsl::span<const uint8_t> buffer,
                            IoHandler handler) = 0;

    /**
     * Releases the underlying resource. Further calls are no-ops.
     */
    virtual outcome::result<void> close() = 0;
  };

}  // namespace wasmbridge::io

#endif  // WASMBRIDGE_SRC_IO_VIRTUAL_FILE_HPP
