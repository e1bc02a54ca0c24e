#ifndef WASMBRIDGE_SRC_IO_HOST_STDIO_FILE_HPP
#define WASMBRIDGE_SRC_IO_HOST_STDIO_FILE_HPP

#include <memory>

#include <boost/asio/io_context.hpp>

#include "io/virtual_file.hpp"

namespace wasmbridge::io {

  /**
   * @brief Default guest stream: the host process's own fd 0, 1 or 2.
   *
   * The descriptor is borrowed. close() only detaches this file from it.
   */
  class HostStdioFile final
      : public VirtualFile,
        public std::enable_shared_from_this<HostStdioFile> {
   public:
    HostStdioFile(boost::asio::io_context &io_context, int host_fd);

    ~HostStdioFile() override = default;

    uint64_t lastAccessed() const override;
    uint64_t lastModified() const override;
    uint64_t createdTime() const override;
    uint64_t size() const override;

    outcome::result<void> setLength(uint64_t new_size) override;
    outcome::result<void> unlink() override;

    outcome::result<size_t> pollReadReady() override;
    outcome::result<size_t> pollWriteReady() override;

    outcome::result<size_t> read(gsl::span<uint8_t> buffer) override;
    outcome::result<size_t> write(gsl::span<const uint8_t> buffer) override;
    outcome::result<uint64_t> seek(int64_t offset, SeekWhence whence) override;
    outcome::result<void> flush() override;

    void asyncRead(gsl::span<uint8_t> buffer, IoHandler handler) override;
    void asyncWrite(gsl::span<const uint8_t> buffer,
                    IoHandler handler) override;

    outcome::result<void> close() override;

   private:
    boost::asio::io_context &io_context_;
    int host_fd_;
  };

}  // namespace wasmbridge::io

#endif  // WASMBRIDGE_SRC_IO_HOST_STDIO_FILE_HPP
