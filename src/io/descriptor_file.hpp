#ifndef WASMBRIDGE_SRC_IO_DESCRIPTOR_FILE_HPP
#define WASMBRIDGE_SRC_IO_DESCRIPTOR_FILE_HPP

#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include "base/logger.hpp"
#include "io/virtual_file.hpp"

namespace wasmbridge::io {

  /**
   * @brief Owned duplicate of a host file descriptor.
   *
   * The host keeps its descriptor, only the duplicate is closed by close() or
   * by the destructor. Readiness is always reported, which is correct for the
   * blocking pipes, terminals and files this is meant for and not for
   * non-blocking sockets.
   */
  class DescriptorFile final
      : public VirtualFile,
        public std::enable_shared_from_this<DescriptorFile> {
   public:
    /**
     * Duplicates \arg host_fd and attaches the duplicate to \arg io_context
     * @return the file, or the OS error of the duplication
     */
    static outcome::result<std::shared_ptr<DescriptorFile>> create(
        boost::asio::io_context &io_context, int host_fd);

    DescriptorFile(const DescriptorFile &) = delete;
    DescriptorFile &operator=(const DescriptorFile &) = delete;

    ~DescriptorFile() override = default;

    /// descriptor number of the duplicate, -1 once closed
    int nativeHandle() const;

    bool isOpen() const;

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
    explicit DescriptorFile(boost::asio::io_context &io_context);

    boost::asio::posix::stream_descriptor descriptor_;
    /// the duplicate, -1 once closed
    int native_fd_ = -1;
    base::Logger logger_ = base::createLogger("DescriptorFile");
  };

}  // namespace wasmbridge::io

#endif  // WASMBRIDGE_SRC_IO_DESCRIPTOR_FILE_HPP
