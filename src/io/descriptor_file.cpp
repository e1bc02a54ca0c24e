#include "io/descriptor_file.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

namespace wasmbridge::io {

  DescriptorFile::DescriptorFile(boost::asio::io_context &io_context)
      : descriptor_{io_context} {}

  outcome::result<std::shared_ptr<DescriptorFile>> DescriptorFile::create(
      boost::asio::io_context &io_context, int host_fd) {
    int dup_fd = ::fcntl(host_fd, F_DUPFD_CLOEXEC, 0);
    if (dup_fd < 0) {
      return std::error_code(errno, std::system_category());
    }

    std::shared_ptr<DescriptorFile> file(new DescriptorFile(io_context));
    boost::system::error_code ec;
    file->descriptor_.assign(dup_fd, ec);
    if (ec) {
      ::close(dup_fd);
      return std::error_code(ec.value(), std::system_category());
    }
    file->native_fd_ = dup_fd;
    file->logger_->trace("fd {} duplicated as {}", host_fd, dup_fd);
    return file;
  }

  int DescriptorFile::nativeHandle() const {
    return native_fd_;
  }

  bool DescriptorFile::isOpen() const {
    return descriptor_.is_open();
  }

  // arbitrary descriptors do not reliably answer stat-like queries
  uint64_t DescriptorFile::lastAccessed() const {
    return 0;
  }

  uint64_t DescriptorFile::lastModified() const {
    return 0;
  }

  uint64_t DescriptorFile::createdTime() const {
    return 0;
  }

  uint64_t DescriptorFile::size() const {
    return 0;
  }

  outcome::result<void> DescriptorFile::setLength(uint64_t /*new_size*/) {
    return FsError::PERMISSION_DENIED;
  }

  outcome::result<void> DescriptorFile::unlink() {
    // a descriptor has no path to remove
    return outcome::success();
  }

  outcome::result<size_t> DescriptorFile::pollReadReady() {
    return 1;
  }

  outcome::result<size_t> DescriptorFile::pollWriteReady() {
    return 1;
  }

  outcome::result<size_t> DescriptorFile::read(gsl::span<uint8_t> buffer) {
    if (!descriptor_.is_open()) {
      return FsError::BAD_DESCRIPTOR;
    }
    boost::system::error_code ec;
    auto bytes = descriptor_.read_some(
        boost::asio::buffer(buffer.data(), buffer.size()), ec);
    if (ec == boost::asio::error::eof) {
      return 0;
    }
    if (ec) {
      logger_->debug("read on fd {} failed: {}", nativeHandle(), ec.message());
      return fsErrorFromAsio(ec);
    }
    return bytes;
  }

  outcome::result<size_t> DescriptorFile::write(
      gsl::span<const uint8_t> buffer) {
    if (!descriptor_.is_open()) {
      return FsError::BAD_DESCRIPTOR;
    }
    boost::system::error_code ec;
    auto bytes = descriptor_.write_some(
        boost::asio::buffer(buffer.data(), buffer.size()), ec);
    if (ec) {
      logger_->debug(
          "write on fd {} failed: {}", nativeHandle(), ec.message());
      return fsErrorFromAsio(ec);
    }
    return bytes;
  }

  outcome::result<uint64_t> DescriptorFile::seek(int64_t offset,
                                                 SeekWhence whence) {
    if (!descriptor_.is_open()) {
      return FsError::BAD_DESCRIPTOR;
    }
    int native_whence = SEEK_SET;
    switch (whence) {
      case SeekWhence::SET:
        native_whence = SEEK_SET;
        break;
      case SeekWhence::CURRENT:
        native_whence = SEEK_CUR;
        break;
      case SeekWhence::END:
        native_whence = SEEK_END;
        break;
    }
    auto position = ::lseek(native_fd_, offset, native_whence);
    if (position < 0) {
      return fsErrorFromErrno(errno);
    }
    return static_cast<uint64_t>(position);
  }

  outcome::result<void> DescriptorFile::flush() {
    // nothing is buffered above the descriptor
    if (!descriptor_.is_open()) {
      return FsError::BAD_DESCRIPTOR;
    }
    return outcome::success();
  }

  void DescriptorFile::asyncRead(gsl::span<uint8_t> buffer,
                                 IoHandler handler) {
    boost::asio::post(
        descriptor_.get_executor(),
        [self = shared_from_this(), buffer, handler = std::move(handler)] {
          handler(self->read(buffer));
        });
  }

  void DescriptorFile::asyncWrite(gsl::span<const uint8_t> buffer,
                                  IoHandler handler) {
    boost::asio::post(
        descriptor_.get_executor(),
        [self = shared_from_this(), buffer, handler = std::move(handler)] {
          handler(self->write(buffer));
        });
  }

  outcome::result<void> DescriptorFile::close() {
    if (!descriptor_.is_open()) {
      return outcome::success();
    }
    auto fd = native_fd_;
    native_fd_ = -1;
    boost::system::error_code ec;
    descriptor_.close(ec);
    if (ec) {
      logger_->warn("closing duplicate fd {} failed: {}", fd, ec.message());
      return fsErrorFromAsio(ec);
    }
    logger_->trace("duplicate fd {} closed", fd);
    return outcome::success();
  }

}  // namespace wasmbridge::io
