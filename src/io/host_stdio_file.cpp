#include "io/host_stdio_file.hpp"

#include <unistd.h>

#include <cerrno>

#include <boost/asio/post.hpp>

namespace wasmbridge::io {

  HostStdioFile::HostStdioFile(boost::asio::io_context &io_context,
                               int host_fd)
      : io_context_{io_context}, host_fd_{host_fd} {}

  uint64_t HostStdioFile::lastAccessed() const {
    return 0;
  }

  uint64_t HostStdioFile::lastModified() const {
    return 0;
  }

  uint64_t HostStdioFile::createdTime() const {
    return 0;
  }

  uint64_t HostStdioFile::size() const {
    return 0;
  }

  outcome::result<void> HostStdioFile::setLength(uint64_t /*new_size*/) {
    return FsError::PERMISSION_DENIED;
  }

  outcome::result<void> HostStdioFile::unlink() {
    return outcome::success();
  }

  outcome::result<size_t> HostStdioFile::pollReadReady() {
    return 1;
  }

  outcome::result<size_t> HostStdioFile::pollWriteReady() {
    return 1;
  }

  outcome::result<size_t> HostStdioFile::read(gsl::span<uint8_t> buffer) {
    if (host_fd_ < 0) {
      return FsError::BAD_DESCRIPTOR;
    }
    ssize_t bytes = 0;
    do {
      bytes = ::read(host_fd_, buffer.data(), buffer.size());
    } while (bytes < 0 && errno == EINTR);
    if (bytes < 0) {
      return fsErrorFromErrno(errno);
    }
    return static_cast<size_t>(bytes);
  }

  outcome::result<size_t> HostStdioFile::write(
      gsl::span<const uint8_t> buffer) {
    if (host_fd_ < 0) {
      return FsError::BAD_DESCRIPTOR;
    }
    ssize_t bytes = 0;
    do {
      bytes = ::write(host_fd_, buffer.data(), buffer.size());
    } while (bytes < 0 && errno == EINTR);
    if (bytes < 0) {
      return fsErrorFromErrno(errno);
    }
    return static_cast<size_t>(bytes);
  }

  outcome::result<uint64_t> HostStdioFile::seek(int64_t offset,
                                                SeekWhence whence) {
    if (host_fd_ < 0) {
      return FsError::BAD_DESCRIPTOR;
    }
    int native_whence = whence == SeekWhence::SET       ? SEEK_SET
                        : whence == SeekWhence::CURRENT ? SEEK_CUR
                                                        : SEEK_END;
    auto position = ::lseek(host_fd_, offset, native_whence);
    if (position < 0) {
      return fsErrorFromErrno(errno);
    }
    return static_cast<uint64_t>(position);
  }

  outcome::result<void> HostStdioFile::flush() {
    if (host_fd_ < 0) {
      return FsError::BAD_DESCRIPTOR;
    }
    return outcome::success();
  }

  void HostStdioFile::asyncRead(gsl::span<uint8_t> buffer,
                                IoHandler handler) {
    boost::asio::post(
        io_context_,
        [self = shared_from_this(), buffer, handler = std::move(handler)] {
          handler(self->read(buffer));
        });
  }

  void HostStdioFile::asyncWrite(gsl::span<const uint8_t> buffer,
                                 IoHandler handler) {
    boost::asio::post(
        io_context_,
        [self = shared_from_this(), buffer, handler = std::move(handler)] {
          handler(self->write(buffer));
        });
  }

  outcome::result<void> HostStdioFile::close() {
    // the host keeps its standard streams
    host_fd_ = -1;
    return outcome::success();
  }

}  // namespace wasmbridge::io
