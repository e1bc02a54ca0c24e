#include "io/fs_error.hpp"

#include <cerrno>

OUTCOME_CPP_DEFINE_CATEGORY_3(wasmbridge::io, FsError, e) {
  using E = wasmbridge::io::FsError;
  switch (e) {
    case E::PERMISSION_DENIED:
      return "permission denied";
    case E::BAD_DESCRIPTOR:
      return "bad file descriptor";
    case E::IO_ERROR:
      return "input/output error";
    case E::INVALID_SEEK:
      return "descriptor is not seekable";
    case E::UNSUPPORTED:
      return "operation is not supported by this file";
  }
  return "unknown error";
}

namespace wasmbridge::io {

  FsError fsErrorFromErrno(int error_number) {
    switch (error_number) {
      case EPERM:
      case EACCES:
        return FsError::PERMISSION_DENIED;
      case EBADF:
        return FsError::BAD_DESCRIPTOR;
      case ESPIPE:
        return FsError::INVALID_SEEK;
      case ENOTSUP:
        return FsError::UNSUPPORTED;
      default:
        return FsError::IO_ERROR;
    }
  }

  FsError fsErrorFromAsio(const boost::system::error_code &ec) {
    if (ec.category() == boost::system::system_category()) {
      return fsErrorFromErrno(ec.value());
    }
    return FsError::IO_ERROR;
  }

}  // namespace wasmbridge::io
