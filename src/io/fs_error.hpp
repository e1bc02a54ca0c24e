#ifndef WASMBRIDGE_SRC_IO_FS_ERROR_HPP
#define WASMBRIDGE_SRC_IO_FS_ERROR_HPP

#include <boost/system/error_code.hpp>

#include "outcome/outcome.hpp"

namespace wasmbridge::io {

  /**
   * @brief errors reported by virtual file operations
   */
  enum class FsError {
    PERMISSION_DENIED = 1,
    BAD_DESCRIPTOR,
    IO_ERROR,
    INVALID_SEEK,
    UNSUPPORTED
  };

  /**
   * @brief Classifies an errno value of a failed descriptor operation
   */
  FsError fsErrorFromErrno(int error_number);

  /**
   * @brief Classifies an error reported by boost::asio
   */
  FsError fsErrorFromAsio(const boost::system::error_code &ec);

}  // namespace wasmbridge::io

OUTCOME_HPP_DECLARE_ERROR_2(wasmbridge::io, FsError);

#endif  // WASMBRIDGE_SRC_IO_FS_ERROR_HPP
