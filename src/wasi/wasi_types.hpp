#ifndef WASMBRIDGE_SRC_WASI_WASI_TYPES_HPP
#define WASMBRIDGE_SRC_WASI_WASI_TYPES_HPP

#include <cstdint>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace wasmbridge::wasi {

  /// guest file descriptor numbers of the standard streams
  enum class StdioStream : uint32_t { STDIN = 0, STDOUT = 1, STDERR = 2 };

  constexpr size_t kStdioStreamCount = 3;

  /// ordered name/value pairs, names are unique
  using Environment = std::vector<std::pair<std::string, std::string>>;

  /**
   * errno values of wasi_snapshot_preview1, only the ones this host reports
   */
  enum class Errno : uint16_t {
    SUCCESS = 0,
    BADF = 8,
    FAULT = 21,
    INVAL = 28,
    IO = 29,
    NOSYS = 52,
    NOTSUP = 58,
    PERM = 63,
    SPIPE = 70,
  };

  enum class FileType : uint8_t {
    UNKNOWN = 0,
    BLOCK_DEVICE = 1,
    CHARACTER_DEVICE = 2,
    DIRECTORY = 3,
    REGULAR_FILE = 4,
  };

  namespace rights {
    constexpr uint64_t kFdDatasync = 1ull << 0;
    constexpr uint64_t kFdRead = 1ull << 1;
    constexpr uint64_t kFdSeek = 1ull << 2;
    constexpr uint64_t kFdSync = 1ull << 4;
    constexpr uint64_t kFdTell = 1ull << 5;
    constexpr uint64_t kFdWrite = 1ull << 6;
    constexpr uint64_t kFdFilestatGet = 1ull << 21;
    constexpr uint64_t kPollFdReadwrite = 1ull << 27;

    constexpr uint64_t kStdio = kFdDatasync | kFdRead | kFdSeek | kFdSync
                                | kFdTell | kFdWrite | kFdFilestatGet
                                | kPollFdReadwrite;
  }  // namespace rights

  /// layout sizes of the preview1 structs written to guest memory
  constexpr uint32_t kIovecSize = 8;
  constexpr uint32_t kFdstatSize = 24;
  constexpr uint32_t kFilestatSize = 64;

  /**
   * Maps a failure of the virtual file or memory layer to the errno the guest
   * receives
   */
  Errno toWasiErrno(const std::error_code &ec);

}  // namespace wasmbridge::wasi

#endif  // WASMBRIDGE_SRC_WASI_WASI_TYPES_HPP
