#include "base/utf8.hpp"

#include <cstdint>
#include <cstring>

namespace wasmbridge::base {

  namespace {
    bool isContinuation(uint8_t byte) {
      return (byte & 0xC0u) == 0x80u;
    }
  }  // namespace

  bool isValidUtf8(std::string_view bytes) noexcept {
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
      auto lead = static_cast<uint8_t>(bytes[i]);
      if (lead < 0x80u) {
        ++i;
        continue;
      }

      size_t width = 0;
      // bounds for the second byte, they exclude overlong forms,
      // surrogates and code points past U+10FFFF
      uint8_t lower = 0x80u;
      uint8_t upper = 0xBFu;
      if (lead >= 0xC2u && lead <= 0xDFu) {
        width = 2;
      } else if (lead >= 0xE0u && lead <= 0xEFu) {
        width = 3;
        if (lead == 0xE0u) {
          lower = 0xA0u;
        } else if (lead == 0xEDu) {
          upper = 0x9Fu;
        }
      } else if (lead >= 0xF0u && lead <= 0xF4u) {
        width = 4;
        if (lead == 0xF0u) {
          lower = 0x90u;
        } else if (lead == 0xF4u) {
          upper = 0x8Fu;
        }
      } else {
        return false;
      }

      if (n - i < width) {
        return false;
      }
      auto second = static_cast<uint8_t>(bytes[i + 1]);
      if (second < lower || second > upper) {
        return false;
      }
      for (size_t k = 2; k < width; ++k) {
        if (!isContinuation(static_cast<uint8_t>(bytes[i + k]))) {
          return false;
        }
      }
      i += width;
    }
    return true;
  }

  boost::optional<std::string> decodeUtf8(const char *c_str) {
    if (c_str == nullptr) {
      return boost::none;
    }
    std::string_view bytes(c_str, std::strlen(c_str));
    if (!isValidUtf8(bytes)) {
      return boost::none;
    }
    return std::string(bytes);
  }

}  // namespace wasmbridge::base
