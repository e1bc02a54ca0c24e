#ifndef WASMBRIDGE_BASE_UTF8_HPP
#define WASMBRIDGE_BASE_UTF8_HPP

#include <string>
#include <string_view>

#include <boost/optional.hpp>

namespace wasmbridge::base {

  /**
   * @brief Checks that the bytes form well-formed UTF-8 (RFC 3629): no
   * overlong forms, no surrogate code points, nothing above U+10FFFF
   */
  bool isValidUtf8(std::string_view bytes) noexcept;

  /**
   * @brief Copies a NUL-terminated host string into an owned UTF-8 string
   * @param c_str pointer owned by the host, may be null
   * @return the string, or boost::none if the pointer is null or the bytes
   * are not valid UTF-8
   */
  boost::optional<std::string> decodeUtf8(const char *c_str);

}  // namespace wasmbridge::base

#endif  // WASMBRIDGE_BASE_UTF8_HPP
