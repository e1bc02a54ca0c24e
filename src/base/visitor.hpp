#ifndef WASMBRIDGE_SRC_BASE_VISITOR_HPP
#define WASMBRIDGE_SRC_BASE_VISITOR_HPP

#include <type_traits>
#include <utility>

#include <boost/variant/apply_visitor.hpp>

namespace wasmbridge {

  /// overload set built from a list of lambdas
  template <typename... Fs>
  struct lambda_visitor : Fs... {
    using Fs::operator()...;
  };

  template <typename... Fs>
  lambda_visitor(Fs...) -> lambda_visitor<Fs...>;

  template <typename... Fs>
  constexpr auto make_visitor(Fs &&... fs) {
    return lambda_visitor<std::decay_t<Fs>...>{std::forward<Fs>(fs)...};
  }

  /**
   * @brief Visits a boost::variant with lambdas given in place
   * @code
   * visit_in_place(variant,
   *                [](const A &a) { ... },
   *                [](const B &b) { ... });
   * @endcode
   */
  template <typename TVariant, typename... TVisitors>
  constexpr decltype(auto) visit_in_place(TVariant &&variant,
                                          TVisitors &&... visitors) {
    return boost::apply_visitor(
        make_visitor(std::forward<TVisitors>(visitors)...),
        std::forward<TVariant>(variant));
  }

}  // namespace wasmbridge

#endif  // WASMBRIDGE_SRC_BASE_VISITOR_HPP
