// mathedit/basic/result.hpp - Value-or-error return type
#pragma once

#include <type_traits>
#include <utility>
#include <variant>

namespace mathedit
{

/**
 * Holds either a success value T or an error E.
 *
 * Used wherever an operation can be rejected as a whole (validation,
 * placeholder filling, config loading) rather than recovering with a
 * partial result.
 *
 * @code
 *     auto r = validator.validate(markup);
 *     if (r) {
 *         use(*r);
 *     } else {
 *         report(r.error());
 *     }
 * @endcode
 */
template <typename T, typename E>
class Result
{
  static_assert(!std::is_same_v<T, E>, "Result value and error types must differ");

public:
  using ValueType = T;
  using ErrorType = E;

  // NOLINTNEXTLINE(google-explicit-constructor)
  Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

  // NOLINTNEXTLINE(google-explicit-constructor)
  Result(E error) : data_(std::in_place_index<1>, std::move(error)) {}

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] bool has_error() const { return data_.index() == 1; }

  explicit operator bool() const { return has_value(); }

  // Get the value (undefined behavior if has_error())
  T & value() & { return std::get<0>(data_); }
  [[nodiscard]] const T & value() const & { return std::get<0>(data_); }
  T && value() && { return std::get<0>(std::move(data_)); }

  // Get the error (undefined behavior if has_value())
  E & error() & { return std::get<1>(data_); }
  [[nodiscard]] const E & error() const & { return std::get<1>(data_); }
  E && error() && { return std::get<1>(std::move(data_)); }

  T * operator->() { return &value(); }
  const T * operator->() const { return &value(); }
  T & operator*() & { return value(); }
  const T & operator*() const & { return value(); }

private:
  std::variant<T, E> data_;
};

}  // namespace mathedit
