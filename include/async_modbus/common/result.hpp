#pragma once

#include <utility>
#include <variant>
#include "error.hpp"

namespace asyncmb {

/**
 * @brief Value-or-error return type used across the library
 *
 * Holds either a T or an Error. Accessing the wrong alternative throws
 * std::bad_variant_access, the same contract as std::get.
 */
template <typename T>
class Result {
 public:
  Result(T value)
      : storage_(std::in_place_index<0>, std::move(value)) {}
  Result(Error error)
      : storage_(std::in_place_index<1>, std::move(error)) {}

  [[nodiscard]] bool has_value() const noexcept { return storage_.index() == 0; }
  explicit operator bool() const noexcept { return has_value(); }

  [[nodiscard]] T &value() & { return std::get<0>(storage_); }
  [[nodiscard]] const T &value() const & { return std::get<0>(storage_); }
  [[nodiscard]] T &&value() && { return std::get<0>(std::move(storage_)); }

  [[nodiscard]] const Error &error() const { return std::get<1>(storage_); }

  T *operator->() { return &value(); }
  const T *operator->() const { return &value(); }
  T &operator*() & { return value(); }
  const T &operator*() const & { return value(); }

 private:
  std::variant<T, Error> storage_;
};

/** Marker value for operations that only succeed or fail */
struct Done {};

}  // namespace asyncmb
