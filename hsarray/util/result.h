// Copyright 2025 The HSArray Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef HSARRAY_UTIL_RESULT_H_
#define HSARRAY_UTIL_RESULT_H_

#include <optional>
#include <type_traits>
#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "hsarray/util/status.h"

namespace hsarray {

template <typename T>
class Result;

template <typename T>
constexpr inline bool IsResult = false;

template <typename T>
constexpr inline bool IsResult<Result<T>> = true;

/// `Result<T>` holds either a successfully-computed value of type `T` or an
/// error `absl::Status`.
///
/// A `Result` constructed from an `absl::Status` must be constructed from an
/// error status; an OK status is converted to an `absl::StatusCode::kUnknown`
/// error.
///
/// Example::
///
///     Result<int> ParseCount(std::string_view s);
///
///     auto result = ParseCount("42");
///     if (!result.ok()) return result.status();
///     int count = *result;
///
/// \ingroup error handling
template <typename T>
class Result {
  static_assert(!std::is_reference_v<T>, "T must not be a reference");
  static_assert(!std::is_same_v<std::decay_t<T>, absl::Status>,
                "T must not be absl::Status");

  template <typename U>
  using EnableIfValueConstructible = std::enable_if_t<
      std::is_constructible_v<T, U&&> &&
      !std::is_same_v<std::decay_t<U>, Result> &&
      !std::is_same_v<std::decay_t<U>, absl::Status> &&
      !std::is_same_v<std::decay_t<U>, std::in_place_t>>;

 public:
  using value_type = T;

  /// Constructs an error result.
  Result(const absl::Status& status) : status_(status) {  // NOLINT
    if (ABSL_PREDICT_FALSE(status_.ok())) {
      status_ = absl::UnknownError("Result constructed from OK status");
    }
  }
  Result(absl::Status&& status) : status_(std::move(status)) {  // NOLINT
    if (ABSL_PREDICT_FALSE(status_.ok())) {
      status_ = absl::UnknownError("Result constructed from OK status");
    }
  }

  /// Constructs a successful result holding `value`.
  template <typename U = T, typename = EnableIfValueConstructible<U>>
  Result(U&& value)  // NOLINT
      : value_(std::in_place, std::forward<U>(value)) {}

  /// Constructs the value in place.
  template <typename... Args>
  explicit Result(std::in_place_t, Args&&... args)
      : value_(std::in_place, std::forward<Args>(args)...) {}

  Result(const Result&) = default;
  Result(Result&&) = default;
  Result& operator=(const Result&) = default;
  Result& operator=(Result&&) = default;

  /// Returns `true` if this result holds a value.
  bool ok() const { return value_.has_value(); }
  bool has_value() const { return value_.has_value(); }
  explicit operator bool() const { return value_.has_value(); }

  /// Returns the error status, or `absl::OkStatus()` if this holds a value.
  const absl::Status& status() const& { return status_; }
  absl::Status status() && { return std::move(status_); }

  /// Returns the contained value.
  ///
  /// \dchecks `has_value()`; terminates with the contained error otherwise.
  T& value() & {
    CheckHasValue();
    return *value_;
  }
  const T& value() const& {
    CheckHasValue();
    return *value_;
  }
  T&& value() && {
    CheckHasValue();
    return std::move(*value_);
  }

  T& operator*() & { return value(); }
  const T& operator*() const& { return value(); }
  T&& operator*() && { return std::move(*this).value(); }

  T* operator->() { return &value(); }
  const T* operator->() const { return &value(); }

  /// Returns the contained value, or `default_value` on error.
  template <typename U>
  T value_or(U&& default_value) const& {
    return has_value() ? *value_
                       : static_cast<T>(std::forward<U>(default_value));
  }
  template <typename U>
  T value_or(U&& default_value) && {
    return has_value() ? std::move(*value_)
                       : static_cast<T>(std::forward<U>(default_value));
  }

  friend bool operator==(const Result& a, const Result& b) {
    if (a.has_value() != b.has_value()) return false;
    return a.has_value() ? *a.value_ == *b.value_ : a.status_ == b.status_;
  }
  friend bool operator!=(const Result& a, const Result& b) { return !(a == b); }

 private:
  void CheckHasValue() const {
    if (ABSL_PREDICT_FALSE(!value_.has_value())) {
      internal::FatalStatus("Result has no value", status_, __FILE__, __LINE__);
    }
  }

  absl::Status status_;
  std::optional<T> value_;
};

/// Returns the error status of `result`, or `absl::OkStatus()`.
///
/// \relates Result
template <typename T>
const absl::Status& GetStatus(const Result<T>& result) {
  return result.status();
}
template <typename T>
absl::Status GetStatus(Result<T>&& result) {
  return std::move(result).status();
}

}  // namespace hsarray

#define HSARRAY_INTERNAL_CONCAT_IMPL(a, b) a##b
#define HSARRAY_INTERNAL_CONCAT(a, b) HSARRAY_INTERNAL_CONCAT_IMPL(a, b)

#define HSARRAY_INTERNAL_ASSIGN_OR_RETURN_IMPL(temp, decl, expr, error_expr, \
                                               ...)                          \
  auto temp = (expr);                                                        \
  static_assert(::hsarray::IsResult<decltype(temp)>,                         \
                "HSARRAY_ASSIGN_OR_RETURN requires a Result value.");        \
  if (ABSL_PREDICT_FALSE(!temp)) {                                           \
    auto _ = std::move(temp).status();                                       \
    static_cast<void>(_);                                                    \
    return (error_expr);                                                     \
  }                                                                          \
  decl = std::move(*temp);                                                   \
  /**/

/// Convenience macro for propagating errors when calling a function that
/// returns a `hsarray::Result`.
///
/// This macro generates multiple statements and should be invoked as follows::
///
///     Result<int> GetSomeResult();
///
///     HSARRAY_ASSIGN_OR_RETURN(int x, GetSomeResult());
///
/// An optional third argument specifies the return expression in the case of an
/// error.  A variable ``_`` bound to the error `absl::Status` value is in
/// scope within this expression.  For example::
///
///     HSARRAY_ASSIGN_OR_RETURN(int x, GetSomeResult(),
///                              MaybeAnnotateStatus(_, "Context message"));
#define HSARRAY_ASSIGN_OR_RETURN(decl, ...)                              \
  HSARRAY_INTERNAL_ASSIGN_OR_RETURN_IMPL(                                \
      HSARRAY_INTERNAL_CONCAT(hsarray_assign_or_return_, __LINE__), decl, \
      __VA_ARGS__, _)                                                    \
  /**/

#endif  // HSARRAY_UTIL_RESULT_H_
