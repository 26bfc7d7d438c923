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

#ifndef HSARRAY_UTIL_STR_CAT_H_
#define HSARRAY_UTIL_STR_CAT_H_

/// \file
/// `StrCat` and `StrAppend` accepting any printable type.

#include <iterator>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

#include "absl/strings/str_cat.h"

namespace hsarray {
namespace internal_strcat {

template <typename T, typename = void>
constexpr inline bool HasOstreamOperator = false;

template <typename T>
constexpr inline bool HasOstreamOperator<
    T, std::void_t<decltype(std::declval<std::ostream&>()
                            << std::declval<const T&>())>> = true;

template <typename T, typename = void>
constexpr inline bool IsRange = false;

template <typename T>
constexpr inline bool
    IsRange<T, std::void_t<decltype(std::begin(std::declval<const T&>()),
                                    std::end(std::declval<const T&>()))>> =
        true;

template <typename T>
constexpr inline bool IsPair = false;

template <typename A, typename B>
constexpr inline bool IsPair<std::pair<A, B>> = true;

template <typename T>
constexpr inline bool IsOptional = false;

template <typename T>
constexpr inline bool IsOptional<std::optional<T>> = true;

/// Returns `x` or a string representation of it that `absl::StrCat` accepts.
///
/// Pairs and ranges print as `{a, b}`, an empty optional prints as `null`,
/// and other types use `operator<<`.
template <typename T>
auto ToAlphaNumOrString(const T& x) {
  if constexpr (std::is_convertible_v<T, absl::AlphaNum> &&
                !std::is_enum_v<T>) {
    return x;
  } else if constexpr (HasOstreamOperator<T>) {
    std::ostringstream os;
    os << x;
    return os.str();
  } else if constexpr (IsPair<T>) {
    return absl::StrCat("{", ToAlphaNumOrString(x.first), ", ",
                        ToAlphaNumOrString(x.second), "}");
  } else if constexpr (IsOptional<T>) {
    return x ? std::string(absl::AlphaNum(ToAlphaNumOrString(*x)).Piece())
             : std::string("null");
  } else if constexpr (IsRange<T>) {
    std::string result = "{";
    const char* separator = "";
    for (const auto& element : x) {
      absl::StrAppend(&result, separator, ToAlphaNumOrString(element));
      separator = ", ";
    }
    result += '}';
    return result;
  } else {
    static_assert(std::is_enum_v<T>, "Type cannot be converted to a string");
    return static_cast<std::underlying_type_t<T>>(x);
  }
}

}  // namespace internal_strcat

/// Concatenates the string representations of `arg...`.
template <typename... Arg>
std::string StrCat(const Arg&... arg) {
  return absl::StrCat(internal_strcat::ToAlphaNumOrString(arg)...);
}

/// Appends the string representations of `arg...` to `*result`.
template <typename... Arg>
void StrAppend(std::string* result, const Arg&... arg) {
  absl::StrAppend(result, internal_strcat::ToAlphaNumOrString(arg)...);
}

}  // namespace hsarray

#endif  // HSARRAY_UTIL_STR_CAT_H_
