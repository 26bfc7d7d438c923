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

#ifndef HSARRAY_INTERNAL_JSON_VALUE_AS_H_
#define HSARRAY_INTERNAL_JSON_VALUE_AS_H_

/// \file
///
/// Low-level functions for extracting primitive values and members from
/// nlohmann::json values, with uniform error messages.

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "absl/status/status.h"
#include <nlohmann/json.hpp>
#include "hsarray/util/result.h"

namespace hsarray {
namespace internal_json {

/// Returns an error message for a json value with the expected type.
absl::Status ExpectedError(const ::nlohmann::json& j,
                           std::string_view type_name);

/// Returns an error indicating that the object member `member` is missing.
absl::Status MissingMemberError(std::string_view member,
                                std::string_view context);

/// Converts `j` to `T` if the conversion is exact.
///
/// Integers accept numbers with an integral value and, unless `strict`,
/// base-10 strings.  Strings only accept JSON strings.
template <typename T>
std::optional<T> JsonValueAs(const ::nlohmann::json& j, bool strict = false) {
  static_assert(!std::is_same_v<T, T>, "Target type not supported.");
}

template <>
std::optional<bool> JsonValueAs<bool>(const ::nlohmann::json& j, bool strict);

template <>
std::optional<int64_t> JsonValueAs<int64_t>(const ::nlohmann::json& j,
                                            bool strict);

template <>
std::optional<std::string> JsonValueAs<std::string>(const ::nlohmann::json& j,
                                                    bool strict);

/// Attempts to convert `json` to an integer in the range
/// `[min_value, max_value]`.
///
/// \param json The JSON value.
/// \param result[out] Non-null pointer to location where result is stored on
///     success.
/// \param strict If `true`, conversions from string are not permitted.
/// \error `absl::StatusCode::kInvalidArgument` on failure.
absl::Status JsonRequireInteger(
    const ::nlohmann::json& json, int64_t* result, bool strict = false,
    int64_t min_value = std::numeric_limits<int64_t>::min(),
    int64_t max_value = std::numeric_limits<int64_t>::max());

/// Requires `j` to be a string.
absl::Status JsonRequireString(const ::nlohmann::json& j, std::string* result);

/// Returns the member `name` of the object `j`.
///
/// \param context Describes the object for error messages, e.g.
///     `"H5T_INTEGER type"`.
/// \error `absl::StatusCode::kInvalidArgument` if `j` is not an object or
///     has no member `name`.
Result<const ::nlohmann::json*> JsonRequireMember(const ::nlohmann::json& j,
                                                  std::string_view name,
                                                  std::string_view context);

/// Returns the member `name` of the object `j`, or `nullptr` if absent.
const ::nlohmann::json* JsonFindMember(const ::nlohmann::json& j,
                                       std::string_view name);

}  // namespace internal_json
}  // namespace hsarray

#endif  // HSARRAY_INTERNAL_JSON_VALUE_AS_H_
