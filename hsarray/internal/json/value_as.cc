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

#include "hsarray/internal/json/value_as.h"

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/numbers.h"
#include <nlohmann/json.hpp>
#include "hsarray/util/result.h"
#include "hsarray/util/str_cat.h"

namespace hsarray {
namespace internal_json {

absl::Status ExpectedError(const ::nlohmann::json& j,
                           std::string_view type_name) {
  if (j.is_discarded()) {
    return absl::InvalidArgumentError(
        StrCat("Expected ", type_name, ", but member is missing"));
  }
  return absl::InvalidArgumentError(
      StrCat("Expected ", type_name, ", but received: ", j.dump()));
}

absl::Status MissingMemberError(std::string_view member,
                                std::string_view context) {
  return absl::InvalidArgumentError(
      StrCat("Missing required member \"", member, "\" in ", context));
}

template <>
std::optional<bool> JsonValueAs<bool>(const ::nlohmann::json& j, bool strict) {
  if (j.is_boolean()) {
    return j.get<bool>();
  }
  if (!strict && j.is_string()) {
    const auto& str = j.get_ref<const std::string&>();
    if (str == "true") return true;
    if (str == "false") return false;
  }
  return std::nullopt;
}

template <>
std::optional<int64_t> JsonValueAs<int64_t>(const ::nlohmann::json& j,
                                            bool strict) {
  if (j.is_number_unsigned()) {
    auto x = j.get<std::uint64_t>();
    if (x <= static_cast<std::uint64_t>(std::numeric_limits<int64_t>::max())) {
      return static_cast<std::int64_t>(x);
    }
  } else if (j.is_number_integer()) {
    return j.get<std::int64_t>();
  } else if (j.is_number_float()) {
    auto x = j.get<double>();
    if (x >= -9223372036854775808.0 /*=-2^63*/ &&
        x < 9223372036854775808.0 /*=2^63*/ && x == std::floor(x)) {
      return static_cast<std::int64_t>(x);
    }
  } else if (!strict && j.is_string()) {
    int64_t result = 0;
    if (absl::SimpleAtoi(j.get_ref<const std::string&>(), &result)) {
      return result;
    }
  }
  return std::nullopt;
}

template <>
std::optional<std::string> JsonValueAs<std::string>(const ::nlohmann::json& j,
                                                    bool strict) {
  if (j.is_string()) {
    return j.get<std::string>();
  }
  return std::nullopt;
}

absl::Status JsonRequireInteger(const ::nlohmann::json& json, int64_t* result,
                                bool strict, int64_t min_value,
                                int64_t max_value) {
  if (auto x = JsonValueAs<int64_t>(json, strict)) {
    if (*x >= min_value && *x <= max_value) {
      *result = *x;
      return absl::OkStatus();
    }
  }
  if (min_value == std::numeric_limits<int64_t>::min() &&
      max_value == std::numeric_limits<int64_t>::max()) {
    return ExpectedError(json, "64-bit signed integer");
  }
  return absl::InvalidArgumentError(
      StrCat("Expected integer in the range [", min_value, ", ", max_value,
             "], but received: ", json.dump()));
}

absl::Status JsonRequireString(const ::nlohmann::json& j, std::string* result) {
  auto value = JsonValueAs<std::string>(j, /*strict=*/true);
  if (!value) return ExpectedError(j, "string");
  *result = std::move(*value);
  return absl::OkStatus();
}

const ::nlohmann::json* JsonFindMember(const ::nlohmann::json& j,
                                       std::string_view name) {
  if (!j.is_object()) return nullptr;
  auto it = j.find(std::string(name));
  if (it == j.end()) return nullptr;
  return &*it;
}

Result<const ::nlohmann::json*> JsonRequireMember(const ::nlohmann::json& j,
                                                  std::string_view name,
                                                  std::string_view context) {
  if (!j.is_object()) {
    return ExpectedError(j, StrCat("object for ", context));
  }
  if (const auto* member = JsonFindMember(j, name)) return member;
  return MissingMemberError(name, context);
}

}  // namespace internal_json
}  // namespace hsarray
