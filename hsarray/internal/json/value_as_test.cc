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

#include <cstdint>
#include <optional>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include <nlohmann/json.hpp>
#include "hsarray/util/status_testutil.h"

namespace {

using ::hsarray::MatchesStatus;
using ::hsarray::internal_json::JsonRequireInteger;
using ::hsarray::internal_json::JsonRequireMember;
using ::hsarray::internal_json::JsonValueAs;

TEST(JsonValueAsTest, Int64) {
  EXPECT_EQ(std::optional<int64_t>(3),
            JsonValueAs<int64_t>(::nlohmann::json(3)));
  EXPECT_EQ(std::optional<int64_t>(4),
            JsonValueAs<int64_t>(::nlohmann::json(4.0)));
  EXPECT_EQ(std::nullopt, JsonValueAs<int64_t>(::nlohmann::json(4.5)));
  EXPECT_EQ(std::optional<int64_t>(-7),
            JsonValueAs<int64_t>(::nlohmann::json("-7")));
  EXPECT_EQ(std::nullopt,
            JsonValueAs<int64_t>(::nlohmann::json("-7"), /*strict=*/true));
}

TEST(JsonValueAsTest, Bool) {
  EXPECT_EQ(std::optional<bool>(true),
            JsonValueAs<bool>(::nlohmann::json(true)));
  EXPECT_EQ(std::optional<bool>(false),
            JsonValueAs<bool>(::nlohmann::json("false")));
  EXPECT_EQ(std::nullopt, JsonValueAs<bool>(::nlohmann::json(1)));
}

TEST(JsonRequireIntegerTest, Range) {
  int64_t value;
  HSARRAY_EXPECT_OK(
      JsonRequireInteger(::nlohmann::json(5), &value, true, 0, 10));
  EXPECT_EQ(5, value);
  EXPECT_THAT(JsonRequireInteger(::nlohmann::json(11), &value, true, 0, 10),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Expected integer in the range \\[0, 10\\], "
                            "but received: 11"));
  EXPECT_THAT(JsonRequireInteger(::nlohmann::json("x"), &value),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Expected 64-bit signed integer, but received: "
                            "\"x\""));
}

TEST(JsonRequireMemberTest, Missing) {
  ::nlohmann::json j{{"class", "H5T_INTEGER"}};
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto* member,
                               JsonRequireMember(j, "class", "type"));
  EXPECT_EQ("H5T_INTEGER", *member);
  EXPECT_THAT(JsonRequireMember(j, "base", "H5T_INTEGER type"),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Missing required member \"base\" in H5T_INTEGER "
                            "type"));
  EXPECT_THAT(JsonRequireMember(::nlohmann::json(3), "base", "type"),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Expected object for type, but received: 3"));
}

}  // namespace
