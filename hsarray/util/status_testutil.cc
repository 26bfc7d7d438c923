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

#include "hsarray/util/status_testutil.h"

#include <ostream>
#include <regex>  // NOLINT
#include <string>

#include <gmock/gmock.h>
#include "absl/status/status.h"

namespace hsarray {
namespace internal_status {

bool StatusExpectation::Matches(
    const absl::Status& status,
    ::testing::MatchResultListener* listener) const {
  if (status.code() != code_) {
    *listener << "whose status is " << status;
    return false;
  }
  if (message_pattern_ &&
      !std::regex_match(std::string(status.message()),
                        std::regex(*message_pattern_))) {
    *listener << "whose message \"" << status.message()
              << "\" doesn't match";
    return false;
  }
  return true;
}

void StatusExpectation::Describe(std::ostream* os, bool negation) const {
  *os << (negation ? "doesn't have" : "has") << " status code "
      << absl::StatusCodeToString(code_);
  if (message_pattern_) {
    *os << (negation ? " or a message matching " : " and a message matching ")
        << "\"" << *message_pattern_ << "\"";
  }
}

}  // namespace internal_status
}  // namespace hsarray
