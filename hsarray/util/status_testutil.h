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

#ifndef HSARRAY_UTIL_STATUS_TESTUTIL_H_
#define HSARRAY_UTIL_STATUS_TESTUTIL_H_

/// \file
/// GMock matchers for `absl::Status` and `Result`.
///
///     EXPECT_THAT(Parse("[1:2]"), IsOkAndHolds(ElementsAre(1)));
///     EXPECT_THAT(Parse("[2:1:0]"),
///                 MatchesStatus(absl::StatusCode::kInvalidArgument,
///                               "Invalid step .*"));
///
/// Message patterns are ECMAScript regular expressions that must match the
/// whole message.

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

#include <gmock/gmock.h>
#include "absl/status/status.h"
#include "hsarray/util/result.h"
#include "hsarray/util/status.h"

namespace hsarray {

template <typename T>
void PrintTo(const Result<T>& result, std::ostream* os) {
  if (result) {
    *os << "Result{" << ::testing::PrintToString(*result) << "}";
  } else {
    *os << result.status();
  }
}

namespace internal_status {

/// Expected code and, optionally, message pattern of a status.
class StatusExpectation {
 public:
  StatusExpectation(absl::StatusCode code,
                    std::optional<std::string> message_pattern)
      : code_(code), message_pattern_(std::move(message_pattern)) {}

  bool Matches(const absl::Status& status,
               ::testing::MatchResultListener* listener) const;
  void Describe(std::ostream* os, bool negation) const;

 private:
  absl::StatusCode code_;
  std::optional<std::string> message_pattern_;
};

// `StatusType` is `const absl::Status&` or `const Result<T>&`.
template <typename StatusType>
class StatusMatcherImpl : public ::testing::MatcherInterface<StatusType> {
 public:
  explicit StatusMatcherImpl(StatusExpectation expectation)
      : expectation_(std::move(expectation)) {}

  void DescribeTo(std::ostream* os) const override {
    expectation_.Describe(os, /*negation=*/false);
  }
  void DescribeNegationTo(std::ostream* os) const override {
    expectation_.Describe(os, /*negation=*/true);
  }
  bool MatchAndExplain(
      StatusType actual,
      ::testing::MatchResultListener* listener) const override {
    return expectation_.Matches(::hsarray::GetStatus(actual), listener);
  }

 private:
  StatusExpectation expectation_;
};

class StatusMatcher {
 public:
  explicit StatusMatcher(StatusExpectation expectation)
      : expectation_(std::move(expectation)) {}

  template <typename StatusType>
  operator ::testing::Matcher<StatusType>() const {  // NOLINT
    return ::testing::Matcher<StatusType>(
        new StatusMatcherImpl<const StatusType&>(expectation_));
  }

 private:
  StatusExpectation expectation_;
};

template <typename ResultType>
class IsOkAndHoldsMatcherImpl : public ::testing::MatcherInterface<ResultType> {
 public:
  using value_type = typename std::remove_cv_t<
      std::remove_reference_t<ResultType>>::value_type;

  template <typename InnerMatcher>
  explicit IsOkAndHoldsMatcherImpl(const InnerMatcher& inner)
      : inner_(::testing::SafeMatcherCast<const value_type&>(inner)) {}

  void DescribeTo(std::ostream* os) const override {
    *os << "is OK and holds a value that ";
    inner_.DescribeTo(os);
  }
  void DescribeNegationTo(std::ostream* os) const override {
    *os << "is not OK or holds a value that ";
    inner_.DescribeNegationTo(os);
  }
  bool MatchAndExplain(
      ResultType actual,
      ::testing::MatchResultListener* listener) const override {
    if (!actual.ok()) {
      *listener << "whose status is " << actual.status();
      return false;
    }
    ::testing::StringMatchResultListener inner_listener;
    if (inner_.MatchAndExplain(*actual, &inner_listener)) return true;
    *listener << "whose value " << ::testing::PrintToString(*actual)
              << " doesn't match";
    if (!inner_listener.str().empty()) {
      *listener << ", " << inner_listener.str();
    }
    return false;
  }

 private:
  ::testing::Matcher<const value_type&> inner_;
};

template <typename InnerMatcher>
class IsOkAndHoldsMatcher {
 public:
  explicit IsOkAndHoldsMatcher(InnerMatcher inner) : inner_(std::move(inner)) {}

  template <typename ResultType>
  operator ::testing::Matcher<ResultType>() const {  // NOLINT
    return ::testing::Matcher<ResultType>(
        new IsOkAndHoldsMatcherImpl<const ResultType&>(inner_));
  }

 private:
  InnerMatcher inner_;
};

}  // namespace internal_status

/// Matches an OK `absl::Status` or a `Result` holding a value.
inline internal_status::StatusMatcher IsOk() {
  return internal_status::StatusMatcher({absl::StatusCode::kOk, std::nullopt});
}

/// Matches a `Result` holding a value that matches `inner`.
template <typename InnerMatcher>
internal_status::IsOkAndHoldsMatcher<std::decay_t<InnerMatcher>> IsOkAndHolds(
    InnerMatcher&& inner) {
  return internal_status::IsOkAndHoldsMatcher<std::decay_t<InnerMatcher>>(
      std::forward<InnerMatcher>(inner));
}

/// Matches a status, or the status of a `Result`, with code `code`.
inline internal_status::StatusMatcher MatchesStatus(absl::StatusCode code) {
  return internal_status::StatusMatcher({code, std::nullopt});
}

/// Matches a status with code `code` whose whole message matches the regular
/// expression `message_pattern`.
inline internal_status::StatusMatcher MatchesStatus(
    absl::StatusCode code, std::string message_pattern) {
  return internal_status::StatusMatcher({code, std::move(message_pattern)});
}

}  // namespace hsarray

/// Expects `expr`, an `absl::Status` or `Result`, to be OK.
#define HSARRAY_EXPECT_OK(expr) EXPECT_THAT(expr, ::hsarray::IsOk())

/// Same as `HSARRAY_EXPECT_OK`, but returns from the test on failure.
#define HSARRAY_ASSERT_OK(expr) ASSERT_THAT(expr, ::hsarray::IsOk())

/// Asserts that the `Result` `expr` holds a value and assigns it to `decl`.
///
///     HSARRAY_ASSERT_OK_AND_ASSIGN(auto selection, Select(shape, expr));
#define HSARRAY_ASSERT_OK_AND_ASSIGN(decl, expr)                    \
  HSARRAY_ASSIGN_OR_RETURN(decl, expr,                              \
                           ([&] { FAIL() << #expr << ": " << _; })()) \
  /**/

#endif  // HSARRAY_UTIL_STATUS_TESTUTIL_H_
