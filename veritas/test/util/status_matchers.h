/*
 *
 * Copyright 2026 Veritas authors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 */

#ifndef VERITAS_TEST_UTIL_STATUS_MATCHERS_H_
#define VERITAS_TEST_UTIL_STATUS_MATCHERS_H_

#include <ostream>
#include <string>
#include <utility>

#include <gmock/gmock-matchers.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"

namespace veritas {
namespace internal {

// Implements a gMock matcher that checks that an absl::StatusOr<T> has an OK
// status and that the contained T value matches another matcher.
template <typename StatusOrT>
class IsOkAndHoldsMatcher
    : public ::testing::MatcherInterface<const StatusOrT &> {
  using ValueType = typename StatusOrT::value_type;

 public:
  template <typename MatcherT>
  explicit IsOkAndHoldsMatcher(MatcherT &&value_matcher)
      : value_matcher_(
            ::testing::SafeMatcherCast<const ValueType &>(value_matcher)) {}

  // From testing::MatcherInterface.
  void DescribeTo(std::ostream *os) const override {
    *os << "is OK and contains a value that ";
    value_matcher_.DescribeTo(os);
  }

  // From testing::MatcherInterface.
  void DescribeNegationTo(std::ostream *os) const override {
    *os << "is not OK or contains a value that ";
    value_matcher_.DescribeNegationTo(os);
  }

  // From testing::MatcherInterface.
  bool MatchAndExplain(
      const StatusOrT &status_or,
      ::testing::MatchResultListener *listener) const override {
    if (!status_or.ok()) {
      *listener << "which is not OK: " << status_or.status();
      return false;
    }

    ::testing::StringMatchResultListener value_listener;
    bool is_a_match =
        value_matcher_.MatchAndExplain(*status_or, &value_listener);
    std::string value_explanation = value_listener.str();
    if (!value_explanation.empty()) {
      *listener << absl::StrCat("which contains a value ", value_explanation);
    }

    return is_a_match;
  }

 private:
  const ::testing::Matcher<const ValueType &> value_matcher_;
};

// A polymorphic IsOkAndHolds() matcher.
//
// IsOkAndHolds() returns a matcher that can be used to process an IsOkAndHolds
// expectation. However, the value type T is not provided when IsOkAndHolds()
// is invoked. The value type is only inferable when the gMock library
// actually invokes the matcher. As a result, the IsOkAndHolds() function must
// return an object that is implicitly convertible to
// ::testing::Matcher<const absl::StatusOr<T> &>.
template <typename ValueMatcherT>
class IsOkAndHoldsGenerator {
 public:
  explicit IsOkAndHoldsGenerator(ValueMatcherT value_matcher)
      : value_matcher_(std::move(value_matcher)) {}

  template <typename T>
  operator ::testing::Matcher<const absl::StatusOr<T> &>() const {
    return ::testing::MakeMatcher(
        new IsOkAndHoldsMatcher<absl::StatusOr<T>>(value_matcher_));
  }

 private:
  const ValueMatcherT value_matcher_;
};

// Implements a status matcher interface that verifies that a status-like
// object has an expected code and a message that matches a string matcher.
class StatusMatcher {
 public:
  template <typename MessageMatcherT>
  StatusMatcher(absl::StatusCode code, MessageMatcherT message_matcher)
      : code_(code),
        message_matcher_(
            ::testing::SafeMatcherCast<const std::string &>(message_matcher)) {}

  // Required by testing::MakePolymorphicMatcher.
  void DescribeTo(std::ostream *os) const {
    *os << "has status code " << absl::StatusCodeToString(code_)
        << " and a message that ";
    message_matcher_.DescribeTo(os);
  }

  void DescribeNegationTo(std::ostream *os) const {
    *os << "does not have status code " << absl::StatusCodeToString(code_)
        << ", or does not have a message that ";
    message_matcher_.DescribeNegationTo(os);
  }

  // Tests whether |status_like| has an error code and error message that meet
  // this matcher's expectations.
  template <typename T>
  bool MatchAndExplain(const T &status_like,
                       ::testing::MatchResultListener *listener) const {
    absl::Status status = GetStatus(status_like);
    if (status.code() != code_) {
      *listener << "whose status code is "
                << absl::StatusCodeToString(status.code());
      return false;
    }
    ::testing::StringMatchResultListener string_listener;
    if (!message_matcher_.MatchAndExplain(std::string(status.message()),
                                          &string_listener)) {
      std::string explanation = string_listener.str();
      *listener << "which has an error message "
                << (explanation.empty() ? "which does not match the expectation"
                                        : explanation);
      return false;
    }
    return true;
  }

 private:
  template <typename ValueT>
  static absl::Status GetStatus(const absl::StatusOr<ValueT> &status_or) {
    return status_or.status();
  }

  static absl::Status GetStatus(const absl::Status &status) { return status; }

  const absl::StatusCode code_;
  const ::testing::Matcher<const std::string &> message_matcher_;
};

// Implements IsOk() as a polymorphic matcher.
class IsOkMatcher {
 public:
  IsOkMatcher() = default;

  void DescribeTo(std::ostream *os) const { *os << "is OK"; }

  void DescribeNegationTo(std::ostream *os) const { *os << "is not OK"; }

  // Tests whether |status_container|'s OK value meets this matcher's
  // expectation.
  template <class T>
  bool MatchAndExplain(const T &status_container,
                       ::testing::MatchResultListener *listener) const {
    if (!status_container.ok()) {
      *listener << "which is not OK";
      return false;
    }
    return true;
  }
};

}  // namespace internal

// Returns a gMock matcher that expects an absl::StatusOr<T> object to have an
// OK status and for the contained T object to match |value_matcher|.
//
// Example:
//
//     absl::StatusOr<std::string> result = Hello();
//     EXPECT_THAT(result, IsOkAndHolds(Eq("hello")));
template <typename ValueMatcherT>
internal::IsOkAndHoldsGenerator<ValueMatcherT> IsOkAndHolds(
    ValueMatcherT value_matcher) {
  return internal::IsOkAndHoldsGenerator<ValueMatcherT>(value_matcher);
}

// Returns a gMock matcher that expects an absl::Status or absl::StatusOr<T> to
// have the given |code|.
inline ::testing::PolymorphicMatcher<internal::StatusMatcher> StatusIs(
    absl::StatusCode code) {
  return ::testing::MakePolymorphicMatcher(
      internal::StatusMatcher(code, ::testing::_));
}

// Returns a gMock matcher that expects an absl::Status or absl::StatusOr<T> to
// have the given |code| and a message matching |message_matcher|.
template <typename MessageMatcherT>
::testing::PolymorphicMatcher<internal::StatusMatcher> StatusIs(
    absl::StatusCode code, MessageMatcherT message_matcher) {
  return ::testing::MakePolymorphicMatcher(
      internal::StatusMatcher(code, message_matcher));
}

// Returns a gMock matcher that expects an absl::Status or absl::StatusOr<T> to
// be OK.
inline ::testing::PolymorphicMatcher<internal::IsOkMatcher> IsOk() {
  return ::testing::MakePolymorphicMatcher(internal::IsOkMatcher());
}

}  // namespace veritas

// Macros for testing the results of functions that return absl::Status or
// absl::StatusOr<T> (for any type T).
#define VERITAS_EXPECT_OK(rexpr) EXPECT_THAT(rexpr, ::veritas::IsOk())
#define VERITAS_ASSERT_OK(rexpr) ASSERT_THAT(rexpr, ::veritas::IsOk())

// Evaluates an expression that returns an absl::StatusOr<T>. If the result is
// OK, moves the contained value into |lhs|. Otherwise fails the test.
#define VERITAS_ASSERT_OK_AND_ASSIGN(lhs, rexpr)                             \
  do {                                                                       \
    auto _statusor_to_verify = rexpr;                                        \
    if (!_statusor_to_verify.ok()) {                                         \
      FAIL() << #rexpr << " returned error: " << _statusor_to_verify.status(); \
    }                                                                        \
    lhs = *std::move(_statusor_to_verify);                                   \
  } while (false)

#endif  // VERITAS_TEST_UTIL_STATUS_MATCHERS_H_
