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

#ifndef HSARRAY_INTERNAL_LOG_VERBOSE_FLAG_H_
#define HSARRAY_INTERNAL_LOG_VERBOSE_FLAG_H_

#include <atomic>
#include <limits>
#include <string_view>

#include "absl/base/attributes.h"
#include "absl/base/optimization.h"

namespace hsarray {
namespace internal_log {

/// Updates the verbose logging configuration.
///
/// `input` is a comma separated list of `name` or `name=level` entries.  The
/// special name `all` sets the level of every flag not named explicitly.  When
/// `overwrite` is `false`, entries not mentioned in `input` keep their
/// previous level.
void UpdateVerboseLogging(std::string_view input, bool overwrite);

/// Named switch for verbose log statements.
///
/// Levels are taken from the `--hsarray_verbose_logging` flag and the
/// `HSARRAY_VERBOSE_LOGGING` environment variable.  Flags must have static
/// storage duration:
///
///   namespace {
///   ABSL_CONST_INIT internal_log::VerboseFlag selection_logging("selection");
///   }
///   ABSL_LOG_IF(INFO, selection_logging) << "Selected " << n << " elements";
///
class VerboseFlag {
 public:
  constexpr static int kValueUninitialized = std::numeric_limits<int>::max();

  explicit constexpr VerboseFlag(const char* name)
      : value_(kValueUninitialized), name_(name), next_(nullptr) {}

  VerboseFlag(const VerboseFlag&) = delete;
  VerboseFlag& operator=(const VerboseFlag&) = delete;

  /// Returns whether logging is enabled at `level` (`level >= 0`).
  ABSL_ATTRIBUTE_ALWAYS_INLINE
  bool Level(int level) {
    int v = value_.load(std::memory_order_relaxed);
    if (ABSL_PREDICT_TRUE(level > v)) {
      return false;
    }
    return SlowPath(this, v, level);
  }

  /// Returns whether logging is enabled at level 0.
  ABSL_ATTRIBUTE_ALWAYS_INLINE
  operator bool() { return Level(0); }

  const char* name() const { return name_; }

 private:
  static bool SlowPath(VerboseFlag* flag, int old_v, int level);
  static int Register(VerboseFlag* flag);

  std::atomic<int> value_;
  const char* const name_;
  VerboseFlag* next_;  // Guarded by the registry mutex.

  friend void UpdateVerboseLogging(std::string_view, bool);
};

}  // namespace internal_log
}  // namespace hsarray

#endif  // HSARRAY_INTERNAL_LOG_VERBOSE_FLAG_H_
