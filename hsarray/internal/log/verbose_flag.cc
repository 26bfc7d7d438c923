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

#include "hsarray/internal/log/verbose_flag.h"

#include <algorithm>
#include <atomic>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/base/const_init.h"
#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/flags/flag.h"
#include "absl/log/absl_log.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_split.h"
#include "absl/synchronization/mutex.h"
#include "hsarray/internal/env.h"
#include "hsarray/internal/no_destructor.h"

ABSL_FLAG(std::string, hsarray_verbose_logging, {},
          "comma-separated list of hsarray verbose logging flags")
    .OnUpdate([]() {
      if (!absl::GetFlag(FLAGS_hsarray_verbose_logging).empty()) {
        hsarray::internal_log::UpdateVerboseLogging(
            absl::GetFlag(FLAGS_hsarray_verbose_logging), true);
      }
    });

namespace hsarray {
namespace internal_log {
namespace {

ABSL_CONST_INIT absl::Mutex g_mutex(absl::kConstInit);

// Every flag that has been evaluated at least once, linked through
// `VerboseFlag::next_`.
ABSL_CONST_INIT VerboseFlag* g_flags ABSL_GUARDED_BY(g_mutex) = nullptr;

struct LevelConfig {
  int default_level = -1;
  absl::flat_hash_map<std::string, int> levels;

  int LevelFor(std::string_view name) const {
    auto it = levels.find(name);
    return it == levels.end() ? default_level : it->second;
  }
};

void ParseLevelConfig(std::string_view input, LevelConfig& config) {
  for (std::string_view entry : absl::StrSplit(input, ',', absl::SkipEmpty())) {
    const size_t eq = entry.rfind('=');
    if (eq == std::string_view::npos) {
      config.levels.insert_or_assign(std::string(entry), 0);
      continue;
    }
    if (eq == 0) continue;
    int level;
    if (!absl::SimpleAtoi(entry.substr(eq + 1), &level)) continue;
    level = std::clamp(level, -1, 1000);
    config.levels.insert_or_assign(std::string(entry.substr(0, eq)), level);
  }
  config.default_level = config.LevelFor("all");
}

// The environment variable is consulted on first use.
LevelConfig& GetLevelConfig() ABSL_EXCLUSIVE_LOCKS_REQUIRED(g_mutex) {
  static internal::NoDestructor<LevelConfig> config{[] {
    LevelConfig config;
    if (auto env = internal::GetEnv("HSARRAY_VERBOSE_LOGGING")) {
      ParseLevelConfig(*env, config);
    }
    return config;
  }()};
  return *config;
}

}  // namespace

void UpdateVerboseLogging(std::string_view input, bool overwrite)
    ABSL_LOCKS_EXCLUDED(g_mutex) {
  ABSL_LOG(INFO) << "--hsarray_verbose_logging=" << input;
  LevelConfig update;
  ParseLevelConfig(input, update);

  absl::MutexLock lock(&g_mutex);
  LevelConfig& config = GetLevelConfig();
  if (overwrite) {
    config = std::move(update);
  } else {
    for (auto& [name, level] : update.levels) {
      config.levels.insert_or_assign(name, level);
    }
    config.default_level = config.LevelFor("all");
  }
  for (VerboseFlag* flag = g_flags; flag != nullptr; flag = flag->next_) {
    flag->value_.store(config.LevelFor(flag->name_), std::memory_order_seq_cst);
  }
}

/* static */
int VerboseFlag::Register(VerboseFlag* flag) {
  absl::MutexLock lock(&g_mutex);
  int v = flag->value_.load(std::memory_order_relaxed);
  if (v == kValueUninitialized) {
    v = GetLevelConfig().LevelFor(flag->name_);
    flag->value_.store(v, std::memory_order_relaxed);
    flag->next_ = std::exchange(g_flags, flag);
  }
  return v;
}

/* static */
bool VerboseFlag::SlowPath(VerboseFlag* flag, int old_v, int level) {
  if (ABSL_PREDICT_TRUE(old_v != kValueUninitialized)) {
    return true;
  }
  return Register(flag) >= level;
}

static_assert(std::is_trivially_destructible<VerboseFlag>::value,
              "VerboseFlag must be trivially destructible");

}  // namespace internal_log
}  // namespace hsarray
