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

#include "hsarray/internal/env.h"

#include <stdlib.h>

#include <cstring>
#include <optional>
#include <string>

#include "absl/container/flat_hash_map.h"

extern char** environ;

namespace hsarray {
namespace internal {

absl::flat_hash_map<std::string, std::string> GetEnvironmentMap() {
  absl::flat_hash_map<std::string, std::string> result;
  for (char** p = environ; *p; ++p) {
    if (const char* eq = std::strchr(*p, '=')) {
      result[std::string(*p, eq - *p)] = eq + 1;
    }
  }
  return result;
}

std::optional<std::string> GetEnv(const char* variable) {
  const char* value = ::getenv(variable);
  if (value == nullptr) return std::nullopt;
  return std::string(value);
}

void SetEnv(const char* variable, const char* value) {
  ::setenv(variable, value, 1);
}

void UnsetEnv(const char* variable) { ::unsetenv(variable); }

}  // namespace internal
}  // namespace hsarray
