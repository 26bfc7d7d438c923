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

#ifndef HSARRAY_INTERNAL_ENV_H_
#define HSARRAY_INTERNAL_ENV_H_

#include <optional>
#include <string>

#include "absl/container/flat_hash_map.h"

namespace hsarray {
namespace internal {

/// Returns a snapshot of the process environment.
absl::flat_hash_map<std::string, std::string> GetEnvironmentMap();

/// Returns the value of the environment variable `variable`, if set.
std::optional<std::string> GetEnv(const char* variable);

/// Sets `variable` to `value` in the process environment.
void SetEnv(const char* variable, const char* value);

/// Removes `variable` from the process environment.
void UnsetEnv(const char* variable);

}  // namespace internal
}  // namespace hsarray

#endif  // HSARRAY_INTERNAL_ENV_H_
