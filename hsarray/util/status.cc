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

#include "hsarray/util/status.h"

#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"

namespace hsarray {
namespace internal {

absl::Status MaybeAnnotateStatusImpl(absl::Status source,
                                     std::string_view prefix_message,
                                     std::optional<absl::StatusCode> new_code) {
  if (source.ok()) return source;
  std::string message(prefix_message);
  if (!source.message().empty()) {
    absl::StrAppend(&message, message.empty() ? "" : ": ", source.message());
  }
  absl::Status annotated(new_code.value_or(source.code()), message);
  source.ForEachPayload([&](std::string_view url, const absl::Cord& payload) {
    annotated.SetPayload(url, payload);
  });
  return annotated;
}

void FatalStatus(const char* message, const absl::Status& status,
                 const char* file, int line) {
  ABSL_LOG(FATAL).AtLocation(file, line) << message << ": " << status;
  std::abort();
}

}  // namespace internal
}  // namespace hsarray
