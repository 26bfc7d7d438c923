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

#ifndef HSARRAY_UTIL_STATUS_H_
#define HSARRAY_UTIL_STATUS_H_

#include <optional>
#include <string_view>
#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"

namespace hsarray {
namespace internal {

absl::Status MaybeAnnotateStatusImpl(absl::Status source,
                                     std::string_view prefix_message,
                                     std::optional<absl::StatusCode> new_code);

/// Logs `message` and `status` at `file:line` and terminates.
[[noreturn]] void FatalStatus(const char* message, const absl::Status& status,
                              const char* file, int line);

}  // namespace internal

/// Prefixes the message of an error `source` with `message`, giving
/// `"<message>: <source message>"`.  The code and payloads are kept.  An OK
/// `source` is returned unchanged.
inline absl::Status MaybeAnnotateStatus(absl::Status source,
                                        std::string_view message) {
  return internal::MaybeAnnotateStatusImpl(std::move(source), message,
                                           std::nullopt);
}

/// Same as above, but also replaces the code of an error `source` with
/// `new_code`.
inline absl::Status MaybeAnnotateStatus(absl::Status source,
                                        std::string_view message,
                                        absl::StatusCode new_code) {
  return internal::MaybeAnnotateStatusImpl(std::move(source), message,
                                           new_code);
}

inline const absl::Status& GetStatus(const absl::Status& status) {
  return status;
}
inline absl::Status GetStatus(absl::Status&& status) {
  return std::move(status);
}

}  // namespace hsarray

/// Returns from the enclosing function if `expr`, an `absl::Status` or
/// `Result`, is an error.
///
/// By default the error status itself is returned.  An optional second
/// argument gives the value to return instead, with the status bound to `_`:
///
///     HSARRAY_RETURN_IF_ERROR(
///         transport.Store(request, payload),
///         MaybeAnnotateStatus(_, StrCat("Error writing ", request.id)));
///
/// `expr` must not contain unparenthesized commas.
#define HSARRAY_RETURN_IF_ERROR(...) \
  HSARRAY_INTERNAL_RETURN_IF_ERROR_IMPL(__VA_ARGS__, _)

#define HSARRAY_INTERNAL_RETURN_IF_ERROR_IMPL(expr, error_expr, ...) \
  for (absl::Status _ = ::hsarray::GetStatus(expr);                  \
       ABSL_PREDICT_FALSE(!_.ok());)                                 \
  return error_expr /**/

#endif  // HSARRAY_UTIL_STATUS_H_
