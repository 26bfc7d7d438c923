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

#ifndef HSARRAY_QUERY_PARAM_H_
#define HSARRAY_QUERY_PARAM_H_

#include <string_view>
#include <vector>

#include "hsarray/index.h"
#include "hsarray/shape.h"
#include "hsarray/util/result.h"

namespace hsarray {

/// Decoded form of a wire selection string.
struct WireSelection {
  /// Selected coordinates along each axis, in increasing order.  The
  /// selection is the Cartesian product of the per-axis coordinates.
  std::vector<std::vector<Index>> coordinates;

  /// Axes indexed by a bare integer.
  std::vector<bool> scalar;

  Index num_elements() const;

  /// Shape of the selected block with scalar axes removed.
  std::vector<Index> mshape() const;
};

/// Parses a selection string produced by `Selection::GetQueryParam`.
///
/// Each axis is one of `i`, `start:stop`, `start:stop:step` (with
/// `start` and `stop` optional) or a bracketed list `[i0,i1,...]`.
///
/// \error `absl::StatusCode::kInvalidArgument` if `select` is malformed or
///     its rank does not match `shape`.
/// \error `absl::StatusCode::kOutOfRange` if a coordinate lies outside
///     `shape`.
Result<WireSelection> ParseQueryParam(std::string_view select,
                                      const Shape& shape);

}  // namespace hsarray

#endif  // HSARRAY_QUERY_PARAM_H_
