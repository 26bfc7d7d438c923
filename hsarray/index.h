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

#ifndef HSARRAY_INDEX_H_
#define HSARRAY_INDEX_H_

#include <cstddef>
#include <cstdint>

namespace hsarray {

/// Type for representing a coordinate in, or a extent of, a multi-dimensional
/// array.
using Index = std::int64_t;

/// Type for representing a dimension index or rank.
using DimensionIndex = std::ptrdiff_t;

/// Maximum supported rank.
constexpr DimensionIndex kMaxRank = 32;

/// Item size reported for element types without a fixed byte size.
constexpr Index kVariableItemSize = -1;

/// Maximum extent value indicating an axis that may grow without bound.
constexpr Index kUnlimited = -1;

}  // namespace hsarray

#endif  // HSARRAY_INDEX_H_
