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

#ifndef HSARRAY_CHUNK_LAYOUT_H_
#define HSARRAY_CHUNK_LAYOUT_H_

#include <iosfwd>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>
#include "absl/types/span.h"
#include "hsarray/index.h"
#include "hsarray/shape.h"
#include "hsarray/util/result.h"

namespace hsarray {

/// Per-axis extent of the storage chunks of an array.
class ChunkLayout {
 public:
  /// Validates `extents`.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if `extents` is empty or any
  ///     extent is not positive.
  static Result<ChunkLayout> Create(absl::Span<const Index> extents);

  /// Same as `Create`, but additionally requires the rank to match `shape`.
  static Result<ChunkLayout> CreateFor(const Shape& shape,
                                       absl::Span<const Index> extents);

  DimensionIndex rank() const {
    return static_cast<DimensionIndex>(extents_.size());
  }
  absl::Span<const Index> extents() const { return extents_; }
  Index operator[](DimensionIndex i) const { return extents_[i]; }

  /// Number of chunks along `dim` needed to cover `[0, extent)`.
  Index GridExtent(DimensionIndex dim, Index extent) const {
    return (extent + extents_[dim] - 1) / extents_[dim];
  }

  friend bool operator==(const ChunkLayout& a, const ChunkLayout& b) {
    return a.extents_ == b.extents_;
  }
  friend bool operator!=(const ChunkLayout& a, const ChunkLayout& b) {
    return !(a == b);
  }
  friend std::ostream& operator<<(std::ostream& os, const ChunkLayout& layout);

 private:
  explicit ChunkLayout(std::vector<Index> extents)
      : extents_(std::move(extents)) {}

  std::vector<Index> extents_;
};

/// Parses the `layout` member of dataset creation properties.
///
/// `H5D_CHUNKED` and the `H5D_CHUNKED_REF*` classes carry a `dims` member
/// and yield a layout; `H5D_CONTIGUOUS` and `H5D_COMPACT` yield
/// `std::nullopt`.
///
/// \error `absl::StatusCode::kInvalidArgument` if `j` is malformed.
Result<std::optional<ChunkLayout>> ParseChunkLayout(const ::nlohmann::json& j);

/// Converts a layout (or its absence) to the JSON accepted by
/// `ParseChunkLayout`.
::nlohmann::json ChunkLayoutToJson(const std::optional<ChunkLayout>& layout);

/// Chooses a chunk layout for an array of `shape` with `item_size`-byte
/// elements.
///
/// Chunks target between 8 KiB and 1 MiB, scaled with the total array size.
/// Axes are halved in turn, starting from the first, until the chunk is close
/// to the target.  Zero extents are treated as `1024` since the array may
/// grow.
///
/// \error `absl::StatusCode::kInvalidArgument` if `shape` is not simple with
///     rank >= 1, or `item_size` is not positive.
Result<ChunkLayout> GuessChunkLayout(const Shape& shape, Index item_size);

}  // namespace hsarray

#endif  // HSARRAY_CHUNK_LAYOUT_H_
