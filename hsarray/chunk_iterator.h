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

#ifndef HSARRAY_CHUNK_ITERATOR_H_
#define HSARRAY_CHUNK_ITERATOR_H_

#include <iosfwd>
#include <optional>
#include <vector>

#include "hsarray/chunk_layout.h"
#include "hsarray/index.h"
#include "hsarray/selection.h"
#include "hsarray/shape.h"
#include "hsarray/util/result.h"

namespace hsarray {

/// Intersection of one storage chunk with a selection: the half-open range
/// `[start[i], stop[i])` along each axis.
struct ChunkRegion {
  std::vector<Index> start;
  std::vector<Index> stop;

  Index num_elements() const;

  friend bool operator==(const ChunkRegion& a, const ChunkRegion& b) {
    return a.start == b.start && a.stop == b.stop;
  }
  friend bool operator!=(const ChunkRegion& a, const ChunkRegion& b) {
    return !(a == b);
  }
  friend std::ostream& operator<<(std::ostream& os, const ChunkRegion& r);
};

/// Forward-only cursor over the chunk-aligned pieces of a selection.
///
/// Regions are produced in row-major chunk order (the last axis varies
/// fastest) and together cover every selected element exactly once.
///
/// Example::
///
///     HSARRAY_ASSIGN_OR_RETURN(auto it,
///                              ChunkIterator::Make(shape, layout, &sel));
///     while (auto region = it.Next()) {
///       HSARRAY_ASSIGN_OR_RETURN(auto piece, it.ToSelection(*region));
///       ...
///     }
class ChunkIterator {
 public:
  /// Constructs an iterator over `selection`, or over all of `shape` if
  /// `selection` is `nullptr`.
  ///
  /// Null and scalar shapes, and empty selections, produce no regions.
  ///
  /// \error `absl::StatusCode::kFailedPrecondition` if `layout` is
  ///     `std::nullopt`.
  /// \error `absl::StatusCode::kInvalidArgument` if the layout rank does not
  ///     match `shape`, or `selection` is not a unit-step hyperslab of
  ///     `shape`.
  static Result<ChunkIterator> Make(const Shape& shape,
                                    const std::optional<ChunkLayout>& layout,
                                    const Selection* selection = nullptr);

  /// Returns the next region, or `std::nullopt` once the selection is
  /// exhausted.
  std::optional<ChunkRegion> Next();

  /// Converts `region` to a selection of the iterated shape.  Axes indexed
  /// by an integer in the original selection remain scalar.
  Result<Selection> ToSelection(const ChunkRegion& region) const;

 private:
  ChunkIterator() = default;

  Shape shape_;
  std::vector<Index> chunk_extents_;
  std::vector<Index> sel_start_;
  std::vector<Index> sel_stop_;
  std::vector<bool> scalar_;
  std::vector<Index> first_chunk_;
  std::vector<Index> chunk_index_;
  bool done_ = true;
};

}  // namespace hsarray

#endif  // HSARRAY_CHUNK_ITERATOR_H_
