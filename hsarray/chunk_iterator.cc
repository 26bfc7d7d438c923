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

#include "hsarray/chunk_iterator.h"

#include <algorithm>
#include <optional>
#include <ostream>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "hsarray/chunk_layout.h"
#include "hsarray/index.h"
#include "hsarray/selection.h"
#include "hsarray/shape.h"
#include "hsarray/util/result.h"
#include "hsarray/util/str_cat.h"

namespace hsarray {

Index ChunkRegion::num_elements() const {
  Index n = 1;
  for (size_t i = 0; i < start.size(); ++i) n *= stop[i] - start[i];
  return n;
}

std::ostream& operator<<(std::ostream& os, const ChunkRegion& r) {
  os << "{";
  for (size_t i = 0; i < r.start.size(); ++i) {
    if (i != 0) os << ", ";
    os << "[" << r.start[i] << ", " << r.stop[i] << ")";
  }
  return os << "}";
}

Result<ChunkIterator> ChunkIterator::Make(
    const Shape& shape, const std::optional<ChunkLayout>& layout,
    const Selection* selection) {
  if (!layout) {
    return absl::FailedPreconditionError("Chunked dataset required");
  }
  ChunkIterator it;
  it.shape_ = shape;
  if (shape.kind() != ShapeKind::kSimple || shape.rank() == 0) return it;
  if (layout->rank() != shape.rank()) {
    return absl::InvalidArgumentError(
        StrCat("Chunk layout ", *layout, " does not match rank of shape ",
               shape));
  }
  const Selection all = Selection::All(shape);
  if (!selection) selection = &all;
  if (selection->shape() != shape) {
    return absl::InvalidArgumentError(
        StrCat("Selection shape ", selection->shape(),
               " does not match shape ", shape));
  }
  if (selection->kind() == SelectionKind::kNone) return it;
  if (selection->kind() != SelectionKind::kAll &&
      selection->kind() != SelectionKind::kSimple) {
    return absl::InvalidArgumentError(
        StrCat("Chunk iteration requires a hyperslab selection, but received: ",
               *selection));
  }
  it.chunk_extents_.assign(layout->extents().begin(), layout->extents().end());
  bool empty = false;
  DimensionIndex dim = 0;
  for (const auto& axis : selection->axes()) {
    if (axis.step != 1) {
      return absl::InvalidArgumentError(
          StrCat("Chunk iteration requires unit steps, but received: ",
                 *selection));
    }
    it.sel_start_.push_back(axis.start);
    it.sel_stop_.push_back(axis.start + axis.count);
    it.scalar_.push_back(axis.scalar);
    it.first_chunk_.push_back(axis.start / it.chunk_extents_[dim++]);
    empty = empty || axis.count == 0;
  }
  it.chunk_index_ = it.first_chunk_;
  it.done_ = empty;
  return it;
}

std::optional<ChunkRegion> ChunkIterator::Next() {
  if (done_) return std::nullopt;
  const DimensionIndex rank = static_cast<DimensionIndex>(sel_start_.size());
  ChunkRegion region;
  region.start.resize(rank);
  region.stop.resize(rank);
  for (DimensionIndex dim = 0; dim < rank; ++dim) {
    const Index chunk_begin = chunk_index_[dim] * chunk_extents_[dim];
    region.start[dim] = std::max(chunk_begin, sel_start_[dim]);
    region.stop[dim] =
        std::min(chunk_begin + chunk_extents_[dim], sel_stop_[dim]);
  }
  DimensionIndex dim = rank - 1;
  for (; dim >= 0; --dim) {
    if (++chunk_index_[dim] * chunk_extents_[dim] < sel_stop_[dim]) break;
    chunk_index_[dim] = first_chunk_[dim];
  }
  if (dim < 0) done_ = true;
  return region;
}

Result<Selection> ChunkIterator::ToSelection(const ChunkRegion& region) const {
  std::vector<SelectionAxis> axes(region.start.size());
  for (size_t dim = 0; dim < axes.size(); ++dim) {
    axes[dim].start = region.start[dim];
    axes[dim].count = region.stop[dim] - region.start[dim];
    axes[dim].scalar = dim < scalar_.size() && scalar_[dim];
  }
  return Selection::Hyperslab(shape_, std::move(axes));
}

}  // namespace hsarray
