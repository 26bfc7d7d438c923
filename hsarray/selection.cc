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

#include "hsarray/selection.h"

#include <algorithm>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "absl/base/optimization.h"
#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/strings/str_join.h"
#include "absl/types/span.h"
#include "hsarray/index.h"
#include "hsarray/index_expression.h"
#include "hsarray/internal/log/verbose_flag.h"
#include "hsarray/shape.h"
#include "hsarray/util/result.h"
#include "hsarray/util/status.h"
#include "hsarray/util/str_cat.h"

namespace hsarray {

namespace {
ABSL_CONST_INIT internal_log::VerboseFlag selection_logging("selection");
}  // namespace

std::string_view ToString(SelectionKind kind) {
  switch (kind) {
    case SelectionKind::kAll:
      return "all";
    case SelectionKind::kNone:
      return "none";
    case SelectionKind::kSimple:
      return "simple";
    case SelectionKind::kFancy:
      return "fancy";
    case SelectionKind::kPoints:
      return "points";
    case SelectionKind::kScalar:
      return "scalar";
  }
  ABSL_UNREACHABLE();
}

std::ostream& operator<<(std::ostream& os, SelectionKind kind) {
  return os << ToString(kind);
}

Index SelectionAxis::stop(Index extent) const {
  if (indices) return indices->empty() ? start : indices->back() + 1;
  if (count == 0) return start;
  return std::min(start + count * step, extent);
}

bool operator==(const SelectionAxis& a, const SelectionAxis& b) {
  return a.start == b.start && a.count == b.count && a.step == b.step &&
         a.scalar == b.scalar && a.indices == b.indices;
}

namespace {

bool IsFullAxis(const SelectionAxis& axis, Index extent) {
  return !axis.scalar && !axis.indices && axis.start == 0 && axis.step == 1 &&
         axis.count == extent;
}

// Resolves a possibly negative integer index.
Result<Index> ResolveIndex(Index index, DimensionIndex dim, Index extent) {
  const Index resolved = index < 0 ? index + extent : index;
  if (resolved < 0 || resolved >= extent) {
    return absl::OutOfRangeError(StrCat("Index ", index,
                                        " is out of bounds for axis ", dim,
                                        " with extent ", extent));
  }
  return resolved;
}

// Resolves a slice bound with NumPy's clamping rules for a positive step.
Index ResolveBound(const std::optional<Index>& bound, Index extent,
                   Index default_value) {
  if (!bound) return default_value;
  Index value = *bound;
  if (value < 0) value = std::max<Index>(0, value + extent);
  return std::min(value, extent);
}

Result<SelectionAxis> ResolveSlice(const Slice& slice, Index extent) {
  SelectionAxis axis;
  axis.step = slice.step.value_or(1);
  if (axis.step < 1) {
    return absl::InvalidArgumentError(
        StrCat("Step must be >= 1 (got ", axis.step, ")"));
  }
  axis.start = ResolveBound(slice.start, extent, 0);
  const Index stop = ResolveBound(slice.stop, extent, extent);
  axis.count = stop <= axis.start ? 0 : 1 + (stop - axis.start - 1) / axis.step;
  return axis;
}

Result<SelectionAxis> ResolveIndexList(std::vector<Index> indices,
                                       DimensionIndex dim, Index extent) {
  for (Index& index : indices) {
    HSARRAY_ASSIGN_OR_RETURN(index, ResolveIndex(index, dim, extent));
  }
  for (size_t i = 1; i < indices.size(); ++i) {
    if (indices[i] <= indices[i - 1]) {
      return absl::InvalidArgumentError(
          StrCat("Index list ", indices, " for axis ", dim,
                 " must be strictly increasing"));
    }
  }
  SelectionAxis axis;
  axis.start = indices.empty() ? 0 : indices.front();
  axis.count = static_cast<Index>(indices.size());
  axis.indices = std::move(indices);
  return axis;
}

absl::Status ValidateMask(const BoolMask& mask) {
  Index num_values = 1;
  for (Index extent : mask.shape) num_values *= extent;
  if (num_values != static_cast<Index>(mask.values.size())) {
    return absl::InvalidArgumentError(
        StrCat("Boolean index array of shape ", mask.shape, " has ",
               mask.values.size(), " values"));
  }
  return absl::OkStatus();
}

Result<SelectionAxis> ResolveAxisMask(const BoolMask& mask, DimensionIndex dim,
                                      Index extent) {
  HSARRAY_RETURN_IF_ERROR(ValidateMask(mask));
  if (mask.shape.size() != 1) {
    return absl::InvalidArgumentError(
        StrCat("Boolean index array for axis ", dim, " must be rank 1, but "
               "has shape ", mask.shape));
  }
  if (mask.shape[0] != extent) {
    return absl::InvalidArgumentError(
        StrCat("Boolean index array of length ", mask.shape[0],
               " does not match extent ", extent, " of axis ", dim));
  }
  std::vector<Index> indices;
  for (Index i = 0; i < extent; ++i) {
    if (mask.values[i]) indices.push_back(i);
  }
  return ResolveIndexList(std::move(indices), dim, extent);
}

// Replaces the ellipsis, or appends one, so that there is one term per axis.
Result<std::vector<IndexTerm>> ExpandEllipsis(const IndexExpression& expr,
                                              const Shape& shape) {
  const DimensionIndex rank = shape.rank();
  const auto& terms = expr.terms();
  const auto num_ellipsis =
      std::count_if(terms.begin(), terms.end(), [](const IndexTerm& t) {
        return std::holds_alternative<Ellipsis>(t);
      });
  if (num_ellipsis > 1) {
    return absl::InvalidArgumentError(
        StrCat("Only one ellipsis may be used: ", expr));
  }
  const DimensionIndex num_indexed =
      static_cast<DimensionIndex>(terms.size()) - num_ellipsis;
  if (num_indexed > rank) {
    return absl::InvalidArgumentError(StrCat(
        "Index ", expr, " has too many terms for array of shape ", shape));
  }
  std::vector<IndexTerm> expanded;
  expanded.reserve(rank);
  bool expanded_ellipsis = false;
  for (const auto& term : terms) {
    if (std::holds_alternative<Ellipsis>(term)) {
      expanded.insert(expanded.end(), rank - num_indexed, Slice{});
      expanded_ellipsis = true;
    } else {
      expanded.push_back(term);
    }
  }
  if (!expanded_ellipsis) {
    expanded.insert(expanded.end(), rank - num_indexed, Slice{});
  }
  return expanded;
}

Result<Selection> MaskToPoints(const Shape& shape, const BoolMask& mask) {
  HSARRAY_RETURN_IF_ERROR(ValidateMask(mask));
  const auto extents = shape.extents();
  std::vector<std::vector<Index>> points;
  std::vector<Index> coord(extents.size(), 0);
  for (size_t i = 0; i < mask.values.size(); ++i) {
    if (mask.values[i]) points.push_back(coord);
    for (DimensionIndex dim = static_cast<DimensionIndex>(coord.size()) - 1;
         dim >= 0; --dim) {
      if (++coord[dim] < extents[dim]) break;
      coord[dim] = 0;
    }
  }
  return SelectPoints(shape, std::move(points));
}

std::vector<Index> ComputeMShape(absl::Span<const SelectionAxis> axes) {
  std::vector<Index> mshape;
  for (const auto& axis : axes) {
    if (!axis.scalar) mshape.push_back(axis.count);
  }
  return mshape;
}

void AppendAxisParam(std::string* out, const SelectionAxis& axis,
                     Index extent) {
  if (axis.indices) {
    StrAppend(out, "[", absl::StrJoin(*axis.indices, ","), "]");
  } else if (axis.scalar) {
    StrAppend(out, axis.start);
  } else {
    StrAppend(out, axis.start, ":", axis.stop(extent));
    if (axis.step != 1) StrAppend(out, ":", axis.step);
  }
}

}  // namespace

Selection Selection::All(const Shape& shape) {
  if (shape.is_null()) return None(shape);
  Selection s;
  s.shape_ = shape;
  if (shape.is_scalar()) {
    s.kind_ = SelectionKind::kScalar;
    s.mshape_.emplace();
    return s;
  }
  s.kind_ = SelectionKind::kAll;
  for (Index extent : shape.extents()) {
    SelectionAxis axis;
    axis.count = extent;
    s.axes_.push_back(axis);
  }
  s.mshape_.emplace(shape.extents().begin(), shape.extents().end());
  return s;
}

Selection Selection::None(const Shape& shape) {
  Selection s;
  s.kind_ = SelectionKind::kNone;
  s.shape_ = shape;
  if (shape.kind() == ShapeKind::kSimple) {
    s.mshape_.emplace(shape.rank(), 0);
  }
  return s;
}

Result<Selection> Selection::Hyperslab(const Shape& shape,
                                       std::vector<SelectionAxis> axes) {
  if (shape.kind() != ShapeKind::kSimple) {
    return absl::InvalidArgumentError(
        StrCat("Hyperslab selection requires a simple shape, but received: ",
               shape));
  }
  if (static_cast<DimensionIndex>(axes.size()) != shape.rank()) {
    return absl::InvalidArgumentError(
        StrCat("Hyperslab rank ", axes.size(), " does not match shape ",
               shape));
  }
  bool all = true;
  for (DimensionIndex dim = 0; dim < shape.rank(); ++dim) {
    const auto& axis = axes[dim];
    const Index extent = shape[dim];
    if (axis.indices) {
      return absl::InvalidArgumentError(
          "Hyperslab selection cannot contain index lists");
    }
    if (axis.step < 1 || axis.count < 0 || (axis.scalar && axis.count != 1)) {
      return absl::InvalidArgumentError(
          StrCat("Invalid hyperslab range for axis ", dim, ": start=",
                 axis.start, ", count=", axis.count, ", step=", axis.step));
    }
    const Index last = axis.start + (axis.count - 1) * axis.step;
    if (axis.start < 0 || (axis.count > 0 && last >= extent)) {
      return absl::OutOfRangeError(
          StrCat("Hyperslab range for axis ", dim, " (start=", axis.start,
                 ", count=", axis.count, ", step=", axis.step,
                 ") exceeds extent ", extent));
    }
    all = all && IsFullAxis(axis, extent);
  }
  Selection s;
  s.kind_ = all ? SelectionKind::kAll : SelectionKind::kSimple;
  s.shape_ = shape;
  s.mshape_ = ComputeMShape(axes);
  s.axes_ = std::move(axes);
  return s;
}

Index Selection::nselect() const {
  switch (kind_) {
    case SelectionKind::kNone:
      return 0;
    case SelectionKind::kScalar:
      return 1;
    case SelectionKind::kPoints:
      return static_cast<Index>(points_.size());
    default:
      break;
  }
  Index n = 1;
  for (const auto& axis : axes_) n *= axis.count;
  return n;
}

std::optional<std::string> Selection::GetQueryParam() const {
  switch (kind_) {
    case SelectionKind::kAll:
    case SelectionKind::kSimple:
    case SelectionKind::kFancy:
      break;
    default:
      return std::nullopt;
  }
  std::string param = "[";
  for (DimensionIndex dim = 0; dim < shape_.rank(); ++dim) {
    if (dim != 0) param += ',';
    AppendAxisParam(&param, axes_[dim], shape_[dim]);
  }
  param += ']';
  return param;
}

Result<std::vector<Index>> Selection::Broadcast(
    absl::Span<const Index> target_shape) const {
  switch (kind_) {
    case SelectionKind::kScalar: {
      Index n = 1;
      for (Index extent : target_shape) n *= extent;
      if (n != 1) {
        return absl::FailedPreconditionError(
            StrCat("Can't broadcast ", target_shape, " to scalar"));
      }
      return std::vector<Index>();
    }
    case SelectionKind::kAll:
    case SelectionKind::kSimple:
      break;
    default:
      return absl::UnimplementedError(StrCat(
          "Broadcasting is not supported for ", kind_, " selections"));
  }
  const DimensionIndex rank = shape_.rank();
  std::vector<Index> tile(rank, 1);
  DimensionIndex remaining = static_cast<DimensionIndex>(target_shape.size());
  for (DimensionIndex dim = rank - 1; dim >= 0; --dim) {
    const auto& axis = axes_[dim];
    if (remaining == 0 || axis.scalar) continue;
    const Index t = target_shape[--remaining];
    if (t != 1 && t != axis.count) {
      return absl::FailedPreconditionError(
          StrCat("Can't broadcast ", target_shape, " to selection shape ",
                 *mshape_));
    }
    tile[dim] = t;
  }
  for (DimensionIndex i = 0; i < remaining; ++i) {
    if (target_shape[i] != 1) {
      return absl::FailedPreconditionError(
          StrCat("Can't broadcast ", target_shape, " to selection shape ",
                 *mshape_));
    }
  }
  return tile;
}

bool operator==(const Selection& a, const Selection& b) {
  return a.kind_ == b.kind_ && a.shape_ == b.shape_ && a.axes_ == b.axes_ &&
         a.points_ == b.points_ && a.mshape_ == b.mshape_;
}

std::ostream& operator<<(std::ostream& os, const Selection& s) {
  os << "Selection(" << s.kind_ << ", shape=" << s.shape_;
  if (auto param = s.GetQueryParam()) {
    os << ", select=" << *param;
  }
  if (s.kind_ == SelectionKind::kPoints) {
    os << ", points=" << s.points_.size();
  }
  return os << ")";
}

Result<Selection> Select(const Shape& shape, const IndexExpression& expr) {
  const auto& terms = expr.terms();
  const bool lone_ellipsis =
      terms.size() == 1 && std::holds_alternative<Ellipsis>(terms[0]);
  if (shape.is_null()) {
    if (terms.empty() || lone_ellipsis) return Selection::None(shape);
    return absl::InvalidArgumentError(
        StrCat("Empty datasets cannot be sliced: ", expr));
  }
  if (shape.is_scalar()) {
    if (lone_ellipsis) return Selection::All(shape);
    if (!terms.empty()) {
      return absl::InvalidArgumentError(
          StrCat("Invalid index ", expr,
                 " for scalar dataset (only ... and () are allowed)"));
    }
    Selection s;
    s.kind_ = SelectionKind::kScalar;
    s.shape_ = shape;
    return s;
  }
  if (terms.size() == 1) {
    if (const auto* mask = std::get_if<BoolMask>(&terms[0])) {
      if (mask->shape.size() > 1 ||
          absl::Span<const Index>(mask->shape) == shape.extents()) {
        if (absl::Span<const Index>(mask->shape) != shape.extents()) {
          return absl::InvalidArgumentError(
              StrCat("Boolean index array of shape ", mask->shape,
                     " does not match array shape ", shape));
        }
        return MaskToPoints(shape, *mask);
      }
    }
  }

  HSARRAY_ASSIGN_OR_RETURN(auto expanded, ExpandEllipsis(expr, shape));
  Selection s;
  s.shape_ = shape;
  bool fancy = false;
  bool all = true;
  for (DimensionIndex dim = 0; dim < shape.rank(); ++dim) {
    const Index extent = shape[dim];
    const auto& term = expanded[dim];
    SelectionAxis axis;
    if (const auto* index = std::get_if<Index>(&term)) {
      HSARRAY_ASSIGN_OR_RETURN(axis.start, ResolveIndex(*index, dim, extent));
      axis.count = 1;
      axis.scalar = true;
    } else if (const auto* slice = std::get_if<Slice>(&term)) {
      HSARRAY_ASSIGN_OR_RETURN(axis, ResolveSlice(*slice, extent));
    } else if (const auto* list = std::get_if<IndexList>(&term)) {
      HSARRAY_ASSIGN_OR_RETURN(axis,
                               ResolveIndexList(list->indices, dim, extent));
      fancy = true;
    } else if (const auto* mask = std::get_if<BoolMask>(&term)) {
      HSARRAY_ASSIGN_OR_RETURN(axis, ResolveAxisMask(*mask, dim, extent));
      fancy = true;
    }
    all = all && IsFullAxis(axis, extent);
    s.axes_.push_back(std::move(axis));
  }
  s.kind_ = fancy ? SelectionKind::kFancy
                  : (all ? SelectionKind::kAll : SelectionKind::kSimple);
  s.mshape_ = ComputeMShape(s.axes_);
  ABSL_LOG_IF(INFO, selection_logging)
      << "Select " << expr << " on " << shape << ": " << s;
  return s;
}

Result<Selection> SelectPoints(const Shape& shape,
                               std::vector<std::vector<Index>> points) {
  if (shape.kind() != ShapeKind::kSimple) {
    return absl::InvalidArgumentError(
        StrCat("Point selection requires a simple shape, but received: ",
               shape));
  }
  const auto extents = shape.extents();
  for (size_t i = 0; i < points.size(); ++i) {
    const auto& point = points[i];
    if (static_cast<DimensionIndex>(point.size()) != shape.rank()) {
      return absl::InvalidArgumentError(
          StrCat("Point ", point, " does not match rank of shape ", shape));
    }
    for (DimensionIndex dim = 0; dim < shape.rank(); ++dim) {
      if (point[dim] < 0 || point[dim] >= extents[dim]) {
        return absl::OutOfRangeError(
            StrCat("Point ", point, " is out of bounds for shape ", shape));
      }
    }
    if (shape.rank() == 1 && i > 0 && point[0] <= points[i - 1][0]) {
      return absl::InvalidArgumentError(
          "Index points must be strictly increasing");
    }
  }
  Selection s;
  s.kind_ = SelectionKind::kPoints;
  s.shape_ = shape;
  s.mshape_.emplace(1, static_cast<Index>(points.size()));
  s.points_ = std::move(points);
  ABSL_LOG_IF(INFO, selection_logging)
      << "SelectPoints on " << shape << ": " << s.points_.size() << " points";
  return s;
}

}  // namespace hsarray
