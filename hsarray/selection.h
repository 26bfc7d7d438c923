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

#ifndef HSARRAY_SELECTION_H_
#define HSARRAY_SELECTION_H_

/// \file
/// Interpretation of index expressions against the shape of an array.
///
/// `Select` follows NumPy indexing rules, restricted to what the array
/// service can transfer in a single request: index lists must be strictly
/// increasing, and steps must be positive.

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/types/span.h"
#include "hsarray/index.h"
#include "hsarray/index_expression.h"
#include "hsarray/shape.h"
#include "hsarray/util/result.h"

namespace hsarray {

enum class SelectionKind {
  /// Every element of a simple shape.
  kAll,
  /// No elements.  The only selection of a null shape.
  kNone,
  /// Strided rectangular region (hyperslab).
  kSimple,
  /// Hyperslab with index lists on one or more axes.
  kFancy,
  /// Explicit list of coordinates.
  kPoints,
  /// The single element of a scalar shape.
  kScalar,
};

std::string_view ToString(SelectionKind kind);
std::ostream& operator<<(std::ostream& os, SelectionKind kind);

/// Selection along one axis of a `kAll`, `kSimple` or `kFancy` selection.
struct SelectionAxis {
  Index start = 0;
  Index count = 0;
  Index step = 1;

  /// Axis was indexed by an integer and does not appear in `mshape`.
  bool scalar = false;

  /// Strictly increasing coordinates, for an axis indexed by a list.
  /// `start` and `count` then describe the first coordinate and the list
  /// size.
  std::optional<std::vector<Index>> indices;

  /// Returns the exclusive upper bound of the selected range, clipped to
  /// `extent`.
  Index stop(Index extent) const;

  friend bool operator==(const SelectionAxis& a, const SelectionAxis& b);
  friend bool operator!=(const SelectionAxis& a, const SelectionAxis& b) {
    return !(a == b);
  }
};

/// Result of applying an index expression to a shape.
class Selection {
 public:
  /// Selects every element of `shape`.  For a scalar shape this is the
  /// `kScalar` selection with `mshape() == {}`; for a null shape it is
  /// `kNone`.
  static Selection All(const Shape& shape);

  /// Selects no elements of `shape`.
  static Selection None(const Shape& shape);

  /// Constructs a `kSimple` (or `kAll`) selection from per-axis ranges.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if `shape` is not simple,
  ///     the rank does not match, a step is not positive or an axis carries
  ///     an index list.
  /// \error `absl::StatusCode::kOutOfRange` if a range exceeds the extent.
  static Result<Selection> Hyperslab(const Shape& shape,
                                     std::vector<SelectionAxis> axes);

  SelectionKind kind() const { return kind_; }
  const Shape& shape() const { return shape_; }

  /// Per-axis selection; empty unless `kind()` is `kAll`, `kSimple` or
  /// `kFancy`.
  absl::Span<const SelectionAxis> axes() const { return axes_; }

  /// Selected coordinates of a `kPoints` selection, each of length
  /// `shape().rank()`.
  const std::vector<std::vector<Index>>& points() const { return points_; }

  /// Shape of the result of the selection.  `std::nullopt` when the result
  /// is not an array, namely for `()` on a scalar shape and for null shapes.
  const std::optional<std::vector<Index>>& mshape() const { return mshape_; }

  /// Number of selected elements.
  Index nselect() const;

  /// Returns the wire selection string, e.g. `"[2:6:2,3,0:10]"` or
  /// `"[0:4,[1,2,5]]"`, or `std::nullopt` for scalar, empty and point
  /// selections, which are not expressed as a query parameter.
  std::optional<std::string> GetQueryParam() const;

  /// Computes the tile shape for writing an array of `target_shape` into
  /// this selection by replication.
  ///
  /// The returned shape has one entry per axis of `shape()`; scalar axes and
  /// axes broadcast from extent 1 have tile extent 1.  Tiling the selection
  /// with the returned shape covers each selected element exactly once.
  ///
  /// \error `absl::StatusCode::kFailedPrecondition` if `target_shape` is
  ///     not broadcastable to `mshape()`.
  /// \error `absl::StatusCode::kUnimplemented` for `kFancy`, `kPoints` and
  ///     `kNone` selections.
  Result<std::vector<Index>> Broadcast(
      absl::Span<const Index> target_shape) const;

  friend bool operator==(const Selection& a, const Selection& b);
  friend bool operator!=(const Selection& a, const Selection& b) {
    return !(a == b);
  }
  friend std::ostream& operator<<(std::ostream& os, const Selection& s);

 private:
  friend Result<Selection> Select(const Shape& shape,
                                  const IndexExpression& expr);
  friend Result<Selection> SelectPoints(
      const Shape& shape, std::vector<std::vector<Index>> points);

  Selection() = default;

  SelectionKind kind_ = SelectionKind::kNone;
  Shape shape_;
  std::vector<SelectionAxis> axes_;
  std::vector<std::vector<Index>> points_;
  std::optional<std::vector<Index>> mshape_;
};

/// Applies a NumPy-style index expression to `shape`.
///
/// \error `absl::StatusCode::kInvalidArgument` if the expression is not a
///     valid index of `shape`: too many terms, more than one ellipsis, a
///     non-positive step, an index list that is not strictly increasing, or
///     a mask whose shape does not fit.
/// \error `absl::StatusCode::kOutOfRange` if an integer index or list entry
///     is outside its axis.
Result<Selection> Select(const Shape& shape, const IndexExpression& expr);

/// Selects explicit coordinates of a simple `shape`.
///
/// \error `absl::StatusCode::kInvalidArgument` if `shape` is not simple or
///     a coordinate has the wrong number of entries.
/// \error `absl::StatusCode::kOutOfRange` if a coordinate is outside
///     `shape`.
Result<Selection> SelectPoints(const Shape& shape,
                               std::vector<std::vector<Index>> points);

}  // namespace hsarray

#endif  // HSARRAY_SELECTION_H_
