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

#ifndef HSARRAY_SHAPE_H_
#define HSARRAY_SHAPE_H_

#include <iosfwd>
#include <optional>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include "absl/types/span.h"
#include "hsarray/index.h"
#include "hsarray/util/result.h"

namespace hsarray {

/// Distinguishes the three kinds of dataspace.
enum class ShapeKind {
  /// No elements and no axes; cannot be indexed.
  kNull,
  /// A single element with zero axes.
  kScalar,
  /// Zero or more axes with non-negative extents.
  kSimple,
};

std::string_view ToString(ShapeKind kind);
std::ostream& operator<<(std::ostream& os, ShapeKind kind);

/// Extent of a logical array.
///
/// A default-constructed `Shape` is scalar.
class Shape {
 public:
  Shape() = default;

  /// Constructs a simple shape.
  ///
  /// \dchecks every extent is non-negative and the rank is at most
  ///     `kMaxRank`.
  explicit Shape(std::vector<Index> extents);

  static Shape Null();
  static Shape Scalar();

  /// Constructs a simple shape, validating `extents`.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if any extent is negative or
  ///     the rank exceeds `kMaxRank`.
  static Result<Shape> Simple(absl::Span<const Index> extents);

  ShapeKind kind() const { return kind_; }
  bool is_null() const { return kind_ == ShapeKind::kNull; }
  bool is_scalar() const { return kind_ == ShapeKind::kScalar; }

  /// Number of axes; `0` for null and scalar shapes.
  DimensionIndex rank() const {
    return static_cast<DimensionIndex>(extents_.size());
  }

  absl::Span<const Index> extents() const { return extents_; }
  Index operator[](DimensionIndex i) const { return extents_[i]; }

  /// Returns `0` for null, `1` for scalar, otherwise the product of the
  /// extents.
  Index num_elements() const;

  friend bool operator==(const Shape& a, const Shape& b) {
    return a.kind_ == b.kind_ && a.extents_ == b.extents_;
  }
  friend bool operator!=(const Shape& a, const Shape& b) { return !(a == b); }

  /// Prints `null`, `()` or `(a, b, ...)`.
  friend std::ostream& operator<<(std::ostream& os, const Shape& shape);

 private:
  ShapeKind kind_ = ShapeKind::kScalar;
  std::vector<Index> extents_;
};

/// Current and maximum extent of an array as reported by the service.
struct Dataspace {
  Shape shape;

  /// Per-axis maximum extents (`kUnlimited` for unbounded axes); only present
  /// for simple shapes that declare them.
  std::optional<std::vector<Index>> maxshape;

  /// Returns `true` if `new_shape` stays within `maxshape`.
  bool CanResizeTo(absl::Span<const Index> new_shape) const;
};

/// Parses the JSON shape description of a dataset.
///
/// Accepts `{"class": "H5S_NULL"}`, `{"class": "H5S_SCALAR"}` and
/// `{"class": "H5S_SIMPLE", "dims": [...], "maxdims": [...]}`, where a
/// `maxdims` entry of `0` or `"H5S_UNLIMITED"` denotes an unlimited axis.
///
/// \error `absl::StatusCode::kInvalidArgument` if `j` is malformed.
Result<Dataspace> ParseDataspace(const ::nlohmann::json& j);

/// Converts `dataspace` to the JSON form accepted by `ParseDataspace`.
::nlohmann::json DataspaceToJson(const Dataspace& dataspace);

}  // namespace hsarray

#endif  // HSARRAY_SHAPE_H_
