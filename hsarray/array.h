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

#ifndef HSARRAY_ARRAY_H_
#define HSARRAY_ARRAY_H_

/// \file
/// Native N-dimensional element buffer.

#include <cstring>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/types/span.h"
#include "hsarray/dtype.h"
#include "hsarray/index.h"
#include "hsarray/util/result.h"

namespace hsarray {

/// Contiguous, C-order array of elements of a `DType`.
///
/// Fixed-size element bytes are stored contiguously.  Each object slot of an
/// element (see `DType::AppendObjectOffsets`) holds a reference into a heap of
/// byte strings owned by the array; an all-zero slot denotes an empty value.
/// Copying an `Array` copies both the elements and the heap.
///
/// A null array (`Array::Null`) has no shape and no elements; it is the value
/// of a dataset with a null dataspace.
class Array {
 public:
  /// Constructs a rank-0 boolean array holding `false`.
  Array() : Array(DType::Bool(), {}) {}

  /// Constructs a zero-initialized array.
  ///
  /// \dchecks All extents of `shape` are non-negative.
  Array(DType dtype, std::vector<Index> shape);

  /// Returns the null array of `dtype`.
  static Array Null(DType dtype);

  /// Constructs an array of the native type `T` from `values` in C order.
  ///
  /// \dchecks `values.size()` equals the product of `shape`.
  template <typename T>
  static Array FromVector(const std::vector<T>& values,
                          std::vector<Index> shape) {
    Array array(DTypeOf<T>(), std::move(shape));
    ABSL_CHECK_EQ(static_cast<Index>(values.size()), array.num_elements());
    for (size_t i = 0; i < values.size(); ++i) {
      array.SetValue<T>(i, values[i]);
    }
    return array;
  }

  /// Constructs a rank-0 array holding `value`.
  template <typename T>
  static Array FromScalar(T value) {
    return FromVector<T>({value}, {});
  }

  /// Constructs an array of variable-length strings.
  ///
  /// \dchecks `dtype` is `VlenText` or `VlenBytes` and `values.size()`
  ///     equals the product of `shape`.
  static Array FromStrings(const std::vector<std::string>& values,
                           std::vector<Index> shape,
                           DType dtype = DType::VlenText());

  const DType& dtype() const { return dtype_; }
  bool is_null() const { return null_; }
  absl::Span<const Index> shape() const { return shape_; }
  DimensionIndex rank() const {
    return static_cast<DimensionIndex>(shape_.size());
  }

  /// Number of elements; 0 for a null array.
  Index num_elements() const;

  /// Size of the fixed-size element buffer in bytes.
  Index num_bytes() const { return static_cast<Index>(data_.size()); }

  char* data() { return data_.data(); }
  const char* data() const { return data_.data(); }

  /// Returns a pointer to element `i` in C order.
  char* element(Index i) { return data_.data() + i * dtype_.itemsize(); }
  const char* element(Index i) const {
    return data_.data() + i * dtype_.itemsize();
  }

  /// Returns the value referenced by the object slot at `slot`, which must
  /// point into this array's buffer.
  std::string_view GetObject(const char* slot) const;

  /// Stores `value` in the object slot at `slot`.
  void SetObject(char* slot, std::string value);

  template <typename T>
  T GetValue(Index i) const {
    T value;
    std::memcpy(&value, element(i), sizeof(T));
    return value;
  }

  template <typename T>
  void SetValue(Index i, T value) {
    std::memcpy(element(i), &value, sizeof(T));
  }

  template <typename T>
  std::vector<T> ToVector() const {
    ABSL_CHECK_EQ(dtype_.itemsize(), static_cast<Index>(sizeof(T)));
    std::vector<T> values(num_elements());
    for (Index i = 0; i < num_elements(); ++i) values[i] = GetValue<T>(i);
    return values;
  }

  /// Returns the values of an array whose elements are single object slots.
  std::vector<std::string> ToStrings() const;

  /// Copies element `src_index` of `src`, including its object values, to
  /// element `dst_index` of this array.
  ///
  /// \dchecks `src.dtype() == dtype()`.
  void CopyElementFrom(const Array& src, Index src_index, Index dst_index);

  /// Copies the value of type `part` at byte `src_offset` of element
  /// `src_index` of `src` to byte `dst_offset` of element `dst_index`.  Used
  /// to move compound fields between arrays of different types.
  ///
  /// \dchecks Both byte ranges lie within an element.
  void CopyPartFrom(const Array& src, Index src_index, Index src_offset,
                    Index dst_index, Index dst_offset, const DType& part);

  /// Compares dtype, shape and element values.  Object slots compare by the
  /// values they reference.
  friend bool operator==(const Array& a, const Array& b);
  friend bool operator!=(const Array& a, const Array& b) { return !(a == b); }

  /// Prints a summary such as `Array(<i4, {2, 3})`.
  friend std::ostream& operator<<(std::ostream& os, const Array& array);

 private:
  DType dtype_;
  std::vector<Index> shape_;
  bool null_ = false;
  std::vector<char> data_;
  std::vector<std::string> objects_;
};

/// Copies the box of `extent` starting at `src_origin` in `src` to the box
/// starting at `dst_origin` in `dst`.
///
/// \dchecks Both arrays have the same dtype and rank, and both boxes are in
///     bounds.
void CopyRegion(const Array& src, absl::Span<const Index> src_origin,
                Array& dst, absl::Span<const Index> dst_origin,
                absl::Span<const Index> extent);

/// Replicates `value` to `target_shape` following NumPy broadcasting rules.
/// Leading extents of `value` beyond the rank of `target_shape` must be 1.
///
/// \error `absl::StatusCode::kFailedPrecondition` if `value` cannot be
///     broadcast to `target_shape`.
Result<Array> BroadcastArray(const Array& value,
                             absl::Span<const Index> target_shape);

}  // namespace hsarray

#endif  // HSARRAY_ARRAY_H_
