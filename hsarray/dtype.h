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

#ifndef HSARRAY_DTYPE_H_
#define HSARRAY_DTYPE_H_

#include <complex>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/types/span.h"
#include "hsarray/encoding.h"
#include "hsarray/index.h"
#include "hsarray/util/result.h"

namespace hsarray {

/// Kind of a native element type, analogous to NumPy's `dtype.kind`.
enum class DTypeKind {
  kBool,
  kInt,
  kUInt,
  kFloat,
  /// Pair of IEEE floats holding the real and imaginary parts.
  kComplex,
  /// Fixed-length byte string (`S<n>`).
  kBytes,
  /// Uninterpreted fixed-size bytes (`V<n>`).
  kOpaque,
  /// Variable-length or reference value stored out of line.
  kObject,
  kCompound,
  kSubarray,
};

/// Interpretation of a `DTypeKind::kObject` element.
enum class ObjectKind {
  kVlenBytes,
  kVlenText,
  kVlenSequence,
  kObjectReference,
  kRegionReference,
};

std::string_view ToString(DTypeKind kind);
std::ostream& operator<<(std::ostream& os, DTypeKind kind);

/// Size in bytes of the in-element slot of an object value.
constexpr Index kObjectSlotSize = 8;

/// Native fixed-layout element type.
///
/// Every element occupies `itemsize()` bytes.  Compound fields are packed in
/// declaration order.  Object elements occupy an 8-byte slot referring to a
/// value stored by the owning `Array`.
///
/// Instances are immutable values; nested types are shared.
class DType {
 public:
  struct Field {
    std::string name;
    std::shared_ptr<const DType> dtype;
    Index offset;
  };

  /// Constructs the boolean type.
  DType() = default;

  static DType Bool();

  /// Signed or unsigned integer of `width` bytes (1, 2, 4 or 8).
  static Result<DType> Int(Index width,
                          ByteOrder byte_order = kNativeByteOrder);
  static Result<DType> UInt(Index width,
                            ByteOrder byte_order = kNativeByteOrder);

  /// IEEE floating point of `width` bytes (2, 4 or 8).
  static Result<DType> Float(Index width,
                             ByteOrder byte_order = kNativeByteOrder);

  /// Complex number of `width` bytes (8 or 16), stored as the real part
  /// followed by the imaginary part.
  static Result<DType> Complex(Index width,
                               ByteOrder byte_order = kNativeByteOrder);

  /// Fixed-length byte string.  `charset` records the declared encoding.
  static Result<DType> Bytes(Index length, Charset charset = Charset::kAscii);

  static Result<DType> Opaque(Index size, std::string tag = {});

  static DType VlenBytes();
  static DType VlenText();
  static DType Vlen(DType base);
  static DType ObjectReference();
  static DType RegionReference();

  /// Integer type with named values.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if `base` is not an integer
  ///     type or `mapping` is empty.
  static Result<DType> Enum(DType base, std::map<std::string, int64_t> mapping);

  /// Packed record type.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if `fields` is empty or
  ///     contains duplicate names.
  static Result<DType> Compound(
      std::vector<std::pair<std::string, DType>> fields);

  /// Fixed-shape sub-array of `base`.  A subarray base is flattened, so
  /// `Subarray(Subarray(i4, {2}), {3})` has base `i4` and dims `{3, 2}`.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if `dims` is empty or
  ///     contains a non-positive extent.
  static Result<DType> Subarray(DType base, std::vector<Index> dims);

  DTypeKind kind() const { return kind_; }
  Index itemsize() const { return itemsize_; }
  ByteOrder byte_order() const { return byte_order_; }
  Charset charset() const { return charset_; }
  ObjectKind object_kind() const { return object_kind_; }
  const std::string& opaque_tag() const { return tag_; }

  bool is_integer() const {
    return kind_ == DTypeKind::kInt || kind_ == DTypeKind::kUInt;
  }
  bool is_enum() const { return !enum_mapping_.empty(); }
  const std::map<std::string, int64_t>& enum_mapping() const {
    return enum_mapping_;
  }

  absl::Span<const Field> fields() const { return fields_; }

  /// Returns the compound field named `name`, or `nullptr`.
  const Field* FindField(std::string_view name) const;

  /// Element type of a subarray or variable-length sequence.
  const DType* base() const { return base_.get(); }

  absl::Span<const Index> subarray_dims() const { return dims_; }

  /// Returns `true` if any part of the element is an object slot.
  bool has_objects() const;

  /// Appends the byte offsets, relative to `origin`, of every object slot in
  /// an element.
  void AppendObjectOffsets(Index origin, std::vector<Index>* offsets) const;

  /// NumPy-style type string, e.g. `"<i4"`, `"|S5"`, `"|O"`.  Compound and
  /// subarray types are printed in a descriptive form.
  std::string str() const;

  friend bool operator==(const DType& a, const DType& b);
  friend bool operator!=(const DType& a, const DType& b) { return !(a == b); }
  friend std::ostream& operator<<(std::ostream& os, const DType& dtype);

 private:
  DTypeKind kind_ = DTypeKind::kBool;
  Index itemsize_ = 1;
  ByteOrder byte_order_ = ByteOrder::kNotApplicable;
  Charset charset_ = Charset::kAscii;
  ObjectKind object_kind_ = ObjectKind::kVlenBytes;
  std::string tag_;
  std::map<std::string, int64_t> enum_mapping_;
  std::vector<Field> fields_;
  std::shared_ptr<const DType> base_;
  std::vector<Index> dims_;
};

/// Returns the compound type made of the fields of `dtype` named by
/// `names`, packed in the order of `names`.
///
/// \error `absl::StatusCode::kInvalidArgument` if `dtype` is not a compound
///     type, `names` is empty or has duplicates, or a name does not appear
///     in `dtype`.
Result<DType> SelectFields(const DType& dtype,
                           absl::Span<const std::string> names);

namespace internal_dtype {
template <typename T>
struct DTypeOfImpl;
}  // namespace internal_dtype

/// Returns the native-order `DType` of the arithmetic type `T`.
///
/// Supported: `bool`, `int8_t` .. `int64_t`, `uint8_t` .. `uint64_t`,
/// `float`, `double` and their `std::complex` counterparts.
template <typename T>
DType DTypeOf() {
  return internal_dtype::DTypeOfImpl<T>::Get();
}

namespace internal_dtype {

DType NativeInt(Index width, bool is_signed);
DType NativeFloat(Index width);
DType NativeComplex(Index width);

template <>
struct DTypeOfImpl<bool> {
  static DType Get() { return DType::Bool(); }
};

#define HSARRAY_INTERNAL_DTYPE_OF_INT(T, SIGNED)                  \
  template <>                                                     \
  struct DTypeOfImpl<T> {                                         \
    static DType Get() { return NativeInt(sizeof(T), SIGNED); }   \
  };                                                              \
  /**/
HSARRAY_INTERNAL_DTYPE_OF_INT(int8_t, true)
HSARRAY_INTERNAL_DTYPE_OF_INT(int16_t, true)
HSARRAY_INTERNAL_DTYPE_OF_INT(int32_t, true)
HSARRAY_INTERNAL_DTYPE_OF_INT(int64_t, true)
HSARRAY_INTERNAL_DTYPE_OF_INT(uint8_t, false)
HSARRAY_INTERNAL_DTYPE_OF_INT(uint16_t, false)
HSARRAY_INTERNAL_DTYPE_OF_INT(uint32_t, false)
HSARRAY_INTERNAL_DTYPE_OF_INT(uint64_t, false)
#undef HSARRAY_INTERNAL_DTYPE_OF_INT

template <>
struct DTypeOfImpl<float> {
  static DType Get() { return NativeFloat(4); }
};
template <>
struct DTypeOfImpl<double> {
  static DType Get() { return NativeFloat(8); }
};
template <>
struct DTypeOfImpl<std::complex<float>> {
  static DType Get() { return NativeComplex(8); }
};
template <>
struct DTypeOfImpl<std::complex<double>> {
  static DType Get() { return NativeComplex(16); }
};

}  // namespace internal_dtype
}  // namespace hsarray

#endif  // HSARRAY_DTYPE_H_
