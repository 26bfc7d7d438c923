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

#ifndef HSARRAY_TYPE_DESCRIPTOR_H_
#define HSARRAY_TYPE_DESCRIPTOR_H_

/// \file
/// Strongly-typed representation of the JSON element type descriptors used by
/// the array service.
///
/// Example JSON forms::
///
///     {"class": "H5T_INTEGER", "base": "H5T_STD_I32LE"}
///     {"class": "H5T_STRING", "charSet": "H5T_CSET_UTF8",
///      "length": "H5T_VARIABLE", "strPad": "H5T_STR_NULLTERM"}
///     {"class": "H5T_COMPOUND",
///      "fields": [{"name": "x", "type": "H5T_IEEE_F64LE"}]}

#include <cstdint>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>
#include "hsarray/encoding.h"
#include "hsarray/index.h"
#include "hsarray/util/result.h"

namespace hsarray {

class TypeDescriptor;

/// Shared immutable nested descriptor.
using TypeDescriptorPtr = std::shared_ptr<const TypeDescriptor>;

/// `H5T_INTEGER`.  `width` is in bytes.
struct IntegerType {
  Index width;
  bool is_signed;
  ByteOrder byte_order;
};

/// `H5T_FLOAT`.  `width` is in bytes.
struct FloatType {
  Index width;
  ByteOrder byte_order;
};

/// `H5T_STRING` with a fixed length in bytes.
struct FixedStringType {
  Index length;
  Charset charset = Charset::kAscii;
  StrPad pad = StrPad::kNullPad;
};

/// `H5T_STRING` with `"length": "H5T_VARIABLE"`.
struct VarStringType {
  Charset charset = Charset::kAscii;
  StrPad pad = StrPad::kNullTerm;
};

/// `H5T_OPAQUE`.
struct OpaqueType {
  Index size;
  std::string tag;
};

/// `H5T_ENUM` over an integer base.
struct EnumType {
  TypeDescriptorPtr base;
  std::map<std::string, int64_t> mapping;
};

/// `H5T_ARRAY`: fixed-shape sub-array of `base`.
struct ArrayType {
  TypeDescriptorPtr base;
  std::vector<Index> dims;
};

/// `H5T_VLEN`: variable-length sequence of `base`.
struct VlenType {
  TypeDescriptorPtr base;
};

struct CompoundField {
  std::string name;
  TypeDescriptorPtr type;
};

/// `H5T_COMPOUND`: ordered named fields.
struct CompoundType {
  std::vector<CompoundField> fields;
};

/// `H5T_REFERENCE`.
struct ReferenceType {
  ReferenceFlavor flavor;
};

bool operator==(const IntegerType& a, const IntegerType& b);
bool operator==(const FloatType& a, const FloatType& b);
bool operator==(const FixedStringType& a, const FixedStringType& b);
bool operator==(const VarStringType& a, const VarStringType& b);
bool operator==(const OpaqueType& a, const OpaqueType& b);
bool operator==(const EnumType& a, const EnumType& b);
bool operator==(const ArrayType& a, const ArrayType& b);
bool operator==(const VlenType& a, const VlenType& b);
bool operator==(const CompoundField& a, const CompoundField& b);
bool operator==(const CompoundType& a, const CompoundType& b);
bool operator==(const ReferenceType& a, const ReferenceType& b);

/// Recursive element type descriptor.
///
/// A closed sum type: exactly one of the variant alternatives is held.  Nested
/// descriptors are shared and never modified after construction.
class TypeDescriptor {
 public:
  using Variant =
      std::variant<IntegerType, FloatType, FixedStringType, VarStringType,
                   OpaqueType, EnumType, ArrayType, VlenType, CompoundType,
                   ReferenceType>;

  template <typename T,
            typename = std::enable_if_t<std::is_constructible_v<Variant, T&&> &&
                                        !std::is_same_v<std::decay_t<T>,
                                                        TypeDescriptor>>>
  TypeDescriptor(T&& value)  // NOLINT
      : value_(std::forward<T>(value)) {}

  const Variant& value() const { return value_; }

  template <typename T>
  const T* get_if() const {
    return std::get_if<T>(&value_);
  }

  template <typename T>
  bool holds() const {
    return std::holds_alternative<T>(value_);
  }

  /// Returns the JSON class name, e.g. `"H5T_INTEGER"`.
  std::string_view class_name() const;

  friend bool operator==(const TypeDescriptor& a, const TypeDescriptor& b) {
    return a.value_ == b.value_;
  }
  friend bool operator!=(const TypeDescriptor& a, const TypeDescriptor& b) {
    return !(a == b);
  }

  /// Prints the JSON representation.
  friend std::ostream& operator<<(std::ostream& os, const TypeDescriptor& t);

 private:
  Variant value_;
};

/// Returns a shared copy of `t`, for use as a nested descriptor.
TypeDescriptorPtr MakeTypeDescriptorPtr(TypeDescriptor t);

/// Parses a JSON type descriptor.
///
/// Bare predefined names such as `"H5T_STD_U8BE"` or `"H5T_IEEE_F32LE"` are
/// accepted in place of the corresponding integer or float object.
///
/// \error `absl::StatusCode::kInvalidArgument` if the class is unknown, a
///     required member is missing, or a member is malformed.
Result<TypeDescriptor> ParseTypeDescriptor(const ::nlohmann::json& j);

/// Converts `t` to its JSON object form.
::nlohmann::json TypeDescriptorToJson(const TypeDescriptor& t);

void to_json(::nlohmann::json& j, const TypeDescriptor& t);  // NOLINT

}  // namespace hsarray

#endif  // HSARRAY_TYPE_DESCRIPTOR_H_
