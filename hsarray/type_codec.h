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

#ifndef HSARRAY_TYPE_CODEC_H_
#define HSARRAY_TYPE_CODEC_H_

/// \file
/// Conversion between wire type descriptors and native element types.
///
/// The two directions are inverses up to normalization: byte order of
/// single-byte integers is not significant, fixed-length string padding is
/// not represented natively, the canonical boolean enumeration decodes
/// to `DType::Bool()`, and a compound of two floats named `r` and `i` decodes
/// to a complex type.

#include <nlohmann/json.hpp>
#include "hsarray/dtype.h"
#include "hsarray/index.h"
#include "hsarray/type_descriptor.h"
#include "hsarray/util/result.h"

namespace hsarray {

/// Converts a native element type to its wire descriptor.
///
/// \error `absl::StatusCode::kInvalidArgument` if a compound field name is
///     not ASCII.
Result<TypeDescriptor> EncodeDType(const DType& dtype);

/// Converts a wire descriptor to the native element type.
///
/// \error `absl::StatusCode::kInvalidArgument` if the descriptor has no
///     native equivalent, e.g. an enumeration over a non-integer base.
Result<DType> DecodeDType(const TypeDescriptor& t);

/// Returns the size in bytes of an element of type `t`, or
/// `kVariableItemSize` if elements of `t` do not have a fixed size.
Index GetItemSize(const TypeDescriptor& t);

/// Returns `true` if `t` is the enumeration `{FALSE: 0, TRUE: 1}` used to
/// store booleans.
bool IsBooleanEnum(const EnumType& t);

/// Returns `true` if `t` is the compound `{r, i}` of two floats of the same
/// width (4 or 8) and byte order used to store complex numbers.
bool IsComplexCompound(const CompoundType& t);

/// Equivalent to `TypeDescriptorToJson(EncodeDType(dtype))`.
Result<::nlohmann::json> EncodeTypeJson(const DType& dtype);

/// Equivalent to `DecodeDType(ParseTypeDescriptor(j))`.
Result<DType> DecodeTypeJson(const ::nlohmann::json& j);

}  // namespace hsarray

#endif  // HSARRAY_TYPE_CODEC_H_
