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

#ifndef HSARRAY_ELEMENT_CODEC_H_
#define HSARRAY_ELEMENT_CODEC_H_

/// \file
/// Binary wire format of array element values.
///
/// Elements are transmitted in C order.  Elements without object slots are
/// sent as their packed bytes, in the byte order declared by their type.
/// Within an element, each object slot is replaced by a little-endian
/// `uint32` byte count followed by the value bytes:
///
/// - variable-length strings: the string bytes;
/// - variable-length sequences: the packed base elements;
/// - references: the referenced object id.

#include <string>
#include <string_view>
#include <vector>

#include "hsarray/array.h"
#include "hsarray/dtype.h"
#include "hsarray/index.h"
#include "hsarray/util/result.h"

namespace hsarray {

/// Encodes the elements of `array`.
///
/// \error `absl::StatusCode::kInvalidArgument` if `array` is null or an
///     object value exceeds 4 GiB.
Result<std::string> EncodeElements(const Array& array);

/// Decodes `payload` as the elements of an array of `dtype` and `shape`.
///
/// \error `absl::StatusCode::kDataLoss` if `payload` is truncated, has
///     trailing bytes or a variable-length sequence whose size is not a
///     multiple of its base item size.
Result<Array> DecodeElements(std::string_view payload, const DType& dtype,
                             std::vector<Index> shape);

}  // namespace hsarray

#endif  // HSARRAY_ELEMENT_CODEC_H_
