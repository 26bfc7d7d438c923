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

#include "hsarray/element_codec.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/base/internal/endian.h"
#include "absl/status/status.h"
#include "hsarray/array.h"
#include "hsarray/dtype.h"
#include "hsarray/index.h"
#include "hsarray/util/result.h"
#include "hsarray/util/str_cat.h"

namespace hsarray {
namespace {

constexpr size_t kLengthPrefixSize = 4;

struct Slot {
  Index offset;
  // Element type of a variable-length sequence, or `nullptr`.
  const DType* sequence_base;
};

// Appends the object slots of an element in increasing offset order.
void AppendSlots(const DType& dtype, Index origin, std::vector<Slot>* slots) {
  switch (dtype.kind()) {
    case DTypeKind::kObject:
      slots->push_back(
          {origin, dtype.object_kind() == ObjectKind::kVlenSequence
                       ? dtype.base()
                       : nullptr});
      break;
    case DTypeKind::kCompound:
      for (const auto& field : dtype.fields()) {
        AppendSlots(*field.dtype, origin + field.offset, slots);
      }
      break;
    case DTypeKind::kSubarray: {
      const DType& base = *dtype.base();
      if (!base.has_objects()) break;
      Index n = 1;
      for (Index extent : dtype.subarray_dims()) n *= extent;
      for (Index j = 0; j < n; ++j) {
        AppendSlots(base, origin + j * base.itemsize(), slots);
      }
      break;
    }
    default:
      break;
  }
}

}  // namespace

Result<std::string> EncodeElements(const Array& array) {
  if (array.is_null()) {
    return absl::InvalidArgumentError("Cannot encode a null array");
  }
  const DType& dtype = array.dtype();
  if (!dtype.has_objects()) {
    return std::string(array.data(), array.num_bytes());
  }
  std::vector<Slot> slots;
  AppendSlots(dtype, 0, &slots);
  const Index itemsize = dtype.itemsize();
  std::string out;
  for (Index i = 0; i < array.num_elements(); ++i) {
    const char* element = array.element(i);
    Index pos = 0;
    for (const Slot& slot : slots) {
      out.append(element + pos, slot.offset - pos);
      std::string_view value = array.GetObject(element + slot.offset);
      if (value.size() > std::numeric_limits<uint32_t>::max()) {
        return absl::InvalidArgumentError(
            StrCat("Value of ", value.size(),
                   " bytes exceeds the maximum encodable size"));
      }
      char prefix[kLengthPrefixSize];
      absl::little_endian::Store32(prefix,
                                   static_cast<uint32_t>(value.size()));
      out.append(prefix, kLengthPrefixSize);
      out.append(value.data(), value.size());
      pos = slot.offset + kObjectSlotSize;
    }
    out.append(element + pos, itemsize - pos);
  }
  return out;
}

Result<Array> DecodeElements(std::string_view payload, const DType& dtype,
                             std::vector<Index> shape) {
  Array array(dtype, std::move(shape));
  if (!dtype.has_objects()) {
    if (static_cast<Index>(payload.size()) != array.num_bytes()) {
      return absl::DataLossError(
          StrCat("Expected ", array.num_bytes(), " bytes but received ",
                 payload.size()));
    }
    std::copy(payload.begin(), payload.end(), array.data());
    return array;
  }
  std::vector<Slot> slots;
  AppendSlots(dtype, 0, &slots);
  const Index itemsize = dtype.itemsize();
  size_t pos = 0;
  auto truncated = [&] {
    return absl::DataLossError(
        StrCat("Payload of ", payload.size(), " bytes is truncated at byte ",
               pos, " while decoding ", array.num_elements(), " elements"));
  };
  for (Index i = 0; i < array.num_elements(); ++i) {
    char* element = array.element(i);
    Index element_pos = 0;
    for (const Slot& slot : slots) {
      const Index offset = slot.offset;
      const size_t fixed = offset - element_pos;
      if (payload.size() - pos < fixed + kLengthPrefixSize) return truncated();
      std::copy_n(payload.data() + pos, fixed, element + element_pos);
      pos += fixed;
      const uint32_t length =
          absl::little_endian::Load32(payload.data() + pos);
      pos += kLengthPrefixSize;
      if (payload.size() - pos < length) return truncated();
      if (const DType* base = slot.sequence_base;
          base && length % base->itemsize() != 0) {
        return absl::DataLossError(
            StrCat("Sequence of ", length,
                   " bytes is not a multiple of the item size ",
                   base->itemsize()));
      }
      if (length != 0) {
        array.SetObject(element + offset,
                        std::string(payload.substr(pos, length)));
      }
      pos += length;
      element_pos = offset + kObjectSlotSize;
    }
    const size_t rest = itemsize - element_pos;
    if (payload.size() - pos < rest) return truncated();
    std::copy_n(payload.data() + pos, rest, element + element_pos);
    pos += rest;
  }
  if (pos != payload.size()) {
    return absl::DataLossError(
        StrCat("Payload has ", payload.size() - pos,
               " unexpected trailing bytes"));
  }
  return array;
}

}  // namespace hsarray
