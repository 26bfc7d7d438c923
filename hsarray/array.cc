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

#include "hsarray/array.h"

#include <cstdint>
#include <cstring>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/types/span.h"
#include "hsarray/dtype.h"
#include "hsarray/index.h"
#include "hsarray/util/result.h"
#include "hsarray/util/str_cat.h"

namespace hsarray {
namespace {

Index ProductOfExtents(absl::Span<const Index> shape) {
  Index n = 1;
  for (Index extent : shape) n *= extent;
  return n;
}

std::vector<Index> ObjectOffsets(const DType& dtype) {
  std::vector<Index> offsets;
  dtype.AppendObjectOffsets(0, &offsets);
  return offsets;
}

uint64_t LoadSlot(const char* slot) {
  uint64_t value;
  std::memcpy(&value, slot, sizeof(value));
  return value;
}

// C-order strides in elements.
std::vector<Index> ElementStrides(absl::Span<const Index> shape) {
  std::vector<Index> strides(shape.size());
  Index stride = 1;
  for (DimensionIndex i = static_cast<DimensionIndex>(shape.size()) - 1;
       i >= 0; --i) {
    strides[i] = stride;
    stride *= shape[i];
  }
  return strides;
}

}  // namespace

Array::Array(DType dtype, std::vector<Index> shape)
    : dtype_(std::move(dtype)), shape_(std::move(shape)) {
  for (Index extent : shape_) ABSL_CHECK_GE(extent, 0);
  data_.resize(ProductOfExtents(shape_) * dtype_.itemsize());
}

Array Array::Null(DType dtype) {
  Array array(std::move(dtype), {0});
  array.shape_.clear();
  array.null_ = true;
  return array;
}

Array Array::FromStrings(const std::vector<std::string>& values,
                         std::vector<Index> shape, DType dtype) {
  ABSL_CHECK(dtype.kind() == DTypeKind::kObject);
  Array array(std::move(dtype), std::move(shape));
  ABSL_CHECK_EQ(static_cast<Index>(values.size()), array.num_elements());
  for (size_t i = 0; i < values.size(); ++i) {
    array.SetObject(array.element(i), values[i]);
  }
  return array;
}

Index Array::num_elements() const {
  if (null_) return 0;
  return ProductOfExtents(shape_);
}

std::string_view Array::GetObject(const char* slot) const {
  const uint64_t ref = LoadSlot(slot);
  if (ref == 0) return {};
  ABSL_CHECK_LE(ref, objects_.size());
  return objects_[ref - 1];
}

void Array::SetObject(char* slot, std::string value) {
  uint64_t ref = LoadSlot(slot);
  if (ref != 0) {
    objects_[ref - 1] = std::move(value);
    return;
  }
  objects_.push_back(std::move(value));
  ref = objects_.size();
  std::memcpy(slot, &ref, sizeof(ref));
}

std::vector<std::string> Array::ToStrings() const {
  ABSL_CHECK(dtype_.kind() == DTypeKind::kObject);
  std::vector<std::string> values;
  values.reserve(num_elements());
  for (Index i = 0; i < num_elements(); ++i) {
    values.emplace_back(GetObject(element(i)));
  }
  return values;
}

void Array::CopyElementFrom(const Array& src, Index src_index,
                            Index dst_index) {
  ABSL_CHECK(src.dtype_ == dtype_);
  CopyPartFrom(src, src_index, 0, dst_index, 0, dtype_);
}

void Array::CopyPartFrom(const Array& src, Index src_index, Index src_offset,
                         Index dst_index, Index dst_offset,
                         const DType& part) {
  const Index size = part.itemsize();
  ABSL_CHECK_LE(src_offset + size, src.dtype_.itemsize());
  ABSL_CHECK_LE(dst_offset + size, dtype_.itemsize());
  const char* src_part = src.element(src_index) + src_offset;
  char* dst_part = element(dst_index) + dst_offset;
  if (!part.has_objects()) {
    std::memcpy(dst_part, src_part, size);
    return;
  }
  // Slot references are local to each array, so object values are copied
  // through the heap while the remaining bytes are copied directly.
  std::vector<std::string> values;
  const auto offsets = ObjectOffsets(part);
  for (Index offset : offsets) {
    values.emplace_back(src.GetObject(src_part + offset));
  }
  std::vector<uint64_t> slots;
  for (Index offset : offsets) slots.push_back(LoadSlot(dst_part + offset));
  std::memcpy(dst_part, src_part, size);
  for (size_t i = 0; i < offsets.size(); ++i) {
    std::memcpy(dst_part + offsets[i], &slots[i], sizeof(uint64_t));
    SetObject(dst_part + offsets[i], std::move(values[i]));
  }
}

bool operator==(const Array& a, const Array& b) {
  if (a.dtype_ != b.dtype_ || a.null_ != b.null_ || a.shape_ != b.shape_) {
    return false;
  }
  if (!a.dtype_.has_objects()) return a.data_ == b.data_;
  const auto offsets = ObjectOffsets(a.dtype_);
  const Index itemsize = a.dtype_.itemsize();
  std::vector<char> a_bytes(itemsize), b_bytes(itemsize);
  for (Index i = 0; i < a.num_elements(); ++i) {
    const char* a_element = a.element(i);
    const char* b_element = b.element(i);
    std::memcpy(a_bytes.data(), a_element, itemsize);
    std::memcpy(b_bytes.data(), b_element, itemsize);
    for (Index offset : offsets) {
      if (a.GetObject(a_element + offset) != b.GetObject(b_element + offset)) {
        return false;
      }
      std::memset(a_bytes.data() + offset, 0, kObjectSlotSize);
      std::memset(b_bytes.data() + offset, 0, kObjectSlotSize);
    }
    if (a_bytes != b_bytes) return false;
  }
  return true;
}

std::ostream& operator<<(std::ostream& os, const Array& array) {
  os << "Array(" << array.dtype_ << ", ";
  if (array.null_) return os << "null)";
  return os << StrCat(array.shape_) << ")";
}

void CopyRegion(const Array& src, absl::Span<const Index> src_origin,
                Array& dst, absl::Span<const Index> dst_origin,
                absl::Span<const Index> extent) {
  ABSL_CHECK(src.dtype() == dst.dtype());
  const DimensionIndex rank = src.rank();
  ABSL_CHECK_EQ(rank, dst.rank());
  ABSL_CHECK_EQ(rank, static_cast<DimensionIndex>(extent.size()));
  for (DimensionIndex i = 0; i < rank; ++i) {
    ABSL_CHECK_LE(src_origin[i] + extent[i], src.shape()[i]);
    ABSL_CHECK_LE(dst_origin[i] + extent[i], dst.shape()[i]);
  }
  if (ProductOfExtents(extent) == 0) return;
  if (rank == 0) {
    dst.CopyElementFrom(src, 0, 0);
    return;
  }
  const auto src_strides = ElementStrides(src.shape());
  const auto dst_strides = ElementStrides(dst.shape());
  const Index row = extent[rank - 1];
  const bool has_objects = src.dtype().has_objects();
  const Index itemsize = src.dtype().itemsize();
  std::vector<Index> position(rank, 0);
  while (true) {
    Index src_index = 0, dst_index = 0;
    for (DimensionIndex i = 0; i < rank; ++i) {
      src_index += (src_origin[i] + position[i]) * src_strides[i];
      dst_index += (dst_origin[i] + position[i]) * dst_strides[i];
    }
    if (has_objects) {
      for (Index j = 0; j < row; ++j) {
        dst.CopyElementFrom(src, src_index + j, dst_index + j);
      }
    } else {
      std::memcpy(dst.element(dst_index), src.element(src_index),
                  row * itemsize);
    }
    // Advance all but the innermost dimension.
    DimensionIndex dim = rank - 2;
    for (; dim >= 0; --dim) {
      if (++position[dim] < extent[dim]) break;
      position[dim] = 0;
    }
    if (dim < 0) break;
  }
}

Result<Array> BroadcastArray(const Array& value,
                             absl::Span<const Index> target_shape) {
  const DimensionIndex target_rank =
      static_cast<DimensionIndex>(target_shape.size());
  const DimensionIndex value_rank = value.rank();
  auto mismatch = [&] {
    return absl::FailedPreconditionError(StrCat(
        "Can't broadcast ", value.shape(), " to ", target_shape));
  };
  if (value.is_null()) return mismatch();
  // Per target axis, the value extent aligned to it (1 if absent).
  std::vector<Index> aligned(target_rank, 1);
  for (DimensionIndex i = 0; i < value_rank; ++i) {
    const DimensionIndex t = target_rank - value_rank + i;
    const Index extent = value.shape()[i];
    if (t < 0) {
      if (extent != 1) return mismatch();
      continue;
    }
    if (extent != 1 && extent != target_shape[t]) return mismatch();
    aligned[t] = extent;
  }
  Array result(value.dtype(),
               std::vector<Index>(target_shape.begin(), target_shape.end()));
  const Index n = result.num_elements();
  if (n == 0) return result;
  const auto value_strides = ElementStrides(aligned);
  std::vector<Index> position(target_rank, 0);
  for (Index i = 0; i < n; ++i) {
    Index src_index = 0;
    for (DimensionIndex d = 0; d < target_rank; ++d) {
      if (aligned[d] != 1) src_index += position[d] * value_strides[d];
    }
    result.CopyElementFrom(value, src_index, i);
    for (DimensionIndex d = target_rank - 1; d >= 0; --d) {
      if (++position[d] < target_shape[d]) break;
      position[d] = 0;
    }
  }
  return result;
}

}  // namespace hsarray
