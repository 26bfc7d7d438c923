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

#include "hsarray/dtype.h"

#include <cstdint>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/base/optimization.h"
#include "absl/container/flat_hash_set.h"
#include "absl/log/absl_check.h"
#include "absl/status/status.h"
#include "absl/strings/str_join.h"
#include "hsarray/encoding.h"
#include "hsarray/index.h"
#include "hsarray/util/result.h"
#include "hsarray/util/str_cat.h"

namespace hsarray {

std::string_view ToString(DTypeKind kind) {
  switch (kind) {
    case DTypeKind::kBool:
      return "bool";
    case DTypeKind::kInt:
      return "int";
    case DTypeKind::kUInt:
      return "uint";
    case DTypeKind::kFloat:
      return "float";
    case DTypeKind::kComplex:
      return "complex";
    case DTypeKind::kBytes:
      return "bytes";
    case DTypeKind::kOpaque:
      return "opaque";
    case DTypeKind::kObject:
      return "object";
    case DTypeKind::kCompound:
      return "compound";
    case DTypeKind::kSubarray:
      return "subarray";
  }
  ABSL_UNREACHABLE();
}

std::ostream& operator<<(std::ostream& os, DTypeKind kind) {
  return os << ToString(kind);
}

namespace {

Result<ByteOrder> ValidateByteOrder(Index width, ByteOrder byte_order) {
  if (width == 1) return ByteOrder::kNotApplicable;
  if (byte_order == ByteOrder::kNotApplicable) {
    return absl::InvalidArgumentError(
        StrCat("Byte order must be specified for ", width, "-byte type"));
  }
  return byte_order;
}

char ByteOrderChar(ByteOrder byte_order) {
  switch (byte_order) {
    case ByteOrder::kLittle:
      return '<';
    case ByteOrder::kBig:
      return '>';
    case ByteOrder::kNotApplicable:
      break;
  }
  return '|';
}

}  // namespace

DType DType::Bool() { return DType(); }

Result<DType> DType::Int(Index width, ByteOrder byte_order) {
  if (width != 1 && width != 2 && width != 4 && width != 8) {
    return absl::InvalidArgumentError(
        StrCat("Unsupported integer width: ", width));
  }
  DType dtype;
  dtype.kind_ = DTypeKind::kInt;
  dtype.itemsize_ = width;
  HSARRAY_ASSIGN_OR_RETURN(dtype.byte_order_,
                           ValidateByteOrder(width, byte_order));
  return dtype;
}

Result<DType> DType::UInt(Index width, ByteOrder byte_order) {
  HSARRAY_ASSIGN_OR_RETURN(auto dtype, Int(width, byte_order));
  dtype.kind_ = DTypeKind::kUInt;
  return dtype;
}

Result<DType> DType::Float(Index width, ByteOrder byte_order) {
  if (width != 2 && width != 4 && width != 8) {
    return absl::InvalidArgumentError(
        StrCat("Unsupported floating point width: ", width));
  }
  DType dtype;
  dtype.kind_ = DTypeKind::kFloat;
  dtype.itemsize_ = width;
  HSARRAY_ASSIGN_OR_RETURN(dtype.byte_order_,
                           ValidateByteOrder(width, byte_order));
  return dtype;
}

Result<DType> DType::Complex(Index width, ByteOrder byte_order) {
  if (width != 8 && width != 16) {
    return absl::InvalidArgumentError(
        StrCat("Unsupported complex width: ", width));
  }
  DType dtype;
  dtype.kind_ = DTypeKind::kComplex;
  dtype.itemsize_ = width;
  HSARRAY_ASSIGN_OR_RETURN(dtype.byte_order_,
                           ValidateByteOrder(width, byte_order));
  return dtype;
}

Result<DType> DType::Bytes(Index length, Charset charset) {
  if (length < 1) {
    return absl::InvalidArgumentError(
        StrCat("Invalid fixed string length: ", length));
  }
  DType dtype;
  dtype.kind_ = DTypeKind::kBytes;
  dtype.itemsize_ = length;
  dtype.charset_ = charset;
  return dtype;
}

Result<DType> DType::Opaque(Index size, std::string tag) {
  if (size < 1) {
    return absl::InvalidArgumentError(StrCat("Invalid opaque size: ", size));
  }
  DType dtype;
  dtype.kind_ = DTypeKind::kOpaque;
  dtype.itemsize_ = size;
  dtype.tag_ = std::move(tag);
  return dtype;
}

DType DType::VlenBytes() {
  DType dtype;
  dtype.kind_ = DTypeKind::kObject;
  dtype.itemsize_ = kObjectSlotSize;
  dtype.object_kind_ = ObjectKind::kVlenBytes;
  return dtype;
}

DType DType::VlenText() {
  DType dtype = VlenBytes();
  dtype.object_kind_ = ObjectKind::kVlenText;
  dtype.charset_ = Charset::kUtf8;
  return dtype;
}

DType DType::Vlen(DType base) {
  DType dtype = VlenBytes();
  dtype.object_kind_ = ObjectKind::kVlenSequence;
  dtype.base_ = std::make_shared<const DType>(std::move(base));
  return dtype;
}

DType DType::ObjectReference() {
  DType dtype = VlenBytes();
  dtype.object_kind_ = ObjectKind::kObjectReference;
  return dtype;
}

DType DType::RegionReference() {
  DType dtype = VlenBytes();
  dtype.object_kind_ = ObjectKind::kRegionReference;
  return dtype;
}

Result<DType> DType::Enum(DType base, std::map<std::string, int64_t> mapping) {
  if (!base.is_integer() || base.is_enum()) {
    return absl::InvalidArgumentError(
        StrCat("Enum base must be an integer type, but received: ", base));
  }
  if (mapping.empty()) {
    return absl::InvalidArgumentError("Enum mapping must not be empty");
  }
  base.enum_mapping_ = std::move(mapping);
  return base;
}

Result<DType> DType::Compound(
    std::vector<std::pair<std::string, DType>> fields) {
  if (fields.empty()) {
    return absl::InvalidArgumentError("Compound type must have fields");
  }
  DType dtype;
  dtype.kind_ = DTypeKind::kCompound;
  dtype.itemsize_ = 0;
  absl::flat_hash_set<std::string> names;
  for (auto& [name, field_dtype] : fields) {
    if (!names.insert(name).second) {
      return absl::InvalidArgumentError(
          StrCat("Duplicate compound field name: \"", name, "\""));
    }
    const Index size = field_dtype.itemsize();
    dtype.fields_.push_back(
        Field{std::move(name),
              std::make_shared<const DType>(std::move(field_dtype)),
              dtype.itemsize_});
    dtype.itemsize_ += size;
  }
  return dtype;
}

Result<DType> DType::Subarray(DType base, std::vector<Index> dims) {
  if (dims.empty()) {
    return absl::InvalidArgumentError("Subarray dims must not be empty");
  }
  for (Index dim : dims) {
    if (dim <= 0) {
      return absl::InvalidArgumentError(
          StrCat("Invalid subarray dims ", dims, ": extents must be positive"));
    }
  }
  if (base.kind_ == DTypeKind::kSubarray) {
    dims.insert(dims.end(), base.dims_.begin(), base.dims_.end());
    DType inner = *base.base_;
    base = std::move(inner);
  }
  Index num_elements = 1;
  for (Index dim : dims) num_elements *= dim;
  DType dtype;
  dtype.kind_ = DTypeKind::kSubarray;
  dtype.itemsize_ = base.itemsize_ * num_elements;
  dtype.dims_ = std::move(dims);
  dtype.base_ = std::make_shared<const DType>(std::move(base));
  return dtype;
}

const DType::Field* DType::FindField(std::string_view name) const {
  for (const auto& field : fields_) {
    if (field.name == name) return &field;
  }
  return nullptr;
}

bool DType::has_objects() const {
  switch (kind_) {
    case DTypeKind::kObject:
      return true;
    case DTypeKind::kCompound:
      for (const auto& field : fields_) {
        if (field.dtype->has_objects()) return true;
      }
      return false;
    case DTypeKind::kSubarray:
      return base_->has_objects();
    default:
      return false;
  }
}

void DType::AppendObjectOffsets(Index origin,
                                std::vector<Index>* offsets) const {
  switch (kind_) {
    case DTypeKind::kObject:
      offsets->push_back(origin);
      return;
    case DTypeKind::kCompound:
      for (const auto& field : fields_) {
        field.dtype->AppendObjectOffsets(origin + field.offset, offsets);
      }
      return;
    case DTypeKind::kSubarray: {
      if (!base_->has_objects()) return;
      const Index n = itemsize_ / base_->itemsize_;
      for (Index i = 0; i < n; ++i) {
        base_->AppendObjectOffsets(origin + i * base_->itemsize_, offsets);
      }
      return;
    }
    default:
      return;
  }
}

std::string DType::str() const {
  switch (kind_) {
    case DTypeKind::kBool:
      return "|b1";
    case DTypeKind::kInt:
      return StrCat(std::string(1, ByteOrderChar(byte_order_)), "i", itemsize_);
    case DTypeKind::kUInt:
      return StrCat(std::string(1, ByteOrderChar(byte_order_)), "u", itemsize_);
    case DTypeKind::kFloat:
      return StrCat(std::string(1, ByteOrderChar(byte_order_)), "f", itemsize_);
    case DTypeKind::kComplex:
      return StrCat(std::string(1, ByteOrderChar(byte_order_)), "c", itemsize_);
    case DTypeKind::kBytes:
      return StrCat("|S", itemsize_);
    case DTypeKind::kOpaque:
      return StrCat("|V", itemsize_);
    case DTypeKind::kObject:
      return "|O";
    case DTypeKind::kCompound: {
      std::string result = "[";
      for (size_t i = 0; i < fields_.size(); ++i) {
        StrAppend(&result, i == 0 ? "" : ", ", "('", fields_[i].name, "', ",
                  fields_[i].dtype->str(), ")");
      }
      return result + "]";
    }
    case DTypeKind::kSubarray:
      return StrCat("(", base_->str(), ", (", absl::StrJoin(dims_, ", "),
                    dims_.size() == 1 ? ",))" : "))");
  }
  ABSL_UNREACHABLE();
}

bool operator==(const DType& a, const DType& b) {
  if (a.kind_ != b.kind_ || a.itemsize_ != b.itemsize_ ||
      a.byte_order_ != b.byte_order_ || a.enum_mapping_ != b.enum_mapping_ ||
      a.dims_ != b.dims_) {
    return false;
  }
  switch (a.kind_) {
    case DTypeKind::kBytes:
      if (a.charset_ != b.charset_) return false;
      break;
    case DTypeKind::kOpaque:
      if (a.tag_ != b.tag_) return false;
      break;
    case DTypeKind::kObject:
      if (a.object_kind_ != b.object_kind_) return false;
      break;
    case DTypeKind::kCompound:
      if (a.fields_.size() != b.fields_.size()) return false;
      for (size_t i = 0; i < a.fields_.size(); ++i) {
        const auto& fa = a.fields_[i];
        const auto& fb = b.fields_[i];
        if (fa.name != fb.name || fa.offset != fb.offset ||
            *fa.dtype != *fb.dtype) {
          return false;
        }
      }
      break;
    default:
      break;
  }
  if (static_cast<bool>(a.base_) != static_cast<bool>(b.base_)) return false;
  return !a.base_ || *a.base_ == *b.base_;
}

std::ostream& operator<<(std::ostream& os, const DType& dtype) {
  if (dtype.kind() == DTypeKind::kObject) {
    switch (dtype.object_kind()) {
      case ObjectKind::kVlenBytes:
        return os << "vlen<bytes>";
      case ObjectKind::kVlenText:
        return os << "vlen<str>";
      case ObjectKind::kVlenSequence:
        return os << "vlen<" << *dtype.base() << ">";
      case ObjectKind::kObjectReference:
        return os << "ref<object>";
      case ObjectKind::kRegionReference:
        return os << "ref<region>";
    }
  }
  if (dtype.is_enum()) {
    os << "enum<" << dtype.str() << ">{";
    bool first = true;
    for (const auto& [name, value] : dtype.enum_mapping()) {
      if (!first) os << ", ";
      first = false;
      os << name << ": " << value;
    }
    return os << "}";
  }
  return os << dtype.str();
}

Result<DType> SelectFields(const DType& dtype,
                           absl::Span<const std::string> names) {
  if (dtype.kind() != DTypeKind::kCompound) {
    return absl::InvalidArgumentError(StrCat(
        "Field names are only allowed for compound types, but received: ",
        dtype));
  }
  if (names.empty()) {
    return absl::InvalidArgumentError("At least one field name is required");
  }
  std::vector<std::pair<std::string, DType>> fields;
  fields.reserve(names.size());
  for (const auto& name : names) {
    const auto* field = dtype.FindField(name);
    if (!field) {
      return absl::InvalidArgumentError(StrCat(
          "Field \"", name, "\" does not appear in type ", dtype));
    }
    fields.emplace_back(name, *field->dtype);
  }
  return DType::Compound(std::move(fields));
}

namespace internal_dtype {

DType NativeInt(Index width, bool is_signed) {
  auto dtype = is_signed ? DType::Int(width) : DType::UInt(width);
  ABSL_CHECK(dtype.ok());
  return *std::move(dtype);
}

DType NativeFloat(Index width) {
  auto dtype = DType::Float(width);
  ABSL_CHECK(dtype.ok());
  return *std::move(dtype);
}

DType NativeComplex(Index width) {
  auto dtype = DType::Complex(width);
  ABSL_CHECK(dtype.ok());
  return *std::move(dtype);
}

}  // namespace internal_dtype
}  // namespace hsarray
