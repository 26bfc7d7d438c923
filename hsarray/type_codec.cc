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

#include "hsarray/type_codec.h"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include <nlohmann/json.hpp>
#include "hsarray/dtype.h"
#include "hsarray/encoding.h"
#include "hsarray/index.h"
#include "hsarray/type_descriptor.h"
#include "hsarray/util/result.h"
#include "hsarray/util/status.h"
#include "hsarray/util/str_cat.h"

namespace hsarray {

namespace {

const std::map<std::string, int64_t>& BooleanEnumMapping() {
  static const std::map<std::string, int64_t> mapping{{"FALSE", 0},
                                                      {"TRUE", 1}};
  return mapping;
}

ByteOrder WireByteOrder(ByteOrder byte_order) {
  return byte_order == ByteOrder::kBig ? ByteOrder::kBig : ByteOrder::kLittle;
}

bool IsAscii(std::string_view s) {
  for (char c : s) {
    if (!absl::ascii_isascii(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

Result<TypeDescriptor> EncodeObject(const DType& dtype) {
  switch (dtype.object_kind()) {
    case ObjectKind::kVlenBytes:
      return VarStringType{Charset::kAscii, StrPad::kNullTerm};
    case ObjectKind::kVlenText:
      return VarStringType{Charset::kUtf8, StrPad::kNullTerm};
    case ObjectKind::kVlenSequence: {
      HSARRAY_ASSIGN_OR_RETURN(
          auto base, EncodeDType(*dtype.base()),
          MaybeAnnotateStatus(_, "Error encoding vlen base type"));
      return VlenType{MakeTypeDescriptorPtr(std::move(base))};
    }
    case ObjectKind::kObjectReference:
      return ReferenceType{ReferenceFlavor::kObject};
    case ObjectKind::kRegionReference:
      return ReferenceType{ReferenceFlavor::kRegion};
  }
  ABSL_UNREACHABLE();
}

Result<TypeDescriptor> EncodeCompound(const DType& dtype) {
  CompoundType t;
  for (const auto& field : dtype.fields()) {
    if (!IsAscii(field.name)) {
      return absl::InvalidArgumentError(StrCat(
          "Compound field name must be ASCII: \"", field.name, "\""));
    }
    HSARRAY_ASSIGN_OR_RETURN(
        auto field_type, EncodeDType(*field.dtype),
        MaybeAnnotateStatus(_, StrCat("Error encoding field \"", field.name,
                                      "\"")));
    t.fields.push_back(CompoundField{
        field.name, MakeTypeDescriptorPtr(std::move(field_type))});
  }
  return t;
}

}  // namespace

bool IsBooleanEnum(const EnumType& t) {
  return t.mapping == BooleanEnumMapping() && t.base &&
         t.base->holds<IntegerType>();
}

bool IsComplexCompound(const CompoundType& t) {
  if (t.fields.size() != 2 || t.fields[0].name != "r" ||
      t.fields[1].name != "i" || !t.fields[0].type || !t.fields[1].type) {
    return false;
  }
  const auto* real = t.fields[0].type->get_if<FloatType>();
  const auto* imag = t.fields[1].type->get_if<FloatType>();
  return real && imag && (real->width == 4 || real->width == 8) &&
         *real == *imag;
}

Result<TypeDescriptor> EncodeDType(const DType& dtype) {
  switch (dtype.kind()) {
    case DTypeKind::kBool:
      return EnumType{MakeTypeDescriptorPtr(
                          IntegerType{1, true, ByteOrder::kLittle}),
                      BooleanEnumMapping()};
    case DTypeKind::kInt:
    case DTypeKind::kUInt: {
      IntegerType base{dtype.itemsize(), dtype.kind() == DTypeKind::kInt,
                       WireByteOrder(dtype.byte_order())};
      if (!dtype.is_enum()) return base;
      return EnumType{MakeTypeDescriptorPtr(base), dtype.enum_mapping()};
    }
    case DTypeKind::kFloat:
      return FloatType{dtype.itemsize(), WireByteOrder(dtype.byte_order())};
    case DTypeKind::kComplex: {
      const FloatType part{dtype.itemsize() / 2,
                           WireByteOrder(dtype.byte_order())};
      return CompoundType{{CompoundField{"r", MakeTypeDescriptorPtr(part)},
                           CompoundField{"i", MakeTypeDescriptorPtr(part)}}};
    }
    case DTypeKind::kBytes:
      return FixedStringType{dtype.itemsize(), dtype.charset(),
                             StrPad::kNullPad};
    case DTypeKind::kOpaque:
      return OpaqueType{dtype.itemsize(), dtype.opaque_tag()};
    case DTypeKind::kObject:
      return EncodeObject(dtype);
    case DTypeKind::kCompound:
      return EncodeCompound(dtype);
    case DTypeKind::kSubarray: {
      HSARRAY_ASSIGN_OR_RETURN(
          auto base, EncodeDType(*dtype.base()),
          MaybeAnnotateStatus(_, "Error encoding subarray base type"));
      return ArrayType{MakeTypeDescriptorPtr(std::move(base)),
                       std::vector<Index>(dtype.subarray_dims().begin(),
                                          dtype.subarray_dims().end())};
    }
  }
  ABSL_UNREACHABLE();
}

Result<DType> DecodeDType(const TypeDescriptor& t) {
  struct Visitor {
    Result<DType> operator()(const IntegerType& t) {
      return t.is_signed ? DType::Int(t.width, t.byte_order)
                         : DType::UInt(t.width, t.byte_order);
    }
    Result<DType> operator()(const FloatType& t) {
      return DType::Float(t.width, t.byte_order);
    }
    Result<DType> operator()(const FixedStringType& t) {
      return DType::Bytes(t.length, t.charset);
    }
    Result<DType> operator()(const VarStringType& t) {
      return t.charset == Charset::kUtf8 ? DType::VlenText()
                                         : DType::VlenBytes();
    }
    Result<DType> operator()(const OpaqueType& t) {
      return DType::Opaque(t.size, t.tag);
    }
    Result<DType> operator()(const EnumType& t) {
      if (IsBooleanEnum(t)) return DType::Bool();
      HSARRAY_ASSIGN_OR_RETURN(
          auto base, DecodeDType(*t.base),
          MaybeAnnotateStatus(_, "Error decoding enum base type"));
      return DType::Enum(std::move(base), t.mapping);
    }
    Result<DType> operator()(const ArrayType& t) {
      HSARRAY_ASSIGN_OR_RETURN(
          auto base, DecodeDType(*t.base),
          MaybeAnnotateStatus(_, "Error decoding array base type"));
      return DType::Subarray(std::move(base), t.dims);
    }
    Result<DType> operator()(const VlenType& t) {
      HSARRAY_ASSIGN_OR_RETURN(
          auto base, DecodeDType(*t.base),
          MaybeAnnotateStatus(_, "Error decoding vlen base type"));
      return DType::Vlen(std::move(base));
    }
    Result<DType> operator()(const CompoundType& t) {
      if (IsComplexCompound(t)) {
        const auto& part = *t.fields[0].type->get_if<FloatType>();
        return DType::Complex(part.width * 2, part.byte_order);
      }
      std::vector<std::pair<std::string, DType>> fields;
      fields.reserve(t.fields.size());
      for (const auto& field : t.fields) {
        HSARRAY_ASSIGN_OR_RETURN(
            auto field_dtype, DecodeDType(*field.type),
            MaybeAnnotateStatus(_, StrCat("Error decoding field \"",
                                          field.name, "\"")));
        fields.emplace_back(field.name, std::move(field_dtype));
      }
      return DType::Compound(std::move(fields));
    }
    Result<DType> operator()(const ReferenceType& t) {
      return t.flavor == ReferenceFlavor::kObject ? DType::ObjectReference()
                                                  : DType::RegionReference();
    }
  };
  return std::visit(Visitor{}, t.value());
}

Index GetItemSize(const TypeDescriptor& t) {
  struct Visitor {
    Index operator()(const IntegerType& t) { return t.width; }
    Index operator()(const FloatType& t) { return t.width; }
    Index operator()(const FixedStringType& t) { return t.length; }
    Index operator()(const VarStringType&) { return kVariableItemSize; }
    Index operator()(const OpaqueType& t) { return t.size; }
    Index operator()(const EnumType& t) { return GetItemSize(*t.base); }
    Index operator()(const ArrayType& t) {
      Index size = GetItemSize(*t.base);
      if (size == kVariableItemSize) return kVariableItemSize;
      for (Index dim : t.dims) size *= dim;
      return size;
    }
    Index operator()(const VlenType&) { return kVariableItemSize; }
    Index operator()(const CompoundType& t) {
      Index size = 0;
      for (const auto& field : t.fields) {
        const Index field_size = GetItemSize(*field.type);
        if (field_size == kVariableItemSize) return kVariableItemSize;
        size += field_size;
      }
      return size;
    }
    Index operator()(const ReferenceType&) { return kVariableItemSize; }
  };
  return std::visit(Visitor{}, t.value());
}

Result<::nlohmann::json> EncodeTypeJson(const DType& dtype) {
  HSARRAY_ASSIGN_OR_RETURN(auto t, EncodeDType(dtype));
  return TypeDescriptorToJson(t);
}

Result<DType> DecodeTypeJson(const ::nlohmann::json& j) {
  HSARRAY_ASSIGN_OR_RETURN(auto t, ParseTypeDescriptor(j));
  return DecodeDType(t);
}

}  // namespace hsarray
