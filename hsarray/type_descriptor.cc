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

#include "hsarray/type_descriptor.h"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "absl/strings/strip.h"
#include <nlohmann/json.hpp>
#include "hsarray/encoding.h"
#include "hsarray/index.h"
#include "hsarray/internal/json/value_as.h"
#include "hsarray/util/result.h"
#include "hsarray/util/status.h"
#include "hsarray/util/str_cat.h"

namespace hsarray {

namespace {

bool SameDescriptor(const TypeDescriptorPtr& a, const TypeDescriptorPtr& b) {
  if (a == b) return true;
  if (!a || !b) return false;
  return *a == *b;
}

}  // namespace

bool operator==(const IntegerType& a, const IntegerType& b) {
  return a.width == b.width && a.is_signed == b.is_signed &&
         a.byte_order == b.byte_order;
}
bool operator==(const FloatType& a, const FloatType& b) {
  return a.width == b.width && a.byte_order == b.byte_order;
}
bool operator==(const FixedStringType& a, const FixedStringType& b) {
  return a.length == b.length && a.charset == b.charset && a.pad == b.pad;
}
bool operator==(const VarStringType& a, const VarStringType& b) {
  return a.charset == b.charset && a.pad == b.pad;
}
bool operator==(const OpaqueType& a, const OpaqueType& b) {
  return a.size == b.size && a.tag == b.tag;
}
bool operator==(const EnumType& a, const EnumType& b) {
  return SameDescriptor(a.base, b.base) && a.mapping == b.mapping;
}
bool operator==(const ArrayType& a, const ArrayType& b) {
  return SameDescriptor(a.base, b.base) && a.dims == b.dims;
}
bool operator==(const VlenType& a, const VlenType& b) {
  return SameDescriptor(a.base, b.base);
}
bool operator==(const CompoundField& a, const CompoundField& b) {
  return a.name == b.name && SameDescriptor(a.type, b.type);
}
bool operator==(const CompoundType& a, const CompoundType& b) {
  return a.fields == b.fields;
}
bool operator==(const ReferenceType& a, const ReferenceType& b) {
  return a.flavor == b.flavor;
}

std::string_view TypeDescriptor::class_name() const {
  struct Visitor {
    std::string_view operator()(const IntegerType&) { return "H5T_INTEGER"; }
    std::string_view operator()(const FloatType&) { return "H5T_FLOAT"; }
    std::string_view operator()(const FixedStringType&) { return "H5T_STRING"; }
    std::string_view operator()(const VarStringType&) { return "H5T_STRING"; }
    std::string_view operator()(const OpaqueType&) { return "H5T_OPAQUE"; }
    std::string_view operator()(const EnumType&) { return "H5T_ENUM"; }
    std::string_view operator()(const ArrayType&) { return "H5T_ARRAY"; }
    std::string_view operator()(const VlenType&) { return "H5T_VLEN"; }
    std::string_view operator()(const CompoundType&) { return "H5T_COMPOUND"; }
    std::string_view operator()(const ReferenceType&) {
      return "H5T_REFERENCE";
    }
  };
  return std::visit(Visitor{}, value_);
}

std::ostream& operator<<(std::ostream& os, const TypeDescriptor& t) {
  return os << TypeDescriptorToJson(t).dump();
}

TypeDescriptorPtr MakeTypeDescriptorPtr(TypeDescriptor t) {
  return std::make_shared<const TypeDescriptor>(std::move(t));
}

namespace {

std::string_view ByteOrderSuffix(ByteOrder order) {
  return order == ByteOrder::kBig ? "BE" : "LE";
}

// Parses the "LE"/"BE" suffix of a predefined type name.
bool ParseByteOrderSuffix(std::string_view& name, ByteOrder* order) {
  if (absl::ConsumeSuffix(&name, "LE")) {
    *order = ByteOrder::kLittle;
    return true;
  }
  if (absl::ConsumeSuffix(&name, "BE")) {
    *order = ByteOrder::kBig;
    return true;
  }
  return false;
}

// Parses the width in bits of a predefined type name, returning bytes.
bool ParseBitWidth(std::string_view digits, Index* width) {
  int bits;
  if (!absl::SimpleAtoi(digits, &bits)) return false;
  if (bits != 8 && bits != 16 && bits != 32 && bits != 64) return false;
  *width = bits / 8;
  return true;
}

Result<TypeDescriptor> ParsePredefinedName(std::string_view name) {
  std::string_view rest = name;
  ByteOrder order;
  Index width;
  if (absl::ConsumePrefix(&rest, "H5T_STD_") && !rest.empty() &&
      (rest[0] == 'I' || rest[0] == 'U')) {
    const bool is_signed = rest[0] == 'I';
    rest.remove_prefix(1);
    if (ParseByteOrderSuffix(rest, &order) && ParseBitWidth(rest, &width)) {
      return IntegerType{width, is_signed, order};
    }
  }
  rest = name;
  if (absl::ConsumePrefix(&rest, "H5T_IEEE_F") &&
      ParseByteOrderSuffix(rest, &order) && ParseBitWidth(rest, &width) &&
      width != 1) {
    return FloatType{width, order};
  }
  return absl::InvalidArgumentError(
      StrCat("Unsupported predefined type: \"", name, "\""));
}

std::string IntegerName(const IntegerType& t) {
  return absl::StrFormat("H5T_STD_%c%d%s", t.is_signed ? 'I' : 'U',
                         t.width * 8, ByteOrderSuffix(t.byte_order));
}

std::string FloatName(const FloatType& t) {
  return absl::StrFormat("H5T_IEEE_F%d%s", t.width * 8,
                         ByteOrderSuffix(t.byte_order));
}

Result<std::string> RequireStringMember(const ::nlohmann::json& j,
                                        std::string_view name,
                                        std::string_view context) {
  HSARRAY_ASSIGN_OR_RETURN(const auto* member,
                           internal_json::JsonRequireMember(j, name, context));
  std::string value;
  HSARRAY_RETURN_IF_ERROR(
      internal_json::JsonRequireString(*member, &value),
      MaybeAnnotateStatus(_, StrCat("Error parsing \"", name, "\"")));
  return value;
}

Result<TypeDescriptorPtr> ParseBase(const ::nlohmann::json& j,
                                    std::string_view context) {
  HSARRAY_ASSIGN_OR_RETURN(
      const auto* base_json,
      internal_json::JsonRequireMember(j, "base", context));
  HSARRAY_ASSIGN_OR_RETURN(
      auto base, ParseTypeDescriptor(*base_json),
      MaybeAnnotateStatus(_, "Error parsing \"base\""));
  return MakeTypeDescriptorPtr(std::move(base));
}

Result<TypeDescriptor> ParseNumeric(const ::nlohmann::json& j,
                                    std::string_view type_class) {
  const std::string context = StrCat(type_class, " type");
  HSARRAY_ASSIGN_OR_RETURN(auto base_name,
                           RequireStringMember(j, "base", context));
  HSARRAY_ASSIGN_OR_RETURN(auto t, ParsePredefinedName(base_name));
  const bool want_integer = type_class == "H5T_INTEGER";
  if (t.holds<IntegerType>() != want_integer) {
    return absl::InvalidArgumentError(
        StrCat("Base \"", base_name, "\" is not valid for ", context));
  }
  return t;
}

Result<Charset> ParseCharset(std::string_view name) {
  if (name == "H5T_CSET_ASCII") return Charset::kAscii;
  if (name == "H5T_CSET_UTF8") return Charset::kUtf8;
  return absl::InvalidArgumentError(
      StrCat("Unsupported character set: \"", name, "\""));
}

Result<StrPad> ParseStrPad(std::string_view name) {
  if (name == "H5T_STR_NULLTERM") return StrPad::kNullTerm;
  if (name == "H5T_STR_NULLPAD") return StrPad::kNullPad;
  if (name == "H5T_STR_SPACEPAD") return StrPad::kSpacePad;
  return absl::InvalidArgumentError(
      StrCat("Unsupported string padding: \"", name, "\""));
}

Result<TypeDescriptor> ParseString(const ::nlohmann::json& j) {
  constexpr std::string_view kContext = "H5T_STRING type";
  HSARRAY_ASSIGN_OR_RETURN(
      const auto* length_json,
      internal_json::JsonRequireMember(j, "length", kContext));
  HSARRAY_ASSIGN_OR_RETURN(auto charset_name,
                           RequireStringMember(j, "charSet", kContext));
  HSARRAY_ASSIGN_OR_RETURN(Charset charset, ParseCharset(charset_name));
  std::optional<StrPad> pad;
  if (const auto* pad_json = internal_json::JsonFindMember(j, "strPad")) {
    std::string pad_name;
    HSARRAY_RETURN_IF_ERROR(
        internal_json::JsonRequireString(*pad_json, &pad_name));
    HSARRAY_ASSIGN_OR_RETURN(pad, ParseStrPad(pad_name));
  }
  if (*length_json == "H5T_VARIABLE") {
    return VarStringType{charset, pad.value_or(StrPad::kNullTerm)};
  }
  Index length;
  HSARRAY_RETURN_IF_ERROR(
      internal_json::JsonRequireInteger(*length_json, &length, /*strict=*/true,
                                        1),
      MaybeAnnotateStatus(_, "Error parsing \"length\""));
  return FixedStringType{length, charset, pad.value_or(StrPad::kNullPad)};
}

Result<TypeDescriptor> ParseOpaque(const ::nlohmann::json& j) {
  constexpr std::string_view kContext = "H5T_OPAQUE type";
  HSARRAY_ASSIGN_OR_RETURN(
      const auto* size_json,
      internal_json::JsonRequireMember(j, "size", kContext));
  OpaqueType t;
  HSARRAY_RETURN_IF_ERROR(
      internal_json::JsonRequireInteger(*size_json, &t.size, /*strict=*/true,
                                        1),
      MaybeAnnotateStatus(_, "Error parsing \"size\""));
  if (const auto* tag_json = internal_json::JsonFindMember(j, "tag")) {
    HSARRAY_RETURN_IF_ERROR(
        internal_json::JsonRequireString(*tag_json, &t.tag));
  }
  return t;
}

Result<TypeDescriptor> ParseEnum(const ::nlohmann::json& j) {
  constexpr std::string_view kContext = "H5T_ENUM type";
  EnumType t;
  HSARRAY_ASSIGN_OR_RETURN(t.base, ParseBase(j, kContext));
  HSARRAY_ASSIGN_OR_RETURN(
      const auto* mapping_json,
      internal_json::JsonRequireMember(j, "mapping", kContext));
  if (!mapping_json->is_object() || mapping_json->empty()) {
    return internal_json::ExpectedError(*mapping_json,
                                        "non-empty object for \"mapping\"");
  }
  for (const auto& item : mapping_json->items()) {
    int64_t value;
    HSARRAY_RETURN_IF_ERROR(
        internal_json::JsonRequireInteger(item.value(), &value,
                                          /*strict=*/true),
        MaybeAnnotateStatus(_, StrCat("Error parsing enum member \"",
                                      item.key(), "\"")));
    t.mapping.emplace(item.key(), value);
  }
  return t;
}

Result<TypeDescriptor> ParseArray(const ::nlohmann::json& j) {
  constexpr std::string_view kContext = "H5T_ARRAY type";
  ArrayType t;
  HSARRAY_ASSIGN_OR_RETURN(t.base, ParseBase(j, kContext));
  HSARRAY_ASSIGN_OR_RETURN(
      const auto* dims_json,
      internal_json::JsonRequireMember(j, "dims", kContext));
  auto parse_dim = [&](const ::nlohmann::json& item) -> absl::Status {
    Index dim;
    HSARRAY_RETURN_IF_ERROR(
        internal_json::JsonRequireInteger(item, &dim, /*strict=*/true, 1),
        MaybeAnnotateStatus(_, "Error parsing \"dims\""));
    t.dims.push_back(dim);
    return absl::OkStatus();
  };
  if (dims_json->is_array()) {
    if (dims_json->empty()) {
      return absl::InvalidArgumentError("H5T_ARRAY \"dims\" must not be empty");
    }
    for (const auto& item : *dims_json) {
      HSARRAY_RETURN_IF_ERROR(parse_dim(item));
    }
  } else {
    HSARRAY_RETURN_IF_ERROR(parse_dim(*dims_json));
  }
  return t;
}

Result<TypeDescriptor> ParseCompound(const ::nlohmann::json& j) {
  constexpr std::string_view kContext = "H5T_COMPOUND type";
  HSARRAY_ASSIGN_OR_RETURN(
      const auto* fields_json,
      internal_json::JsonRequireMember(j, "fields", kContext));
  if (!fields_json->is_array() || fields_json->empty()) {
    return internal_json::ExpectedError(*fields_json,
                                        "non-empty array for \"fields\"");
  }
  CompoundType t;
  absl::flat_hash_set<std::string> names;
  for (const auto& field_json : *fields_json) {
    CompoundField field;
    HSARRAY_ASSIGN_OR_RETURN(
        field.name, RequireStringMember(field_json, "name", "compound field"));
    if (!names.insert(field.name).second) {
      return absl::InvalidArgumentError(
          StrCat("Duplicate compound field name: \"", field.name, "\""));
    }
    HSARRAY_ASSIGN_OR_RETURN(
        const auto* type_json,
        internal_json::JsonRequireMember(field_json, "type", "compound field"));
    HSARRAY_ASSIGN_OR_RETURN(
        auto field_type, ParseTypeDescriptor(*type_json),
        MaybeAnnotateStatus(_, StrCat("Error parsing field \"", field.name,
                                      "\"")));
    field.type = MakeTypeDescriptorPtr(std::move(field_type));
    t.fields.push_back(std::move(field));
  }
  return t;
}

Result<TypeDescriptor> ParseReference(const ::nlohmann::json& j) {
  HSARRAY_ASSIGN_OR_RETURN(
      auto base_name, RequireStringMember(j, "base", "H5T_REFERENCE type"));
  if (base_name == "H5T_STD_REF_OBJ") {
    return ReferenceType{ReferenceFlavor::kObject};
  }
  if (base_name == "H5T_STD_REF_DSETREG") {
    return ReferenceType{ReferenceFlavor::kRegion};
  }
  return absl::InvalidArgumentError(
      StrCat("Unsupported reference type: \"", base_name, "\""));
}

}  // namespace

Result<TypeDescriptor> ParseTypeDescriptor(const ::nlohmann::json& j) {
  if (j.is_string()) {
    return ParsePredefinedName(j.get_ref<const std::string&>());
  }
  HSARRAY_ASSIGN_OR_RETURN(auto type_class,
                           RequireStringMember(j, "class", "type"));
  if (type_class == "H5T_INTEGER" || type_class == "H5T_FLOAT") {
    return ParseNumeric(j, type_class);
  }
  if (type_class == "H5T_STRING") return ParseString(j);
  if (type_class == "H5T_OPAQUE") return ParseOpaque(j);
  if (type_class == "H5T_ENUM") return ParseEnum(j);
  if (type_class == "H5T_ARRAY") return ParseArray(j);
  if (type_class == "H5T_VLEN") {
    HSARRAY_ASSIGN_OR_RETURN(auto base, ParseBase(j, "H5T_VLEN type"));
    return VlenType{std::move(base)};
  }
  if (type_class == "H5T_COMPOUND") return ParseCompound(j);
  if (type_class == "H5T_REFERENCE") return ParseReference(j);
  return absl::InvalidArgumentError(
      StrCat("Unknown type class: \"", type_class, "\""));
}

::nlohmann::json TypeDescriptorToJson(const TypeDescriptor& t) {
  struct Visitor {
    ::nlohmann::json operator()(const IntegerType& t) {
      return {{"class", "H5T_INTEGER"}, {"base", IntegerName(t)}};
    }
    ::nlohmann::json operator()(const FloatType& t) {
      return {{"class", "H5T_FLOAT"}, {"base", FloatName(t)}};
    }
    ::nlohmann::json operator()(const FixedStringType& t) {
      return {{"class", "H5T_STRING"},
              {"charSet", std::string(ToString(t.charset))},
              {"length", t.length},
              {"strPad", std::string(ToString(t.pad))}};
    }
    ::nlohmann::json operator()(const VarStringType& t) {
      return {{"class", "H5T_STRING"},
              {"charSet", std::string(ToString(t.charset))},
              {"length", "H5T_VARIABLE"},
              {"strPad", std::string(ToString(t.pad))}};
    }
    ::nlohmann::json operator()(const OpaqueType& t) {
      ::nlohmann::json j{{"class", "H5T_OPAQUE"}, {"size", t.size}};
      if (!t.tag.empty()) j["tag"] = t.tag;
      return j;
    }
    ::nlohmann::json operator()(const EnumType& t) {
      ::nlohmann::json mapping = ::nlohmann::json::object();
      for (const auto& [name, value] : t.mapping) mapping[name] = value;
      return {{"class", "H5T_ENUM"},
              {"base", TypeDescriptorToJson(*t.base)},
              {"mapping", std::move(mapping)}};
    }
    ::nlohmann::json operator()(const ArrayType& t) {
      return {{"class", "H5T_ARRAY"},
              {"base", TypeDescriptorToJson(*t.base)},
              {"dims", t.dims}};
    }
    ::nlohmann::json operator()(const VlenType& t) {
      return {{"class", "H5T_VLEN"}, {"base", TypeDescriptorToJson(*t.base)}};
    }
    ::nlohmann::json operator()(const CompoundType& t) {
      ::nlohmann::json fields = ::nlohmann::json::array();
      for (const auto& field : t.fields) {
        fields.push_back({{"name", field.name},
                          {"type", TypeDescriptorToJson(*field.type)}});
      }
      return {{"class", "H5T_COMPOUND"}, {"fields", std::move(fields)}};
    }
    ::nlohmann::json operator()(const ReferenceType& t) {
      return {{"class", "H5T_REFERENCE"},
              {"base", std::string(ToString(t.flavor))}};
    }
  };
  return std::visit(Visitor{}, t.value());
}

void to_json(::nlohmann::json& j, const TypeDescriptor& t) {
  j = TypeDescriptorToJson(t);
}

}  // namespace hsarray
