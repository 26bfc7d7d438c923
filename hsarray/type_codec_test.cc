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

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include <nlohmann/json.hpp>
#include "hsarray/dtype.h"
#include "hsarray/encoding.h"
#include "hsarray/index.h"
#include "hsarray/type_descriptor.h"
#include "hsarray/util/status_testutil.h"

namespace {

using ::hsarray::ByteOrder;
using ::hsarray::CompoundType;
using ::hsarray::DecodeDType;
using ::hsarray::DecodeTypeJson;
using ::hsarray::DType;
using ::hsarray::DTypeKind;
using ::hsarray::DTypeOf;
using ::hsarray::EncodeDType;
using ::hsarray::EncodeTypeJson;
using ::hsarray::GetItemSize;
using ::hsarray::IsComplexCompound;
using ::hsarray::IsOkAndHolds;
using ::hsarray::kVariableItemSize;
using ::hsarray::MatchesStatus;
using ::hsarray::ObjectKind;
using ::hsarray::ParseTypeDescriptor;
using ::nlohmann::json;

// Checks that decoding is stable across an encode/decode cycle.
void TestRoundTrip(const json& j) {
  SCOPED_TRACE(j.dump());
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto dtype, DecodeTypeJson(j));
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto encoded, EncodeTypeJson(dtype));
  EXPECT_THAT(DecodeTypeJson(encoded), IsOkAndHolds(dtype));
}

TEST(TypeCodecTest, Bool) {
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto j, EncodeTypeJson(DType::Bool()));
  EXPECT_EQ(json({{"class", "H5T_ENUM"},
                  {"base", {{"class", "H5T_INTEGER"},
                            {"base", "H5T_STD_I8LE"}}},
                  {"mapping", {{"FALSE", 0}, {"TRUE", 1}}}}),
            j);
  EXPECT_THAT(DecodeTypeJson(j), IsOkAndHolds(DType::Bool()));

  // Any other mapping stays an enumeration.
  HSARRAY_ASSERT_OK_AND_ASSIGN(
      auto tri, DecodeTypeJson({{"class", "H5T_ENUM"},
                                {"base", "H5T_STD_I8LE"},
                                {"mapping",
                                 {{"FALSE", 0}, {"TRUE", 1}, {"MAYBE", 2}}}}));
  EXPECT_TRUE(tri.is_enum());
  EXPECT_EQ(DTypeKind::kInt, tri.kind());
}

TEST(TypeCodecTest, Integers) {
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto be, DType::UInt(2, ByteOrder::kBig));
  EXPECT_THAT(EncodeTypeJson(be),
              IsOkAndHolds(json({{"class", "H5T_INTEGER"},
                                 {"base", "H5T_STD_U16BE"}})));
  EXPECT_THAT(EncodeTypeJson(DTypeOf<int8_t>()),
              IsOkAndHolds(json({{"class", "H5T_INTEGER"},
                                 {"base", "H5T_STD_I8LE"}})));
  EXPECT_THAT(DecodeTypeJson("H5T_STD_I8BE"),
              IsOkAndHolds(DTypeOf<int8_t>()));
  EXPECT_THAT(DecodeTypeJson("H5T_IEEE_F64LE"),
              IsOkAndHolds(DType::Float(8, ByteOrder::kLittle).value()));
}

TEST(TypeCodecTest, Strings) {
  EXPECT_THAT(EncodeTypeJson(DType::VlenText()),
              IsOkAndHolds(json({{"class", "H5T_STRING"},
                                 {"charSet", "H5T_CSET_UTF8"},
                                 {"length", "H5T_VARIABLE"},
                                 {"strPad", "H5T_STR_NULLTERM"}})));
  EXPECT_THAT(EncodeTypeJson(DType::VlenBytes()),
              IsOkAndHolds(json({{"class", "H5T_STRING"},
                                 {"charSet", "H5T_CSET_ASCII"},
                                 {"length", "H5T_VARIABLE"},
                                 {"strPad", "H5T_STR_NULLTERM"}})));
  EXPECT_THAT(EncodeTypeJson(DType::Bytes(5).value()),
              IsOkAndHolds(json({{"class", "H5T_STRING"},
                                 {"charSet", "H5T_CSET_ASCII"},
                                 {"length", 5},
                                 {"strPad", "H5T_STR_NULLPAD"}})));
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto text,
                               DecodeTypeJson({{"class", "H5T_STRING"},
                                               {"charSet", "H5T_CSET_UTF8"},
                                               {"length", "H5T_VARIABLE"}}));
  EXPECT_EQ(ObjectKind::kVlenText, text.object_kind());
}

TEST(TypeCodecTest, References) {
  EXPECT_THAT(EncodeTypeJson(DType::ObjectReference()),
              IsOkAndHolds(json({{"class", "H5T_REFERENCE"},
                                 {"base", "H5T_STD_REF_OBJ"}})));
  EXPECT_THAT(DecodeTypeJson({{"class", "H5T_REFERENCE"},
                              {"base", "H5T_STD_REF_DSETREG"}}),
              IsOkAndHolds(DType::RegionReference()));
}

TEST(TypeCodecTest, Subarray) {
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto dtype,
                               DType::Subarray(DTypeOf<int16_t>(), {2, 3}));
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto t, EncodeDType(dtype));
  EXPECT_EQ(12, GetItemSize(t));
  EXPECT_THAT(DecodeDType(t), IsOkAndHolds(dtype));
}

TEST(TypeCodecTest, VariableSizeCompound) {
  json j{{"class", "H5T_COMPOUND"},
         {"fields",
          {{{"name", "id"}, {"type", "H5T_STD_I32LE"}},
           {{"name", "label"},
            {"type",
             {{"class", "H5T_STRING"},
              {"charSet", "H5T_CSET_UTF8"},
              {"length", "H5T_VARIABLE"}}}}}}};
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto t, ParseTypeDescriptor(j));
  EXPECT_EQ(kVariableItemSize, GetItemSize(t));
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto dtype, DecodeDType(t));
  EXPECT_EQ(DTypeKind::kCompound, dtype.kind());
  EXPECT_EQ(12, dtype.itemsize());
  EXPECT_TRUE(dtype.has_objects());
  TestRoundTrip(j);
}

json ComplexJson(const json& real, const json& imag,
                 const char* real_name = "r") {
  return {{"class", "H5T_COMPOUND"},
          {"fields",
           {{{"name", real_name}, {"type", real}},
            {{"name", "i"}, {"type", imag}}}}};
}

TEST(TypeCodecTest, Complex) {
  HSARRAY_ASSERT_OK_AND_ASSIGN(
      auto t, ParseTypeDescriptor(
                  ComplexJson("H5T_IEEE_F64LE", "H5T_IEEE_F64LE")));
  ASSERT_TRUE(t.holds<CompoundType>());
  EXPECT_TRUE(IsComplexCompound(*t.get_if<CompoundType>()));
  EXPECT_EQ(16, GetItemSize(t));
  EXPECT_THAT(DecodeDType(t),
              IsOkAndHolds(DType::Complex(16, ByteOrder::kLittle).value()));

  HSARRAY_ASSERT_OK_AND_ASSIGN(auto c8, DType::Complex(8, ByteOrder::kBig));
  json f4be{{"class", "H5T_FLOAT"}, {"base", "H5T_IEEE_F32BE"}};
  EXPECT_THAT(EncodeTypeJson(c8), IsOkAndHolds(ComplexJson(f4be, f4be)));
  TestRoundTrip(ComplexJson(f4be, f4be));
}

TEST(TypeCodecTest, ComplexRequiresMatchingFloatPair) {
  // Each of these remains an ordinary compound type.
  const json cases[] = {
      ComplexJson("H5T_IEEE_F32LE", "H5T_IEEE_F64LE"),
      ComplexJson("H5T_IEEE_F64LE", "H5T_IEEE_F64BE"),
      ComplexJson("H5T_IEEE_F16LE", "H5T_IEEE_F16LE"),
      ComplexJson("H5T_STD_I32LE", "H5T_STD_I32LE"),
      ComplexJson("H5T_IEEE_F64LE", "H5T_IEEE_F64LE", "re"),
  };
  for (const auto& j : cases) {
    SCOPED_TRACE(j.dump());
    HSARRAY_ASSERT_OK_AND_ASSIGN(auto t, ParseTypeDescriptor(j));
    EXPECT_FALSE(IsComplexCompound(*t.get_if<CompoundType>()));
    HSARRAY_ASSERT_OK_AND_ASSIGN(auto dtype, DecodeDType(t));
    EXPECT_EQ(DTypeKind::kCompound, dtype.kind());
  }
}

TEST(TypeCodecTest, GetItemSize) {
  auto size_of = [](const json& j) {
    return GetItemSize(ParseTypeDescriptor(j).value());
  };
  EXPECT_EQ(4, size_of("H5T_IEEE_F32BE"));
  EXPECT_EQ(kVariableItemSize,
            size_of({{"class", "H5T_VLEN"}, {"base", "H5T_STD_I8LE"}}));
  EXPECT_EQ(kVariableItemSize, size_of({{"class", "H5T_REFERENCE"},
                                        {"base", "H5T_STD_REF_OBJ"}}));
  EXPECT_EQ(7, size_of({{"class", "H5T_OPAQUE"}, {"size", 7}}));
  EXPECT_EQ(2, size_of({{"class", "H5T_ENUM"},
                        {"base", "H5T_STD_U16LE"},
                        {"mapping", {{"A", 0}}}}));
  EXPECT_EQ(kVariableItemSize,
            size_of({{"class", "H5T_ARRAY"},
                     {"base", {{"class", "H5T_VLEN"},
                               {"base", "H5T_STD_I8LE"}}},
                     {"dims", {4}}}));
  EXPECT_EQ(9, size_of({{"class", "H5T_COMPOUND"},
                        {"fields",
                         {{{"name", "a"}, {"type", "H5T_STD_U8LE"}},
                          {{"name", "b"}, {"type", "H5T_IEEE_F64BE"}}}}}));
}

TEST(TypeCodecTest, RoundTrip) {
  TestRoundTrip("H5T_STD_U64BE");
  TestRoundTrip({{"class", "H5T_OPAQUE"}, {"size", 3}, {"tag", "t"}});
  TestRoundTrip({{"class", "H5T_ENUM"},
                 {"base", "H5T_STD_I16BE"},
                 {"mapping", {{"LOW", -1}, {"HIGH", 1}}}});
  TestRoundTrip({{"class", "H5T_VLEN"},
                 {"base", {{"class", "H5T_COMPOUND"},
                           {"fields",
                            {{{"name", "x"}, {"type", "H5T_IEEE_F32LE"}},
                             {{"name", "y"}, {"type", "H5T_IEEE_F32LE"}}}}}}});
  TestRoundTrip({{"class", "H5T_ARRAY"},
                 {"base", {{"class", "H5T_ARRAY"},
                           {"base", "H5T_STD_I8LE"},
                           {"dims", {2}}}},
                 {"dims", {3}}});
}

TEST(TypeCodecTest, Errors) {
  EXPECT_THAT(DecodeTypeJson({{"class", "H5T_ENUM"},
                              {"base", "H5T_IEEE_F32LE"},
                              {"mapping", {{"A", 0}}}}),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Enum base must be an integer type, .*"));
  HSARRAY_ASSERT_OK_AND_ASSIGN(
      auto dtype, DType::Compound({{"caf\xc3\xa9", DTypeOf<int32_t>()}}));
  EXPECT_THAT(EncodeDType(dtype),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Compound field name must be ASCII: .*"));
  EXPECT_THAT(DecodeTypeJson({{"class", "H5T_BITFIELD"}}),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Unknown type class: .*"));
}

}  // namespace
