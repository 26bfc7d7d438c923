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
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "hsarray/dtype.h"
#include "hsarray/index.h"
#include "hsarray/util/status_testutil.h"
#include "hsarray/util/str_cat.h"

namespace {

using ::hsarray::Array;
using ::hsarray::BroadcastArray;
using ::hsarray::CopyRegion;
using ::hsarray::DType;
using ::hsarray::DTypeOf;
using ::hsarray::Index;
using ::hsarray::MatchesStatus;
using ::hsarray::StrCat;
using ::testing::ElementsAre;

TEST(ArrayTest, Basic) {
  auto array = Array::FromVector<int32_t>({1, 2, 3, 4, 5, 6}, {2, 3});
  EXPECT_EQ(DTypeOf<int32_t>(), array.dtype());
  EXPECT_EQ(2, array.rank());
  EXPECT_EQ(6, array.num_elements());
  EXPECT_EQ(24, array.num_bytes());
  EXPECT_EQ(5, array.GetValue<int32_t>(4));
  array.SetValue<int32_t>(4, 50);
  EXPECT_THAT(array.ToVector<int32_t>(), ElementsAre(1, 2, 3, 4, 50, 6));
  EXPECT_EQ("Array(<i4, {2, 3})", StrCat(array));
}

TEST(ArrayTest, ZeroInitialized) {
  Array array(DTypeOf<double>(), {3});
  EXPECT_THAT(array.ToVector<double>(), ElementsAre(0, 0, 0));
  Array empty(DTypeOf<double>(), {0, 3});
  EXPECT_EQ(0, empty.num_elements());
  EXPECT_EQ(0, empty.num_bytes());
}

TEST(ArrayTest, Null) {
  auto array = Array::Null(DTypeOf<int16_t>());
  EXPECT_TRUE(array.is_null());
  EXPECT_EQ(0, array.num_elements());
  EXPECT_EQ(0, array.rank());
  EXPECT_NE(Array(DTypeOf<int16_t>(), {}), array);
  EXPECT_EQ(Array::Null(DTypeOf<int16_t>()), array);
  EXPECT_EQ("Array(<i2, null)", StrCat(array));
}

TEST(ArrayTest, Strings) {
  auto array = Array::FromStrings({"a", "", "hello"}, {3});
  EXPECT_THAT(array.ToStrings(), ElementsAre("a", "", "hello"));
  array.SetObject(array.element(1), "world");
  array.SetObject(array.element(0), "b");
  EXPECT_THAT(array.ToStrings(), ElementsAre("b", "world", "hello"));
  Array unset(DType::VlenText(), {2});
  EXPECT_THAT(unset.ToStrings(), ElementsAre("", ""));
}

TEST(ArrayTest, EqualityComparesObjectValues) {
  auto a = Array::FromStrings({"x", "y"}, {2});
  Array b(DType::VlenText(), {2});
  // Populating in reverse order gives different slot contents.
  b.SetObject(b.element(1), "y");
  b.SetObject(b.element(0), "x");
  EXPECT_EQ(a, b);
  b.SetObject(b.element(0), "z");
  EXPECT_NE(a, b);
  EXPECT_NE(a, Array::FromStrings({"x", "y"}, {2}, DType::VlenBytes()));
}

TEST(ArrayTest, CopyElementFromRehomesObjects) {
  HSARRAY_ASSERT_OK_AND_ASSIGN(
      auto dtype, DType::Compound({{"id", DTypeOf<int32_t>()},
                                   {"name", DType::VlenText()}}));
  Array src(dtype, {2});
  src.SetValue<int32_t>(1, 7);
  src.SetObject(src.element(1) + 4, "seven");
  Array dst(dtype, {3});
  dst.SetObject(dst.element(0) + 4, "zero");
  dst.CopyElementFrom(src, 1, 2);
  EXPECT_EQ(7, dst.GetValue<int32_t>(2));
  EXPECT_EQ("seven", dst.GetObject(dst.element(2) + 4));
  EXPECT_EQ("zero", dst.GetObject(dst.element(0) + 4));
  dst.CopyElementFrom(src, 0, 0);
  EXPECT_EQ("", dst.GetObject(dst.element(0) + 4));
}

TEST(ArrayTest, CopyPartFromMovesFields) {
  HSARRAY_ASSERT_OK_AND_ASSIGN(
      auto record, DType::Compound({{"id", DTypeOf<int32_t>()},
                                    {"name", DType::VlenText()},
                                    {"score", DTypeOf<double>()}}));
  HSARRAY_ASSERT_OK_AND_ASSIGN(
      auto part, DType::Compound({{"score", DTypeOf<double>()},
                                  {"name", DType::VlenText()}}));
  Array src(part, {1});
  const double one_and_a_half = 1.5;
  std::memcpy(src.element(0), &one_and_a_half, sizeof(double));
  src.SetObject(src.element(0) + 8, "one");
  Array dst(record, {2});
  dst.SetValue<int32_t>(1, 9);
  dst.CopyPartFrom(src, 0, 0, 1, 12, DTypeOf<double>());
  dst.CopyPartFrom(src, 0, 8, 1, 4, DType::VlenText());
  EXPECT_EQ(9, dst.GetValue<int32_t>(1));
  EXPECT_EQ("one", dst.GetObject(dst.element(1) + 4));
  double score;
  std::memcpy(&score, dst.element(1) + 12, sizeof(score));
  EXPECT_EQ(1.5, score);
  EXPECT_EQ("", dst.GetObject(dst.element(0) + 4));
}

TEST(CopyRegionTest, Box) {
  auto src = Array::FromVector<int32_t>({0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11},
                                        {3, 4});
  Array dst(DTypeOf<int32_t>(), {2, 5});
  const Index src_origin[] = {1, 1};
  const Index dst_origin[] = {0, 2};
  const Index extent[] = {2, 3};
  CopyRegion(src, src_origin, dst, dst_origin, extent);
  EXPECT_THAT(dst.ToVector<int32_t>(),
              ElementsAre(0, 0, 5, 6, 7,  //
                          0, 0, 9, 10, 11));
}

TEST(CopyRegionTest, Strings) {
  auto src = Array::FromStrings({"a", "b", "c", "d"}, {2, 2});
  Array dst(DType::VlenText(), {2, 1});
  const Index src_origin[] = {0, 1};
  const Index dst_origin[] = {0, 0};
  const Index extent[] = {2, 1};
  CopyRegion(src, src_origin, dst, dst_origin, extent);
  EXPECT_THAT(dst.ToStrings(), ElementsAre("b", "d"));
}

TEST(CopyRegionTest, RankZero) {
  auto src = Array::FromScalar<double>(2.5);
  Array dst(DTypeOf<double>(), {});
  CopyRegion(src, {}, dst, {}, {});
  EXPECT_EQ(2.5, dst.GetValue<double>(0));
}

TEST(BroadcastArrayTest, ScalarToMatrix) {
  auto value = Array::FromScalar<int16_t>(42);
  const Index target[] = {5, 3};
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto result, BroadcastArray(value, target));
  EXPECT_THAT(result.shape(), ElementsAre(5, 3));
  EXPECT_EQ(std::vector<int16_t>(15, 42), result.ToVector<int16_t>());
}

TEST(BroadcastArrayTest, RowAndColumn) {
  auto row = Array::FromVector<int32_t>({1, 2, 3}, {3});
  const Index target[] = {2, 3};
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto rows, BroadcastArray(row, target));
  EXPECT_THAT(rows.ToVector<int32_t>(), ElementsAre(1, 2, 3, 1, 2, 3));

  auto column = Array::FromVector<int32_t>({1, 2}, {2, 1});
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto columns, BroadcastArray(column, target));
  EXPECT_THAT(columns.ToVector<int32_t>(), ElementsAre(1, 1, 1, 2, 2, 2));
}

TEST(BroadcastArrayTest, LeadingUnitExtents) {
  auto value = Array::FromVector<int32_t>({1, 2, 3}, {1, 1, 3});
  const Index target[] = {3};
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto result, BroadcastArray(value, target));
  EXPECT_THAT(result.ToVector<int32_t>(), ElementsAre(1, 2, 3));
}

TEST(BroadcastArrayTest, Strings) {
  auto value = Array::FromStrings({"x"}, {});
  const Index target[] = {2};
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto result, BroadcastArray(value, target));
  EXPECT_THAT(result.ToStrings(), ElementsAre("x", "x"));
}

TEST(BroadcastArrayTest, Errors) {
  const Index target[] = {5, 3};
  EXPECT_THAT(
      BroadcastArray(Array::FromVector<int32_t>({1, 2}, {2}), target),
      MatchesStatus(absl::StatusCode::kFailedPrecondition,
                    "Can't broadcast \\{2\\} to \\{5, 3\\}"));
  EXPECT_THAT(BroadcastArray(Array::FromVector<int32_t>({1, 2}, {2, 1, 1}),
                             target),
              MatchesStatus(absl::StatusCode::kFailedPrecondition));
  EXPECT_THAT(BroadcastArray(Array::Null(DTypeOf<int32_t>()), target),
              MatchesStatus(absl::StatusCode::kFailedPrecondition));
}

}  // namespace
