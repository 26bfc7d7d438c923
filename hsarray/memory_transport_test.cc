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

#include "hsarray/memory_transport.h"

#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include <nlohmann/json.hpp>
#include "hsarray/array.h"
#include "hsarray/chunk_layout.h"
#include "hsarray/dtype.h"
#include "hsarray/element_codec.h"
#include "hsarray/index.h"
#include "hsarray/shape.h"
#include "hsarray/transport.h"
#include "hsarray/type_codec.h"
#include "hsarray/util/status_testutil.h"

namespace {

using ::hsarray::Array;
using ::hsarray::ChunkLayout;
using ::hsarray::Dataspace;
using ::hsarray::DecodeElements;
using ::hsarray::DType;
using ::hsarray::DTypeOf;
using ::hsarray::EncodeDType;
using ::hsarray::EncodeElements;
using ::hsarray::Index;
using ::hsarray::kUnlimited;
using ::hsarray::MatchesStatus;
using ::hsarray::MemoryTransport;
using ::hsarray::Shape;
using ::hsarray::ValueRequest;
using ::testing::ElementsAre;

class MemoryTransportTest : public ::testing::Test {
 protected:
  void SetUp() override {
    HSARRAY_ASSERT_OK_AND_ASSIGN(auto layout, ChunkLayout::Create({2, 2}));
    HSARRAY_ASSERT_OK(transport_.CreateDataset(
        "d-1", DTypeOf<int32_t>(),
        Dataspace{Shape({3, 4}), std::vector<Index>{kUnlimited, 4}}, layout));
    std::vector<int32_t> values(12);
    for (int i = 0; i < 12; ++i) values[i] = i;
    HSARRAY_ASSERT_OK(
        transport_.SetArray("d-1", Array::FromVector(values, {3, 4})));
  }

  ValueRequest Request(std::optional<std::string> select = std::nullopt) {
    ValueRequest request;
    request.id = "d-1";
    request.select = std::move(select);
    request.type = EncodeDType(DTypeOf<int32_t>()).value();
    return request;
  }

  std::vector<int32_t> FetchInts(const ValueRequest& request,
                                 std::vector<Index> shape) {
    auto payload = transport_.Fetch(request);
    EXPECT_TRUE(payload.ok()) << payload.status();
    if (!payload.ok()) return {};
    auto array = DecodeElements(*payload, DTypeOf<int32_t>(), shape);
    EXPECT_TRUE(array.ok()) << array.status();
    if (!array.ok()) return {};
    return array->ToVector<int32_t>();
  }

  MemoryTransport transport_;
};

TEST_F(MemoryTransportTest, Metadata) {
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto metadata, transport_.GetMetadata("d-1"));
  EXPECT_EQ("d-1", metadata["id"]);
  EXPECT_EQ((::nlohmann::json{{"class", "H5S_SIMPLE"},
                              {"dims", {3, 4}},
                              {"maxdims",
                               ::nlohmann::json::array({"H5S_UNLIMITED", 4})}}),
            metadata["shape"]);
  EXPECT_EQ("H5T_INTEGER", metadata["type"]["class"]);
  EXPECT_EQ((::nlohmann::json{{"class", "H5D_CHUNKED"}, {"dims", {2, 2}}}),
            metadata["creationProperties"]["layout"]);
  EXPECT_THAT(transport_.GetMetadata("d-2"),
              MatchesStatus(absl::StatusCode::kNotFound));
}

TEST_F(MemoryTransportTest, FetchSelection) {
  EXPECT_THAT(FetchInts(Request(), {3, 4}),
              ElementsAre(0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11));
  EXPECT_THAT(FetchInts(Request("[1:3,0:4:2]"), {2, 2}),
              ElementsAre(4, 6, 8, 10));
  EXPECT_THAT(FetchInts(Request("[2,[0,3]]"), {2}), ElementsAre(8, 11));
}

TEST_F(MemoryTransportTest, FetchPoints) {
  auto request = Request();
  request.points = {{2, 3}, {0, 1}};
  EXPECT_THAT(FetchInts(request, {2}), ElementsAre(11, 1));
  request.points = {{3, 0}};
  EXPECT_THAT(transport_.Fetch(request),
              MatchesStatus(absl::StatusCode::kOutOfRange));
}

TEST_F(MemoryTransportTest, Store) {
  HSARRAY_ASSERT_OK_AND_ASSIGN(
      auto payload,
      EncodeElements(Array::FromVector<int32_t>({-1, -2}, {1, 2})));
  HSARRAY_ASSERT_OK(transport_.Store(Request("[0:1,2:4]"), payload));
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto array, transport_.GetArray("d-1"));
  EXPECT_THAT(array.ToVector<int32_t>(),
              ElementsAre(0, 1, -1, -2, 4, 5, 6, 7, 8, 9, 10, 11));
  EXPECT_THAT(transport_.Store(Request("[0:1,2:4]"), payload.substr(1)),
              MatchesStatus(absl::StatusCode::kDataLoss));
}

TEST_F(MemoryTransportTest, RecordsRequestsAndRunsHook) {
  EXPECT_THAT(FetchInts(Request("[0,0]"), {}), ElementsAre(0));
  int calls = 0;
  transport_.SetRequestHook([&](const ValueRequest& request) {
    ++calls;
    return absl::UnavailableError("injected");
  });
  EXPECT_THAT(transport_.Fetch(Request("[0,1]")),
              MatchesStatus(absl::StatusCode::kUnavailable, "injected"));
  EXPECT_EQ(1, calls);
  auto requests = transport_.requests();
  ASSERT_EQ(2u, requests.size());
  EXPECT_EQ(std::optional<std::string>("[0,0]"), requests[0].select);
  EXPECT_EQ(std::optional<std::string>("[0,1]"), requests[1].select);
  transport_.ClearRequests();
  EXPECT_TRUE(transport_.requests().empty());
}

TEST_F(MemoryTransportTest, TypeMismatch) {
  auto request = Request();
  request.type = EncodeDType(DTypeOf<int16_t>()).value();
  EXPECT_THAT(transport_.Fetch(request),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Request type .* does not match type .*"));
}

TEST_F(MemoryTransportTest, SetExtent) {
  const Index grown[] = {4, 4};
  HSARRAY_ASSERT_OK(transport_.SetExtent("d-1", grown));
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto array, transport_.GetArray("d-1"));
  EXPECT_THAT(array.shape(), ElementsAre(4, 4));
  EXPECT_THAT(array.ToVector<int32_t>(),
              ElementsAre(0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 0, 0, 0, 0));
  const Index shrunk[] = {1, 2};
  HSARRAY_ASSERT_OK(transport_.SetExtent("d-1", shrunk));
  HSARRAY_ASSERT_OK_AND_ASSIGN(array, transport_.GetArray("d-1"));
  EXPECT_THAT(array.ToVector<int32_t>(), ElementsAre(0, 1));
  const Index too_wide[] = {1, 5};
  EXPECT_THAT(transport_.SetExtent("d-1", too_wide),
              MatchesStatus(absl::StatusCode::kOutOfRange));
}

TEST_F(MemoryTransportTest, CreateErrors) {
  EXPECT_THAT(transport_.CreateDataset("d-1", DTypeOf<int32_t>(),
                                       Dataspace{Shape({1})}),
              MatchesStatus(absl::StatusCode::kAlreadyExists));
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto layout, ChunkLayout::Create({2}));
  EXPECT_THAT(transport_.CreateDataset("d-2", DTypeOf<int32_t>(),
                                       Dataspace{Shape({4, 4})}, layout),
              MatchesStatus(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(transport_.CreateDataset("d-3", DTypeOf<int32_t>(),
                                       Dataspace{Shape::Scalar()}, layout),
              MatchesStatus(absl::StatusCode::kInvalidArgument));
}

TEST(MemoryTransportFieldsTest, TransfersNamedFields) {
  MemoryTransport transport;
  HSARRAY_ASSERT_OK_AND_ASSIGN(
      auto dtype, DType::Compound({{"x", DTypeOf<int32_t>()},
                                   {"label", DType::VlenText()},
                                   {"y", DTypeOf<int32_t>()}}));
  HSARRAY_ASSERT_OK(
      transport.CreateDataset("d-xy", dtype, Dataspace{Shape({2})}));
  Array value(dtype, {2});
  for (int i = 0; i < 2; ++i) {
    value.SetValue<int32_t>(i, 10 + i);
    value.SetObject(value.element(i) + 4, i == 0 ? "a" : "b");
    std::memcpy(value.element(i) + 12, &i, sizeof(int32_t));
  }
  HSARRAY_ASSERT_OK(transport.SetArray("d-xy", value));

  ValueRequest request;
  request.id = "d-xy";
  request.type = EncodeDType(dtype).value();
  request.fields = {"label", "x"};
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto payload, transport.Fetch(request));
  HSARRAY_ASSERT_OK_AND_ASSIGN(
      auto part_dtype, DType::Compound({{"label", DType::VlenText()},
                                        {"x", DTypeOf<int32_t>()}}));
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto part,
                               DecodeElements(payload, part_dtype, {2}));
  EXPECT_EQ("b", part.GetObject(part.element(1)));
  int32_t x;
  std::memcpy(&x, part.element(1) + 8, sizeof(x));
  EXPECT_EQ(11, x);

  // Storing a single field leaves the others unchanged.
  request.fields = {"y"};
  request.select = "[1:2]";
  HSARRAY_ASSERT_OK_AND_ASSIGN(
      payload, EncodeElements(Array::FromVector<int32_t>({-5}, {1})));
  HSARRAY_ASSERT_OK(transport.Store(request, payload));
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto stored, transport.GetArray("d-xy"));
  int32_t y;
  std::memcpy(&y, stored.element(1) + 12, sizeof(y));
  EXPECT_EQ(-5, y);
  EXPECT_EQ(11, stored.GetValue<int32_t>(1));
  EXPECT_EQ("b", stored.GetObject(stored.element(1) + 4));
  std::memcpy(&y, stored.element(0) + 12, sizeof(y));
  EXPECT_EQ(0, y);

  request.fields = {"z"};
  EXPECT_THAT(transport.Fetch(request),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Field \"z\" does not appear in type .*"));
}

TEST(MemoryTransportNullTest, FetchFails) {
  MemoryTransport transport;
  HSARRAY_ASSERT_OK(transport.CreateDataset("d-n", DType::VlenText(),
                                            Dataspace{Shape::Null()}));
  ValueRequest request;
  request.id = "d-n";
  request.type = EncodeDType(DType::VlenText()).value();
  EXPECT_THAT(transport.Fetch(request),
              MatchesStatus(absl::StatusCode::kFailedPrecondition));
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto array, transport.GetArray("d-n"));
  EXPECT_TRUE(array.is_null());
}

}  // namespace
