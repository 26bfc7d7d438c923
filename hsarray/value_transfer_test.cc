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

#include "hsarray/value_transfer.h"

#include <complex>
#include <cstdint>
#include <cstring>
#include <memory>
#include <numeric>
#include <optional>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "hsarray/array.h"
#include "hsarray/array_handle.h"
#include "hsarray/chunk_iterator.h"
#include "hsarray/chunk_layout.h"
#include "hsarray/connection_registry.h"
#include "hsarray/dtype.h"
#include "hsarray/index.h"
#include "hsarray/index_expression.h"
#include "hsarray/memory_transport.h"
#include "hsarray/selection.h"
#include "hsarray/shape.h"
#include "hsarray/transport.h"
#include "hsarray/util/result.h"
#include "hsarray/util/status_testutil.h"

namespace {

using ::hsarray::Array;
using ::hsarray::ArrayHandle;
using ::hsarray::ChunkLayout;
using ::hsarray::ChunkRegion;
using ::hsarray::ConnectionHandle;
using ::hsarray::ConnectionRegistry;
using ::hsarray::Dataspace;
using ::hsarray::DType;
using ::hsarray::DTypeOf;
using ::hsarray::Ellipsis;
using ::hsarray::Index;
using ::hsarray::IterChunks;
using ::hsarray::IndexList;
using ::hsarray::kUnlimited;
using ::hsarray::MatchesStatus;
using ::hsarray::MemoryTransport;
using ::hsarray::OpenArray;
using ::hsarray::Read;
using ::hsarray::ReadPoints;
using ::hsarray::Result;
using ::hsarray::Select;
using ::hsarray::Shape;
using ::hsarray::Slice;
using ::hsarray::TransferOptions;
using ::hsarray::ValueRequest;
using ::hsarray::Write;
using ::hsarray::WritePoints;
using ::testing::ElementsAre;
using ::testing::ElementsAreArray;

std::vector<int32_t> Iota(Index n) {
  std::vector<int32_t> values(n);
  std::iota(values.begin(), values.end(), 0);
  return values;
}

ChunkLayout Chunks(std::vector<Index> extents) {
  return ChunkLayout::Create(extents).value();
}

class ValueTransferTest : public ::testing::Test {
 protected:
  ValueTransferTest()
      : transport_(std::make_shared<MemoryTransport>()),
        connection_(registry_.Register(transport_)) {}

  // Creates an int32 dataset filled with 0, 1, 2, ... in C order.
  ArrayHandle CreateInts(std::string id, std::vector<Index> shape,
                         std::optional<ChunkLayout> layout,
                         std::optional<std::vector<Index>> maxshape = {}) {
    Index n = 1;
    for (Index extent : shape) n *= extent;
    EXPECT_TRUE(transport_
                    ->CreateDataset(id, DTypeOf<int32_t>(),
                                    Dataspace{Shape(shape), maxshape}, layout)
                    .ok());
    EXPECT_TRUE(
        transport_->SetArray(id, Array::FromVector(Iota(n), shape)).ok());
    return Open(id);
  }

  ArrayHandle Open(std::string id) {
    auto handle = OpenArray(registry_, connection_, id);
    EXPECT_TRUE(handle.ok()) << handle.status();
    transport_->ClearRequests();
    return handle.ok() ? *handle : ArrayHandle{};
  }

  std::vector<std::string> Selects() {
    std::vector<std::string> selects;
    for (const auto& request : transport_->requests()) {
      selects.push_back(request.select.value_or("<none>"));
    }
    return selects;
  }

  ConnectionRegistry registry_;
  std::shared_ptr<MemoryTransport> transport_;
  ConnectionHandle connection_;
};

TEST_F(ValueTransferTest, OpenArray) {
  auto handle = CreateInts("d-1", {10, 4}, Chunks({5, 4}),
                           std::vector<Index>{kUnlimited, 4});
  EXPECT_EQ("d-1", handle.id);
  EXPECT_EQ(Shape({10, 4}), handle.shape());
  EXPECT_EQ(DTypeOf<int32_t>(), handle.dtype);
  EXPECT_EQ(Chunks({5, 4}), handle.chunk_layout);
  EXPECT_EQ((std::vector<Index>{kUnlimited, 4}), handle.dataspace.maxshape);

  HSARRAY_ASSERT_OK_AND_ASSIGN(
      auto prefixed, OpenArray(registry_, connection_, "datasets/d-1"));
  EXPECT_EQ("d-1", prefixed.id);
}

TEST_F(ValueTransferTest, OpenArrayErrors) {
  EXPECT_THAT(OpenArray(registry_, connection_, "g-1"),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Object Group\\(g-1\\) is not a dataset"));
  EXPECT_THAT(OpenArray(registry_, connection_, "d-missing"),
              MatchesStatus(absl::StatusCode::kNotFound));
}

TEST_F(ValueTransferTest, ShapeLaw) {
  auto handle = CreateInts("d-cube", {10, 10, 10}, Chunks({4, 4, 4}));
  HSARRAY_ASSERT_OK_AND_ASSIGN(
      auto result, Read(handle, {Slice{2, 6, 2}, 3, Slice{}}));
  EXPECT_THAT(result.shape(), ElementsAre(2, 10));
  std::vector<int32_t> expected;
  for (int i : {2, 4}) {
    for (int k = 0; k < 10; ++k) expected.push_back(i * 100 + 30 + k);
  }
  EXPECT_EQ(expected, result.ToVector<int32_t>());
  EXPECT_THAT(Selects(), ElementsAre("[2:6:2,3,0:10]"));
}

TEST_F(ValueTransferTest, PagedRead) {
  auto handle = CreateInts("d-line", {13}, Chunks({4}));
  TransferOptions options;
  options.max_chunks_per_request = 1;
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto result, Read(handle, {}, options));
  EXPECT_EQ(Iota(13), result.ToVector<int32_t>());
  EXPECT_THAT(Selects(), ElementsAre("[0:4]", "[4:8]", "[8:12]", "[12:13]"));
}

TEST_F(ValueTransferTest, PagedReadWithStep) {
  auto handle = CreateInts("d-line", {13}, Chunks({4}));
  TransferOptions options;
  options.max_chunks_per_request = 1;
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto result,
                               Read(handle, {Slice{1, 13, 3}}, options));
  EXPECT_THAT(result.ToVector<int32_t>(), ElementsAre(1, 4, 7, 10));
  EXPECT_THAT(Selects(), ElementsAre("[1:7:3]", "[7:13:3]"));
}

TEST_F(ValueTransferTest, PagesAlongAxisWithMostChunks) {
  auto handle = CreateInts("d-2d", {8, 20}, Chunks({4, 4}));
  TransferOptions options;
  options.max_chunks_per_request = 2;
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto result, Read(handle, {}, options));
  EXPECT_EQ(Iota(160), result.ToVector<int32_t>());
  EXPECT_THAT(Selects(),
              ElementsAre("[0:8,0:8]", "[0:8,8:16]", "[0:8,16:20]"));

  transport_->ClearRequests();
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto row, Read(handle, {3, Slice{}}, options));
  std::vector<int32_t> expected(20);
  std::iota(expected.begin(), expected.end(), 60);
  EXPECT_EQ(expected, row.ToVector<int32_t>());
  EXPECT_THAT(Selects(), ElementsAre("[3,0:8]", "[3,8:16]", "[3,16:20]"));
}

TEST_F(ValueTransferTest, UnchunkedReadIsOneRequest) {
  auto handle = CreateInts("d-flat", {6, 2}, std::nullopt);
  TransferOptions options;
  options.max_chunks_per_request = 1;
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto result, Read(handle, {}, options));
  EXPECT_EQ(Iota(12), result.ToVector<int32_t>());
  EXPECT_THAT(Selects(), ElementsAre("[0:6,0:2]"));
}

TEST_F(ValueTransferTest, SingleElement) {
  auto handle = CreateInts("d-2d", {8, 20}, Chunks({4, 4}));
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto result, Read(handle, {2, 5}));
  EXPECT_EQ(0, result.rank());
  EXPECT_EQ(45, result.GetValue<int32_t>(0));
  EXPECT_THAT(Selects(), ElementsAre("[2,5]"));
}

TEST_F(ValueTransferTest, EmptySelection) {
  auto empty = CreateInts("d-empty", {0, 3}, Chunks({4, 3}));
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto result, Read(empty, {}));
  EXPECT_THAT(result.shape(), ElementsAre(0, 3));
  auto handle = CreateInts("d-line", {13}, Chunks({4}));
  HSARRAY_ASSERT_OK_AND_ASSIGN(result, Read(handle, {Slice{5, 5}}));
  EXPECT_THAT(result.shape(), ElementsAre(0));
  EXPECT_TRUE(transport_->requests().empty());
}

TEST_F(ValueTransferTest, FancyRead) {
  auto handle = CreateInts("d-2d", {8, 20}, Chunks({4, 4}));
  HSARRAY_ASSERT_OK_AND_ASSIGN(
      auto result, Read(handle, {Slice{0, 2}, IndexList{{1, 5, 19}}}));
  EXPECT_THAT(result.shape(), ElementsAre(2, 3));
  EXPECT_THAT(result.ToVector<int32_t>(), ElementsAre(1, 5, 19, 21, 25, 39));
  auto requests = transport_->requests();
  ASSERT_EQ(1u, requests.size());
  EXPECT_EQ("[0:2,[1,5,19]]", requests[0].select);
  EXPECT_FALSE(requests[0].post_select);
}

TEST_F(ValueTransferTest, LongFancySelectionIsPosted) {
  auto handle = CreateInts("d-long", {200}, Chunks({50}));
  std::vector<Index> indices;
  for (Index i = 0; i < 200; i += 4) indices.push_back(i);
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto result,
                               Read(handle, {IndexList{indices}}));
  EXPECT_EQ(50, result.num_elements());
  EXPECT_EQ(196, result.GetValue<int32_t>(49));
  auto requests = transport_->requests();
  ASSERT_EQ(1u, requests.size());
  EXPECT_TRUE(requests[0].post_select);

  TransferOptions options;
  options.max_select_query_len = 1000;
  transport_->ClearRequests();
  HSARRAY_ASSERT_OK(Read(handle, {IndexList{indices}}, options).status());
  EXPECT_FALSE(transport_->requests()[0].post_select);
}

TEST_F(ValueTransferTest, Points) {
  auto handle = CreateInts("d-2d", {8, 20}, Chunks({4, 4}));
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto result,
                               ReadPoints(handle, {{7, 19}, {0, 3}}));
  EXPECT_THAT(result.ToVector<int32_t>(), ElementsAre(159, 3));
  auto requests = transport_->requests();
  ASSERT_EQ(1u, requests.size());
  EXPECT_FALSE(requests[0].select.has_value());
  EXPECT_EQ(2u, requests[0].points.size());

  HSARRAY_ASSERT_OK(WritePoints(handle, {{1, 1}, {2, 2}},
                                Array::FromVector<int32_t>({-1, -2}, {2})));
  HSARRAY_ASSERT_OK_AND_ASSIGN(result, ReadPoints(handle, {{1, 1}, {2, 2}}));
  EXPECT_THAT(result.ToVector<int32_t>(), ElementsAre(-1, -2));
}

class TruncatingTransport : public MemoryTransport {
 public:
  Result<std::string> Fetch(const ValueRequest& request) override {
    auto payload = MemoryTransport::Fetch(request);
    if (!payload.ok()) return payload;
    return payload->substr(4);
  }
};

TEST(ValueTransferCorruptTest, ResponseSizeIsVerified) {
  ConnectionRegistry registry;
  auto transport = std::make_shared<TruncatingTransport>();
  HSARRAY_ASSERT_OK(transport->CreateDataset(
      "d-1", DTypeOf<int32_t>(), Dataspace{Shape({4, 4})}, Chunks({2, 2})));
  auto connection = registry.Register(transport);
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto handle,
                               OpenArray(registry, connection, "d-1"));
  EXPECT_THAT(ReadPoints(handle, {{0, 0}, {1, 1}}),
              MatchesStatus(absl::StatusCode::kDataLoss));
  EXPECT_THAT(Read(handle, {}), MatchesStatus(absl::StatusCode::kDataLoss));
}

TEST_F(ValueTransferTest, Write) {
  auto handle = CreateInts("d-2d", {4, 5}, Chunks({2, 2}));
  HSARRAY_ASSERT_OK(Write(handle, {Slice{1, 3}, Slice{0, 5, 2}},
                          Array::FromVector<int32_t>({-1, -2, -3, -4, -5, -6},
                                                     {2, 3})));
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto result, transport_->GetArray("d-2d"));
  EXPECT_THAT(result.ToVector<int32_t>(),
              ElementsAre(0, 1, 2, 3, 4,        //
                          -1, 6, -2, 8, -3,     //
                          -4, 11, -5, 13, -6,   //
                          15, 16, 17, 18, 19));
}

TEST_F(ValueTransferTest, PagedWrite) {
  auto handle = CreateInts("d-line", {13}, Chunks({4}));
  TransferOptions options;
  options.max_chunks_per_request = 2;
  std::vector<int32_t> values(13);
  std::iota(values.begin(), values.end(), 100);
  HSARRAY_ASSERT_OK(
      Write(handle, {}, Array::FromVector(values, {13}), options));
  EXPECT_THAT(Selects(), ElementsAre("[0:8]", "[8:13]"));
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto result, transport_->GetArray("d-line"));
  EXPECT_EQ(values, result.ToVector<int32_t>());
}

TEST_F(ValueTransferTest, BroadcastLaw) {
  auto handle = CreateInts("d-2d", {5, 3}, Chunks({2, 3}));
  HSARRAY_ASSERT_OK(Write(handle, {}, Array::FromScalar<int32_t>(7)));
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto result, transport_->GetArray("d-2d"));
  EXPECT_EQ(std::vector<int32_t>(15, 7), result.ToVector<int32_t>());

  HSARRAY_ASSERT_OK(
      Write(handle, {Slice{0, 2}},
            Array::FromVector<int32_t>({1, 2, 3}, {3})));
  HSARRAY_ASSERT_OK_AND_ASSIGN(result, transport_->GetArray("d-2d"));
  EXPECT_THAT(result.ToVector<int32_t>(),
              ElementsAre(1, 2, 3, 1, 2, 3, 7, 7, 7, 7, 7, 7, 7, 7, 7));

  EXPECT_THAT(Write(handle, {}, Array::FromVector<int32_t>({1, 2}, {2})),
              MatchesStatus(absl::StatusCode::kFailedPrecondition));
  EXPECT_THAT(Write(handle, {IndexList{{0, 2}}},
                    Array::FromScalar<int32_t>(1)),
              MatchesStatus(absl::StatusCode::kUnimplemented));
}

TEST_F(ValueTransferTest, WriteTypeMismatch) {
  auto handle = CreateInts("d-line", {13}, Chunks({4}));
  EXPECT_THAT(Write(handle, {}, Array::FromScalar<double>(1)),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Cannot write values of type <f8 to dataset of "
                            "type <i4"));
  EXPECT_TRUE(transport_->requests().empty());
}

TEST_F(ValueTransferTest, VariableSizeCompound) {
  HSARRAY_ASSERT_OK_AND_ASSIGN(
      auto dtype, DType::Compound({{"id", DTypeOf<int32_t>()},
                                   {"name", DType::VlenText()}}));
  HSARRAY_ASSERT_OK(transport_->CreateDataset(
      "d-records", dtype, Dataspace{Shape({3})}, Chunks({2})));
  auto handle = Open("d-records");
  EXPECT_EQ(dtype, handle.dtype);
  Array value(dtype, {3});
  const char* names[] = {"a", "bb", ""};
  for (int i = 0; i < 3; ++i) {
    value.SetValue<int32_t>(i, i + 1);
    value.SetObject(value.element(i) + 4, names[i]);
  }
  TransferOptions options;
  options.max_chunks_per_request = 1;
  HSARRAY_ASSERT_OK(Write(handle, {}, value, options));
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto result, Read(handle, {}, options));
  EXPECT_EQ(value, result);
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto middle, Read(handle, {1}));
  EXPECT_EQ("bb", middle.GetObject(middle.element(0) + 4));
}

// Compound `{x: int32, name: str, y: double}` with x = i, y = i / 2.
class ValueTransferFieldsTest : public ValueTransferTest {
 protected:
  void SetUp() override {
    dtype_ = DType::Compound({{"x", DTypeOf<int32_t>()},
                              {"name", DType::VlenText()},
                              {"y", DTypeOf<double>()}})
                 .value();
    HSARRAY_ASSERT_OK(transport_->CreateDataset(
        "d-rec", dtype_, Dataspace{Shape({5})}, Chunks({2})));
    Array value(dtype_, {5});
    for (int i = 0; i < 5; ++i) {
      value.SetValue<int32_t>(i, i);
      value.SetObject(value.element(i) + 4, std::string(i, 'n'));
      SetY(value, i, i / 2.0);
    }
    HSARRAY_ASSERT_OK(transport_->SetArray("d-rec", value));
    handle_ = Open("d-rec");
  }

  static double GetY(const Array& array, Index i, Index offset = 12) {
    double y;
    std::memcpy(&y, array.element(i) + offset, sizeof(y));
    return y;
  }

  static void SetY(Array& array, Index i, double y, Index offset = 12) {
    std::memcpy(array.element(i) + offset, &y, sizeof(y));
  }

  DType dtype_;
  ArrayHandle handle_;
};

TEST_F(ValueTransferFieldsTest, ReadSingleFieldIsUnwrapped) {
  TransferOptions options;
  options.fields = {"x"};
  options.max_chunks_per_request = 1;
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto x, Read(handle_, {Slice{1}}, options));
  EXPECT_EQ(DTypeOf<int32_t>(), x.dtype());
  EXPECT_THAT(x.ToVector<int32_t>(), ElementsAre(1, 2, 3, 4));

  options.fields = {"name"};
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto names, Read(handle_, {}, options));
  EXPECT_THAT(names.ToStrings(), ElementsAre("", "n", "nn", "nnn", "nnnn"));

  auto requests = transport_->requests();
  ASSERT_FALSE(requests.empty());
  for (const auto& request : requests) {
    EXPECT_EQ(1u, request.fields.size());
  }
}

TEST_F(ValueTransferFieldsTest, ReadFieldsInRequestedOrder) {
  TransferOptions options;
  options.fields = {"y", "x"};
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto values,
                               Read(handle_, {IndexList{{1, 4}}}, options));
  EXPECT_EQ(DType::Compound({{"y", DTypeOf<double>()},
                             {"x", DTypeOf<int32_t>()}})
                .value(),
            values.dtype());
  ASSERT_THAT(values.shape(), ElementsAre(2));
  EXPECT_EQ(0.5, GetY(values, 0, 0));
  EXPECT_EQ(2.0, GetY(values, 1, 0));
  int32_t x;
  std::memcpy(&x, values.element(1) + 8, sizeof(x));
  EXPECT_EQ(4, x);
}

TEST_F(ValueTransferFieldsTest, WriteSingleFieldLeavesOthers) {
  TransferOptions options;
  options.fields = {"y"};
  options.max_chunks_per_request = 1;
  HSARRAY_ASSERT_OK(
      Write(handle_, {Slice{0, 3}}, Array::FromScalar<double>(-1), options));
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto stored, transport_->GetArray("d-rec"));
  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(i < 3 ? -1.0 : i / 2.0, GetY(stored, i)) << i;
    EXPECT_EQ(i, stored.GetValue<int32_t>(i));
    EXPECT_EQ(std::string(i, 'n'), stored.GetObject(stored.element(i) + 4));
  }
  for (const auto& request : transport_->requests()) {
    EXPECT_THAT(request.fields, ElementsAre("y"));
  }
}

TEST_F(ValueTransferFieldsTest, WriteSeveralFields) {
  TransferOptions options;
  options.fields = {"name", "x"};
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto part_dtype,
                               DType::Compound({{"name", DType::VlenText()},
                                                {"x", DTypeOf<int32_t>()}}));
  Array value(part_dtype, {2});
  for (int i = 0; i < 2; ++i) {
    value.SetObject(value.element(i), i == 0 ? "first" : "second");
    const int32_t x = 100 + i;
    std::memcpy(value.element(i) + 8, &x, sizeof(x));
  }
  HSARRAY_ASSERT_OK(WritePoints(handle_, {{4}, {2}}, value, options));
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto stored, transport_->GetArray("d-rec"));
  EXPECT_EQ(100, stored.GetValue<int32_t>(4));
  EXPECT_EQ("first", stored.GetObject(stored.element(4) + 4));
  EXPECT_EQ(101, stored.GetValue<int32_t>(2));
  EXPECT_EQ("second", stored.GetObject(stored.element(2) + 4));
  EXPECT_EQ(2.0, GetY(stored, 4));
  EXPECT_EQ(3, stored.GetValue<int32_t>(3));
}

TEST_F(ValueTransferFieldsTest, FieldErrors) {
  TransferOptions options;
  options.fields = {"x", "z"};
  EXPECT_THAT(Read(handle_, {}, options),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Cannot select fields of dataset d-rec: "
                            "Field \"z\" does not appear in type .*"));
  options.fields = {"x"};
  EXPECT_THAT(Write(handle_, {}, Array::FromScalar<double>(1), options),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Cannot write values of type <f8 to fields "
                            "\\{x\\} of type <i4"));
  EXPECT_THAT(Write(handle_, {}, Array::FromScalar<int32_t>(1)),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Cannot write values of type <i4 to dataset of "
                            "type .*"));
  EXPECT_TRUE(transport_->requests().empty());

  auto ints = CreateInts("d-line", {4}, std::nullopt);
  EXPECT_THAT(Read(ints, {}, options),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Cannot select fields of dataset d-line: Field "
                            "names are only allowed for compound types.*"));
  EXPECT_THAT(Write(ints, {}, Array::FromScalar<int32_t>(1), options),
              MatchesStatus(absl::StatusCode::kInvalidArgument));
}

TEST_F(ValueTransferTest, ComplexValues) {
  using C = std::complex<double>;
  HSARRAY_ASSERT_OK(transport_->CreateDataset(
      "d-complex", DTypeOf<C>(), Dataspace{Shape({3})}, Chunks({2})));
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto metadata,
                               transport_->GetMetadata("d-complex"));
  EXPECT_EQ("H5T_COMPOUND", metadata["type"]["class"]);
  EXPECT_EQ("r", metadata["type"]["fields"][0]["name"]);
  EXPECT_EQ("i", metadata["type"]["fields"][1]["name"]);

  auto handle = Open("d-complex");
  EXPECT_EQ(DTypeOf<C>(), handle.dtype);
  TransferOptions options;
  options.max_chunks_per_request = 1;
  HSARRAY_ASSERT_OK(Write(
      handle, {}, Array::FromVector<C>({{1, 2}, {3, -4}, {0, 0.5}}, {3}),
      options));
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto result, Read(handle, {Slice{1}}));
  EXPECT_THAT(result.ToVector<C>(), ElementsAre(C(3, -4), C(0, 0.5)));
  EXPECT_THAT(Write(handle, {0}, Array::FromScalar<double>(1)),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Cannot write values of type <f8 to dataset of "
                            "type <c16"));
}

TEST_F(ValueTransferTest, IterChunks) {
  auto handle = CreateInts("d-grid", {5, 4}, Chunks({2, 4}));
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto it, IterChunks(handle));
  std::vector<ChunkRegion> regions;
  while (auto region = it.Next()) regions.push_back(*region);
  EXPECT_THAT(regions, ElementsAre(ChunkRegion{{0, 0}, {2, 4}},
                                   ChunkRegion{{2, 0}, {4, 4}},
                                   ChunkRegion{{4, 0}, {5, 4}}));

  HSARRAY_ASSERT_OK_AND_ASSIGN(auto selection,
                               Select(handle.shape(), {Slice{1, 3}, 2}));
  HSARRAY_ASSERT_OK_AND_ASSIGN(it, IterChunks(handle, &selection));
  regions.clear();
  while (auto region = it.Next()) regions.push_back(*region);
  EXPECT_THAT(regions, ElementsAre(ChunkRegion{{1, 2}, {2, 3}},
                                   ChunkRegion{{2, 2}, {3, 3}}));
  EXPECT_TRUE(transport_->requests().empty());

  auto flat = CreateInts("d-flat", {4}, std::nullopt);
  EXPECT_THAT(IterChunks(flat),
              MatchesStatus(absl::StatusCode::kFailedPrecondition,
                            "Chunked dataset required"));
}

TEST_F(ValueTransferTest, ScalarDataset) {
  HSARRAY_ASSERT_OK(transport_->CreateDataset(
      "d-scalar", DTypeOf<double>(), Dataspace{Shape::Scalar()}));
  auto handle = Open("d-scalar");
  HSARRAY_ASSERT_OK(Write(handle, {}, Array::FromScalar<double>(2.5)));
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto result, Read(handle, {}));
  EXPECT_EQ(0, result.rank());
  EXPECT_EQ(2.5, result.GetValue<double>(0));
  HSARRAY_ASSERT_OK_AND_ASSIGN(result, Read(handle, {Ellipsis{}}));
  EXPECT_EQ(2.5, result.GetValue<double>(0));
  for (const auto& request : transport_->requests()) {
    EXPECT_FALSE(request.select.has_value());
  }
  EXPECT_THAT(Write(handle, {}, Array::FromVector<double>({1, 2}, {2})),
              MatchesStatus(absl::StatusCode::kFailedPrecondition));
  EXPECT_THAT(Read(handle, {0}),
              MatchesStatus(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(hsarray::Len(handle),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Dataset of shape \\(\\) has no length"));
}

TEST_F(ValueTransferTest, NullDataset) {
  HSARRAY_ASSERT_OK(transport_->CreateDataset("d-null", DTypeOf<int32_t>(),
                                              Dataspace{Shape::Null()}));
  auto handle = Open("d-null");
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto result, Read(handle, {}));
  EXPECT_TRUE(result.is_null());
  EXPECT_THAT(Read(handle, {0}),
              MatchesStatus(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(Write(handle, {}, Array::FromScalar<int32_t>(1)),
              MatchesStatus(absl::StatusCode::kInvalidArgument));
  EXPECT_TRUE(transport_->requests().empty());
}

TEST_F(ValueTransferTest, Resize) {
  auto handle = CreateInts("d-line", {13}, Chunks({4}),
                           std::vector<Index>{16});
  HSARRAY_ASSERT_OK(hsarray::Resize(handle, {16}));
  EXPECT_EQ(Shape({16}), handle.shape());
  EXPECT_THAT(hsarray::Len(handle), ::hsarray::IsOkAndHolds(16));
  HSARRAY_ASSERT_OK_AND_ASSIGN(auto result, Read(handle, {Slice{12}}));
  EXPECT_THAT(result.ToVector<int32_t>(), ElementsAre(12, 0, 0, 0));
  EXPECT_THAT(hsarray::Resize(handle, {17}),
              MatchesStatus(absl::StatusCode::kOutOfRange));
  EXPECT_THAT(hsarray::Resize(handle, {4, 4}),
              MatchesStatus(absl::StatusCode::kInvalidArgument));
  HSARRAY_ASSERT_OK(hsarray::ResizeAxis(handle, 0, 2));
  EXPECT_THAT(hsarray::Len(handle), ::hsarray::IsOkAndHolds(2));
  EXPECT_THAT(hsarray::ResizeAxis(handle, 1, 2),
              MatchesStatus(absl::StatusCode::kInvalidArgument));

  auto flat = CreateInts("d-flat", {4}, std::nullopt);
  EXPECT_THAT(hsarray::Resize(flat, {8}),
              MatchesStatus(absl::StatusCode::kUnimplemented,
                            "Only chunked datasets can be resized"));
}

TEST_F(ValueTransferTest, StaleConnection) {
  auto handle = CreateInts("d-line", {13}, Chunks({4}));
  HSARRAY_ASSERT_OK(registry_.Close(connection_));
  EXPECT_THAT(Read(handle, {}),
              MatchesStatus(absl::StatusCode::kFailedPrecondition,
                            "stale connection handle .*"));
  EXPECT_THAT(Write(handle, {}, Array::FromScalar<int32_t>(1)),
              MatchesStatus(absl::StatusCode::kFailedPrecondition));
  EXPECT_THAT(OpenArray(registry_, connection_, "d-line"),
              MatchesStatus(absl::StatusCode::kFailedPrecondition));
}

}  // namespace
