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

#include <algorithm>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/span.h"
#include <nlohmann/json.hpp>
#include "hsarray/array.h"
#include "hsarray/chunk_layout.h"
#include "hsarray/dtype.h"
#include "hsarray/element_codec.h"
#include "hsarray/index.h"
#include "hsarray/query_param.h"
#include "hsarray/shape.h"
#include "hsarray/transport.h"
#include "hsarray/type_codec.h"
#include "hsarray/type_descriptor.h"
#include "hsarray/util/result.h"
#include "hsarray/util/status.h"
#include "hsarray/util/str_cat.h"

namespace hsarray {
namespace {

// Elements of the stored array addressed by a request, in transfer order.
struct Target {
  std::vector<Index> source_indices;
  std::vector<Index> shape;
};

std::vector<Index> CStrides(absl::Span<const Index> shape) {
  std::vector<Index> strides(shape.size());
  Index stride = 1;
  for (DimensionIndex i = static_cast<DimensionIndex>(shape.size()) - 1;
       i >= 0; --i) {
    strides[i] = stride;
    stride *= shape[i];
  }
  return strides;
}

Result<Target> ResolveTarget(const Shape& shape, const ValueRequest& request) {
  if (shape.is_null()) {
    return absl::FailedPreconditionError(
        StrCat("Dataset ", request.id, " has a null dataspace"));
  }
  const auto strides = CStrides(shape.extents());
  Target target;
  if (!request.points.empty()) {
    for (const auto& point : request.points) {
      if (static_cast<DimensionIndex>(point.size()) != shape.rank()) {
        return absl::InvalidArgumentError(
            StrCat("Point ", point, " does not match rank of shape ", shape));
      }
      Index index = 0;
      for (size_t i = 0; i < point.size(); ++i) {
        if (point[i] < 0 || point[i] >= shape[i]) {
          return absl::OutOfRangeError(
              StrCat("Point ", point, " is out of bounds for shape ", shape));
        }
        index += point[i] * strides[i];
      }
      target.source_indices.push_back(index);
    }
    target.shape = {static_cast<Index>(request.points.size())};
    return target;
  }
  if (!request.select) {
    const Index n = shape.num_elements();
    target.source_indices.resize(n);
    for (Index i = 0; i < n; ++i) target.source_indices[i] = i;
    target.shape.assign(shape.extents().begin(), shape.extents().end());
    return target;
  }
  HSARRAY_ASSIGN_OR_RETURN(auto wire, ParseQueryParam(*request.select, shape));
  target.shape = wire.mshape();
  const Index n = wire.num_elements();
  if (n == 0) return target;
  const DimensionIndex rank = shape.rank();
  std::vector<size_t> position(rank, 0);
  target.source_indices.reserve(n);
  for (Index i = 0; i < n; ++i) {
    Index index = 0;
    for (DimensionIndex d = 0; d < rank; ++d) {
      index += wire.coordinates[d][position[d]] * strides[d];
    }
    target.source_indices.push_back(index);
    for (DimensionIndex d = rank - 1; d >= 0; --d) {
      if (++position[d] < wire.coordinates[d].size()) break;
      position[d] = 0;
    }
  }
  return target;
}

// Byte offsets of a field in the stored element and in the transferred
// element.
struct FieldPart {
  Index stored_offset;
  Index transferred_offset;
  const DType* dtype;
};

// Resolves the fields named by `request` against the stored element type.
// Returns the element type of the transferred values.
Result<DType> ResolveFields(const DType& stored, const ValueRequest& request,
                            std::vector<FieldPart>& parts) {
  if (request.fields.empty()) return stored;
  HSARRAY_ASSIGN_OR_RETURN(auto subset, SelectFields(stored, request.fields));
  for (const auto& field : subset.fields()) {
    parts.push_back({stored.FindField(field.name)->offset, field.offset,
                     field.dtype.get()});
  }
  return subset;
}

Array MakeArray(const DType& dtype, const Shape& shape) {
  if (shape.is_null()) return Array::Null(dtype);
  return Array(dtype,
               std::vector<Index>(shape.extents().begin(),
                                  shape.extents().end()));
}

}  // namespace

absl::Status MemoryTransport::CreateDataset(std::string id,
                                            const DType& dtype,
                                            Dataspace dataspace,
                                            std::optional<ChunkLayout> layout) {
  HSARRAY_ASSIGN_OR_RETURN(auto type, EncodeDType(dtype));
  if (layout) {
    if (dataspace.shape.kind() != ShapeKind::kSimple) {
      return absl::InvalidArgumentError(
          StrCat("Chunk layout ", *layout, " requires a simple dataspace"));
    }
    if (layout->rank() != dataspace.shape.rank()) {
      return absl::InvalidArgumentError(
          StrCat("Chunk layout ", *layout, " does not match rank of shape ",
                 dataspace.shape));
    }
  }
  Array value = MakeArray(dtype, dataspace.shape);
  absl::MutexLock lock(&mutex_);
  if (datasets_.contains(id)) {
    return absl::AlreadyExistsError(StrCat("Dataset ", id, " already exists"));
  }
  datasets_.try_emplace(
      std::move(id), Dataset{std::move(type), std::move(dataspace),
                             std::move(layout), std::move(value)});
  return absl::OkStatus();
}

Result<MemoryTransport::Dataset*> MemoryTransport::FindDataset(
    std::string_view id) {
  auto it = datasets_.find(id);
  if (it == datasets_.end()) {
    return absl::NotFoundError(StrCat("Dataset ", id, " not found"));
  }
  return &it->second;
}

Result<Array> MemoryTransport::GetArray(std::string_view id) const {
  absl::MutexLock lock(&mutex_);
  auto it = datasets_.find(id);
  if (it == datasets_.end()) {
    return absl::NotFoundError(StrCat("Dataset ", id, " not found"));
  }
  return it->second.value;
}

absl::Status MemoryTransport::SetArray(std::string_view id, Array value) {
  absl::MutexLock lock(&mutex_);
  HSARRAY_ASSIGN_OR_RETURN(auto* dataset, FindDataset(id));
  if (value.dtype() != dataset->value.dtype() ||
      value.shape() != dataset->value.shape() ||
      value.is_null() != dataset->value.is_null()) {
    return absl::InvalidArgumentError(
        StrCat("Cannot assign ", value, " to dataset ", id, " of ",
               dataset->value));
  }
  dataset->value = std::move(value);
  return absl::OkStatus();
}

std::vector<ValueRequest> MemoryTransport::requests() const {
  absl::MutexLock lock(&mutex_);
  return requests_;
}

void MemoryTransport::ClearRequests() {
  absl::MutexLock lock(&mutex_);
  requests_.clear();
}

void MemoryTransport::SetRequestHook(RequestHook hook) {
  absl::MutexLock lock(&mutex_);
  hook_ = std::move(hook);
}

absl::Status MemoryTransport::BeginRequest(const ValueRequest& request) {
  RequestHook hook;
  {
    absl::MutexLock lock(&mutex_);
    requests_.push_back(request);
    hook = hook_;
  }
  // The hook may block, so it runs without holding the lock.
  if (hook) return hook(request);
  return absl::OkStatus();
}

Result<::nlohmann::json> MemoryTransport::GetMetadata(std::string_view id) {
  absl::MutexLock lock(&mutex_);
  HSARRAY_ASSIGN_OR_RETURN(auto* dataset, FindDataset(id));
  return ::nlohmann::json{
      {"id", std::string(id)},
      {"shape", DataspaceToJson(dataset->dataspace)},
      {"type", TypeDescriptorToJson(dataset->type)},
      {"creationProperties",
       {{"layout", ChunkLayoutToJson(dataset->layout)}}},
  };
}

Result<std::string> MemoryTransport::Fetch(const ValueRequest& request) {
  HSARRAY_RETURN_IF_ERROR(BeginRequest(request));
  absl::MutexLock lock(&mutex_);
  HSARRAY_ASSIGN_OR_RETURN(auto* dataset, FindDataset(request.id));
  if (request.type != dataset->type) {
    return absl::InvalidArgumentError(
        StrCat("Request type ", request.type, " does not match type ",
               dataset->type, " of dataset ", request.id));
  }
  const Array& stored = dataset->value;
  std::vector<FieldPart> parts;
  HSARRAY_ASSIGN_OR_RETURN(auto dtype,
                           ResolveFields(stored.dtype(), request, parts));
  HSARRAY_ASSIGN_OR_RETURN(auto target,
                           ResolveTarget(dataset->dataspace.shape, request));
  Array out(std::move(dtype), std::move(target.shape));
  for (size_t i = 0; i < target.source_indices.size(); ++i) {
    const Index index = target.source_indices[i];
    if (parts.empty()) {
      out.CopyElementFrom(stored, index, i);
      continue;
    }
    for (const auto& part : parts) {
      out.CopyPartFrom(stored, index, part.stored_offset, i,
                       part.transferred_offset, *part.dtype);
    }
  }
  return EncodeElements(out);
}

absl::Status MemoryTransport::Store(const ValueRequest& request,
                                    std::string_view payload) {
  HSARRAY_RETURN_IF_ERROR(BeginRequest(request));
  absl::MutexLock lock(&mutex_);
  HSARRAY_ASSIGN_OR_RETURN(auto* dataset, FindDataset(request.id));
  if (request.type != dataset->type) {
    return absl::InvalidArgumentError(
        StrCat("Request type ", request.type, " does not match type ",
               dataset->type, " of dataset ", request.id));
  }
  Array& stored = dataset->value;
  std::vector<FieldPart> parts;
  HSARRAY_ASSIGN_OR_RETURN(auto dtype,
                           ResolveFields(stored.dtype(), request, parts));
  HSARRAY_ASSIGN_OR_RETURN(auto target,
                           ResolveTarget(dataset->dataspace.shape, request));
  HSARRAY_ASSIGN_OR_RETURN(
      auto values, DecodeElements(payload, dtype, std::move(target.shape)));
  for (size_t i = 0; i < target.source_indices.size(); ++i) {
    const Index index = target.source_indices[i];
    if (parts.empty()) {
      stored.CopyElementFrom(values, i, index);
      continue;
    }
    for (const auto& part : parts) {
      stored.CopyPartFrom(values, i, part.transferred_offset, index,
                          part.stored_offset, *part.dtype);
    }
  }
  return absl::OkStatus();
}

absl::Status MemoryTransport::SetExtent(std::string_view id,
                                        absl::Span<const Index> shape) {
  absl::MutexLock lock(&mutex_);
  HSARRAY_ASSIGN_OR_RETURN(auto* dataset, FindDataset(id));
  auto& dataspace = dataset->dataspace;
  if (!dataset->layout) {
    return absl::FailedPreconditionError(
        StrCat("Dataset ", id, " is not chunked"));
  }
  if (!dataspace.CanResizeTo(shape)) {
    return absl::OutOfRangeError(
        StrCat("Cannot resize dataset ", id, " of shape ", dataspace.shape,
               " to ", shape));
  }
  HSARRAY_ASSIGN_OR_RETURN(auto new_shape, Shape::Simple(shape));
  Array value = MakeArray(dataset->value.dtype(), new_shape);
  std::vector<Index> common(shape.size());
  for (size_t i = 0; i < shape.size(); ++i) {
    common[i] = std::min(shape[i], dataspace.shape[i]);
  }
  const std::vector<Index> origin(shape.size(), 0);
  CopyRegion(dataset->value, origin, value, origin, common);
  dataset->value = std::move(value);
  dataspace.shape = std::move(new_shape);
  return absl::OkStatus();
}

}  // namespace hsarray
