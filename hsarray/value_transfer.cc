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

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "absl/functional/function_ref.h"
#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/types/span.h"
#include <nlohmann/json.hpp>
#include "hsarray/array.h"
#include "hsarray/array_handle.h"
#include "hsarray/chunk_iterator.h"
#include "hsarray/chunk_layout.h"
#include "hsarray/connection_registry.h"
#include "hsarray/dtype.h"
#include "hsarray/element_codec.h"
#include "hsarray/index.h"
#include "hsarray/index_expression.h"
#include "hsarray/internal/json/value_as.h"
#include "hsarray/internal/log/verbose_flag.h"
#include "hsarray/object_ref.h"
#include "hsarray/selection.h"
#include "hsarray/shape.h"
#include "hsarray/transport.h"
#include "hsarray/type_codec.h"
#include "hsarray/type_descriptor.h"
#include "hsarray/util/result.h"
#include "hsarray/util/status.h"
#include "hsarray/util/str_cat.h"

namespace hsarray {

namespace {
ABSL_CONST_INIT internal_log::VerboseFlag value_transfer_logging(
    "value_transfer");

Result<ArrayHandle> ParseMetadata(const ::nlohmann::json& metadata,
                                  ArrayHandle handle) {
  constexpr std::string_view kContext = "dataset metadata";
  HSARRAY_ASSIGN_OR_RETURN(
      const auto* shape_json,
      internal_json::JsonRequireMember(metadata, "shape", kContext));
  HSARRAY_ASSIGN_OR_RETURN(handle.dataspace, ParseDataspace(*shape_json),
                           MaybeAnnotateStatus(_, "Error parsing \"shape\""));
  HSARRAY_ASSIGN_OR_RETURN(
      const auto* type_json,
      internal_json::JsonRequireMember(metadata, "type", kContext));
  HSARRAY_ASSIGN_OR_RETURN(handle.type, ParseTypeDescriptor(*type_json),
                           MaybeAnnotateStatus(_, "Error parsing \"type\""));
  HSARRAY_ASSIGN_OR_RETURN(handle.dtype, DecodeDType(handle.type),
                           MaybeAnnotateStatus(_, "Error parsing \"type\""));
  if (const auto* properties =
          internal_json::JsonFindMember(metadata, "creationProperties")) {
    if (const auto* layout = internal_json::JsonFindMember(*properties,
                                                           "layout")) {
      HSARRAY_ASSIGN_OR_RETURN(
          handle.chunk_layout, ParseChunkLayout(*layout),
          MaybeAnnotateStatus(_, "Error parsing \"layout\""));
    }
  }
  if (handle.chunk_layout &&
      handle.chunk_layout->rank() != handle.dataspace.shape.rank()) {
    return absl::InvalidArgumentError(
        StrCat("Chunk layout ", *handle.chunk_layout,
               " does not match rank of shape ", handle.dataspace.shape));
  }
  return handle;
}

Result<std::shared_ptr<Transport>> GetTransport(const ArrayHandle& handle) {
  if (!handle.registry) {
    return absl::FailedPreconditionError("Array handle is not open");
  }
  return handle.registry->Lookup(handle.connection);
}

ValueRequest MakeRequest(const ArrayHandle& handle,
                         const TransferOptions& options) {
  ValueRequest request;
  request.id = handle.id;
  request.type = handle.type;
  request.fields = options.fields;
  return request;
}

// Returns the element type of the values transferred for `options.fields`.
Result<DType> GetTransferDType(const ArrayHandle& handle,
                               const TransferOptions& options) {
  if (options.fields.empty()) return handle.dtype;
  HSARRAY_ASSIGN_OR_RETURN(
      auto subset, SelectFields(handle.dtype, options.fields),
      MaybeAnnotateStatus(_, StrCat("Cannot select fields of dataset ",
                                    handle.id)));
  // A single-field compound has the same layout and encoding as the field.
  if (subset.fields().size() == 1) return *subset.fields()[0].dtype;
  return subset;
}

std::vector<Index> ResultShape(const Selection& selection) {
  if (const auto& mshape = selection.mshape()) return *mshape;
  return {};
}

// Divides a hyperslab selection into pages along the axis that spans the
// most chunks.  `fn` receives each page and the offset of the page within
// the result along the paging axis.  Scalar axes are never paged.
absl::Status ForEachPage(
    const ArrayHandle& handle, const Selection& selection,
    const TransferOptions& options,
    absl::FunctionRef<absl::Status(const Selection& page,
                                   DimensionIndex mshape_dim, Index offset)>
        fn) {
  const Shape& shape = handle.shape();
  const DimensionIndex rank = shape.rank();
  auto axes = selection.axes();
  DimensionIndex split_dim = -1;
  Index max_chunks = 1;
  for (DimensionIndex dim = 0; dim < rank; ++dim) {
    const auto& axis = axes[dim];
    if (axis.scalar) continue;
    const Index chunk_extent = std::max<Index>(
        1, handle.chunk_layout ? (*handle.chunk_layout)[dim] : shape[dim]);
    const Index count = axis.stop(shape[dim]) - axis.start;
    const Index num_chunks = (count + chunk_extent - 1) / chunk_extent;
    if (split_dim < 0 || num_chunks > max_chunks) {
      max_chunks = num_chunks;
      split_dim = dim;
    }
  }
  if (split_dim < 0) return fn(selection, 0, 0);

  DimensionIndex mshape_dim = 0;
  for (DimensionIndex dim = 0; dim < split_dim; ++dim) {
    if (!axes[dim].scalar) ++mshape_dim;
  }
  const Index chunks_per_page =
      options.max_chunks_per_request > 0
          ? std::min(options.max_chunks_per_request, max_chunks)
          : max_chunks;
  const Index chunk_extent = std::max<Index>(
      1, handle.chunk_layout ? (*handle.chunk_layout)[split_dim]
                             : shape[split_dim]);
  const Index num_rows = chunks_per_page * chunk_extent;
  const SelectionAxis& split_axis = axes[split_dim];
  const Index sel_stop = split_axis.stop(shape[split_dim]);
  const Index step = split_axis.step;

  ABSL_LOG_IF(INFO, value_transfer_logging)
      << "Paging " << selection << " along axis " << split_dim << ": "
      << max_chunks << " chunks, " << chunks_per_page << " per page";

  std::vector<SelectionAxis> page_axes(axes.begin(), axes.end());
  Index page_start = split_axis.start;
  Index offset = 0;
  while (page_start < sel_stop) {
    Index page_stop = page_start + num_rows;
    // Keep the next page start on the selection's stride.
    if (const Index rem = (page_stop - page_start) % step; rem != 0) {
      page_stop += step - rem;
    }
    page_stop = std::min(page_stop, sel_stop);
    const Index page_count = (page_stop - page_start - 1) / step + 1;
    page_axes[split_dim].start = page_start;
    page_axes[split_dim].count = page_count;
    HSARRAY_ASSIGN_OR_RETURN(auto page,
                             Selection::Hyperslab(shape, page_axes));
    HSARRAY_RETURN_IF_ERROR(fn(page, mshape_dim, offset));
    offset += page_count;
    page_start += page_count * step;
  }
  return absl::OkStatus();
}

Result<Array> FetchArray(Transport& transport, const ValueRequest& request,
                         const DType& dtype, std::vector<Index> shape) {
  HSARRAY_ASSIGN_OR_RETURN(auto payload, transport.Fetch(request));
  return DecodeElements(payload, dtype, std::move(shape));
}

absl::Status StoreArray(Transport& transport, const ValueRequest& request,
                        const Array& value) {
  HSARRAY_ASSIGN_OR_RETURN(auto payload, EncodeElements(value));
  return transport.Store(request, payload);
}

// Sets the selection of `request` for a single-request transfer.
void SetSelect(const Selection& selection, const TransferOptions& options,
               ValueRequest& request) {
  if (selection.kind() == SelectionKind::kPoints) {
    request.points = selection.points();
    return;
  }
  request.select = selection.GetQueryParam();
  if (request.select &&
      static_cast<Index>(request.select->size()) >
          options.max_select_query_len) {
    request.post_select = true;
  }
}

}  // namespace

Result<ArrayHandle> OpenArray(ConnectionRegistry& registry,
                              ConnectionHandle connection,
                              std::string_view id) {
  HSARRAY_ASSIGN_OR_RETURN(auto ref, ResolveObjectId(id));
  const auto* dataset = std::get_if<DatasetRef>(&ref);
  if (!dataset) {
    return absl::InvalidArgumentError(
        StrCat("Object ", ref, " is not a dataset"));
  }
  HSARRAY_ASSIGN_OR_RETURN(auto transport, registry.Lookup(connection));
  HSARRAY_ASSIGN_OR_RETURN(auto metadata, transport->GetMetadata(dataset->id));
  ArrayHandle handle;
  handle.registry = &registry;
  handle.connection = connection;
  handle.id = dataset->id;
  HSARRAY_ASSIGN_OR_RETURN(
      handle, ParseMetadata(metadata, std::move(handle)),
      MaybeAnnotateStatus(_, StrCat("Error opening dataset ", dataset->id)));
  ABSL_LOG_IF(INFO, value_transfer_logging)
      << "Opened dataset " << handle.id << ": shape=" << handle.shape()
      << ", dtype=" << handle.dtype << ", chunks="
      << (handle.chunk_layout ? StrCat(*handle.chunk_layout)
                              : std::string("none"));
  return handle;
}

Result<Array> ReadSelection(const ArrayHandle& handle,
                            const Selection& selection,
                            const TransferOptions& options) {
  HSARRAY_ASSIGN_OR_RETURN(auto dtype, GetTransferDType(handle, options));
  const Shape& shape = handle.shape();
  if (shape.is_null()) return Array::Null(dtype);
  Array result(dtype, ResultShape(selection));
  if (selection.nselect() == 0) return result;
  HSARRAY_ASSIGN_OR_RETURN(auto transport, GetTransport(handle));

  switch (selection.kind()) {
    case SelectionKind::kScalar: {
      auto request = MakeRequest(handle, options);
      return FetchArray(*transport, request, dtype, {});
    }
    case SelectionKind::kAll:
    case SelectionKind::kSimple: {
      auto read_page = [&](const Selection& page, DimensionIndex mshape_dim,
                           Index offset) -> absl::Status {
        auto request = MakeRequest(handle, options);
        request.select = page.GetQueryParam();
        HSARRAY_ASSIGN_OR_RETURN(
            auto values,
            FetchArray(*transport, request, dtype, ResultShape(page)));
        std::vector<Index> origin(values.rank(), 0);
        std::vector<Index> dest(values.rank(), 0);
        if (values.rank() > 0) dest[mshape_dim] = offset;
        CopyRegion(values, origin, result, dest, values.shape());
        return absl::OkStatus();
      };
      HSARRAY_RETURN_IF_ERROR(
          ForEachPage(handle, selection, options, read_page));
      return result;
    }
    case SelectionKind::kFancy:
    case SelectionKind::kPoints: {
      auto request = MakeRequest(handle, options);
      SetSelect(selection, options, request);
      ABSL_LOG_IF(INFO, value_transfer_logging)
          << "Reading " << selection << " in one request " << request;
      return FetchArray(*transport, request, dtype, ResultShape(selection));
    }
    case SelectionKind::kNone:
      break;
  }
  return result;
}

Result<Array> Read(const ArrayHandle& handle, const IndexExpression& expr,
                   const TransferOptions& options) {
  HSARRAY_ASSIGN_OR_RETURN(auto selection, Select(handle.shape(), expr));
  return ReadSelection(handle, selection, options);
}

Result<Array> ReadPoints(const ArrayHandle& handle,
                         std::vector<std::vector<Index>> points,
                         const TransferOptions& options) {
  HSARRAY_ASSIGN_OR_RETURN(auto selection,
                           SelectPoints(handle.shape(), std::move(points)));
  return ReadSelection(handle, selection, options);
}

absl::Status WriteSelection(const ArrayHandle& handle,
                            const Selection& selection, const Array& value,
                            const TransferOptions& options) {
  HSARRAY_ASSIGN_OR_RETURN(auto dtype, GetTransferDType(handle, options));
  if (value.dtype() != dtype) {
    if (options.fields.empty()) {
      return absl::InvalidArgumentError(
          StrCat("Cannot write values of type ", value.dtype(),
                 " to dataset of type ", dtype));
    }
    return absl::InvalidArgumentError(
        StrCat("Cannot write values of type ", value.dtype(), " to fields ",
               options.fields, " of type ", dtype));
  }
  if (handle.shape().is_null()) {
    return absl::InvalidArgumentError(
        "Cannot write to a dataset with a null dataspace");
  }
  if (selection.nselect() == 0) return absl::OkStatus();

  const auto target_shape = ResultShape(selection);
  const Array* source = &value;
  Array broadcast;
  if (value.is_null() ||
      value.shape() != absl::MakeConstSpan(target_shape)) {
    HSARRAY_RETURN_IF_ERROR(selection.Broadcast(value.shape()).status());
    HSARRAY_ASSIGN_OR_RETURN(broadcast, BroadcastArray(value, target_shape));
    source = &broadcast;
  }
  HSARRAY_ASSIGN_OR_RETURN(auto transport, GetTransport(handle));

  switch (selection.kind()) {
    case SelectionKind::kAll:
    case SelectionKind::kSimple: {
      auto write_page = [&](const Selection& page, DimensionIndex mshape_dim,
                            Index offset) -> absl::Status {
        Array values(dtype, ResultShape(page));
        std::vector<Index> origin(values.rank(), 0);
        std::vector<Index> src(values.rank(), 0);
        if (values.rank() > 0) src[mshape_dim] = offset;
        CopyRegion(*source, src, values, origin, values.shape());
        auto request = MakeRequest(handle, options);
        request.select = page.GetQueryParam();
        return StoreArray(*transport, request, values);
      };
      return ForEachPage(handle, selection, options, write_page);
    }
    default: {
      auto request = MakeRequest(handle, options);
      SetSelect(selection, options, request);
      ABSL_LOG_IF(INFO, value_transfer_logging)
          << "Writing " << selection << " in one request " << request;
      return StoreArray(*transport, request, *source);
    }
  }
}

absl::Status Write(const ArrayHandle& handle, const IndexExpression& expr,
                   const Array& value, const TransferOptions& options) {
  HSARRAY_ASSIGN_OR_RETURN(auto selection, Select(handle.shape(), expr));
  return WriteSelection(handle, selection, value, options);
}

absl::Status WritePoints(const ArrayHandle& handle,
                         std::vector<std::vector<Index>> points,
                         const Array& value, const TransferOptions& options) {
  HSARRAY_ASSIGN_OR_RETURN(auto selection,
                           SelectPoints(handle.shape(), std::move(points)));
  return WriteSelection(handle, selection, value, options);
}

absl::Status Resize(ArrayHandle& handle, std::vector<Index> new_shape) {
  if (!handle.chunk_layout) {
    return absl::UnimplementedError("Only chunked datasets can be resized");
  }
  const Shape& shape = handle.shape();
  if (static_cast<DimensionIndex>(new_shape.size()) != shape.rank()) {
    return absl::InvalidArgumentError(
        StrCat("Cannot change the rank of dataset of shape ", shape, " to ",
               new_shape.size()));
  }
  HSARRAY_ASSIGN_OR_RETURN(auto resized, Shape::Simple(new_shape));
  if (!handle.dataspace.CanResizeTo(new_shape)) {
    return absl::OutOfRangeError(
        StrCat("Shape ", resized, " exceeds maximum shape ",
               *handle.dataspace.maxshape));
  }
  HSARRAY_ASSIGN_OR_RETURN(auto transport, GetTransport(handle));
  HSARRAY_RETURN_IF_ERROR(transport->SetExtent(handle.id, new_shape));
  ABSL_LOG_IF(INFO, value_transfer_logging)
      << "Resized dataset " << handle.id << " from " << shape << " to "
      << resized;
  handle.dataspace.shape = std::move(resized);
  return absl::OkStatus();
}

absl::Status ResizeAxis(ArrayHandle& handle, DimensionIndex axis,
                        Index size) {
  const Shape& shape = handle.shape();
  if (axis < 0 || axis >= shape.rank()) {
    return absl::InvalidArgumentError(
        StrCat("Invalid axis ", axis, " for shape ", shape));
  }
  std::vector<Index> new_shape(shape.extents().begin(),
                               shape.extents().end());
  new_shape[axis] = size;
  return Resize(handle, std::move(new_shape));
}

Result<Index> Len(const ArrayHandle& handle) {
  const Shape& shape = handle.shape();
  if (shape.kind() != ShapeKind::kSimple || shape.rank() == 0) {
    return absl::InvalidArgumentError(
        StrCat("Dataset of shape ", shape, " has no length"));
  }
  return shape[0];
}

Result<ChunkIterator> IterChunks(const ArrayHandle& handle,
                                 const Selection* selection) {
  return ChunkIterator::Make(handle.shape(), handle.chunk_layout, selection);
}

}  // namespace hsarray
