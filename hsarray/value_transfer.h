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

#ifndef HSARRAY_VALUE_TRANSFER_H_
#define HSARRAY_VALUE_TRANSFER_H_

/// \file
/// Reading and writing dataset values through a `Transport`.
///
/// Example:
///
///     HSARRAY_ASSIGN_OR_RETURN(auto handle,
///                              OpenArray(registry, connection, "d-1234"));
///     HSARRAY_ASSIGN_OR_RETURN(
///         auto rows, Read(handle, {Slice{2, 6, 2}, 3, Ellipsis{}}));

#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "hsarray/array.h"
#include "hsarray/array_handle.h"
#include "hsarray/chunk_iterator.h"
#include "hsarray/connection_registry.h"
#include "hsarray/index.h"
#include "hsarray/index_expression.h"
#include "hsarray/selection.h"
#include "hsarray/util/result.h"

namespace hsarray {

/// Controls how selections are split into requests.
struct TransferOptions {
  /// Selection strings longer than this are sent in the request body.
  Index max_select_query_len = 100;

  /// Maximum number of chunks along the paging axis covered by one request
  /// for a hyperslab selection.  `0` transfers each selection in one request.
  Index max_chunks_per_request = 0;

  /// Names of the compound fields to transfer, or empty to transfer whole
  /// elements.
  ///
  /// Several names transfer values of the compound type made of those
  /// fields, in the order given; a write leaves the other fields unchanged.
  /// A single name transfers values of that field's own type.
  std::vector<std::string> fields;
};

/// Fetches the metadata of dataset `id` and returns a handle to it.
///
/// \error `absl::StatusCode::kInvalidArgument` if `id` does not name a
///     dataset or the metadata is malformed.
/// \error `absl::StatusCode::kFailedPrecondition` if `connection` is stale.
Result<ArrayHandle> OpenArray(ConnectionRegistry& registry,
                              ConnectionHandle connection,
                              std::string_view id);

/// Reads the values selected by `selection`, which must be a selection of
/// `handle.shape()`.
///
/// The result has shape `selection.mshape()`, or rank 0 if it is
/// `std::nullopt` for a scalar dataset.  A null dataset yields
/// `Array::Null`.  Nothing is requested when no element is selected.
///
/// \error `absl::StatusCode::kInvalidArgument` if `options.fields` is
///     non-empty and the dataset is not compound or lacks a named field.
Result<Array> ReadSelection(const ArrayHandle& handle,
                            const Selection& selection,
                            const TransferOptions& options = {});

/// Reads the values selected by the index expression `expr`.
Result<Array> Read(const ArrayHandle& handle, const IndexExpression& expr,
                   const TransferOptions& options = {});

/// Reads the values at `points`, in order.
Result<Array> ReadPoints(const ArrayHandle& handle,
                         std::vector<std::vector<Index>> points,
                         const TransferOptions& options = {});

/// Writes `value` to the elements selected by `selection`.
///
/// A `value` whose shape differs from `selection.mshape()` is broadcast.
///
/// \error `absl::StatusCode::kInvalidArgument` if the dtype of `value` does
///     not match the dataset or the fields selected by `options.fields`, or
///     the dataset has a null dataspace.
/// \error `absl::StatusCode::kFailedPrecondition` if `value` cannot be
///     broadcast to the selection.
/// \error `absl::StatusCode::kUnimplemented` if broadcasting is required for
///     a fancy or point selection.
absl::Status WriteSelection(const ArrayHandle& handle,
                            const Selection& selection, const Array& value,
                            const TransferOptions& options = {});

absl::Status Write(const ArrayHandle& handle, const IndexExpression& expr,
                   const Array& value, const TransferOptions& options = {});

absl::Status WritePoints(const ArrayHandle& handle,
                         std::vector<std::vector<Index>> points,
                         const Array& value,
                         const TransferOptions& options = {});

/// Changes the shape of a chunked dataset.  Existing values keep their
/// coordinates.  On success `handle` is updated.
///
/// \error `absl::StatusCode::kUnimplemented` if the dataset is not chunked.
/// \error `absl::StatusCode::kInvalidArgument` if the rank differs.
/// \error `absl::StatusCode::kOutOfRange` if `new_shape` exceeds the maximum
///     shape.
absl::Status Resize(ArrayHandle& handle, std::vector<Index> new_shape);

/// Changes the extent of axis `axis` only.
absl::Status ResizeAxis(ArrayHandle& handle, DimensionIndex axis, Index size);

/// Returns the extent of the first axis.
///
/// \error `absl::StatusCode::kInvalidArgument` for scalar and null datasets.
Result<Index> Len(const ArrayHandle& handle);

/// Returns an iterator over the chunk-aligned regions of `selection`, or of
/// the whole dataset if `selection` is `nullptr`.
///
/// \error `absl::StatusCode::kFailedPrecondition` if the dataset is not
///     chunked.
Result<ChunkIterator> IterChunks(const ArrayHandle& handle,
                                 const Selection* selection = nullptr);

}  // namespace hsarray

#endif  // HSARRAY_VALUE_TRANSFER_H_
