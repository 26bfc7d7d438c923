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

#ifndef HSARRAY_MEMORY_TRANSPORT_H_
#define HSARRAY_MEMORY_TRANSPORT_H_

/// \file
/// In-process `Transport` holding datasets in memory.

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/span.h"
#include <nlohmann/json.hpp>
#include "hsarray/array.h"
#include "hsarray/chunk_layout.h"
#include "hsarray/dtype.h"
#include "hsarray/index.h"
#include "hsarray/shape.h"
#include "hsarray/transport.h"
#include "hsarray/type_descriptor.h"
#include "hsarray/util/result.h"

namespace hsarray {

/// `Transport` backed by in-memory arrays.
///
/// Selection strings are decoded with `ParseQueryParam` and values are
/// exchanged in the wire format of `element_codec.h`, so the transport
/// exercises the same request path as a remote service.  Every value
/// request is recorded.
class MemoryTransport : public Transport {
 public:
  /// Called for each `Fetch` and `Store` before it is served.  A non-ok
  /// return fails the request.
  using RequestHook = std::function<absl::Status(const ValueRequest&)>;

  /// Creates a zero-filled dataset.
  ///
  /// \error `absl::StatusCode::kAlreadyExists` if `id` exists.
  /// \error `absl::StatusCode::kInvalidArgument` if `layout` does not match
  ///     the rank of a simple dataspace, or is specified for a scalar or null
  ///     dataspace.
  absl::Status CreateDataset(std::string id, const DType& dtype,
                             Dataspace dataspace,
                             std::optional<ChunkLayout> layout = std::nullopt);

  /// Returns the contents of dataset `id`.
  Result<Array> GetArray(std::string_view id) const;

  /// Replaces the contents of dataset `id`.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if the dtype or shape of
  ///     `value` differs from the dataset.
  absl::Status SetArray(std::string_view id, Array value);

  /// Returns the value requests served so far, in order.
  std::vector<ValueRequest> requests() const;
  void ClearRequests();

  void SetRequestHook(RequestHook hook);

  Result<::nlohmann::json> GetMetadata(std::string_view id) override;
  Result<std::string> Fetch(const ValueRequest& request) override;
  absl::Status Store(const ValueRequest& request,
                     std::string_view payload) override;
  absl::Status SetExtent(std::string_view id,
                         absl::Span<const Index> shape) override;

 private:
  struct Dataset {
    TypeDescriptor type;
    Dataspace dataspace;
    std::optional<ChunkLayout> layout;
    Array value;
  };

  Result<Dataset*> FindDataset(std::string_view id)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  absl::Status BeginRequest(const ValueRequest& request)
      ABSL_LOCKS_EXCLUDED(mutex_);

  mutable absl::Mutex mutex_;
  absl::flat_hash_map<std::string, Dataset> datasets_ ABSL_GUARDED_BY(mutex_);
  std::vector<ValueRequest> requests_ ABSL_GUARDED_BY(mutex_);
  RequestHook hook_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace hsarray

#endif  // HSARRAY_MEMORY_TRANSPORT_H_
