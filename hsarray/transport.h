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

#ifndef HSARRAY_TRANSPORT_H_
#define HSARRAY_TRANSPORT_H_

/// \file
/// Interface to the service that stores array metadata and element values.

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/types/span.h"
#include <nlohmann/json.hpp>
#include "hsarray/index.h"
#include "hsarray/type_descriptor.h"
#include "hsarray/util/result.h"

namespace hsarray {

/// Request to read or write element values of an array.
struct ValueRequest {
  /// Id of the dataset.
  std::string id;

  /// Selection string as returned by `Selection::GetQueryParam`, or
  /// `std::nullopt` for the whole array.
  std::optional<std::string> select;

  /// Coordinates of a point selection.  If non-empty, `select` is
  /// `std::nullopt` and values are transferred in the order of `points`.
  std::vector<std::vector<Index>> points;

  /// Indicates that `select` is sent in the request body rather than the
  /// query string because it is too long.
  bool post_select = false;

  /// Element type of the dataset.
  TypeDescriptor type = IntegerType{};

  /// Names of the compound fields transferred, or empty for whole elements.
  /// If non-empty, values are exchanged as the compound of these fields in
  /// the order given, and a store leaves the other fields unchanged.
  std::vector<std::string> fields;

  friend std::ostream& operator<<(std::ostream& os,
                                  const ValueRequest& request);
};

/// Synchronous connection to the array service.
///
/// Element values are exchanged in the format of `element_codec.h`.
/// Implementations must be safe to call from multiple threads.
class Transport {
 public:
  virtual ~Transport();

  /// Returns the JSON description of the object `id`, including at least the
  /// `shape`, `type` and `creationProperties` members for a dataset.
  ///
  /// \error `absl::StatusCode::kNotFound` if there is no such object.
  virtual Result<::nlohmann::json> GetMetadata(std::string_view id) = 0;

  /// Returns the encoded values selected by `request`.
  virtual Result<std::string> Fetch(const ValueRequest& request) = 0;

  /// Writes `payload`, the encoded values for the selection of `request`.
  virtual absl::Status Store(const ValueRequest& request,
                             std::string_view payload) = 0;

  /// Changes the extent of the dataset `id`.
  virtual absl::Status SetExtent(std::string_view id,
                                 absl::Span<const Index> shape) = 0;
};

}  // namespace hsarray

#endif  // HSARRAY_TRANSPORT_H_
