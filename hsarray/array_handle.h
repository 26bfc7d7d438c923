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

#ifndef HSARRAY_ARRAY_HANDLE_H_
#define HSARRAY_ARRAY_HANDLE_H_

#include <optional>
#include <string>

#include "hsarray/chunk_layout.h"
#include "hsarray/connection_registry.h"
#include "hsarray/dtype.h"
#include "hsarray/shape.h"
#include "hsarray/type_descriptor.h"

namespace hsarray {

/// Open dataset: the connection it is accessed through and its metadata,
/// fetched once by `OpenArray`.
///
/// The connection is referenced, not owned; operations on a handle whose
/// connection has been closed fail with
/// `absl::StatusCode::kFailedPrecondition`.
struct ArrayHandle {
  ConnectionRegistry* registry = nullptr;
  ConnectionHandle connection;

  /// Dataset id, without a collection prefix.
  std::string id;

  Dataspace dataspace;

  /// Element type as declared by the service.
  TypeDescriptor type = IntegerType{};

  /// Native element type decoded from `type`.
  DType dtype;

  /// Chunk layout, or `std::nullopt` if the dataset is not chunked.
  std::optional<ChunkLayout> chunk_layout;

  const Shape& shape() const { return dataspace.shape; }
};

}  // namespace hsarray

#endif  // HSARRAY_ARRAY_HANDLE_H_
