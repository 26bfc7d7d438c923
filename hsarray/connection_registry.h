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

#ifndef HSARRAY_CONNECTION_REGISTRY_H_
#define HSARRAY_CONNECTION_REGISTRY_H_

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "hsarray/transport.h"
#include "hsarray/util/result.h"

namespace hsarray {

/// Non-owning reference to a connection held by a `ConnectionRegistry`.
///
/// A handle becomes stale when its connection is closed; slots are reused
/// with an incremented generation so stale handles never alias a newer
/// connection.
struct ConnectionHandle {
  uint32_t index = 0;
  uint32_t generation = 0;

  friend bool operator==(ConnectionHandle a, ConnectionHandle b) {
    return a.index == b.index && a.generation == b.generation;
  }
  friend bool operator!=(ConnectionHandle a, ConnectionHandle b) {
    return !(a == b);
  }
  friend std::ostream& operator<<(std::ostream& os, ConnectionHandle h);
};

/// Owns open transports and hands out `ConnectionHandle`s to them.
///
/// All methods are thread safe.
class ConnectionRegistry {
 public:
  ConnectionRegistry() = default;
  ConnectionRegistry(const ConnectionRegistry&) = delete;
  ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

  ConnectionHandle Register(std::shared_ptr<Transport> transport);

  /// Returns the transport of `handle`.  The returned reference keeps the
  /// transport alive even if the connection is closed concurrently.
  ///
  /// \error `absl::StatusCode::kFailedPrecondition` if `handle` is stale.
  Result<std::shared_ptr<Transport>> Lookup(ConnectionHandle handle) const;

  /// Closes the connection of `handle`.
  ///
  /// \error `absl::StatusCode::kFailedPrecondition` if `handle` is stale.
  absl::Status Close(ConnectionHandle handle);

  /// Returns the number of open connections.
  size_t size() const;

 private:
  struct Slot {
    std::shared_ptr<Transport> transport;
    uint32_t generation = 0;
  };

  mutable absl::Mutex mutex_;
  std::vector<Slot> slots_ ABSL_GUARDED_BY(mutex_);
  std::vector<uint32_t> free_slots_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace hsarray

#endif  // HSARRAY_CONNECTION_REGISTRY_H_
