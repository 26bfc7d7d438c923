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

#include "hsarray/connection_registry.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <utility>

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "hsarray/transport.h"
#include "hsarray/util/result.h"
#include "hsarray/util/str_cat.h"

namespace hsarray {
namespace {

absl::Status StaleHandleError(ConnectionHandle handle) {
  return absl::FailedPreconditionError(
      StrCat("stale connection handle ", handle));
}

}  // namespace

std::ostream& operator<<(std::ostream& os, ConnectionHandle h) {
  return os << "{" << h.index << "@" << h.generation << "}";
}

ConnectionHandle ConnectionRegistry::Register(
    std::shared_ptr<Transport> transport) {
  ABSL_CHECK(transport);
  absl::MutexLock lock(&mutex_);
  uint32_t index;
  if (!free_slots_.empty()) {
    index = free_slots_.back();
    free_slots_.pop_back();
  } else {
    index = static_cast<uint32_t>(slots_.size());
    slots_.emplace_back();
  }
  auto& slot = slots_[index];
  slot.transport = std::move(transport);
  return ConnectionHandle{index, slot.generation};
}

Result<std::shared_ptr<Transport>> ConnectionRegistry::Lookup(
    ConnectionHandle handle) const {
  absl::MutexLock lock(&mutex_);
  if (handle.index >= slots_.size()) return StaleHandleError(handle);
  const auto& slot = slots_[handle.index];
  if (slot.generation != handle.generation || !slot.transport) {
    return StaleHandleError(handle);
  }
  return slot.transport;
}

absl::Status ConnectionRegistry::Close(ConnectionHandle handle) {
  std::shared_ptr<Transport> transport;
  {
    absl::MutexLock lock(&mutex_);
    if (handle.index >= slots_.size()) return StaleHandleError(handle);
    auto& slot = slots_[handle.index];
    if (slot.generation != handle.generation || !slot.transport) {
      return StaleHandleError(handle);
    }
    // Destroy the transport outside the lock.
    transport = std::move(slot.transport);
    slot.transport = nullptr;
    ++slot.generation;
    free_slots_.push_back(handle.index);
  }
  return absl::OkStatus();
}

size_t ConnectionRegistry::size() const {
  absl::MutexLock lock(&mutex_);
  return slots_.size() - free_slots_.size();
}

}  // namespace hsarray
