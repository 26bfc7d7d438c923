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

#ifndef HSARRAY_INTERNAL_THREAD_THREAD_POOL_H_
#define HSARRAY_INTERNAL_THREAD_THREAD_POOL_H_

#include <stddef.h>

#include "hsarray/util/executor.h"

namespace hsarray {
namespace internal {

/// Returns an executor backed by the process-wide detached thread pool.
///
/// At most `num_threads` tasks submitted through the returned executor (and
/// its copies) run concurrently; additional tasks are queued in submission
/// order.  The shared pool starts worker threads on demand and lets idle
/// workers exit.  Queued work keeps running after the last copy of the
/// executor is destroyed.
///
/// \param num_threads Maximum concurrency, must be positive.
Executor DetachedThreadPool(size_t num_threads);

}  // namespace internal
}  // namespace hsarray

#endif  // HSARRAY_INTERNAL_THREAD_THREAD_POOL_H_
