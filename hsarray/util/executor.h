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

#ifndef HSARRAY_UTIL_EXECUTOR_H_
#define HSARRAY_UTIL_EXECUTOR_H_

#include <functional>

#include "absl/functional/any_invocable.h"

namespace hsarray {

/// Type-erased nullary task, invoked at most once.
///
/// \relates Executor
using ExecutorTask = absl::AnyInvocable<void() &&>;

/// Type-erased executor.
///
/// An executor must eventually invoke (or destroy) every `ExecutorTask` it is
/// called with, possibly on another thread.
using Executor = std::function<void(ExecutorTask)>;

}  // namespace hsarray

#endif  // HSARRAY_UTIL_EXECUTOR_H_
