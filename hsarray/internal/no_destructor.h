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

#ifndef HSARRAY_INTERNAL_NO_DESTRUCTOR_H_
#define HSARRAY_INTERNAL_NO_DESTRUCTOR_H_

#include <new>
#include <utility>

namespace hsarray {
namespace internal {

/// Holds a `T` whose destructor never runs.
///
/// Intended for function-local statics that must remain usable during
/// static destruction, such as state shared with detached threads.
template <typename T>
class NoDestructor {
 public:
  template <typename... U>
  explicit NoDestructor(U&&... args) {
    new (storage_) T(std::forward<U>(args)...);
  }
  NoDestructor(const NoDestructor&) = delete;
  NoDestructor& operator=(const NoDestructor&) = delete;

  T* get() { return reinterpret_cast<T*>(storage_); }
  const T* get() const { return reinterpret_cast<const T*>(storage_); }
  T& operator*() { return *get(); }
  const T& operator*() const { return *get(); }
  T* operator->() { return get(); }
  const T* operator->() const { return get(); }

 private:
  alignas(T) unsigned char storage_[sizeof(T)];
};

}  // namespace internal
}  // namespace hsarray

#endif  // HSARRAY_INTERNAL_NO_DESTRUCTOR_H_
