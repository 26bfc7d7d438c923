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

#include "hsarray/internal/thread/thread_pool.h"

#include <atomic>
#include <cstddef>
#include <memory>
#include <vector>

#include <gtest/gtest.h>
#include "absl/synchronization/blocking_counter.h"
#include "absl/synchronization/notification.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "hsarray/util/executor.h"

namespace {

using ::hsarray::Executor;
using ::hsarray::internal::DetachedThreadPool;

TEST(DetachedThreadPoolTest, Basic) {
  auto executor = DetachedThreadPool(1);
  absl::Notification notification;
  executor([&] { notification.Notify(); });
  notification.WaitForNotification();
}

TEST(DetachedThreadPoolTest, Concurrent) {
  auto executor = DetachedThreadPool(2);
  absl::Notification started, release, done;
  executor([&] {
    started.Notify();
    release.WaitForNotification();
    done.Notify();
  });
  executor([&] {
    started.WaitForNotification();
    release.Notify();
  });
  done.WaitForNotification();
}

TEST(DetachedThreadPoolTest, ThreadLimit) {
  constexpr static size_t kThreadLimit = 3;
  auto executor = DetachedThreadPool(kThreadLimit);
  std::atomic<size_t> running{0};
  std::atomic<size_t> max_running{0};
  absl::BlockingCounter counter(8);
  for (int i = 0; i < 8; ++i) {
    executor([&] {
      size_t now = ++running;
      size_t prev = max_running.load();
      while (now > prev && !max_running.compare_exchange_weak(prev, now)) {
      }
      absl::SleepFor(absl::Milliseconds(50));
      --running;
      counter.DecrementCount();
    });
  }
  counter.Wait();
  EXPECT_LE(max_running.load(), kThreadLimit);
  EXPECT_GE(max_running.load(), 1u);
}

TEST(DetachedThreadPoolTest, IndependentLimits) {
  auto executor_a = DetachedThreadPool(1);
  auto executor_b = DetachedThreadPool(1);
  absl::Notification a_started, b_done;
  executor_a([&] {
    a_started.Notify();
    b_done.WaitForNotification();
  });
  a_started.WaitForNotification();
  executor_b([&] { b_done.Notify(); });
  b_done.WaitForNotification();
}

TEST(DetachedThreadPoolTest, EnqueueFromTaskDestructor) {
  struct Task {
    Executor* executor;
    absl::Notification* ran;
    absl::Notification* destroyed;
    void operator()() { ran->Notify(); }
    ~Task() {
      if (executor) {
        (*executor)([destroyed = destroyed] { destroyed->Notify(); });
      }
    }
  };
  struct TaskWrapper {
    std::unique_ptr<Task> task;
    void operator()() { (*task)(); }
  };

  auto executor = DetachedThreadPool(1);
  absl::Notification ran, destroyed;
  executor(TaskWrapper{std::unique_ptr<Task>(
      new Task{&executor, &ran, &destroyed})});
  ran.WaitForNotification();
  destroyed.WaitForNotification();
}

}  // namespace
