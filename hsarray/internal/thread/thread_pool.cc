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

#include <stddef.h>

#include <memory>
#include <queue>
#include <thread>  // NOLINT
#include <utility>

#include "absl/base/thread_annotations.h"
#include "absl/log/absl_check.h"
#include "absl/log/absl_log.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "hsarray/internal/log/verbose_flag.h"
#include "hsarray/internal/no_destructor.h"
#include "hsarray/util/executor.h"

namespace hsarray {
namespace internal {
namespace {

ABSL_CONST_INIT internal_log::VerboseFlag thread_pool_logging("thread_pool");

constexpr absl::Duration kThreadIdleBeforeExit = absl::Seconds(20);

class TaskQueue;

/// Dynamically-sized pool of detached worker threads shared by every
/// `TaskQueue`.
///
/// A worker thread is started whenever a task is enqueued and no worker is
/// idle.  Workers exit after being idle for `kThreadIdleBeforeExit`.
class SharedThreadPool {
 public:
  struct QueuedTask {
    std::shared_ptr<TaskQueue> owner;
    ExecutorTask callback;
  };

  void AddTask(QueuedTask task) ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  void StartThread() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  void WorkerLoop() ABSL_LOCKS_EXCLUDED(mutex_);

  absl::Mutex mutex_;
  std::queue<QueuedTask> queue_ ABSL_GUARDED_BY(mutex_);
  size_t idle_threads_ ABSL_GUARDED_BY(mutex_) = 0;
  size_t total_threads_ ABSL_GUARDED_BY(mutex_) = 0;
};

/// Limits the number of tasks of one executor that run concurrently on the
/// shared pool.
class TaskQueue : public std::enable_shared_from_this<TaskQueue> {
 public:
  TaskQueue(SharedThreadPool* pool, size_t thread_limit)
      : pool_(pool), thread_limit_(thread_limit) {}

  /// Enqueues a task.  Never blocks.
  void AddTask(ExecutorTask task) ABSL_LOCKS_EXCLUDED(mutex_);

  /// Called by the pool when a task of this queue completes.
  void TaskDone() ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  SharedThreadPool* const pool_;
  const size_t thread_limit_;
  absl::Mutex mutex_;
  size_t in_use_ ABSL_GUARDED_BY(mutex_) = 0;
  std::queue<ExecutorTask> pending_ ABSL_GUARDED_BY(mutex_);
};

void SharedThreadPool::AddTask(QueuedTask task) {
  absl::MutexLock lock(&mutex_);
  queue_.push(std::move(task));
  if (idle_threads_ == 0) {
    StartThread();
  }
}

void SharedThreadPool::StartThread() {
  ++idle_threads_;
  ++total_threads_;
  ABSL_LOG_IF(INFO, thread_pool_logging)
      << "Starting worker thread, total=" << total_threads_;
  std::thread([this] { WorkerLoop(); }).detach();
}

void SharedThreadPool::WorkerLoop() {
  absl::MutexLock lock(&mutex_);
  while (true) {
    if (queue_.empty()) {
      auto has_work = [this]() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
        return !queue_.empty();
      };
      if (!mutex_.AwaitWithTimeout(absl::Condition(&has_work),
                                   kThreadIdleBeforeExit)) {
        --idle_threads_;
        --total_threads_;
        return;
      }
    }
    QueuedTask task = std::move(queue_.front());
    queue_.pop();
    if (--idle_threads_ == 0 && !queue_.empty()) {
      StartThread();
    }
    mutex_.Unlock();
    std::move(task.callback)();
    task.owner->TaskDone();
    // Destroy the task while the mutex is unlocked.
    task = QueuedTask{};
    mutex_.Lock();
    ++idle_threads_;
  }
}

void TaskQueue::AddTask(ExecutorTask task) {
  {
    absl::MutexLock lock(&mutex_);
    if (in_use_ >= thread_limit_) {
      pending_.push(std::move(task));
      return;
    }
    ++in_use_;
  }
  pool_->AddTask({shared_from_this(), std::move(task)});
}

void TaskQueue::TaskDone() {
  ExecutorTask task;
  {
    absl::MutexLock lock(&mutex_);
    if (pending_.empty()) {
      --in_use_;
      return;
    }
    task = std::move(pending_.front());
    pending_.pop();
  }
  pool_->AddTask({shared_from_this(), std::move(task)});
}

}  // namespace

Executor DetachedThreadPool(size_t num_threads) {
  ABSL_CHECK_GT(num_threads, 0u);
  // Detached workers may outlive static destruction.
  static NoDestructor<SharedThreadPool> pool;
  auto queue = std::make_shared<TaskQueue>(pool.get(), num_threads);
  return [queue = std::move(queue)](ExecutorTask task) {
    queue->AddTask(std::move(task));
  };
}

}  // namespace internal
}  // namespace hsarray
