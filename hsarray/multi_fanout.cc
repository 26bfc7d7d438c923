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

#include "hsarray/multi_fanout.h"

#include <stddef.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/base/attributes.h"
#include "absl/base/thread_annotations.h"
#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/span.h"
#include "hsarray/array.h"
#include "hsarray/array_handle.h"
#include "hsarray/index_expression.h"
#include "hsarray/internal/log/verbose_flag.h"
#include "hsarray/internal/thread/thread_pool.h"
#include "hsarray/util/executor.h"
#include "hsarray/util/result.h"
#include "hsarray/util/status.h"
#include "hsarray/util/str_cat.h"
#include "hsarray/value_transfer.h"

namespace hsarray {

namespace {
ABSL_CONST_INIT internal_log::VerboseFlag fanout_logging("fanout");

// Completion state of one fan-out call.  Shared with the tasks, since tasks
// still in flight may outlive the call after a failure.
struct FanoutState {
  explicit FanoutState(size_t num_tasks) : remaining(num_tasks) {}

  absl::Mutex mutex;
  size_t remaining ABSL_GUARDED_BY(mutex);
  absl::Status error ABSL_GUARDED_BY(mutex);

  static bool DoneOrFailed(FanoutState* state)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(state->mutex) {
    return state->remaining == 0 || !state->error.ok();
  }
};

// Runs `task(i)` for each `i` in `[0, num_tasks)` on `executor` and waits
// until all succeed or one fails.
absl::Status RunTasks(const Executor& executor, std::string_view op,
                      size_t num_tasks,
                      std::function<absl::Status(size_t)> task) {
  if (num_tasks == 0) return absl::OkStatus();
  auto state = std::make_shared<FanoutState>(num_tasks);
  for (size_t i = 0; i < num_tasks; ++i) {
    executor([state, task, i, op = std::string(op)] {
      {
        absl::MutexLock lock(&state->mutex);
        if (!state->error.ok()) {
          ABSL_LOG_IF(INFO, fanout_logging)
              << "Skipping " << op << " for target " << i;
          --state->remaining;
          return;
        }
      }
      absl::Status status = task(i);
      absl::MutexLock lock(&state->mutex);
      --state->remaining;
      if (!status.ok() && state->error.ok()) {
        state->error = MaybeAnnotateStatus(
            std::move(status),
            StrCat("Fan-out ", op, " failed for target ", i));
      }
    });
  }
  absl::MutexLock lock(&state->mutex);
  state->mutex.Await(absl::Condition(&FanoutState::DoneOrFailed, state.get()));
  return state->error;
}

absl::Status ValidateCount(std::string_view what, size_t expected,
                           size_t actual) {
  if (expected == actual) return absl::OkStatus();
  return absl::InvalidArgumentError(
      StrCat("Expected ", expected, " ", what, " for ", expected,
             " targets, but received ", actual));
}

}  // namespace

MultiFanout::MultiFanout(std::vector<ArrayHandle> targets,
                         FanoutOptions options)
    : targets_(std::move(targets)),
      options_(std::move(options)),
      executor_(internal::DetachedThreadPool(
          std::max<size_t>(1, options_.max_workers))) {}

Result<std::vector<Array>> MultiFanout::Read(
    const IndexExpression& expr) const {
  return RunRead({expr});
}

Result<std::vector<Array>> MultiFanout::Read(
    absl::Span<const IndexExpression> exprs) const {
  HSARRAY_RETURN_IF_ERROR(
      ValidateCount("selections", targets_.size(), exprs.size()));
  return RunRead(std::vector<IndexExpression>(exprs.begin(), exprs.end()));
}

absl::Status MultiFanout::Write(const IndexExpression& expr,
                                const Array& value) const {
  return RunWrite({expr}, {value});
}

absl::Status MultiFanout::Write(const IndexExpression& expr,
                                absl::Span<const Array> values) const {
  HSARRAY_RETURN_IF_ERROR(
      ValidateCount("values", targets_.size(), values.size()));
  return RunWrite({expr}, std::vector<Array>(values.begin(), values.end()));
}

absl::Status MultiFanout::Write(absl::Span<const IndexExpression> exprs,
                                absl::Span<const Array> values) const {
  HSARRAY_RETURN_IF_ERROR(
      ValidateCount("selections", targets_.size(), exprs.size()));
  HSARRAY_RETURN_IF_ERROR(
      ValidateCount("values", targets_.size(), values.size()));
  return RunWrite(std::vector<IndexExpression>(exprs.begin(), exprs.end()),
                  std::vector<Array>(values.begin(), values.end()));
}

// `exprs` and `values` hold either one entry shared by all targets or one
// entry per target.  They are moved into state owned by the tasks.

Result<std::vector<Array>> MultiFanout::RunRead(
    std::vector<IndexExpression> exprs) const {
  struct ReadState {
    std::vector<ArrayHandle> targets;
    std::vector<IndexExpression> exprs;
    TransferOptions options;
    std::vector<Array> results;
  };
  auto read = std::make_shared<ReadState>();
  read->targets = targets_;
  read->exprs = std::move(exprs);
  read->options = options_.transfer;
  read->results.resize(targets_.size());
  ABSL_LOG_IF(INFO, fanout_logging)
      << "Reading from " << targets_.size() << " targets";
  auto read_target = [read](size_t i) -> absl::Status {
    const auto& expr = read->exprs[read->exprs.size() == 1 ? 0 : i];
    HSARRAY_ASSIGN_OR_RETURN(
        read->results[i],
        ::hsarray::Read(read->targets[i], expr, read->options));
    return absl::OkStatus();
  };
  HSARRAY_RETURN_IF_ERROR(
      RunTasks(executor_, "read", targets_.size(), std::move(read_target)));
  return std::move(read->results);
}

absl::Status MultiFanout::RunWrite(std::vector<IndexExpression> exprs,
                                   std::vector<Array> values) const {
  struct WriteState {
    std::vector<ArrayHandle> targets;
    std::vector<IndexExpression> exprs;
    std::vector<Array> values;
    TransferOptions options;
  };
  auto write = std::make_shared<WriteState>();
  write->targets = targets_;
  write->exprs = std::move(exprs);
  write->values = std::move(values);
  write->options = options_.transfer;
  ABSL_LOG_IF(INFO, fanout_logging)
      << "Writing to " << targets_.size() << " targets";
  auto write_target = [write](size_t i) -> absl::Status {
    const auto& expr = write->exprs[write->exprs.size() == 1 ? 0 : i];
    const auto& value = write->values[write->values.size() == 1 ? 0 : i];
    return ::hsarray::Write(write->targets[i], expr, value, write->options);
  };
  return RunTasks(executor_, "write", targets_.size(),
                  std::move(write_target));
}

}  // namespace hsarray
