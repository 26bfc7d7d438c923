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

#ifndef HSARRAY_MULTI_FANOUT_H_
#define HSARRAY_MULTI_FANOUT_H_

/// \file
/// Concurrent reads and writes across several datasets.
///
/// Example:
///
///     MultiFanout fanout({handle_a, handle_b, handle_c});
///     HSARRAY_ASSIGN_OR_RETURN(auto rows, fanout.Read({0, Ellipsis{}}));
///     // rows[i] holds the first row of the i-th dataset.

#include <cstddef>
#include <vector>

#include "absl/status/status.h"
#include "absl/types/span.h"
#include "hsarray/array.h"
#include "hsarray/array_handle.h"
#include "hsarray/index_expression.h"
#include "hsarray/util/executor.h"
#include "hsarray/util/result.h"
#include "hsarray/value_transfer.h"

namespace hsarray {

struct FanoutOptions {
  /// Maximum number of targets processed concurrently.
  size_t max_workers = 16;

  /// Options applied to the transfer for each target.
  TransferOptions transfer;
};

/// Applies one read or write operation to a list of datasets, with one task
/// per dataset.
///
/// Results are returned in target order.  The first failing task fails the
/// whole call: the call returns without waiting for tasks still in flight,
/// tasks not yet started are skipped, and results of other tasks are
/// discarded.  The error keeps the status code of the failing task and is
/// annotated with the target position.
///
/// Writes are not atomic across targets: when a write fails, targets that
/// were already written keep their new values.
class MultiFanout {
 public:
  explicit MultiFanout(std::vector<ArrayHandle> targets,
                       FanoutOptions options = {});

  const std::vector<ArrayHandle>& targets() const { return targets_; }
  const FanoutOptions& options() const { return options_; }

  /// Reads the selection `expr` from every target.
  Result<std::vector<Array>> Read(const IndexExpression& expr) const;

  /// Reads `exprs[i]` from target `i`.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if `exprs.size()` does not
  ///     equal the number of targets.
  Result<std::vector<Array>> Read(
      absl::Span<const IndexExpression> exprs) const;

  /// Writes `value` to the selection `expr` of every target.
  absl::Status Write(const IndexExpression& expr, const Array& value) const;

  /// Writes `values[i]` to the selection `expr` of target `i`.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if `values.size()` does not
  ///     equal the number of targets.
  absl::Status Write(const IndexExpression& expr,
                     absl::Span<const Array> values) const;

  /// Writes `values[i]` to the selection `exprs[i]` of target `i`.
  absl::Status Write(absl::Span<const IndexExpression> exprs,
                     absl::Span<const Array> values) const;

 private:
  Result<std::vector<Array>> RunRead(
      std::vector<IndexExpression> exprs) const;
  absl::Status RunWrite(std::vector<IndexExpression> exprs,
                        std::vector<Array> values) const;

  std::vector<ArrayHandle> targets_;
  FanoutOptions options_;
  Executor executor_;
};

}  // namespace hsarray

#endif  // HSARRAY_MULTI_FANOUT_H_
