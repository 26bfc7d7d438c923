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

#ifndef HSARRAY_INDEX_EXPRESSION_H_
#define HSARRAY_INDEX_EXPRESSION_H_

/// \file
/// NumPy-style index expressions.
///
/// An `IndexExpression` is the C++ counterpart of the tuple passed to
/// NumPy's `__getitem__`::
///
///     a[2:6:2, 3, ...]      {Slice{2, 6, 2}, 3, Ellipsis{}}
///     a[[1, 2, 5]]          {IndexList{{1, 2, 5}}}
///     a[()]                 {}

#include <cstddef>
#include <initializer_list>
#include <iosfwd>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

#include "hsarray/index.h"

namespace hsarray {

/// Half-open strided range `start:stop:step`.  Missing bounds select from the
/// beginning or to the end of the axis; a missing step is `1`.
struct Slice {
  std::optional<Index> start;
  std::optional<Index> stop;
  std::optional<Index> step;
};

/// Stands for as many full slices as needed to index every axis.
struct Ellipsis {};

/// Explicit coordinates along one axis.
struct IndexList {
  std::vector<Index> indices;
};

/// Boolean mask in C order.  A rank-1 mask selects along a single axis; a
/// mask with the full shape of the array selects individual points.
struct BoolMask {
  std::vector<Index> shape;
  std::vector<bool> values;
};

using IndexTerm = std::variant<Index, Slice, Ellipsis, IndexList, BoolMask>;

bool operator==(const Slice& a, const Slice& b);
bool operator==(const Ellipsis& a, const Ellipsis& b);
bool operator==(const IndexList& a, const IndexList& b);
bool operator==(const BoolMask& a, const BoolMask& b);

/// Ordered sequence of index terms.  An empty expression is NumPy's `()`.
class IndexExpression {
 public:
  IndexExpression() = default;
  IndexExpression(std::initializer_list<IndexTerm> terms) : terms_(terms) {}
  explicit IndexExpression(std::vector<IndexTerm> terms)
      : terms_(std::move(terms)) {}

  const std::vector<IndexTerm>& terms() const { return terms_; }
  bool empty() const { return terms_.empty(); }
  size_t size() const { return terms_.size(); }

  friend bool operator==(const IndexExpression& a, const IndexExpression& b) {
    return a.terms_ == b.terms_;
  }
  friend bool operator!=(const IndexExpression& a, const IndexExpression& b) {
    return !(a == b);
  }

  /// Prints NumPy syntax, e.g. `[2:6:2, 3, ...]` or `[()]`.
  friend std::ostream& operator<<(std::ostream& os,
                                  const IndexExpression& expr);

 private:
  std::vector<IndexTerm> terms_;
};

}  // namespace hsarray

#endif  // HSARRAY_INDEX_EXPRESSION_H_
