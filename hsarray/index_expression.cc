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

#include "hsarray/index_expression.h"

#include <ostream>
#include <variant>

#include "absl/strings/str_join.h"

namespace hsarray {

bool operator==(const Slice& a, const Slice& b) {
  return a.start == b.start && a.stop == b.stop && a.step == b.step;
}
bool operator==(const Ellipsis&, const Ellipsis&) { return true; }
bool operator==(const IndexList& a, const IndexList& b) {
  return a.indices == b.indices;
}
bool operator==(const BoolMask& a, const BoolMask& b) {
  return a.shape == b.shape && a.values == b.values;
}

namespace {

struct TermPrinter {
  std::ostream& os;
  void operator()(Index i) { os << i; }
  void operator()(const Slice& s) {
    if (s.start) os << *s.start;
    os << ':';
    if (s.stop) os << *s.stop;
    if (s.step) os << ':' << *s.step;
  }
  void operator()(const Ellipsis&) { os << "..."; }
  void operator()(const IndexList& l) {
    os << '[' << absl::StrJoin(l.indices, ", ") << ']';
  }
  void operator()(const BoolMask& m) {
    os << "mask(" << absl::StrJoin(m.shape, ", ") << ')';
  }
};

}  // namespace

std::ostream& operator<<(std::ostream& os, const IndexExpression& expr) {
  if (expr.empty()) return os << "[()]";
  os << '[';
  for (size_t i = 0; i < expr.terms().size(); ++i) {
    if (i != 0) os << ", ";
    std::visit(TermPrinter{os}, expr.terms()[i]);
  }
  return os << ']';
}

}  // namespace hsarray
