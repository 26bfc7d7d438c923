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

#include "hsarray/transport.h"

#include <ostream>

#include "absl/strings/str_join.h"

namespace hsarray {

Transport::~Transport() = default;

std::ostream& operator<<(std::ostream& os, const ValueRequest& request) {
  os << "{id=" << request.id;
  if (request.select) os << ", select=" << *request.select;
  if (!request.points.empty()) os << ", points=" << request.points.size();
  if (request.post_select) os << ", post_select";
  if (!request.fields.empty()) {
    os << ", fields=" << absl::StrJoin(request.fields, ",");
  }
  return os << "}";
}

}  // namespace hsarray
