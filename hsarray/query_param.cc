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

#include "hsarray/query_param.h"

#include <algorithm>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "hsarray/index.h"
#include "hsarray/shape.h"
#include "hsarray/util/result.h"
#include "hsarray/util/status.h"
#include "hsarray/util/str_cat.h"

namespace hsarray {

Index WireSelection::num_elements() const {
  Index n = 1;
  for (const auto& c : coordinates) n *= static_cast<Index>(c.size());
  return n;
}

std::vector<Index> WireSelection::mshape() const {
  std::vector<Index> shape;
  for (size_t i = 0; i < coordinates.size(); ++i) {
    if (!scalar[i]) shape.push_back(static_cast<Index>(coordinates[i].size()));
  }
  return shape;
}

namespace {

Result<Index> ParseInteger(std::string_view s, Index default_value) {
  s = absl::StripAsciiWhitespace(s);
  if (s.empty()) return default_value;
  Index value;
  if (!absl::SimpleAtoi(s, &value)) {
    return absl::InvalidArgumentError(
        StrCat("Invalid integer in selection: \"", s, "\""));
  }
  return value;
}

absl::Status CheckBounds(Index value, Index extent, size_t dim) {
  if (value < 0 || value >= extent) {
    return absl::OutOfRangeError(StrCat("Selection index ", value,
                                        " is out of bounds for axis ", dim,
                                        " with extent ", extent));
  }
  return absl::OkStatus();
}

// Splits the body of the selection on commas outside of nested brackets.
Result<std::vector<std::string_view>> SplitAxes(std::string_view body) {
  std::vector<std::string_view> parts;
  int depth = 0;
  size_t begin = 0;
  for (size_t i = 0; i < body.size(); ++i) {
    if (body[i] == '[') {
      ++depth;
    } else if (body[i] == ']') {
      if (--depth < 0) break;
    } else if (body[i] == ',' && depth == 0) {
      parts.push_back(body.substr(begin, i - begin));
      begin = i + 1;
    }
  }
  if (depth != 0) {
    return absl::InvalidArgumentError("Unbalanced brackets in selection");
  }
  parts.push_back(body.substr(begin));
  return parts;
}

absl::Status ParseAxis(std::string_view part, size_t dim, Index extent,
                       WireSelection* result) {
  part = absl::StripAsciiWhitespace(part);
  std::vector<Index> coords;
  bool scalar = false;
  if (part.empty()) {
    return absl::InvalidArgumentError(StrCat("Empty index for axis ", dim));
  }
  if (absl::ConsumePrefix(&part, "[")) {
    if (!absl::ConsumeSuffix(&part, "]")) {
      return absl::InvalidArgumentError(
          StrCat("Invalid index list for axis ", dim));
    }
    if (!absl::StripAsciiWhitespace(part).empty()) {
      for (std::string_view item : absl::StrSplit(part, ',')) {
        HSARRAY_ASSIGN_OR_RETURN(Index value, ParseInteger(item, -1));
        HSARRAY_RETURN_IF_ERROR(CheckBounds(value, extent, dim));
        if (!coords.empty() && value <= coords.back()) {
          return absl::InvalidArgumentError(StrCat(
              "Index list for axis ", dim, " must be strictly increasing"));
        }
        coords.push_back(value);
      }
    }
  } else if (!absl::StrContains(part, ':')) {
    HSARRAY_ASSIGN_OR_RETURN(Index value, ParseInteger(part, -1));
    HSARRAY_RETURN_IF_ERROR(CheckBounds(value, extent, dim));
    coords.push_back(value);
    scalar = true;
  } else {
    std::vector<std::string_view> fields = absl::StrSplit(part, ':');
    if (fields.size() > 3) {
      return absl::InvalidArgumentError(
          StrCat("Invalid range \"", part, "\" for axis ", dim));
    }
    HSARRAY_ASSIGN_OR_RETURN(Index start, ParseInteger(fields[0], 0));
    HSARRAY_ASSIGN_OR_RETURN(Index stop, ParseInteger(fields[1], extent));
    Index step = 1;
    if (fields.size() == 3) {
      HSARRAY_ASSIGN_OR_RETURN(step, ParseInteger(fields[2], 1));
    }
    if (step < 1 || start < 0 || stop < start) {
      return absl::InvalidArgumentError(
          StrCat("Invalid range \"", part, "\" for axis ", dim));
    }
    if (stop > extent) {
      return absl::OutOfRangeError(StrCat("Range \"", part,
                                          "\" exceeds extent ", extent,
                                          " of axis ", dim));
    }
    for (Index i = start; i < stop; i += step) coords.push_back(i);
  }
  result->coordinates.push_back(std::move(coords));
  result->scalar.push_back(scalar);
  return absl::OkStatus();
}

}  // namespace

Result<WireSelection> ParseQueryParam(std::string_view select,
                                      const Shape& shape) {
  std::string_view body = absl::StripAsciiWhitespace(select);
  if (!absl::ConsumePrefix(&body, "[") || !absl::ConsumeSuffix(&body, "]")) {
    return absl::InvalidArgumentError(
        StrCat("Selection must be enclosed in brackets: \"", select, "\""));
  }
  HSARRAY_ASSIGN_OR_RETURN(
      auto parts, SplitAxes(body),
      MaybeAnnotateStatus(_, StrCat("Invalid selection \"", select, "\"")));
  if (static_cast<DimensionIndex>(parts.size()) != shape.rank()) {
    return absl::InvalidArgumentError(
        StrCat("Selection \"", select, "\" has rank ", parts.size(),
               " but shape ", shape, " has rank ", shape.rank()));
  }
  WireSelection result;
  for (size_t dim = 0; dim < parts.size(); ++dim) {
    HSARRAY_RETURN_IF_ERROR(
        ParseAxis(parts[dim], dim, shape[dim], &result),
        MaybeAnnotateStatus(_, StrCat("Invalid selection \"", select, "\"")));
  }
  return result;
}

}  // namespace hsarray
