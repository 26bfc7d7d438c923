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

#include "hsarray/shape.h"

#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/base/optimization.h"
#include "absl/log/absl_check.h"
#include "absl/status/status.h"
#include "absl/strings/str_join.h"
#include <nlohmann/json.hpp>
#include "hsarray/index.h"
#include "hsarray/internal/json/value_as.h"
#include "hsarray/util/result.h"
#include "hsarray/util/status.h"
#include "hsarray/util/str_cat.h"

namespace hsarray {

std::string_view ToString(ShapeKind kind) {
  switch (kind) {
    case ShapeKind::kNull:
      return "null";
    case ShapeKind::kScalar:
      return "scalar";
    case ShapeKind::kSimple:
      return "simple";
  }
  ABSL_UNREACHABLE();
}

std::ostream& operator<<(std::ostream& os, ShapeKind kind) {
  return os << ToString(kind);
}

Shape::Shape(std::vector<Index> extents)
    : kind_(ShapeKind::kSimple), extents_(std::move(extents)) {
  ABSL_CHECK_LE(rank(), kMaxRank);
  for (Index extent : extents_) {
    ABSL_CHECK_GE(extent, 0);
  }
}

Shape Shape::Null() {
  Shape shape;
  shape.kind_ = ShapeKind::kNull;
  return shape;
}

Shape Shape::Scalar() { return Shape(); }

Result<Shape> Shape::Simple(absl::Span<const Index> extents) {
  if (static_cast<DimensionIndex>(extents.size()) > kMaxRank) {
    return absl::InvalidArgumentError(StrCat(
        "Rank ", extents.size(), " exceeds maximum rank of ", kMaxRank));
  }
  for (Index extent : extents) {
    if (extent < 0) {
      return absl::InvalidArgumentError(
          StrCat("Invalid shape ", extents, ": extents must be non-negative"));
    }
  }
  return Shape(std::vector<Index>(extents.begin(), extents.end()));
}

Index Shape::num_elements() const {
  switch (kind_) {
    case ShapeKind::kNull:
      return 0;
    case ShapeKind::kScalar:
      return 1;
    case ShapeKind::kSimple:
      break;
  }
  Index n = 1;
  for (Index extent : extents_) n *= extent;
  return n;
}

std::ostream& operator<<(std::ostream& os, const Shape& shape) {
  switch (shape.kind()) {
    case ShapeKind::kNull:
      return os << "null";
    case ShapeKind::kScalar:
      return os << "()";
    case ShapeKind::kSimple:
      break;
  }
  os << "(" << absl::StrJoin(shape.extents(), ", ");
  if (shape.rank() == 1) os << ",";
  return os << ")";
}

bool Dataspace::CanResizeTo(absl::Span<const Index> new_shape) const {
  if (static_cast<DimensionIndex>(new_shape.size()) != shape.rank()) {
    return false;
  }
  if (!maxshape) return true;
  for (size_t i = 0; i < new_shape.size(); ++i) {
    Index max_extent = (*maxshape)[i];
    if (max_extent != kUnlimited && new_shape[i] > max_extent) return false;
  }
  return true;
}

namespace {

Result<std::vector<Index>> ParseExtents(const ::nlohmann::json& j,
                                        bool allow_unlimited) {
  if (!j.is_array()) {
    return internal_json::ExpectedError(j, "array of extents");
  }
  std::vector<Index> extents;
  for (const auto& item : j) {
    if (allow_unlimited && item == "H5S_UNLIMITED") {
      extents.push_back(kUnlimited);
      continue;
    }
    Index extent;
    HSARRAY_RETURN_IF_ERROR(internal_json::JsonRequireInteger(
        item, &extent, /*strict=*/true, 0));
    if (allow_unlimited && extent == 0) extent = kUnlimited;
    extents.push_back(extent);
  }
  return extents;
}

}  // namespace

Result<Dataspace> ParseDataspace(const ::nlohmann::json& j) {
  HSARRAY_ASSIGN_OR_RETURN(
      const auto* class_json,
      internal_json::JsonRequireMember(j, "class", "shape"));
  std::string shape_class;
  HSARRAY_RETURN_IF_ERROR(internal_json::JsonRequireString(*class_json,
                                                           &shape_class));
  Dataspace dataspace;
  if (shape_class == "H5S_NULL") {
    dataspace.shape = Shape::Null();
    return dataspace;
  }
  if (shape_class == "H5S_SCALAR") {
    dataspace.shape = Shape::Scalar();
    return dataspace;
  }
  if (shape_class != "H5S_SIMPLE") {
    return absl::InvalidArgumentError(
        StrCat("Unknown shape class: ", class_json->dump()));
  }
  HSARRAY_ASSIGN_OR_RETURN(
      const auto* dims_json,
      internal_json::JsonRequireMember(j, "dims", "H5S_SIMPLE shape"));
  HSARRAY_ASSIGN_OR_RETURN(auto dims, ParseExtents(*dims_json, false),
                           MaybeAnnotateStatus(_, "Error parsing \"dims\""));
  HSARRAY_ASSIGN_OR_RETURN(dataspace.shape, Shape::Simple(dims));
  if (const auto* maxdims_json = internal_json::JsonFindMember(j, "maxdims")) {
    HSARRAY_ASSIGN_OR_RETURN(
        auto maxdims, ParseExtents(*maxdims_json, true),
        MaybeAnnotateStatus(_, "Error parsing \"maxdims\""));
    if (maxdims.size() != dims.size()) {
      return absl::InvalidArgumentError(
          StrCat("\"maxdims\" rank ", maxdims.size(),
                 " does not match \"dims\" rank ", dims.size()));
    }
    for (size_t i = 0; i < dims.size(); ++i) {
      if (maxdims[i] != kUnlimited && maxdims[i] < dims[i]) {
        return absl::InvalidArgumentError(
            StrCat("\"maxdims\" ", maxdims_json->dump(),
                   " is smaller than \"dims\" ", dims_json->dump()));
      }
    }
    dataspace.maxshape = std::move(maxdims);
  }
  return dataspace;
}

::nlohmann::json DataspaceToJson(const Dataspace& dataspace) {
  switch (dataspace.shape.kind()) {
    case ShapeKind::kNull:
      return {{"class", "H5S_NULL"}};
    case ShapeKind::kScalar:
      return {{"class", "H5S_SCALAR"}};
    case ShapeKind::kSimple:
      break;
  }
  ::nlohmann::json j{{"class", "H5S_SIMPLE"}};
  j["dims"] = std::vector<Index>(dataspace.shape.extents().begin(),
                                 dataspace.shape.extents().end());
  if (dataspace.maxshape) {
    auto maxdims = ::nlohmann::json::array();
    for (Index extent : *dataspace.maxshape) {
      if (extent == kUnlimited) {
        maxdims.push_back("H5S_UNLIMITED");
      } else {
        maxdims.push_back(extent);
      }
    }
    j["maxdims"] = std::move(maxdims);
  }
  return j;
}

}  // namespace hsarray
