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

#include "hsarray/chunk_layout.h"

#include <algorithm>
#include <cmath>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "absl/strings/str_join.h"
#include <nlohmann/json.hpp>
#include "hsarray/index.h"
#include "hsarray/internal/json/value_as.h"
#include "hsarray/shape.h"
#include "hsarray/util/result.h"
#include "hsarray/util/status.h"
#include "hsarray/util/str_cat.h"

namespace hsarray {
namespace {

constexpr double kChunkBase = 16 * 1024;
constexpr double kChunkMin = 8 * 1024;
constexpr double kChunkMax = 1024 * 1024;
constexpr Index kGuessedUnlimitedExtent = 1024;

}  // namespace

Result<ChunkLayout> ChunkLayout::Create(absl::Span<const Index> extents) {
  if (extents.empty()) {
    return absl::InvalidArgumentError("Chunk layout must have rank >= 1");
  }
  if (static_cast<DimensionIndex>(extents.size()) > kMaxRank) {
    return absl::InvalidArgumentError(StrCat(
        "Rank ", extents.size(), " exceeds maximum rank of ", kMaxRank));
  }
  for (Index extent : extents) {
    if (extent <= 0) {
      return absl::InvalidArgumentError(StrCat(
          "Invalid chunk layout ", extents, ": extents must be positive"));
    }
  }
  return ChunkLayout(std::vector<Index>(extents.begin(), extents.end()));
}

Result<ChunkLayout> ChunkLayout::CreateFor(const Shape& shape,
                                           absl::Span<const Index> extents) {
  if (static_cast<DimensionIndex>(extents.size()) != shape.rank()) {
    return absl::InvalidArgumentError(
        StrCat("Chunk layout rank ", extents.size(),
               " does not match rank of shape ", shape));
  }
  return Create(extents);
}

std::ostream& operator<<(std::ostream& os, const ChunkLayout& layout) {
  return os << "{" << absl::StrJoin(layout.extents(), ", ") << "}";
}

Result<std::optional<ChunkLayout>> ParseChunkLayout(const ::nlohmann::json& j) {
  HSARRAY_ASSIGN_OR_RETURN(
      const auto* class_json,
      internal_json::JsonRequireMember(j, "class", "layout"));
  std::string layout_class;
  HSARRAY_RETURN_IF_ERROR(
      internal_json::JsonRequireString(*class_json, &layout_class));
  if (layout_class == "H5D_CONTIGUOUS" || layout_class == "H5D_COMPACT") {
    return std::optional<ChunkLayout>();
  }
  if (!absl::StartsWith(layout_class, "H5D_CHUNKED")) {
    return absl::InvalidArgumentError(
        StrCat("Unknown layout class: ", class_json->dump()));
  }
  HSARRAY_ASSIGN_OR_RETURN(
      const auto* dims_json,
      internal_json::JsonRequireMember(j, "dims",
                                       StrCat(layout_class, " layout")));
  if (!dims_json->is_array()) {
    return internal_json::ExpectedError(*dims_json, "array of chunk extents");
  }
  std::vector<Index> extents;
  for (const auto& item : *dims_json) {
    Index extent;
    HSARRAY_RETURN_IF_ERROR(
        internal_json::JsonRequireInteger(item, &extent, /*strict=*/true, 1),
        MaybeAnnotateStatus(_, "Error parsing chunk \"dims\""));
    extents.push_back(extent);
  }
  HSARRAY_ASSIGN_OR_RETURN(auto layout, ChunkLayout::Create(extents));
  return std::optional<ChunkLayout>(std::move(layout));
}

::nlohmann::json ChunkLayoutToJson(const std::optional<ChunkLayout>& layout) {
  if (!layout) return {{"class", "H5D_CONTIGUOUS"}};
  return {{"class", "H5D_CHUNKED"},
          {"dims", std::vector<Index>(layout->extents().begin(),
                                      layout->extents().end())}};
}

Result<ChunkLayout> GuessChunkLayout(const Shape& shape, Index item_size) {
  if (shape.kind() != ShapeKind::kSimple || shape.rank() == 0) {
    return absl::InvalidArgumentError(
        StrCat("Chunks not allowed for shape ", shape));
  }
  if (item_size <= 0) {
    return absl::InvalidArgumentError(
        StrCat("Invalid item size: ", item_size));
  }
  const DimensionIndex rank = shape.rank();
  std::vector<double> chunks(rank);
  for (DimensionIndex i = 0; i < rank; ++i) {
    chunks[i] = static_cast<double>(shape[i] != 0 ? shape[i]
                                                  : kGuessedUnlimitedExtent);
  }
  auto product = [&] {
    double n = 1;
    for (double c : chunks) n *= c;
    return n;
  };

  const double dataset_bytes = product() * item_size;
  double target_bytes =
      kChunkBase * std::pow(2.0, std::log10(dataset_bytes / (1024.0 * 1024)));
  target_bytes = std::min(std::max(target_bytes, kChunkMin), kChunkMax);

  for (DimensionIndex i = 0;; ++i) {
    const double chunk_bytes = product() * item_size;
    if ((chunk_bytes < target_bytes ||
         std::abs(chunk_bytes - target_bytes) / target_bytes < 0.5) &&
        chunk_bytes < kChunkMax) {
      break;
    }
    // A single element exceeds the maximum.
    if (product() == 1) break;
    double& c = chunks[i % rank];
    c = std::ceil(c / 2.0);
  }
  std::vector<Index> extents(rank);
  for (DimensionIndex i = 0; i < rank; ++i) {
    extents[i] = static_cast<Index>(chunks[i]);
  }
  return ChunkLayout::Create(extents);
}

}  // namespace hsarray
