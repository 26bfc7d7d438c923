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

#include "hsarray/object_ref.h"

#include <ostream>
#include <string>
#include <string_view>
#include <variant>

#include "absl/status/status.h"
#include "absl/strings/match.h"
#include <nlohmann/json.hpp>
#include "hsarray/internal/json/value_as.h"
#include "hsarray/util/result.h"
#include "hsarray/util/status.h"
#include "hsarray/util/str_cat.h"

namespace hsarray {
namespace {

constexpr std::string_view kGroups = "groups";
constexpr std::string_view kDatasets = "datasets";
constexpr std::string_view kDatatypes = "datatypes";

Result<ObjectRef> MakeRef(std::string_view collection, std::string_view id) {
  if (collection == kGroups) return GroupRef{std::string(id)};
  if (collection == kDatasets) return DatasetRef{std::string(id)};
  if (collection == kDatatypes) return DatatypeRef{std::string(id)};
  return absl::InvalidArgumentError(
      StrCat("Unknown collection \"", collection, "\""));
}

std::string_view CollectionForId(std::string_view id) {
  if (absl::StartsWith(id, "g-")) return kGroups;
  if (absl::StartsWith(id, "d-")) return kDatasets;
  if (absl::StartsWith(id, "t-")) return kDatatypes;
  return {};
}

Result<std::string> RequireString(const ::nlohmann::json& j,
                                  std::string_view name,
                                  std::string_view context) {
  HSARRAY_ASSIGN_OR_RETURN(const auto* member,
                           internal_json::JsonRequireMember(j, name, context));
  std::string value;
  HSARRAY_RETURN_IF_ERROR(
      internal_json::JsonRequireString(*member, &value),
      MaybeAnnotateStatus(_, StrCat("Error parsing \"", name, "\"")));
  return value;
}

struct RefPrinter {
  std::ostream& os;
  void operator()(const GroupRef& r) { os << "Group(" << r.id << ")"; }
  void operator()(const DatasetRef& r) { os << "Dataset(" << r.id << ")"; }
  void operator()(const DatatypeRef& r) { os << "Datatype(" << r.id << ")"; }
  void operator()(const SoftLinkRef& r) {
    os << "SoftLink(" << r.h5path << ")";
  }
  void operator()(const ExternalLinkRef& r) {
    os << "ExternalLink(" << r.h5domain << ", " << r.h5path << ")";
  }
  void operator()(const HardLinkRef& r) {
    os << "HardLink(" << r.collection << "/" << r.id << ")";
  }
};

}  // namespace

std::ostream& operator<<(std::ostream& os, const ObjectRef& ref) {
  std::visit(RefPrinter{os}, ref);
  return os;
}

Result<ObjectRef> ResolveObjectId(std::string_view id) {
  for (std::string_view collection : {kGroups, kDatasets, kDatatypes}) {
    if (absl::StartsWith(id, collection) &&
        id.substr(collection.size()).substr(0, 1) == "/") {
      return MakeRef(collection, id.substr(collection.size() + 1));
    }
  }
  std::string_view collection = CollectionForId(id);
  if (collection.empty()) {
    return absl::InvalidArgumentError(
        StrCat("Unexpected object id: \"", id, "\""));
  }
  return MakeRef(collection, id);
}

Result<ObjectRef> ParseLink(const ::nlohmann::json& j) {
  constexpr std::string_view kContext = "link";
  HSARRAY_ASSIGN_OR_RETURN(auto link_class,
                           RequireString(j, "class", kContext));
  if (link_class == "H5L_TYPE_HARD") {
    HardLinkRef link;
    HSARRAY_ASSIGN_OR_RETURN(link.id, RequireString(j, "id", kContext));
    if (const auto* collection = internal_json::JsonFindMember(
            j, "collection")) {
      HSARRAY_RETURN_IF_ERROR(
          internal_json::JsonRequireString(*collection, &link.collection),
          MaybeAnnotateStatus(_, "Error parsing \"collection\""));
    } else {
      link.collection = std::string(CollectionForId(link.id));
    }
    return link;
  }
  if (link_class == "H5L_TYPE_SOFT") {
    SoftLinkRef link;
    HSARRAY_ASSIGN_OR_RETURN(link.h5path,
                             RequireString(j, "h5path", kContext));
    return link;
  }
  if (link_class == "H5L_TYPE_EXTERNAL") {
    ExternalLinkRef link;
    HSARRAY_ASSIGN_OR_RETURN(link.h5domain,
                             RequireString(j, "h5domain", kContext));
    HSARRAY_ASSIGN_OR_RETURN(link.h5path,
                             RequireString(j, "h5path", kContext));
    return link;
  }
  if (link_class == "H5L_TYPE_USER_DEFINED") {
    return absl::InvalidArgumentError("User-defined links are not supported");
  }
  return absl::InvalidArgumentError(
      StrCat("Invalid link class: \"", link_class, "\""));
}

Result<ObjectRef> ResolveHardLink(const HardLinkRef& link) {
  HSARRAY_ASSIGN_OR_RETURN(auto ref, MakeRef(link.collection, link.id));
  std::string_view expected = CollectionForId(link.id);
  if (!expected.empty() && expected != link.collection) {
    return absl::InvalidArgumentError(
        StrCat("Object id \"", link.id, "\" does not belong to collection \"",
               link.collection, "\""));
  }
  return ref;
}

std::string_view GetCollection(const ObjectRef& ref) {
  if (std::holds_alternative<GroupRef>(ref)) return kGroups;
  if (std::holds_alternative<DatasetRef>(ref)) return kDatasets;
  if (std::holds_alternative<DatatypeRef>(ref)) return kDatatypes;
  return {};
}

}  // namespace hsarray
