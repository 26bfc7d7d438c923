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

#ifndef HSARRAY_OBJECT_REF_H_
#define HSARRAY_OBJECT_REF_H_

/// \file
/// Closed set of objects and links addressable in a domain.

#include <iosfwd>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>
#include "hsarray/util/result.h"

namespace hsarray {

/// Group object, identified by a `g-` id.
struct GroupRef {
  std::string id;

  friend bool operator==(const GroupRef& a, const GroupRef& b) {
    return a.id == b.id;
  }
  friend bool operator!=(const GroupRef& a, const GroupRef& b) {
    return !(a == b);
  }
};

/// Dataset object, identified by a `d-` id.
struct DatasetRef {
  std::string id;

  friend bool operator==(const DatasetRef& a, const DatasetRef& b) {
    return a.id == b.id;
  }
  friend bool operator!=(const DatasetRef& a, const DatasetRef& b) {
    return !(a == b);
  }
};

/// Committed datatype object, identified by a `t-` id.
struct DatatypeRef {
  std::string id;

  friend bool operator==(const DatatypeRef& a, const DatatypeRef& b) {
    return a.id == b.id;
  }
  friend bool operator!=(const DatatypeRef& a, const DatatypeRef& b) {
    return !(a == b);
  }
};

/// Link to an object by path within the same domain.
struct SoftLinkRef {
  std::string h5path;

  friend bool operator==(const SoftLinkRef& a, const SoftLinkRef& b) {
    return a.h5path == b.h5path;
  }
  friend bool operator!=(const SoftLinkRef& a, const SoftLinkRef& b) {
    return !(a == b);
  }
};

/// Link to an object by path within another domain.
struct ExternalLinkRef {
  std::string h5domain;
  std::string h5path;

  friend bool operator==(const ExternalLinkRef& a, const ExternalLinkRef& b) {
    return a.h5domain == b.h5domain && a.h5path == b.h5path;
  }
  friend bool operator!=(const ExternalLinkRef& a, const ExternalLinkRef& b) {
    return !(a == b);
  }
};

/// Link to an object by id.  `collection` is one of `"groups"`,
/// `"datasets"` and `"datatypes"`.
struct HardLinkRef {
  std::string id;
  std::string collection;

  friend bool operator==(const HardLinkRef& a, const HardLinkRef& b) {
    return a.id == b.id && a.collection == b.collection;
  }
  friend bool operator!=(const HardLinkRef& a, const HardLinkRef& b) {
    return !(a == b);
  }
};

using ObjectRef = std::variant<GroupRef, DatasetRef, DatatypeRef, SoftLinkRef,
                               ExternalLinkRef, HardLinkRef>;

std::ostream& operator<<(std::ostream& os, const ObjectRef& ref);

/// Resolves an object id to a `GroupRef`, `DatasetRef` or `DatatypeRef`.
///
/// The id may carry a collection prefix (`"datasets/d-..."`), in which case
/// the prefix determines the kind.
///
/// \error `absl::StatusCode::kInvalidArgument` if the kind of `id` cannot be
///     determined.
Result<ObjectRef> ResolveObjectId(std::string_view id);

/// Parses a link description such as
/// `{"class": "H5L_TYPE_HARD", "collection": "datasets", "id": "d-..."}`.
///
/// \error `absl::StatusCode::kInvalidArgument` if `j` is malformed or
///     describes a user-defined link.
Result<ObjectRef> ParseLink(const ::nlohmann::json& j);

/// Resolves a hard link to the object it refers to.
///
/// \error `absl::StatusCode::kInvalidArgument` if the collection is unknown
///     or does not match the id.
Result<ObjectRef> ResolveHardLink(const HardLinkRef& link);

/// Returns the collection name of an object reference, or an empty string
/// for links.
std::string_view GetCollection(const ObjectRef& ref);

}  // namespace hsarray

#endif  // HSARRAY_OBJECT_REF_H_
