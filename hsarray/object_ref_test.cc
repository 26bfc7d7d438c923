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

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include <nlohmann/json.hpp>
#include "hsarray/util/status_testutil.h"
#include "hsarray/util/str_cat.h"

namespace {

using ::hsarray::DatasetRef;
using ::hsarray::DatatypeRef;
using ::hsarray::ExternalLinkRef;
using ::hsarray::GetCollection;
using ::hsarray::GroupRef;
using ::hsarray::HardLinkRef;
using ::hsarray::IsOkAndHolds;
using ::hsarray::MatchesStatus;
using ::hsarray::ObjectRef;
using ::hsarray::ParseLink;
using ::hsarray::ResolveHardLink;
using ::hsarray::ResolveObjectId;
using ::hsarray::SoftLinkRef;
using ::hsarray::StrCat;

TEST(ResolveObjectIdTest, ByPrefix) {
  EXPECT_THAT(ResolveObjectId("g-1234"),
              IsOkAndHolds(ObjectRef(GroupRef{"g-1234"})));
  EXPECT_THAT(ResolveObjectId("d-1234"),
              IsOkAndHolds(ObjectRef(DatasetRef{"d-1234"})));
  EXPECT_THAT(ResolveObjectId("t-1234"),
              IsOkAndHolds(ObjectRef(DatatypeRef{"t-1234"})));
}

TEST(ResolveObjectIdTest, CollectionPrefix) {
  EXPECT_THAT(ResolveObjectId("datasets/d-1"),
              IsOkAndHolds(ObjectRef(DatasetRef{"d-1"})));
  EXPECT_THAT(ResolveObjectId("groups/abc"),
              IsOkAndHolds(ObjectRef(GroupRef{"abc"})));
}

TEST(ResolveObjectIdTest, Unknown) {
  EXPECT_THAT(ResolveObjectId("x-1234"),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Unexpected object id: \"x-1234\""));
  EXPECT_THAT(ResolveObjectId("datasetsd-1"),
              MatchesStatus(absl::StatusCode::kInvalidArgument));
}

TEST(ParseLinkTest, Hard) {
  EXPECT_THAT(ParseLink({{"class", "H5L_TYPE_HARD"},
                         {"collection", "datasets"},
                         {"id", "d-1"},
                         {"title", "dset"}}),
              IsOkAndHolds(ObjectRef(HardLinkRef{"d-1", "datasets"})));
  EXPECT_THAT(ParseLink({{"class", "H5L_TYPE_HARD"}, {"id", "g-2"}}),
              IsOkAndHolds(ObjectRef(HardLinkRef{"g-2", "groups"})));
}

TEST(ParseLinkTest, SoftAndExternal) {
  EXPECT_THAT(ParseLink({{"class", "H5L_TYPE_SOFT"}, {"h5path", "/a/b"}}),
              IsOkAndHolds(ObjectRef(SoftLinkRef{"/a/b"})));
  EXPECT_THAT(ParseLink({{"class", "H5L_TYPE_EXTERNAL"},
                         {"h5domain", "/home/other.h5"},
                         {"h5path", "/x"}}),
              IsOkAndHolds(
                  ObjectRef(ExternalLinkRef{"/home/other.h5", "/x"})));
}

TEST(ParseLinkTest, Errors) {
  EXPECT_THAT(ParseLink({{"class", "H5L_TYPE_USER_DEFINED"}}),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "User-defined links are not supported"));
  EXPECT_THAT(ParseLink({{"class", "H5L_TYPE_BOGUS"}}),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Invalid link class: \"H5L_TYPE_BOGUS\""));
  EXPECT_THAT(ParseLink({{"class", "H5L_TYPE_SOFT"}}),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Missing required member \"h5path\" in link"));
  EXPECT_THAT(ParseLink({{"class", "H5L_TYPE_HARD"}, {"id", 5}}),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Error parsing \"id\": .*"));
}

TEST(ResolveHardLinkTest, Basic) {
  EXPECT_THAT(ResolveHardLink({"d-1", "datasets"}),
              IsOkAndHolds(ObjectRef(DatasetRef{"d-1"})));
  EXPECT_THAT(ResolveHardLink({"d-1", "groups"}),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Object id \"d-1\" does not belong to collection "
                            "\"groups\""));
  EXPECT_THAT(ResolveHardLink({"d-1", "tables"}),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Unknown collection \"tables\""));
}

TEST(ObjectRefTest, CollectionAndPrint) {
  EXPECT_EQ("datasets", GetCollection(DatasetRef{"d-1"}));
  EXPECT_EQ("", GetCollection(SoftLinkRef{"/a"}));
  EXPECT_EQ("Dataset(d-1)", StrCat(ObjectRef(DatasetRef{"d-1"})));
  EXPECT_EQ("ExternalLink(f.h5, /x)",
            StrCat(ObjectRef(ExternalLinkRef{"f.h5", "/x"})));
  EXPECT_NE(ObjectRef(GroupRef{"g-1"}), ObjectRef(DatasetRef{"g-1"}));
}

}  // namespace
