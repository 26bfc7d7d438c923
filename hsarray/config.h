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

#ifndef HSARRAY_CONFIG_H_
#define HSARRAY_CONFIG_H_

/// \file
/// Client configuration read from `.hscfg` files and the environment.
///
/// A configuration file holds one `key = value` setting per line.  Blank
/// lines and lines starting with `#` are ignored:
///
///     # HSDS service
///     hs_endpoint = http://hsds.example.org
///     hs_username = alice
///     max_workers = 8

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include <nlohmann/json.hpp>
#include "hsarray/index.h"
#include "hsarray/multi_fanout.h"
#include "hsarray/util/result.h"
#include "hsarray/value_transfer.h"

namespace hsarray {

struct ClientConfig {
  std::string hs_endpoint;
  std::string hs_username;
  std::string hs_password;
  std::string hs_api_key;

  /// Concurrency limit of `MultiFanout`.  Must be positive.
  Index max_workers = 16;

  /// See `TransferOptions::max_select_query_len`.
  Index max_select_query_len = 100;

  /// See `TransferOptions::max_chunks_per_request`.
  Index max_chunks_per_request = 0;

  /// Settings with keys not listed above, kept verbatim.
  std::map<std::string, std::string> extra;

  /// Applies the setting `key = value`.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if `key` names a numeric
  ///     setting and `value` is not a valid value for it.
  absl::Status Set(std::string_view key, std::string_view value);

  /// Returns the setting `key` formatted as in a configuration file, or
  /// `std::nullopt` if `key` is neither a known nor an extra setting.
  std::optional<std::string> Get(std::string_view key) const;

  TransferOptions transfer_options() const;
  FanoutOptions fanout_options() const;

  /// Parses the JSON object produced by `to_json`.  Numeric settings may
  /// also be given as base-10 strings.
  static Result<ClientConfig> FromJson(const ::nlohmann::json& j);

  friend void to_json(::nlohmann::json& j, const ClientConfig& config);

  friend bool operator==(const ClientConfig& a, const ClientConfig& b);
  friend bool operator!=(const ClientConfig& a, const ClientConfig& b) {
    return !(a == b);
  }
};

/// Applies the settings in the configuration file contents `text` to
/// `config`.
///
/// Lines without `=` are logged and skipped.
///
/// \param source Name of the file, used in messages.
/// \error `absl::StatusCode::kInvalidArgument` if a numeric setting is
///     invalid.
absl::Status ParseConfig(std::string_view text, std::string_view source,
                         ClientConfig& config);

/// Loads the client configuration.
///
/// Settings are read from `path` if specified, otherwise from `./.hscfg` if
/// it exists, otherwise from `~/.hscfg` if it exists.  Each setting is then
/// overridden by the environment variable named by the upper-cased key, if
/// set, e.g. `HS_ENDPOINT` or `MAX_WORKERS`.
///
/// \error `absl::StatusCode::kNotFound` if `path` is specified but cannot be
///     opened.
/// \error `absl::StatusCode::kInvalidArgument` if a numeric setting is
///     invalid.
Result<ClientConfig> LoadConfig(
    std::optional<std::string> path = std::nullopt);

}  // namespace hsarray

#endif  // HSARRAY_CONFIG_H_
