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

#include "hsarray/config.h"

#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include <nlohmann/json.hpp>
#include "hsarray/index.h"
#include "hsarray/internal/env.h"
#include "hsarray/internal/json/value_as.h"
#include "hsarray/internal/log/verbose_flag.h"
#include "hsarray/multi_fanout.h"
#include "hsarray/util/result.h"
#include "hsarray/util/status.h"
#include "hsarray/util/str_cat.h"
#include "hsarray/value_transfer.h"

namespace hsarray {

namespace {
ABSL_CONST_INIT internal_log::VerboseFlag config_logging("config");

struct StringSetting {
  std::string_view key;
  std::string ClientConfig::*member;
};

struct NumericSetting {
  std::string_view key;
  Index ClientConfig::*member;
  Index min_value;
};

constexpr StringSetting kStringSettings[] = {
    {"hs_endpoint", &ClientConfig::hs_endpoint},
    {"hs_username", &ClientConfig::hs_username},
    {"hs_password", &ClientConfig::hs_password},
    {"hs_api_key", &ClientConfig::hs_api_key},
};

constexpr NumericSetting kNumericSettings[] = {
    {"max_workers", &ClientConfig::max_workers, 1},
    {"max_select_query_len", &ClientConfig::max_select_query_len, 0},
    {"max_chunks_per_request", &ClientConfig::max_chunks_per_request, 0},
};

const StringSetting* FindStringSetting(std::string_view key) {
  for (const auto& setting : kStringSettings) {
    if (setting.key == key) return &setting;
  }
  return nullptr;
}

const NumericSetting* FindNumericSetting(std::string_view key) {
  for (const auto& setting : kNumericSettings) {
    if (setting.key == key) return &setting;
  }
  return nullptr;
}

absl::Status CheckMinimum(const NumericSetting& setting, Index value) {
  if (value >= setting.min_value) return absl::OkStatus();
  return absl::InvalidArgumentError(StrCat("Invalid value for \"", setting.key,
                                           "\": ", value, " is less than ",
                                           setting.min_value));
}

bool FileExists(const std::string& path) {
  std::ifstream file(path);
  return file.good();
}

// Returns the file to read when no path is specified, if any.
std::optional<std::string> FindDefaultConfigFile() {
  if (FileExists(".hscfg")) return ".hscfg";
  if (auto home = internal::GetEnv("HOME")) {
    std::string path = StrCat(*home, "/.hscfg");
    if (FileExists(path)) return path;
  }
  return std::nullopt;
}

absl::Status ApplyEnvironment(ClientConfig& config) {
  auto apply = [&](std::string_view key) -> absl::Status {
    std::string variable = absl::AsciiStrToUpper(key);
    auto value = internal::GetEnv(variable.c_str());
    if (!value) return absl::OkStatus();
    ABSL_LOG_IF(INFO, config_logging)
        << "Setting " << key << " from environment variable " << variable;
    return MaybeAnnotateStatus(
        config.Set(key, *value),
        StrCat("Error in environment variable ", variable));
  };
  for (const auto& setting : kStringSettings) {
    HSARRAY_RETURN_IF_ERROR(apply(setting.key));
  }
  for (const auto& setting : kNumericSettings) {
    HSARRAY_RETURN_IF_ERROR(apply(setting.key));
  }
  // `Set` only replaces existing values of `extra` here.
  for (const auto& [key, value] : config.extra) {
    HSARRAY_RETURN_IF_ERROR(apply(key));
  }
  return absl::OkStatus();
}

}  // namespace

absl::Status ClientConfig::Set(std::string_view key, std::string_view value) {
  if (const auto* setting = FindStringSetting(key)) {
    this->*(setting->member) = std::string(value);
    return absl::OkStatus();
  }
  if (const auto* setting = FindNumericSetting(key)) {
    Index parsed;
    if (!absl::SimpleAtoi(value, &parsed)) {
      return absl::InvalidArgumentError(
          StrCat("Invalid value for \"", key, "\": \"", value, "\""));
    }
    HSARRAY_RETURN_IF_ERROR(CheckMinimum(*setting, parsed));
    this->*(setting->member) = parsed;
    return absl::OkStatus();
  }
  extra[std::string(key)] = std::string(value);
  return absl::OkStatus();
}

std::optional<std::string> ClientConfig::Get(std::string_view key) const {
  if (const auto* setting = FindStringSetting(key)) {
    return this->*(setting->member);
  }
  if (const auto* setting = FindNumericSetting(key)) {
    return StrCat(this->*(setting->member));
  }
  auto it = extra.find(std::string(key));
  if (it == extra.end()) return std::nullopt;
  return it->second;
}

TransferOptions ClientConfig::transfer_options() const {
  TransferOptions options;
  options.max_select_query_len = max_select_query_len;
  options.max_chunks_per_request = max_chunks_per_request;
  return options;
}

FanoutOptions ClientConfig::fanout_options() const {
  FanoutOptions options;
  options.max_workers = static_cast<size_t>(max_workers);
  options.transfer = transfer_options();
  return options;
}

Result<ClientConfig> ClientConfig::FromJson(const ::nlohmann::json& j) {
  if (!j.is_object()) return internal_json::ExpectedError(j, "object");
  ClientConfig config;
  for (const auto& item : j.items()) {
    const std::string& key = item.key();
    const ::nlohmann::json& member = item.value();
    auto annotate = [&key](absl::Status status) {
      return MaybeAnnotateStatus(std::move(status),
                                 StrCat("Error parsing \"", key, "\""));
    };
    if (const auto* setting = FindNumericSetting(key)) {
      Index value;
      HSARRAY_RETURN_IF_ERROR(
          internal_json::JsonRequireInteger(member, &value, /*strict=*/false,
                                            setting->min_value),
          annotate(_));
      config.*(setting->member) = value;
      continue;
    }
    std::string value;
    HSARRAY_RETURN_IF_ERROR(internal_json::JsonRequireString(member, &value),
                            annotate(_));
    HSARRAY_RETURN_IF_ERROR(config.Set(key, value));
  }
  return config;
}

void to_json(::nlohmann::json& j, const ClientConfig& config) {
  j = ::nlohmann::json::object();
  for (const auto& setting : kStringSettings) {
    j[std::string(setting.key)] = config.*(setting.member);
  }
  for (const auto& setting : kNumericSettings) {
    j[std::string(setting.key)] = config.*(setting.member);
  }
  for (const auto& [key, value] : config.extra) {
    j[key] = value;
  }
}

bool operator==(const ClientConfig& a, const ClientConfig& b) {
  return a.hs_endpoint == b.hs_endpoint && a.hs_username == b.hs_username &&
         a.hs_password == b.hs_password && a.hs_api_key == b.hs_api_key &&
         a.max_workers == b.max_workers &&
         a.max_select_query_len == b.max_select_query_len &&
         a.max_chunks_per_request == b.max_chunks_per_request &&
         a.extra == b.extra;
}

absl::Status ParseConfig(std::string_view text, std::string_view source,
                         ClientConfig& config) {
  int line_number = 0;
  for (std::string_view line : absl::StrSplit(text, '\n')) {
    ++line_number;
    line = absl::StripAsciiWhitespace(line);
    if (line.empty() || line[0] == '#') continue;
    std::pair<std::string_view, std::string_view> fields =
        absl::StrSplit(line, absl::MaxSplits('=', 1));
    std::string_view key = absl::StripAsciiWhitespace(fields.first);
    if (line.find('=') == std::string_view::npos || key.empty()) {
      ABSL_LOG(WARNING) << "Config file " << source << " line " << line_number
                        << " is not valid";
      continue;
    }
    HSARRAY_RETURN_IF_ERROR(
        config.Set(key, absl::StripAsciiWhitespace(fields.second)),
        MaybeAnnotateStatus(_, StrCat("Error in ", source, " line ",
                                      line_number)));
  }
  return absl::OkStatus();
}

Result<ClientConfig> LoadConfig(std::optional<std::string> path) {
  ClientConfig config;
  if (!path) path = FindDefaultConfigFile();
  if (path) {
    std::ifstream file(*path);
    if (!file) {
      return absl::NotFoundError(
          StrCat("Cannot open config file \"", *path, "\""));
    }
    std::stringstream contents;
    contents << file.rdbuf();
    ABSL_LOG_IF(INFO, config_logging) << "Reading config file " << *path;
    HSARRAY_RETURN_IF_ERROR(ParseConfig(contents.str(), *path, config));
  }
  HSARRAY_RETURN_IF_ERROR(ApplyEnvironment(config));
  return config;
}

}  // namespace hsarray
