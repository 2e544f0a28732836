// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "config/configuration.h"

#include "base/vlog.h"
#include "config/logger.h"

#include <seastar/util/log.hh>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <optional>
#include <sstream>

namespace config {

namespace {

constexpr auto log_levels = std::to_array<std::string_view>(
  {"error", "warn", "info", "debug", "trace"});

std::optional<ss::sstring> validate_log_level(const ss::sstring& level) {
    for (auto l : log_levels) {
        if (l == std::string_view(level)) {
            return std::nullopt;
        }
    }
    return fmt::format(
      "'{}' is not one of error, warn, info, debug, trace", level);
}

// the engine's loggers, see the logger.cc of each module
constexpr auto engine_loggers = std::to_array<std::string_view>(
  {"comparator", "descriptor", "resources", "json", "config"});

} // namespace

configuration::configuration()
  : allow_api_version_promotion(
      *this,
      "allow_api_version_promotion",
      "Treat a type moved to another api version of the same package, as "
      "in .pkg.v1.T to .pkg.v1beta1.T, as the same type",
      {},
      true)
  , check_resource_references(
      *this,
      "check_resource_references",
      "Compare google.api.resource_reference annotations of fields",
      {},
      true)
  , log_level(
      *this,
      "log_level",
      "Level of the engine loggers",
      {.example = "debug"},
      "info",
      validate_log_level) {}

config_store::error_map_t configuration::load(const YAML::Node& root_node) {
    auto errors = read_yaml(root_node);
    for (const auto& [name, error] : errors) {
        vlog(conflog.warn, "Ignoring property {}: {}", name, error);
    }
    vlog(
      conflog.debug,
      "Loaded configuration with {} rejected properties",
      errors.size());
    return errors;
}

config_store::error_map_t
configuration::load(const std::filesystem::path& file) {
    vlog(conflog.info, "Reading configuration from {}", file.native());
    return load(YAML::LoadFile(file.native()));
}

void configuration::apply_log_level() const {
    auto level = ss::log_level::info;
    std::istringstream(std::string(log_level())) >> level;
    auto& registry = ss::global_logger_registry();
    // only the loggers linked into this binary are registered
    for (const auto& name : registry.get_all_logger_names()) {
        if (std::ranges::find(engine_loggers, std::string_view(name))
            != engine_loggers.end()) {
            registry.set_logger_level(name, level);
        }
    }
}

} // namespace config
