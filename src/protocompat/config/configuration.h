/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Use of this software is governed by the Business Source License
 * included in the file licenses/BSL.md
 *
 * As of the Change Date specified in that file, in accordance with
 * the Business Source License, use of this software will be governed
 * by the Apache License, Version 2.0
 */

#pragma once

#include "config/config_store.h"
#include "config/property.h"

#include <filesystem>

namespace config {

/**
 * Settings of the compatibility checker.
 *
 * Every setting has a default, so an empty document is a valid
 * configuration:
 *
 *   allow_api_version_promotion: true
 *   check_resource_references: true
 *   log_level: info
 */
struct configuration final : public config_store {
    property<bool> allow_api_version_promotion;
    property<bool> check_resource_references;
    property<ss::sstring> log_level;

    configuration();

    /// Loads a YAML document, see config_store::read_yaml.
    error_map_t load(const YAML::Node& root_node);
    error_map_t load(const std::filesystem::path& file);

    /// Sets the level of every logger of the engine to `log_level`.
    void apply_log_level() const;
};

} // namespace config
