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

namespace config {
struct configuration;
} // namespace config

namespace comparator {

/// Knobs of one comparison run.
struct options {
    // `.pkg.v1.T` -> `.pkg.v1beta1.T` is not a type change when the api
    // version of the declaring files moved from v1 to v1beta1
    bool allow_api_version_promotion{true};
    bool check_resource_references{true};

    static options from(const config::configuration&);
};

} // namespace comparator
