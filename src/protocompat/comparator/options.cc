// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0
#include "comparator/options.h"

#include "config/configuration.h"

namespace comparator {

options options::from(const config::configuration& cfg) {
    return options{
      .allow_api_version_promotion = cfg.allow_api_version_promotion(),
      .check_resource_references = cfg.check_resource_references(),
    };
}

} // namespace comparator
