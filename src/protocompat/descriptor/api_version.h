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

#include "base/seastarx.h"

#include <seastar/core/sstring.hh>

#include <optional>
#include <string_view>

namespace descriptor {

/// True for v1, v2p1, v1alpha, v1beta1, v3p1beta2 and the like.
bool is_api_version(std::string_view segment);

/**
 * The api version of a proto file: the first directory segment of
 * `file_path` that is a version (`google/pubsub/v1/pubsub.proto` -> v1),
 * else the first version segment of the dotted `package`.
 */
std::optional<ss::sstring>
extract_api_version(std::string_view file_path, std::string_view package);

} // namespace descriptor
