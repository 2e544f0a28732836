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

namespace comparator {

/**
 * Whether `updated` names the same type as `original` once the api version
 * of the declaring files is taken into account.
 *
 * Every dot separated segment of `original` equal to `original_version` is
 * replaced by `updated_version`; the names are equivalent when the result
 * equals `updated`. Only whole segments are replaced, so with versions v1
 * and v2 `.pkg.v1beta1.T` is never rewritten to `.pkg.v2beta1.T`. Without
 * a version on both sides only identical names are equivalent.
 */
bool equivalent_type_names(
  std::string_view original,
  std::string_view updated,
  const std::optional<ss::sstring>& original_version,
  const std::optional<ss::sstring>& updated_version);

} // namespace comparator
