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

#include "comparator/entity_pair.h"
#include "findings/finding_container.h"

namespace comparator {

/// Enum values only carry a name and a number: an addition is minor, a
/// removal or a rename is major.
void compare(const enum_value_pair& pair, findings::finding_container& out);

} // namespace comparator
