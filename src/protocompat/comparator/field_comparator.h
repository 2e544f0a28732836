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
#include "comparator/options.h"
#include "findings/finding_container.h"

namespace comparator {

/**
 * Reports how one field changed between two schema trees.
 *
 * An added or removed field yields exactly one finding. A matched field
 * goes through the checks in order: name (a rename ends the comparison),
 * repeated label, required behavior, type, oneof membership and proto3
 * optional, and finally the resource reference annotation. Findings cite
 * the updated side, except those about removals which cite the original.
 *
 * Throws malformed_resource_reference when a resource reference of a
 * matched pair names no type. The check runs before any other check of
 * the pair, so `out` is left untouched in that case.
 */
void compare(
  const field_pair& pair,
  findings::finding_container& out,
  const options& opts = {});

} // namespace comparator
