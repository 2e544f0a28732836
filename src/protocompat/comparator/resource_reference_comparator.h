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

#include "base/outcome.h"
#include "descriptor/views.h"
#include "findings/finding_container.h"

namespace comparator {

/// errc::malformed_resource_reference when `field` carries a resource
/// reference that names no type.
result<void> check_resource_reference(const descriptor::field_view& field);

/// Throws malformed_resource_reference when either side carries a
/// resource reference that names no type.
void require_well_formed_references(
  const descriptor::field_view& original,
  const descriptor::field_view& updated);

/**
 * Compares the `google.api.resource_reference` annotations of a field that
 * exists in both trees.
 *
 * Parent lookups for a `child_type` reference go to the resource database
 * of the tree that declares that reference; a missing database answers
 * every lookup with nothing. Throws malformed_resource_reference before
 * reporting anything when either side is malformed.
 */
void compare_resource_references(
  const descriptor::field_view& original,
  const descriptor::field_view& updated,
  findings::finding_container& out);

} // namespace comparator
