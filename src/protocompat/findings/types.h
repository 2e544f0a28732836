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

#include "base/fmt.h"

#include <cstdint>
#include <iosfwd>
#include <string_view>

namespace findings {

/// Kind of difference a comparator found. The rendered names (see
/// to_string_view) are part of the report contract and must not change.
enum class finding_category : uint8_t {
    field_addition,
    field_removal,
    field_name_change,
    field_repeated_change,
    field_behavior_change,
    field_type_change,
    field_oneof_addition,
    field_oneof_removal,
    field_proto3_optional_change,
    resource_reference_addition,
    resource_reference_removal,
    resource_reference_change,
    enum_value_addition,
    enum_value_removal,
    enum_value_name_change,
};

/// Severity of a finding. `major` is a breaking change; `minor` and `patch`
/// are informational.
enum class change_type : uint8_t {
    major,
    minor,
    patch,
};

std::string_view to_string_view(finding_category);
std::string_view to_string_view(change_type);

std::ostream& operator<<(std::ostream&, finding_category);
std::ostream& operator<<(std::ostream&, change_type);

} // namespace findings

PC_OSTREAM_FMT(findings::finding_category)
PC_OSTREAM_FMT(findings::change_type)
