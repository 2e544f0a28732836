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

#include "resources/types.h"

#include <google/protobuf/descriptor.pb.h>

#include <optional>
#include <vector>

/*
 * Decoders for the googleapis annotations the comparators care about.
 *
 * The options messages are re-read in wire form, so the decoders see the
 * annotations whether the googleapis extensions were linked into this
 * binary (known extensions) or not (unknown fields). Malformed payloads
 * raise descriptor::exception with errc::malformed_option.
 */
namespace descriptor::annotations {

// google/api/field_behavior.proto
inline constexpr int field_behavior_extension = 1052;
inline constexpr uint64_t field_behavior_required = 2;
// google/api/resource.proto
inline constexpr int resource_reference_extension = 1055;
inline constexpr int resource_extension = 1053;
inline constexpr int resource_definition_extension = 1053;

/// `[(google.api.field_behavior) = REQUIRED]`
bool has_required_behavior(const google::protobuf::FieldOptions&);

/// `[(google.api.resource_reference) = {...}]`. An annotation that sets
/// neither `type` nor `child_type` comes back with both empty.
std::optional<resources::resource_reference>
resource_reference_of(const google::protobuf::FieldOptions&);

/// `option (google.api.resource) = {...}` on a message.
std::optional<resources::resource_definition>
resource_of(const google::protobuf::MessageOptions&);

/// Every `option (google.api.resource_definition) = {...}` of a file.
std::vector<resources::resource_definition>
resource_definitions_of(const google::protobuf::FileOptions&);

} // namespace descriptor::annotations
