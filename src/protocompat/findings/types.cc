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

#include "findings/types.h"

#include <ostream>

namespace findings {

std::string_view to_string_view(finding_category c) {
    switch (c) {
    case finding_category::field_addition:
        return "FIELD_ADDITION";
    case finding_category::field_removal:
        return "FIELD_REMOVAL";
    case finding_category::field_name_change:
        return "FIELD_NAME_CHANGE";
    case finding_category::field_repeated_change:
        return "FIELD_REPEATED_CHANGE";
    case finding_category::field_behavior_change:
        return "FIELD_BEHAVIOR_CHANGE";
    case finding_category::field_type_change:
        return "FIELD_TYPE_CHANGE";
    case finding_category::field_oneof_addition:
        return "FIELD_ONEOF_ADDITION";
    case finding_category::field_oneof_removal:
        return "FIELD_ONEOF_REMOVAL";
    case finding_category::field_proto3_optional_change:
        return "FIELD_PROTO3_OPTIONAL_CHANGE";
    case finding_category::resource_reference_addition:
        return "RESOURCE_REFERENCE_ADDITION";
    case finding_category::resource_reference_removal:
        return "RESOURCE_REFERENCE_REMOVAL";
    case finding_category::resource_reference_change:
        return "RESOURCE_REFERENCE_CHANGE";
    case finding_category::enum_value_addition:
        return "ENUM_VALUE_ADDITION";
    case finding_category::enum_value_removal:
        return "ENUM_VALUE_REMOVAL";
    case finding_category::enum_value_name_change:
        return "ENUM_VALUE_NAME_CHANGE";
    }
    return "{unknown}";
}

std::string_view to_string_view(change_type t) {
    switch (t) {
    case change_type::major:
        return "MAJOR";
    case change_type::minor:
        return "MINOR";
    case change_type::patch:
        return "PATCH";
    }
    return "{unknown}";
}

std::ostream& operator<<(std::ostream& o, finding_category c) {
    return o << to_string_view(c);
}

std::ostream& operator<<(std::ostream& o, change_type t) {
    return o << to_string_view(t);
}

} // namespace findings
