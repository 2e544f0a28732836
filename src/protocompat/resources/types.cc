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

#include "resources/types.h"

#include <fmt/ostream.h>
#include <fmt/ranges.h>

#include <ostream>

namespace resources {

std::ostream& operator<<(std::ostream& o, const resource_reference& r) {
    if (r.is_child_type()) {
        fmt::print(o, "{{child_type: {}}}", *r.child_type);
    } else if (r.is_well_formed()) {
        fmt::print(o, "{{type: {}}}", *r.type);
    } else {
        o << "{malformed}";
    }
    return o;
}

std::ostream& operator<<(std::ostream& o, const resource_definition& d) {
    fmt::print(
      o, "{{type: {}, patterns: [{}]}}", d.type, fmt::join(d.patterns, ", "));
    return o;
}

} // namespace resources
