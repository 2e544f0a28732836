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
#include "base/seastarx.h"

#include <seastar/core/sstring.hh>

#include <iosfwd>
#include <optional>
#include <vector>

namespace resources {

/**
 * A `google.api.resource_reference` field annotation.
 *
 * Well-formed references set one of `type` (the field names a resource
 * of that type) or `child_type` (the field names a parent of a resource
 * of that type). When both are set `child_type` decides. A reference
 * with neither, or with only empty strings, is malformed; the comparator
 * rejects it rather than treating it as absent.
 */
struct resource_reference {
    std::optional<ss::sstring> type;
    std::optional<ss::sstring> child_type;

    bool is_child_type() const { return child_type && !child_type->empty(); }
    bool is_well_formed() const {
        return (type && !type->empty()) || is_child_type();
    }

    /// `child_type` for child references, `type` otherwise.
    const ss::sstring& referenced_type() const {
        return is_child_type() ? *child_type : *type;
    }

    friend bool
    operator==(const resource_reference&, const resource_reference&)
      = default;
    friend std::ostream& operator<<(std::ostream&, const resource_reference&);
};

/**
 * A `google.api.resource` (message scope) or
 * `google.api.resource_definition` (file scope) declaration.
 */
struct resource_definition {
    ss::sstring type;
    std::vector<ss::sstring> patterns;

    friend bool
    operator==(const resource_definition&, const resource_definition&)
      = default;
    friend std::ostream&
    operator<<(std::ostream&, const resource_definition&);
};

} // namespace resources

PC_OSTREAM_FMT(resources::resource_reference)
PC_OSTREAM_FMT(resources::resource_definition)
