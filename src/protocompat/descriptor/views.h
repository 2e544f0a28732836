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
#include "model/source_location.h"
#include "resources/resource_database.h"
#include "resources/types.h"
#include "utils/named_type.h"

#include <seastar/core/sstring.hh>

#include <iosfwd>
#include <optional>
#include <string_view>

namespace descriptor {

using field_number = named_type<int32_t, struct field_number_tag>;

enum class field_label : uint8_t {
    optional,
    required,
    repeated,
};

/// LABEL_OPTIONAL, LABEL_REQUIRED or LABEL_REPEATED
std::string_view to_string_view(field_label);
std::ostream& operator<<(std::ostream&, field_label);

/// Key and value types of a map field. Scalars are spelled with their proto
/// keyword (`string`), messages and enums with their fully qualified name
/// (`.google.pubsub.v1.Topic`).
struct map_entry_type {
    ss::sstring key;
    ss::sstring value;

    friend bool operator==(const map_entry_type&, const map_entry_type&)
      = default;
};

/// Lines of the individual parts of a field declaration. Any of them may be
/// unknown, in which case findings about that part cite the field line.
struct field_source_lines {
    model::source_line label{model::unknown_line};
    model::source_line type{model::unknown_line};
    model::source_line field_behavior{model::unknown_line};
    model::source_line resource_reference{model::unknown_line};
};

/**
 * Normalized, read-only view of one field at one schema revision.
 *
 * Views are built once per comparison run and never modified by the
 * comparators. `resource_db` points into the schema tree the field was
 * taken from and may be null when the tree was built without a resource
 * index.
 */
struct field_view {
    ss::sstring name;
    field_number number;
    field_label label{field_label::optional};
    // google.api.field_behavior = REQUIRED
    bool required{false};
    // TYPE_INT32, TYPE_MESSAGE, ...
    ss::sstring proto_type;
    // fully qualified message or enum name with a leading dot
    std::optional<ss::sstring> type_name;
    std::optional<map_entry_type> map_entry;
    std::optional<ss::sstring> oneof_name;
    bool proto3_optional{false};
    std::optional<resources::resource_reference> resource_reference;
    // version segment of the declaring file, e.g. v1 or v1beta1
    std::optional<ss::sstring> api_version;
    // resource declared on the enclosing message
    std::optional<resources::resource_definition> message_resource;
    const resources::resource_database* resource_db{nullptr};
    model::source_location location;
    field_source_lines lines;

    bool repeated() const { return label == field_label::repeated; }
    bool is_map_type() const { return map_entry.has_value(); }
    bool in_oneof() const { return oneof_name.has_value(); }

    model::source_location label_location() const {
        return location.at(lines.label);
    }
    model::source_location type_location() const {
        return location.at(lines.type);
    }
    model::source_location field_behavior_location() const {
        return location.at(lines.field_behavior);
    }
    model::source_location resource_reference_location() const {
        return location.at(lines.resource_reference);
    }
};

struct enum_value_view {
    ss::sstring name;
    int32_t number{0};
    model::source_location location;
};

std::ostream& operator<<(std::ostream&, const field_view&);
std::ostream& operator<<(std::ostream&, const enum_value_view&);

} // namespace descriptor

PC_OSTREAM_FMT(descriptor::field_label)
PC_OSTREAM_FMT(descriptor::field_view)
PC_OSTREAM_FMT(descriptor::enum_value_view)
