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

#include "descriptor/annotations.h"

#include "base/vlog.h"
#include "descriptor/errc.h"
#include "descriptor/logger.h"

#include <fmt/format.h>
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/unknown_field_set.h>

#include <string>

namespace descriptor::annotations {

namespace pb = google::protobuf;

namespace {

// ResourceReference and ResourceDescriptor field numbers
constexpr int reference_type_field = 1;
constexpr int reference_child_type_field = 2;
constexpr int descriptor_type_field = 1;
constexpr int descriptor_pattern_field = 2;

void parse_wire_fields(const pb::Message& msg, pb::UnknownFieldSet* out) {
    std::string bytes;
    if (!msg.SerializeToString(&bytes) || !out->ParseFromString(bytes)) {
        throw exception(
          errc::malformed_option,
          fmt::format("Unable to re-read {} in wire form", msg.GetTypeName()));
    }
}

void parse_nested(
  const pb::UnknownField& f, int extension, pb::UnknownFieldSet* out) {
    if (
      f.type() != pb::UnknownField::TYPE_LENGTH_DELIMITED
      || !out->ParseFromString(f.length_delimited())) {
        throw exception(
          errc::malformed_option,
          fmt::format("Extension {} is not a well formed message", extension));
    }
}

std::optional<ss::sstring>
non_empty_string(const pb::UnknownFieldSet& set, int number) {
    std::optional<ss::sstring> value;
    for (int i = 0; i < set.field_count(); ++i) {
        const auto& f = set.field(i);
        if (
          f.number() == number
          && f.type() == pb::UnknownField::TYPE_LENGTH_DELIMITED
          && !f.length_delimited().empty()) {
            // last one wins, as for any singular proto field
            value = ss::sstring(f.length_delimited());
        }
    }
    return value;
}

resources::resource_definition
decode_resource_descriptor(const pb::UnknownField& f, int extension) {
    pb::UnknownFieldSet set;
    parse_nested(f, extension, &set);
    resources::resource_definition def;
    for (int i = 0; i < set.field_count(); ++i) {
        const auto& p = set.field(i);
        if (
          p.number() == descriptor_pattern_field
          && p.type() == pb::UnknownField::TYPE_LENGTH_DELIMITED) {
            def.patterns.emplace_back(p.length_delimited());
        }
    }
    def.type = non_empty_string(set, descriptor_type_field).value_or("");
    return def;
}

bool packed_contains(const std::string& payload, uint64_t wanted) {
    pb::io::CodedInputStream in(
      reinterpret_cast<const uint8_t*>(payload.data()),
      static_cast<int>(payload.size()));
    uint64_t v = 0;
    while (in.ReadVarint64(&v)) {
        if (v == wanted) {
            return true;
        }
    }
    return false;
}

} // namespace

bool has_required_behavior(const pb::FieldOptions& opts) {
    pb::UnknownFieldSet set;
    parse_wire_fields(opts, &set);
    for (int i = 0; i < set.field_count(); ++i) {
        const auto& f = set.field(i);
        if (f.number() != field_behavior_extension) {
            continue;
        }
        switch (f.type()) {
        case pb::UnknownField::TYPE_VARINT:
            if (f.varint() == field_behavior_required) {
                return true;
            }
            break;
        case pb::UnknownField::TYPE_LENGTH_DELIMITED:
            if (packed_contains(f.length_delimited(), field_behavior_required)) {
                return true;
            }
            break;
        default:
            vlog(
              dlog.warn,
              "Ignoring field_behavior with unexpected wire type {}",
              static_cast<int>(f.type()));
        }
    }
    return false;
}

std::optional<resources::resource_reference>
resource_reference_of(const pb::FieldOptions& opts) {
    pb::UnknownFieldSet set;
    parse_wire_fields(opts, &set);
    std::optional<resources::resource_reference> ref;
    for (int i = 0; i < set.field_count(); ++i) {
        const auto& f = set.field(i);
        if (f.number() != resource_reference_extension) {
            continue;
        }
        pb::UnknownFieldSet nested;
        parse_nested(f, resource_reference_extension, &nested);
        ref = resources::resource_reference{
          .type = non_empty_string(nested, reference_type_field),
          .child_type = non_empty_string(nested, reference_child_type_field)};
    }
    return ref;
}

std::optional<resources::resource_definition>
resource_of(const pb::MessageOptions& opts) {
    pb::UnknownFieldSet set;
    parse_wire_fields(opts, &set);
    std::optional<resources::resource_definition> def;
    for (int i = 0; i < set.field_count(); ++i) {
        const auto& f = set.field(i);
        if (f.number() == resource_extension) {
            def = decode_resource_descriptor(f, resource_extension);
        }
    }
    return def;
}

std::vector<resources::resource_definition>
resource_definitions_of(const pb::FileOptions& opts) {
    pb::UnknownFieldSet set;
    parse_wire_fields(opts, &set);
    std::vector<resources::resource_definition> defs;
    for (int i = 0; i < set.field_count(); ++i) {
        const auto& f = set.field(i);
        if (f.number() == resource_definition_extension) {
            defs.push_back(
              decode_resource_descriptor(f, resource_definition_extension));
        }
    }
    return defs;
}

} // namespace descriptor::annotations
