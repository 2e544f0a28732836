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

#include "descriptor/views.h"
#include "model/source_location.h"

#include <absl/container/btree_map.h>
#include <google/protobuf/descriptor.h>

#include <vector>

namespace descriptor {

/**
 * Line lookup over the SourceCodeInfo of one file.
 *
 * Locations are keyed by their descriptor path (see the comments on
 * SourceCodeInfo.Location in descriptor.proto). Files compiled without
 * source info resolve every path to model::unknown_line.
 */
class source_code_locator {
public:
    using path_t = std::vector<int>;

    explicit source_code_locator(const google::protobuf::FileDescriptor& file);

    /// 1-based line of the first location recorded for `path`.
    model::source_line line(const path_t& path) const;

    model::source_line line_of(const google::protobuf::FieldDescriptor&) const;
    model::source_line
    line_of(const google::protobuf::EnumValueDescriptor&) const;

    /// Lines of the label, type, field_behavior and resource_reference
    /// parts of a field declaration.
    field_source_lines
    field_lines(const google::protobuf::FieldDescriptor&) const;

    static path_t path_of(const google::protobuf::Descriptor&);
    static path_t path_of(const google::protobuf::FieldDescriptor&);
    static path_t path_of(const google::protobuf::EnumDescriptor&);
    static path_t path_of(const google::protobuf::EnumValueDescriptor&);

private:
    absl::btree_map<path_t, model::source_line> _lines;
};

} // namespace descriptor
