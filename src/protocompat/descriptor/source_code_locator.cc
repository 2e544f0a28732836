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

#include "descriptor/source_code_locator.h"

#include "descriptor/annotations.h"

#include <google/protobuf/descriptor.pb.h>

namespace descriptor {

namespace pb = google::protobuf;

namespace {
// FileDescriptorProto
constexpr int file_message_type = 4;
constexpr int file_enum_type = 5;
constexpr int file_extension = 7;
// DescriptorProto
constexpr int message_field = 2;
constexpr int message_nested_type = 3;
constexpr int message_enum_type = 4;
constexpr int message_extension = 6;
// FieldDescriptorProto
constexpr int field_label_part = 4;
constexpr int field_type_part = 5;
constexpr int field_type_name_part = 6;
constexpr int field_options_part = 8;
// EnumDescriptorProto
constexpr int enum_value = 2;

source_code_locator::path_t
append(source_code_locator::path_t p, std::initializer_list<int> tail) {
    p.insert(p.end(), tail);
    return p;
}
} // namespace

source_code_locator::source_code_locator(const pb::FileDescriptor& file) {
    pb::FileDescriptorProto proto;
    file.CopySourceCodeInfoTo(&proto);
    for (const auto& loc : proto.source_code_info().location()) {
        if (loc.span_size() == 0) {
            continue;
        }
        path_t path(loc.path().begin(), loc.path().end());
        _lines.try_emplace(
          std::move(path), model::source_line{loc.span(0) + 1});
    }
}

model::source_line source_code_locator::line(const path_t& path) const {
    auto it = _lines.find(path);
    return it == _lines.end() ? model::unknown_line : it->second;
}

model::source_line
source_code_locator::line_of(const pb::FieldDescriptor& f) const {
    return line(path_of(f));
}

model::source_line
source_code_locator::line_of(const pb::EnumValueDescriptor& v) const {
    return line(path_of(v));
}

field_source_lines
source_code_locator::field_lines(const pb::FieldDescriptor& f) const {
    auto base = path_of(f);
    auto type_line = line(append(base, {field_type_name_part}));
    if (type_line == model::unknown_line) {
        type_line = line(append(base, {field_type_part}));
    }
    auto options = append(base, {field_options_part});
    // repeated options are recorded per element
    auto behavior_line = line(
      append(options, {annotations::field_behavior_extension}));
    if (behavior_line == model::unknown_line) {
        behavior_line = line(
          append(options, {annotations::field_behavior_extension, 0}));
    }
    return field_source_lines{
      .label = line(append(base, {field_label_part})),
      .type = type_line,
      .field_behavior = behavior_line,
      .resource_reference = line(
        append(options, {annotations::resource_reference_extension})),
    };
}

source_code_locator::path_t
source_code_locator::path_of(const pb::Descriptor& d) {
    if (const auto* parent = d.containing_type(); parent != nullptr) {
        return append(path_of(*parent), {message_nested_type, d.index()});
    }
    return {file_message_type, d.index()};
}

source_code_locator::path_t
source_code_locator::path_of(const pb::FieldDescriptor& f) {
    if (f.is_extension()) {
        if (const auto* scope = f.extension_scope(); scope != nullptr) {
            return append(path_of(*scope), {message_extension, f.index()});
        }
        return {file_extension, f.index()};
    }
    return append(path_of(*f.containing_type()), {message_field, f.index()});
}

source_code_locator::path_t
source_code_locator::path_of(const pb::EnumDescriptor& e) {
    if (const auto* parent = e.containing_type(); parent != nullptr) {
        return append(path_of(*parent), {message_enum_type, e.index()});
    }
    return {file_enum_type, e.index()};
}

source_code_locator::path_t
source_code_locator::path_of(const pb::EnumValueDescriptor& v) {
    return append(path_of(*v.type()), {enum_value, v.index()});
}

} // namespace descriptor
