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

#include "descriptor/annotations.h"

#include <google/protobuf/descriptor.pb.h>
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/unknown_field_set.h>
#include <google/protobuf/wire_format_lite.h>

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

// Helpers to assemble descriptor protos the way protoc would emit them for
// files annotated with google/api/field_behavior.proto and
// google/api/resource.proto, without linking those files.
namespace descriptor::test_utils {

namespace pb = google::protobuf;

/// Wire form of a message made of string fields.
inline std::string
encode_strings(std::initializer_list<std::pair<int, std::string_view>> fields) {
    std::string out;
    {
        pb::io::StringOutputStream stream(&out);
        pb::io::CodedOutputStream coded(&stream);
        for (const auto& [number, value] : fields) {
            coded.WriteTag(
              pb::internal::WireFormatLite::MakeTag(
                number, pb::internal::WireFormatLite::WIRETYPE_LENGTH_DELIMITED));
            coded.WriteVarint32(static_cast<uint32_t>(value.size()));
            coded.WriteRaw(value.data(), static_cast<int>(value.size()));
        }
    }
    return out;
}

inline void set_required(pb::FieldOptions* opts) {
    opts->GetReflection()->MutableUnknownFields(opts)->AddVarint(
      annotations::field_behavior_extension,
      annotations::field_behavior_required);
}

// OUTPUT_ONLY = 3, REQUIRED = 2
inline void set_packed_behaviors(
  pb::FieldOptions* opts, std::initializer_list<uint8_t> behaviors) {
    std::string payload(behaviors.begin(), behaviors.end());
    opts->GetReflection()->MutableUnknownFields(opts)->AddLengthDelimited(
      annotations::field_behavior_extension, payload);
}

inline void set_resource_reference(
  pb::FieldOptions* opts,
  std::string_view type,
  std::string_view child_type = {}) {
    std::string payload;
    if (!type.empty()) {
        payload += encode_strings({{1, type}});
    }
    if (!child_type.empty()) {
        payload += encode_strings({{2, child_type}});
    }
    opts->GetReflection()->MutableUnknownFields(opts)->AddLengthDelimited(
      annotations::resource_reference_extension, payload);
}

inline std::string encode_resource(
  std::string_view type, std::initializer_list<std::string_view> patterns) {
    std::string payload = encode_strings({{1, type}});
    for (auto p : patterns) {
        payload += encode_strings({{2, p}});
    }
    return payload;
}

inline void set_resource(
  pb::MessageOptions* opts,
  std::string_view type,
  std::initializer_list<std::string_view> patterns) {
    opts->GetReflection()->MutableUnknownFields(opts)->AddLengthDelimited(
      annotations::resource_extension, encode_resource(type, patterns));
}

inline void add_resource_definition(
  pb::FileOptions* opts,
  std::string_view type,
  std::initializer_list<std::string_view> patterns) {
    opts->GetReflection()->MutableUnknownFields(opts)->AddLengthDelimited(
      annotations::resource_definition_extension,
      encode_resource(type, patterns));
}

inline pb::FieldDescriptorProto* add_field(
  pb::DescriptorProto* msg,
  std::string_view name,
  int number,
  pb::FieldDescriptorProto::Type type,
  std::string_view type_name = {},
  pb::FieldDescriptorProto::Label label
  = pb::FieldDescriptorProto::LABEL_OPTIONAL) {
    auto* f = msg->add_field();
    f->set_name(std::string(name));
    f->set_number(number);
    f->set_type(type);
    f->set_label(label);
    if (!type_name.empty()) {
        f->set_type_name(std::string(type_name));
    }
    return f;
}

/// Records a 0-based `line` for `path`, as protoc does.
inline void add_location(
  pb::FileDescriptorProto* file, std::vector<int> path, int line) {
    auto* loc = file->mutable_source_code_info()->add_location();
    for (auto p : path) {
        loc->add_path(p);
    }
    loc->add_span(line);
    loc->add_span(2);
    loc->add_span(40);
}

} // namespace descriptor::test_utils
