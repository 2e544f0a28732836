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

#include "descriptor/schema_tree.h"

#include "base/vlog.h"
#include "descriptor/annotations.h"
#include "descriptor/api_version.h"
#include "descriptor/errc.h"
#include "descriptor/logger.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <string>
#include <vector>

namespace descriptor {

namespace pb = google::protobuf;

class schema_tree::error_collector final
  : public pb::DescriptorPool::ErrorCollector {
public:
    void AddError(
      const std::string& filename,
      const std::string& element_name,
      const pb::Message*,
      ErrorLocation,
      const std::string& message) final {
        _errors.push_back(
          fmt::format("{}: {}: {}", filename, element_name, message));
    }

    void AddWarning(
      const std::string& filename,
      const std::string& element_name,
      const pb::Message*,
      ErrorLocation,
      const std::string& message) final {
        vlog(
          dlog.warn,
          "Descriptor warning {}: {}: {}",
          filename,
          element_name,
          message);
    }

    bool has_errors() const { return !_errors.empty(); }

    ss::sstring error() const {
        return ss::sstring(fmt::format("{}", fmt::join(_errors, "; ")));
    }

private:
    std::vector<std::string> _errors;
};

namespace {

ss::sstring type_spelling(const pb::FieldDescriptor& f) {
    if (const auto* m = f.message_type(); m != nullptr) {
        return ss::sstring("." + m->full_name());
    }
    if (const auto* e = f.enum_type(); e != nullptr) {
        return ss::sstring("." + e->full_name());
    }
    return ss::sstring(f.type_name());
}

field_label label_of(const pb::FieldDescriptor& f) {
    if (f.is_repeated()) {
        return field_label::repeated;
    }
    if (f.is_required()) {
        return field_label::required;
    }
    return field_label::optional;
}

} // namespace

schema_tree::schema_tree()
  : _errors(std::make_unique<error_collector>())
  , _pool(&_database, _errors.get()) {}

schema_tree::~schema_tree() = default;

std::unique_ptr<schema_tree>
schema_tree::build(const pb::FileDescriptorSet& set) {
    // private constructor
    std::unique_ptr<schema_tree> tree(new schema_tree());

    for (const auto& file : set.file()) {
        if (!tree->_database.Add(file)) {
            throw exception(
              errc::pool_build_failed,
              fmt::format("Conflicting definition of file {}", file.name()));
        }
    }

    std::vector<const pb::FileDescriptor*> built;
    built.reserve(set.file_size());
    for (const auto& file : set.file()) {
        const auto* fd = tree->_pool.FindFileByName(file.name());
        if (fd == nullptr || tree->_errors->has_errors()) {
            throw exception(
              errc::pool_build_failed,
              fmt::format(
                "Unable to build {}: {}", file.name(), tree->_errors->error()));
        }
        built.push_back(fd);
    }

    for (const auto* fd : built) {
        tree->index_file(*fd);
    }
    vlog(
      dlog.debug,
      "Built schema tree of {} files with {} resources",
      built.size(),
      tree->_resources.size());
    return tree;
}

void schema_tree::index_file(const pb::FileDescriptor& file) {
    _locators.try_emplace(
      &file, std::make_unique<source_code_locator>(file));
    for (auto& def : annotations::resource_definitions_of(file.options())) {
        _resources.register_resource(std::move(def));
    }
    for (int i = 0; i < file.message_type_count(); ++i) {
        index_message(*file.message_type(i));
    }
}

void schema_tree::index_message(const pb::Descriptor& msg) {
    if (auto def = annotations::resource_of(msg.options()); def) {
        _resources.register_resource(std::move(*def));
    }
    for (int i = 0; i < msg.nested_type_count(); ++i) {
        index_message(*msg.nested_type(i));
    }
}

const source_code_locator&
schema_tree::locator(const pb::FileDescriptor& file) const {
    auto it = _locators.find(&file);
    if (it == _locators.end()) {
        throw exception(
          errc::unknown_file,
          fmt::format("File {} is not part of this schema tree", file.name()));
    }
    return *it->second;
}

field_view schema_tree::make_field_view(const pb::FieldDescriptor& f) const {
    const auto& loc = locator(*f.file());

    field_view v;
    v.name = ss::sstring(f.name());
    v.number = field_number{f.number()};
    v.label = label_of(f);
    v.required = annotations::has_required_behavior(f.options());
    v.proto_type = ss::sstring(pb::FieldDescriptorProto::Type_Name(
      static_cast<pb::FieldDescriptorProto::Type>(f.type())));
    if (f.message_type() != nullptr || f.enum_type() != nullptr) {
        v.type_name = type_spelling(f);
    }
    if (f.is_map()) {
        const auto* entry = f.message_type();
        v.map_entry = map_entry_type{
          .key = type_spelling(*entry->map_key()),
          .value = type_spelling(*entry->map_value())};
    }
    if (const auto* oneof = f.containing_oneof(); oneof != nullptr) {
        v.oneof_name = ss::sstring(oneof->name());
    }
    v.proto3_optional = f.has_optional_keyword();
    v.resource_reference = annotations::resource_reference_of(f.options());
    v.api_version = extract_api_version(f.file()->name(), f.file()->package());
    if (const auto* msg = f.containing_type(); msg != nullptr) {
        v.message_resource = annotations::resource_of(msg->options());
    }
    v.resource_db = &_resources;
    v.location = model::source_location{
      .proto_file_name = ss::sstring(f.file()->name()),
      .line = loc.line_of(f)};
    v.lines = loc.field_lines(f);
    return v;
}

enum_value_view
schema_tree::make_enum_value_view(const pb::EnumValueDescriptor& ev) const {
    const auto& file = *ev.type()->file();
    return enum_value_view{
      .name = ss::sstring(ev.name()),
      .number = ev.number(),
      .location = model::source_location{
        .proto_file_name = ss::sstring(file.name()),
        .line = locator(file).line_of(ev)}};
}

} // namespace descriptor
