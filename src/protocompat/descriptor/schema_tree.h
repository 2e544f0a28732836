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

#include "descriptor/source_code_locator.h"
#include "descriptor/views.h"
#include "resources/resource_database.h"

#include <absl/container/flat_hash_map.h>
#include <google/protobuf/descriptor.h>
#include <google/protobuf/descriptor.pb.h>
#include <google/protobuf/descriptor_database.h>

#include <memory>

namespace descriptor {

/**
 * One revision of a schema: the files of an already compiled
 * FileDescriptorSet linked into a descriptor pool, plus the resource index
 * built from their google.api.resource annotations.
 *
 * The tree owns everything the views it produces point at, so it must
 * outlive every comparison that uses them. It is immutable once built.
 */
class schema_tree {
public:
    /// Links every file of `set`. Throws descriptor::exception
    /// (errc::pool_build_failed) with all collected errors when the set
    /// does not link, e.g. because an import is missing.
    static std::unique_ptr<schema_tree>
    build(const google::protobuf::FileDescriptorSet& set);

    schema_tree(const schema_tree&) = delete;
    schema_tree& operator=(const schema_tree&) = delete;
    schema_tree(schema_tree&&) = delete;
    schema_tree& operator=(schema_tree&&) = delete;
    ~schema_tree();

    const google::protobuf::DescriptorPool& pool() const { return _pool; }
    const resources::resource_database& resource_db() const {
        return _resources;
    }

    field_view make_field_view(const google::protobuf::FieldDescriptor&) const;
    enum_value_view
    make_enum_value_view(const google::protobuf::EnumValueDescriptor&) const;

private:
    class error_collector;

    schema_tree();

    void index_file(const google::protobuf::FileDescriptor&);
    void index_message(const google::protobuf::Descriptor&);
    const source_code_locator&
    locator(const google::protobuf::FileDescriptor&) const;

    google::protobuf::SimpleDescriptorDatabase _database;
    std::unique_ptr<error_collector> _errors;
    google::protobuf::DescriptorPool _pool;
    resources::resource_database _resources;
    absl::flat_hash_map<
      const google::protobuf::FileDescriptor*,
      std::unique_ptr<source_code_locator>>
      _locators;
};

} // namespace descriptor
