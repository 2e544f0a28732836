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

#include "resources/types.h"

#include <absl/container/btree_map.h>

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace resources {

/**
 * Index over every resource declaration visible in one schema tree.
 *
 * The database is filled once while the tree is loaded and is read-only
 * for the rest of its life, so concurrent readers need no locking.
 *
 * Parent relationships are derived from patterns: the parent of
 * `projects/{project}/topics/{topic}` is whatever resource is declared
 * with the pattern `projects/{project}`.
 */
class resource_database {
public:
    resource_database() = default;
    resource_database(const resource_database&) = delete;
    resource_database& operator=(const resource_database&) = delete;
    resource_database(resource_database&&) noexcept = default;
    resource_database& operator=(resource_database&&) noexcept = default;
    ~resource_database() = default;

    /// Registers a declaration. The first declaration of a type wins;
    /// returns false when `def.type` was already registered or is empty.
    bool register_resource(resource_definition def);

    /// The declaration of `type`, if any. Throws std::invalid_argument for
    /// an empty type.
    const resource_definition* get_resource_by_type(std::string_view type) const;

    std::vector<const resource_definition*>
    get_resources_by_pattern(std::string_view pattern) const;

    /// Every resource whose pattern is a parent pattern of one of the
    /// patterns of `child_type`. Empty when `child_type` is unknown.
    /// Throws std::invalid_argument for an empty child type.
    std::vector<const resource_definition*>
    get_parent_resources_by_child_type(std::string_view child_type) const;

    size_t size() const { return _resources.size(); }
    bool empty() const { return _resources.empty(); }

private:
    std::vector<std::unique_ptr<resource_definition>> _resources;
    absl::btree_map<ss::sstring, const resource_definition*> _by_type;
    absl::btree_map<ss::sstring, std::vector<const resource_definition*>>
      _by_pattern;
};

/// The pattern one level up from `pattern`: a trailing `collection/{id}`
/// pair is dropped, as is a trailing singleton segment. std::nullopt when
/// nothing is left.
std::optional<ss::sstring> parent_pattern(std::string_view pattern);

} // namespace resources
