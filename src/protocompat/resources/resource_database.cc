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

#include "resources/resource_database.h"

#include "base/vlog.h"
#include "resources/logger.h"

#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>
#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

namespace resources {

namespace {
bool is_variable(std::string_view segment) {
    return segment.size() >= 2 && segment.front() == '{'
           && segment.back() == '}';
}

void require_type(std::string_view type, std::string_view what) {
    if (type.empty()) {
        throw std::invalid_argument(
          fmt::format("{} must not be empty", what));
    }
}
} // namespace

std::optional<ss::sstring> parent_pattern(std::string_view pattern) {
    std::vector<std::string_view> segments = absl::StrSplit(
      pattern, '/', absl::SkipEmpty());
    if (segments.empty()) {
        return std::nullopt;
    }
    // `collection/{id}` is one level, a literal singleton is one level
    auto drop = is_variable(segments.back()) ? 2 : 1;
    if (segments.size() <= static_cast<size_t>(drop)) {
        return std::nullopt;
    }
    segments.resize(segments.size() - drop);
    return ss::sstring(absl::StrJoin(segments, "/"));
}

bool resource_database::register_resource(resource_definition def) {
    if (def.type.empty()) {
        vlog(rslog.warn, "Ignoring resource without a type {}", def);
        return false;
    }
    if (_by_type.contains(def.type)) {
        vlog(
          rslog.warn,
          "Resource type {} already registered, ignoring {}",
          def.type,
          def);
        return false;
    }
    auto& stored = *_resources.emplace_back(
      std::make_unique<resource_definition>(std::move(def)));
    _by_type.emplace(stored.type, &stored);
    for (const auto& pattern : stored.patterns) {
        _by_pattern[pattern].push_back(&stored);
    }
    vlog(rslog.trace, "Registered resource {}", stored);
    return true;
}

const resource_definition*
resource_database::get_resource_by_type(std::string_view type) const {
    require_type(type, "resource type");
    auto it = _by_type.find(ss::sstring(type));
    return it == _by_type.end() ? nullptr : it->second;
}

std::vector<const resource_definition*>
resource_database::get_resources_by_pattern(std::string_view pattern) const {
    auto it = _by_pattern.find(ss::sstring(pattern));
    if (it == _by_pattern.end()) {
        return {};
    }
    return it->second;
}

std::vector<const resource_definition*>
resource_database::get_parent_resources_by_child_type(
  std::string_view child_type) const {
    require_type(child_type, "child resource type");
    const auto* child = get_resource_by_type(child_type);
    if (child == nullptr) {
        vlog(
          rslog.trace, "No resource registered for child type {}", child_type);
        return {};
    }
    std::vector<const resource_definition*> parents;
    for (const auto& pattern : child->patterns) {
        auto parent = parent_pattern(pattern);
        if (!parent) {
            continue;
        }
        for (const auto* def : get_resources_by_pattern(*parent)) {
            if (std::ranges::find(parents, def) == parents.end()) {
                parents.push_back(def);
            }
        }
    }
    return parents;
}

} // namespace resources
