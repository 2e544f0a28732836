// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0
#include "comparator/resource_reference_comparator.h"

#include "base/vlog.h"
#include "comparator/errc.h"
#include "comparator/logger.h"

#include <fmt/format.h>

#include <algorithm>
#include <string_view>
#include <vector>

namespace comparator {

using findings::change_type;
using findings::finding_category;

namespace {

std::vector<const resources::resource_definition*> parents_of(
  const resources::resource_database* db, std::string_view child_type) {
    if (db == nullptr) {
        vlog(
          cmplog.warn,
          "No resource database to resolve child_type {}",
          child_type);
        return {};
    }
    return db->get_parent_resources_by_child_type(child_type);
}

bool has_parent_of_type(
  const resources::resource_database* db,
  std::string_view child_type,
  std::string_view type) {
    auto parents = parents_of(db, child_type);
    vlog(
      cmplog.trace,
      "child_type {} resolves to {} parent resources",
      child_type,
      parents.size());
    return std::ranges::any_of(
      parents, [type](const auto* p) { return p->type == type; });
}

// the reference of a new annotation is declared somewhere in the updated tree
bool is_registered(
  const resources::resource_database* db,
  const resources::resource_reference& ref) {
    if (ref.is_child_type()) {
        return !parents_of(db, *ref.child_type).empty();
    }
    if (db == nullptr) {
        vlog(cmplog.warn, "No resource database to resolve type {}", *ref.type);
        return false;
    }
    return db->get_resource_by_type(*ref.type) != nullptr;
}

// the annotation was dropped from the field because the enclosing message
// now declares the same resource
bool moved_to_message_resource(
  const descriptor::field_view& original,
  const descriptor::field_view& updated) {
    if (!updated.message_resource) {
        return false;
    }
    const auto& ref = *original.resource_reference;
    const auto& local_type = updated.message_resource->type;
    if (ref.is_child_type()) {
        return has_parent_of_type(
          original.resource_db, *ref.child_type, local_type);
    }
    return local_type == *ref.type;
}

void report_added(
  const descriptor::field_view& original,
  const descriptor::field_view& updated,
  findings::finding_container& out) {
    const auto& ref = *updated.resource_reference;
    if (is_registered(updated.resource_db, ref)) {
        out.add_finding(
          finding_category::resource_reference_addition,
          updated.resource_reference_location(),
          fmt::format(
            "A resource reference option is added to the field `{}`.",
            original.name),
          change_type::minor);
    } else {
        out.add_finding(
          finding_category::resource_reference_addition,
          updated.resource_reference_location(),
          fmt::format(
            "A resource reference option is added to the field `{}`, but it "
            "is not defined anywhere",
            original.name),
          change_type::major);
    }
}

void report_removed(
  const descriptor::field_view& original,
  const descriptor::field_view& updated,
  findings::finding_container& out) {
    if (moved_to_message_resource(original, updated)) {
        out.add_finding(
          finding_category::resource_reference_removal,
          original.resource_reference_location(),
          fmt::format(
            "A resource reference option of the field `{}` is removed, but "
            "added back to the message options.",
            original.name),
          change_type::minor);
    } else {
        out.add_finding(
          finding_category::resource_reference_removal,
          original.resource_reference_location(),
          fmt::format(
            "A resource reference option of the field `{}` is removed.",
            original.name),
          change_type::major);
    }
}

} // namespace

result<void> check_resource_reference(const descriptor::field_view& field) {
    if (field.resource_reference && !field.resource_reference->is_well_formed()) {
        return errc::malformed_resource_reference;
    }
    return outcome::success();
}

void require_well_formed_references(
  const descriptor::field_view& original,
  const descriptor::field_view& updated) {
    for (const auto* side : {&original, &updated}) {
        if (auto r = check_resource_reference(*side); r.has_error()) {
            throw malformed_resource_reference(fmt::format(
              "{}: resource_reference of field `{}` sets neither type nor "
              "child_type",
              side->location,
              side->name));
        }
    }
}

void compare_resource_references(
  const descriptor::field_view& original,
  const descriptor::field_view& updated,
  findings::finding_container& out) {
    const auto& ref_original = original.resource_reference;
    const auto& ref_updated = updated.resource_reference;
    if (!ref_original && !ref_updated) {
        return;
    }

    require_well_formed_references(original, updated);

    if (!ref_original) {
        report_added(original, updated, out);
        return;
    }
    if (!ref_updated) {
        report_removed(original, updated, out);
        return;
    }

    if (ref_original->is_child_type() == ref_updated->is_child_type()) {
        const auto& from = ref_original->referenced_type();
        const auto& to = ref_updated->referenced_type();
        if (from != to) {
            out.add_finding(
              finding_category::resource_reference_change,
              updated.resource_reference_location(),
              fmt::format(
                "The type of resource reference option of the field `{}` is "
                "changed from `{}` to `{}`.",
                original.name,
                from,
                to),
              change_type::major);
        }
        return;
    }

    // type <-> child_type: still the same resource when the child side's
    // parent is the type named by the other side
    const auto& child_side = ref_original->is_child_type() ? original
                                                           : updated;
    const auto& type_side = ref_original->is_child_type() ? updated
                                                          : original;
    const auto& child_type = *child_side.resource_reference->child_type;
    const auto& parent_type = *type_side.resource_reference->type;
    if (!has_parent_of_type(child_side.resource_db, child_type, parent_type)) {
        out.add_finding(
          finding_category::resource_reference_change,
          updated.resource_reference_location(),
          fmt::format(
            "The child_type `{}` and type `{}` of resource reference option "
            "in field `{}` cannot be resolved to the identical resource.",
            child_type,
            parent_type,
            original.name),
          change_type::major);
    }
}

} // namespace comparator
