// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0
#include "comparator/enum_value_comparator.h"

#include "base/vlog.h"
#include "comparator/logger.h"

#include <fmt/format.h>

#include <type_traits>

namespace comparator {

using findings::change_type;
using findings::finding_category;

void compare(const enum_value_pair& pair, findings::finding_container& out) {
    pair.visit([&out](const auto& p) {
        using P = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<P, enum_value_pair::added>) {
            out.add_finding(
              finding_category::enum_value_addition,
              p.updated.location,
              fmt::format("A new EnumValue `{}` is added.", p.updated.name),
              change_type::minor);
        } else if constexpr (std::is_same_v<P, enum_value_pair::removed>) {
            out.add_finding(
              finding_category::enum_value_removal,
              p.original.location,
              fmt::format(
                "An existing EnumValue `{}` is removed.", p.original.name),
              change_type::major);
        } else if (p.original.name != p.updated.name) {
            vlog(
              cmplog.trace,
              "enum value {} renamed to {}",
              p.original,
              p.updated);
            out.add_finding(
              finding_category::enum_value_name_change,
              p.updated.location,
              fmt::format(
                "Name of the EnumValue is changed from `{}` to `{}`.",
                p.original.name,
                p.updated.name),
              change_type::major);
        }
    });
}

} // namespace comparator
