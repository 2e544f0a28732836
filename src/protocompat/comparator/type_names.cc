// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0
#include "comparator/type_names.h"

#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>

#include <string>
#include <vector>

namespace comparator {

bool equivalent_type_names(
  std::string_view original,
  std::string_view updated,
  const std::optional<ss::sstring>& original_version,
  const std::optional<ss::sstring>& updated_version) {
    if (original == updated) {
        return true;
    }
    if (!original_version || !updated_version) {
        return false;
    }
    const std::string_view from{*original_version};
    const std::string_view to{*updated_version};
    std::vector<std::string_view> segments = absl::StrSplit(original, '.');
    for (auto& s : segments) {
        if (s == from) {
            s = to;
        }
    }
    return absl::StrJoin(segments, ".") == updated;
}

} // namespace comparator
