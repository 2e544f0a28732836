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

#include "descriptor/api_version.h"

#include <absl/strings/str_split.h>

#include <regex>
#include <vector>

namespace descriptor {

bool is_api_version(std::string_view segment) {
    static const std::regex re(R"(^v\d+(p\d+)?((alpha|beta)\d*)?$)");
    return std::regex_match(segment.begin(), segment.end(), re);
}

std::optional<ss::sstring>
extract_api_version(std::string_view file_path, std::string_view package) {
    std::vector<std::string_view> dirs = absl::StrSplit(file_path, '/');
    if (!dirs.empty()) {
        // last segment is the file name
        dirs.pop_back();
    }
    for (auto d : dirs) {
        if (is_api_version(d)) {
            return ss::sstring(d);
        }
    }
    for (auto p : absl::StrSplit(package, '.')) {
        if (is_api_version(p)) {
            return ss::sstring(p);
        }
    }
    return std::nullopt;
}

} // namespace descriptor
