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

#include "findings/finding_container.h"

#include <algorithm>
#include <iterator>
#include <utility>

namespace findings {

void finding_container::add_finding(
  finding_category category,
  model::source_location location,
  ss::sstring message,
  change_type type) {
    _findings.emplace_back(
      category, type, std::move(message), std::move(location));
}

std::vector<finding> finding_container::drain() {
    auto out = std::exchange(_findings, {});
    return out;
}

void finding_container::merge(finding_container&& other) {
    _findings.reserve(_findings.size() + other._findings.size());
    std::move(
      other._findings.begin(),
      other._findings.end(),
      std::back_inserter(_findings));
    other._findings.clear();
}

bool finding_container::has_breaking_changes() const {
    return std::ranges::any_of(
      _findings, [](const finding& f) { return f.is_breaking(); });
}

} // namespace findings
