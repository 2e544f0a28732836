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

#include "findings/finding.h"

#include <vector>

namespace findings {

/**
 * Append-only sink the comparators write into.
 *
 * A container belongs to one comparison run. Drivers that fan comparisons
 * out across workers give every worker its own container and merge them
 * afterwards; the container itself does no locking.
 *
 * Findings are kept in insertion order and never deduplicated: a field that
 * is both renamed and retyped legitimately yields two findings.
 */
class finding_container {
public:
    finding_container() = default;
    finding_container(const finding_container&) = delete;
    finding_container& operator=(const finding_container&) = delete;
    finding_container(finding_container&&) noexcept = default;
    finding_container& operator=(finding_container&&) noexcept = default;
    ~finding_container() = default;

    void add_finding(
      finding_category category,
      model::source_location location,
      ss::sstring message,
      change_type type);

    const std::vector<finding>& findings() const { return _findings; }

    /// Hands the accumulated findings to the caller and leaves the
    /// container empty for the next run.
    std::vector<finding> drain();

    void reset() { _findings.clear(); }

    /// Appends everything `other` collected, preserving its order.
    void merge(finding_container&& other);

    size_t size() const { return _findings.size(); }
    bool empty() const { return _findings.empty(); }

    /// True when at least one finding is `change_type::major`.
    bool has_breaking_changes() const;

private:
    std::vector<finding> _findings;
};

} // namespace findings
