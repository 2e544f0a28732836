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

#include "base/fmt.h"
#include "base/seastarx.h"
#include "findings/types.h"
#include "model/source_location.h"

#include <seastar/core/sstring.hh>

#include <iosfwd>

namespace findings {

/**
 * One detected difference between an original and an updated schema
 * element. A finding never changes after construction; the location is
 * always the side of the pair that still exists (the updated element,
 * or the original one for removals).
 */
class finding {
public:
    finding(
      finding_category category,
      change_type type,
      ss::sstring message,
      model::source_location location);

    finding_category category() const { return _category; }
    change_type type() const { return _type; }
    const ss::sstring& message() const { return _message; }
    const model::source_location& location() const { return _location; }

    bool is_breaking() const { return _type == change_type::major; }

    friend bool operator==(const finding&, const finding&) = default;
    friend std::ostream& operator<<(std::ostream&, const finding&);

private:
    finding_category _category;
    change_type _type;
    ss::sstring _message;
    model::source_location _location;
};

} // namespace findings

PC_OSTREAM_FMT(findings::finding)
