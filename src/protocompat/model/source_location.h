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
#include "utils/named_type.h"

#include <seastar/core/sstring.hh>

#include <iosfwd>

namespace model {

/// 1-based line within a .proto file; `unknown_line` when the descriptor set
/// was produced without --include_source_info.
using source_line = named_type<int32_t, struct source_line_tag>;
inline constexpr source_line unknown_line{-1};

struct source_location {
    ss::sstring proto_file_name;
    source_line line{unknown_line};

    /// The same file at another line. An unknown line keeps this one.
    source_location at(source_line other) const;

    friend bool operator==(const source_location&, const source_location&)
      = default;
    friend std::ostream& operator<<(std::ostream&, const source_location&);
};

} // namespace model

PC_OSTREAM_FMT(model::source_location)
