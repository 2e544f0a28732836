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

#include "model/source_location.h"

#include <fmt/ostream.h>

#include <ostream>

namespace model {

source_location source_location::at(source_line other) const {
    if (other == unknown_line) {
        return *this;
    }
    return source_location{.proto_file_name = proto_file_name, .line = other};
}

std::ostream& operator<<(std::ostream& o, const source_location& l) {
    fmt::print(o, "{}:{}", l.proto_file_name, l.line);
    return o;
}

} // namespace model
