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

#include "findings/finding.h"

#include <fmt/ostream.h>

#include <ostream>

namespace findings {

finding::finding(
  finding_category category,
  change_type type,
  ss::sstring message,
  model::source_location location)
  : _category(category)
  , _type(type)
  , _message(std::move(message))
  , _location(std::move(location)) {}

std::ostream& operator<<(std::ostream& o, const finding& f) {
    fmt::print(
      o,
      "{{category: {}, change_type: {}, location: {}, message: {}}}",
      f._category,
      f._type,
      f._location,
      f._message);
    return o;
}

} // namespace findings
