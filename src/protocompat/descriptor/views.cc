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

#include "descriptor/views.h"

#include <fmt/ostream.h>

#include <ostream>

namespace descriptor {

std::string_view to_string_view(field_label l) {
    switch (l) {
    case field_label::optional:
        return "LABEL_OPTIONAL";
    case field_label::required:
        return "LABEL_REQUIRED";
    case field_label::repeated:
        return "LABEL_REPEATED";
    }
    return "{unknown}";
}

std::ostream& operator<<(std::ostream& o, field_label l) {
    return o << to_string_view(l);
}

std::ostream& operator<<(std::ostream& o, const field_view& f) {
    fmt::print(
      o,
      "{{name: {}, number: {}, label: {}, type: {}, type_name: {}, "
      "location: {}}}",
      f.name,
      f.number,
      f.label,
      f.proto_type,
      f.type_name.value_or("none"),
      f.location);
    return o;
}

std::ostream& operator<<(std::ostream& o, const enum_value_view& v) {
    fmt::print(
      o, "{{name: {}, number: {}, location: {}}}", v.name, v.number, v.location);
    return o;
}

} // namespace descriptor
