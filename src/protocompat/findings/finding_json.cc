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

#include "findings/finding_json.h"

#include "json/json.h"

#include <string_view>

namespace findings {

using json::rjson_serialize;

void rjson_serialize(json::Writer<json::StringBuffer>& w, const finding& f) {
    w.StartObject();
    w.Key("category");
    rjson_serialize(w, to_string_view(f.category()));
    w.Key("change_type");
    rjson_serialize(w, to_string_view(f.type()));
    w.Key("message");
    rjson_serialize(w, std::string_view(f.message()));
    w.Key("location");
    w.StartObject();
    w.Key("proto_file_name");
    rjson_serialize(w, std::string_view(f.location().proto_file_name));
    w.Key("source_code_line");
    rjson_serialize(w, f.location().line());
    w.EndObject();
    w.EndObject();
}

void rjson_serialize(
  json::Writer<json::StringBuffer>& w, const finding_container& c) {
    w.StartArray();
    for (const auto& f : c.findings()) {
        rjson_serialize(w, f);
    }
    w.EndArray();
}

std::string to_json(const finding_container& c) {
    json::StringBuffer buf;
    json::Writer<json::StringBuffer> w(buf);
    rjson_serialize(w, c);
    return {buf.GetString(), buf.GetSize()};
}

} // namespace findings
