// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "json/json.h"

namespace json {

template<typename Buffer>
void rjson_serialize(json::Writer<Buffer>& w, bool v) {
    w.Bool(v);
}

template<typename Buffer>
void rjson_serialize(json::Writer<Buffer>& w, int v) {
    w.Int(v);
}

template<typename Buffer>
void rjson_serialize(json::Writer<Buffer>& w, std::string_view v) {
    w.String(v.data(), v.size());
}

template void
rjson_serialize<json::StringBuffer>(json::Writer<json::StringBuffer>& w, bool v);

template void
rjson_serialize<json::StringBuffer>(json::Writer<json::StringBuffer>& w, int v);

template void rjson_serialize<json::StringBuffer>(
  json::Writer<json::StringBuffer>& w, std::string_view s);

} // namespace json
