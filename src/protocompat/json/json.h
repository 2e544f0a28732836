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

#include "json/stringbuffer.h"
#include "json/writer.h"

#include <string_view>

namespace json {

template<typename Buffer>
void rjson_serialize(json::Writer<Buffer>& w, bool v);

template<typename Buffer>
void rjson_serialize(json::Writer<Buffer>& w, int v);

template<typename Buffer>
void rjson_serialize(json::Writer<Buffer>& w, std::string_view s);

} // namespace json
