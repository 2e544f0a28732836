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
#include "findings/finding_container.h"
#include "json/stringbuffer.h"
#include "json/writer.h"

#include <string>

namespace findings {

/**
 * Writes a finding as the structured record consumed by report tooling:
 *
 *   {
 *     "category": "FIELD_TYPE_CHANGE",
 *     "change_type": "MAJOR",
 *     "message": "...",
 *     "location": {"proto_file_name": "a/v1/b.proto", "source_code_line": 7}
 *   }
 *
 * Key names and the MAJOR/MINOR/PATCH vocabulary are stable.
 */
void rjson_serialize(json::Writer<json::StringBuffer>& w, const finding& f);

void rjson_serialize(
  json::Writer<json::StringBuffer>& w, const finding_container& c);

// NOTE: uses std::string since the result is usually handed to a report
// writer that is not seastar aware.
std::string to_json(const finding_container& c);

} // namespace findings
