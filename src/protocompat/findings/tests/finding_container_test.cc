// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "findings/finding_container.h"
#include "findings/finding_json.h"

#include <gtest/gtest.h>

using namespace findings;

namespace {
model::source_location at(int32_t line) {
    return {.proto_file_name = "google/pubsub/v1/pubsub.proto",
            .line = model::source_line{line}};
}
} // namespace

TEST(finding_container, keeps_insertion_order_without_dedup) {
    finding_container c;
    c.add_finding(
      finding_category::field_name_change, at(3), "renamed", change_type::major);
    c.add_finding(
      finding_category::field_type_change, at(3), "retyped", change_type::major);
    c.add_finding(
      finding_category::field_type_change, at(3), "retyped", change_type::major);

    ASSERT_EQ(c.size(), 3);
    EXPECT_EQ(c.findings()[0].category(), finding_category::field_name_change);
    EXPECT_EQ(c.findings()[1].message(), "retyped");
    EXPECT_EQ(c.findings()[1], c.findings()[2]);
}

TEST(finding_container, drain_empties) {
    finding_container c;
    c.add_finding(
      finding_category::field_addition, at(7), "added", change_type::minor);

    auto drained = c.drain();
    ASSERT_EQ(drained.size(), 1);
    EXPECT_EQ(drained[0].location(), at(7));
    EXPECT_TRUE(c.empty());
    EXPECT_TRUE(c.drain().empty());
}

TEST(finding_container, reset) {
    finding_container c;
    c.add_finding(
      finding_category::field_removal, at(1), "gone", change_type::major);
    c.reset();
    EXPECT_TRUE(c.empty());
    EXPECT_FALSE(c.has_breaking_changes());
}

TEST(finding_container, merge_appends_in_order) {
    finding_container a;
    finding_container b;
    a.add_finding(
      finding_category::field_addition, at(1), "a", change_type::minor);
    b.add_finding(
      finding_category::field_removal, at(2), "b1", change_type::major);
    b.add_finding(
      finding_category::field_addition, at(3), "b2", change_type::minor);

    a.merge(std::move(b));
    ASSERT_EQ(a.size(), 3);
    EXPECT_EQ(a.findings()[0].message(), "a");
    EXPECT_EQ(a.findings()[1].message(), "b1");
    EXPECT_EQ(a.findings()[2].message(), "b2");
}

TEST(finding_container, breaking_changes) {
    finding_container c;
    EXPECT_FALSE(c.has_breaking_changes());
    c.add_finding(
      finding_category::enum_value_addition, at(1), "x", change_type::minor);
    c.add_finding(
      finding_category::field_addition, at(2), "y", change_type::patch);
    EXPECT_FALSE(c.has_breaking_changes());
    c.add_finding(
      finding_category::enum_value_removal, at(3), "z", change_type::major);
    EXPECT_TRUE(c.has_breaking_changes());
    EXPECT_TRUE(c.findings().back().is_breaking());
}

TEST(finding_types, rendered_names) {
    EXPECT_EQ(
      to_string_view(finding_category::field_proto3_optional_change),
      "FIELD_PROTO3_OPTIONAL_CHANGE");
    EXPECT_EQ(
      to_string_view(finding_category::resource_reference_addition),
      "RESOURCE_REFERENCE_ADDITION");
    EXPECT_EQ(
      to_string_view(finding_category::enum_value_name_change),
      "ENUM_VALUE_NAME_CHANGE");
    EXPECT_EQ(to_string_view(change_type::major), "MAJOR");
    EXPECT_EQ(to_string_view(change_type::minor), "MINOR");
    EXPECT_EQ(to_string_view(change_type::patch), "PATCH");
}

TEST(finding_json, record_shape) {
    finding_container c;
    c.add_finding(
      finding_category::field_type_change,
      at(12),
      "Type of an existing field `foo` is changed from `TYPE_INT32` to "
      "`TYPE_STRING`.",
      change_type::major);

    EXPECT_EQ(
      to_json(c),
      R"([{"category":"FIELD_TYPE_CHANGE","change_type":"MAJOR",)"
      R"("message":"Type of an existing field `foo` is changed from )"
      R"(`TYPE_INT32` to `TYPE_STRING`.",)"
      R"("location":{"proto_file_name":"google/pubsub/v1/pubsub.proto",)"
      R"("source_code_line":12}}])");
}

TEST(finding_json, empty_container) {
    finding_container c;
    EXPECT_EQ(to_json(c), "[]");
}

TEST(finding_json, escapes_message) {
    finding_container c;
    c.add_finding(
      finding_category::field_addition,
      {.proto_file_name = "a.proto", .line = model::unknown_line},
      "quote \" here",
      change_type::minor);
    EXPECT_EQ(
      to_json(c),
      R"([{"category":"FIELD_ADDITION","change_type":"MINOR",)"
      R"("message":"quote \" here",)"
      R"("location":{"proto_file_name":"a.proto","source_code_line":-1}}])");
}
