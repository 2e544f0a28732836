// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "comparator/errc.h"
#include "comparator/field_comparator.h"
#include "comparator/resource_reference_comparator.h"
#include "comparator/tests/field_builders.h"

#include <gtest/gtest.h>

using namespace comparator;
using namespace comparator::test_utils;
using findings::change_type;
using findings::finding_category;
using findings::finding_container;

namespace {

constexpr auto project = "cloudresourcemanager.googleapis.com/Project";
constexpr auto topic = "pubsub.googleapis.com/Topic";

resources::resource_database pubsub_db() {
    resources::resource_database db;
    db.register_resource({.type = project, .patterns = {"projects/{project}"}});
    db.register_resource(
      {.type = topic, .patterns = {"projects/{project}/topics/{topic}"}});
    return db;
}

descriptor::field_view with_type(
  const resources::resource_database* db, std::string_view type, int32_t line) {
    auto v = make_field("topic", "TYPE_STRING");
    v.resource_reference = resources::resource_reference{
      .type = ss::sstring(type)};
    v.resource_db = db;
    v.lines.resource_reference = model::source_line{line};
    return v;
}

descriptor::field_view with_child_type(
  const resources::resource_database* db,
  std::string_view child_type,
  int32_t line) {
    auto v = make_field("topic", "TYPE_STRING");
    v.resource_reference = resources::resource_reference{
      .child_type = ss::sstring(child_type)};
    v.resource_db = db;
    v.lines.resource_reference = model::source_line{line};
    return v;
}

descriptor::field_view without_reference(const resources::resource_database* db) {
    auto v = make_field("topic", "TYPE_STRING");
    v.resource_db = db;
    return v;
}

finding_container run(
  const descriptor::field_view& original,
  const descriptor::field_view& updated) {
    finding_container out;
    compare_resource_references(original, updated, out);
    return out;
}

} // namespace

TEST(resource_reference, absent_on_both_sides) {
    auto db = pubsub_db();
    EXPECT_TRUE(run(without_reference(&db), without_reference(&db)).empty());
}

TEST(resource_reference, added_and_registered) {
    auto db = pubsub_db();
    auto out = run(without_reference(&db), with_type(&db, topic, 20));
    ASSERT_EQ(out.size(), 1);
    const auto& finding = out.findings()[0];
    EXPECT_EQ(finding.category(), finding_category::resource_reference_addition);
    EXPECT_EQ(finding.type(), change_type::minor);
    EXPECT_EQ(
      finding.message(),
      "A resource reference option is added to the field `topic`.");
    EXPECT_EQ(finding.location().line, model::source_line{20});
}

TEST(resource_reference, added_child_type_with_registered_parent) {
    auto db = pubsub_db();
    auto out = run(without_reference(&db), with_child_type(&db, topic, 20));
    ASSERT_EQ(out.size(), 1);
    EXPECT_EQ(out.findings()[0].type(), change_type::minor);
}

TEST(resource_reference, added_but_not_defined) {
    auto db = pubsub_db();
    auto out = run(
      without_reference(&db),
      with_type(&db, "pubsub.googleapis.com/Snapshot", 20));
    ASSERT_EQ(out.size(), 1);
    const auto& finding = out.findings()[0];
    EXPECT_EQ(finding.category(), finding_category::resource_reference_addition);
    EXPECT_EQ(finding.type(), change_type::major);
    EXPECT_EQ(
      finding.message(),
      "A resource reference option is added to the field `topic`, but it is "
      "not defined anywhere");
}

TEST(resource_reference, added_child_type_without_parent) {
    auto db = pubsub_db();
    auto out = run(without_reference(&db), with_child_type(&db, project, 20));
    ASSERT_EQ(out.size(), 1);
    EXPECT_EQ(out.findings()[0].type(), change_type::major);
}

TEST(resource_reference, added_without_database) {
    auto out = run(without_reference(nullptr), with_type(nullptr, topic, 20));
    ASSERT_EQ(out.size(), 1);
    EXPECT_EQ(out.findings()[0].type(), change_type::major);
}

TEST(resource_reference, removed) {
    auto db = pubsub_db();
    auto original = with_type(&db, topic, 17);
    original.location.proto_file_name = example_file_v2;
    auto out = run(original, without_reference(&db));
    ASSERT_EQ(out.size(), 1);
    const auto& finding = out.findings()[0];
    EXPECT_EQ(finding.category(), finding_category::resource_reference_removal);
    EXPECT_EQ(finding.type(), change_type::major);
    EXPECT_EQ(
      finding.message(),
      "A resource reference option of the field `topic` is removed.");
    EXPECT_EQ(finding.location().proto_file_name, example_file_v2);
    EXPECT_EQ(finding.location().line, model::source_line{17});
}

TEST(resource_reference, removed_but_declared_on_message) {
    auto db = pubsub_db();
    auto updated = without_reference(&db);
    updated.message_resource = resources::resource_definition{
      .type = topic, .patterns = {"projects/{project}/topics/{topic}"}};

    auto out = run(with_type(&db, topic, 17), updated);
    ASSERT_EQ(out.size(), 1);
    const auto& finding = out.findings()[0];
    EXPECT_EQ(finding.category(), finding_category::resource_reference_removal);
    EXPECT_EQ(finding.type(), change_type::minor);
    EXPECT_EQ(
      finding.message(),
      "A resource reference option of the field `topic` is removed, but "
      "added back to the message options.");
}

TEST(resource_reference, removed_with_other_message_resource) {
    auto db = pubsub_db();
    auto updated = without_reference(&db);
    updated.message_resource = resources::resource_definition{
      .type = project, .patterns = {"projects/{project}"}};

    auto out = run(with_type(&db, topic, 17), updated);
    ASSERT_EQ(out.size(), 1);
    EXPECT_EQ(out.findings()[0].type(), change_type::major);
}

TEST(resource_reference, removed_child_type_declared_as_parent_on_message) {
    auto db = pubsub_db();
    auto updated = without_reference(nullptr);
    updated.message_resource = resources::resource_definition{
      .type = project, .patterns = {"projects/{project}"}};

    // parents are looked up in the original tree, which owns the child_type
    auto out = run(with_child_type(&db, topic, 17), updated);
    ASSERT_EQ(out.size(), 1);
    EXPECT_EQ(out.findings()[0].type(), change_type::minor);
}

TEST(resource_reference, same_type) {
    auto db = pubsub_db();
    EXPECT_TRUE(run(with_type(&db, topic, 3), with_type(&db, topic, 4)).empty());
    EXPECT_TRUE(
      run(with_child_type(&db, topic, 3), with_child_type(&db, topic, 4))
        .empty());
}

TEST(resource_reference, type_changed) {
    auto db = pubsub_db();
    auto out = run(with_type(&db, topic, 3), with_type(&db, project, 4));
    ASSERT_EQ(out.size(), 1);
    const auto& finding = out.findings()[0];
    EXPECT_EQ(finding.category(), finding_category::resource_reference_change);
    EXPECT_EQ(finding.type(), change_type::major);
    EXPECT_EQ(
      finding.message(),
      "The type of resource reference option of the field `topic` is changed "
      "from `pubsub.googleapis.com/Topic` to "
      "`cloudresourcemanager.googleapis.com/Project`.");
    EXPECT_EQ(finding.location().line, model::source_line{4});
}

TEST(resource_reference, child_type_changed) {
    auto db = pubsub_db();
    auto out = run(
      with_child_type(&db, topic, 3),
      with_child_type(&db, "pubsub.googleapis.com/Subscription", 4));
    ASSERT_EQ(out.size(), 1);
    EXPECT_EQ(
      out.findings()[0].category(), finding_category::resource_reference_change);
}

TEST(resource_reference, child_type_to_parent_type_resolves) {
    auto db = pubsub_db();
    EXPECT_TRUE(
      run(with_child_type(&db, topic, 3), with_type(&db, project, 4)).empty());
}

TEST(resource_reference, parent_type_to_child_type_resolves) {
    auto db = pubsub_db();
    EXPECT_TRUE(
      run(with_type(&db, project, 3), with_child_type(&db, topic, 4)).empty());
}

TEST(resource_reference, flip_resolves_in_owning_tree_only) {
    auto db = pubsub_db();
    resources::resource_database empty;
    // the original tree declares the child_type and cannot resolve it
    auto out = run(
      with_child_type(&empty, topic, 3), with_type(&db, project, 4));
    ASSERT_EQ(out.size(), 1);

    // the updated tree declares the child_type and resolves it
    EXPECT_TRUE(
      run(with_type(&empty, project, 3), with_child_type(&db, topic, 4))
        .empty());
}

TEST(resource_reference, flip_cannot_be_resolved) {
    auto db = pubsub_db();
    auto out = run(
      with_child_type(&db, topic, 3),
      with_type(&db, "pubsub.googleapis.com/Schema", 4));
    ASSERT_EQ(out.size(), 1);
    const auto& finding = out.findings()[0];
    EXPECT_EQ(finding.category(), finding_category::resource_reference_change);
    EXPECT_EQ(finding.type(), change_type::major);
    EXPECT_EQ(
      finding.message(),
      "The child_type `pubsub.googleapis.com/Topic` and type "
      "`pubsub.googleapis.com/Schema` of resource reference option in field "
      "`topic` cannot be resolved to the identical resource.");
    EXPECT_EQ(finding.location().line, model::source_line{4});
}

TEST(resource_reference, flip_without_database) {
    auto out = run(
      with_child_type(nullptr, topic, 3), with_type(nullptr, project, 4));
    EXPECT_EQ(out.size(), 1);
}

TEST(resource_reference, malformed_reference_rejected) {
    auto db = pubsub_db();
    auto malformed = without_reference(&db);
    malformed.resource_reference = resources::resource_reference{
      .type = ss::sstring{}};

    EXPECT_EQ(
      check_resource_reference(malformed).error(),
      errc::malformed_resource_reference);
    EXPECT_FALSE(check_resource_reference(with_type(&db, topic, 1)).has_error());
    EXPECT_FALSE(check_resource_reference(without_reference(&db)).has_error());

    finding_container out;
    try {
        compare_resource_references(with_type(&db, topic, 1), malformed, out);
        FAIL() << "expected malformed_resource_reference";
    } catch (const malformed_resource_reference& e) {
        EXPECT_EQ(e.code(), errc::malformed_resource_reference);
    }
    EXPECT_TRUE(out.empty());

    EXPECT_THROW(
      compare(field_pair::make_matched(malformed, without_reference(&db)), out),
      comparator::exception);
}
