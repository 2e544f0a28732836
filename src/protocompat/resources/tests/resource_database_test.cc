// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "resources/resource_database.h"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace resources;

namespace {
resource_database pubsub_db() {
    resource_database db;
    db.register_resource(
      {.type = "cloudresourcemanager.googleapis.com/Project",
       .patterns = {"projects/{project}"}});
    db.register_resource(
      {.type = "pubsub.googleapis.com/Topic",
       .patterns
       = {"projects/{project}/topics/{topic}", "_deleted-topic_"}});
    db.register_resource(
      {.type = "pubsub.googleapis.com/Subscription",
       .patterns = {"projects/{project}/subscriptions/{subscription}"}});
    db.register_resource(
      {.type = "example.googleapis.com/Settings",
       .patterns = {"projects/{project}/settings"}});
    return db;
}
} // namespace

TEST(parent_pattern, drops_collection_and_id) {
    EXPECT_EQ(
      parent_pattern("projects/{project}/topics/{topic}"),
      "projects/{project}");
    EXPECT_EQ(parent_pattern("projects/{project}/settings"), "projects/{project}");
    EXPECT_EQ(parent_pattern("projects/{project}"), std::nullopt);
    EXPECT_EQ(parent_pattern("_deleted-topic_"), std::nullopt);
    EXPECT_EQ(parent_pattern(""), std::nullopt);
}

TEST(resource_database, lookup_by_type) {
    auto db = pubsub_db();
    EXPECT_EQ(db.size(), 4);
    const auto* topic = db.get_resource_by_type("pubsub.googleapis.com/Topic");
    ASSERT_NE(topic, nullptr);
    EXPECT_EQ(topic->patterns.size(), 2);
    EXPECT_EQ(db.get_resource_by_type("pubsub.googleapis.com/Snapshot"), nullptr);
}

TEST(resource_database, first_registration_wins) {
    auto db = pubsub_db();
    EXPECT_FALSE(db.register_resource(
      {.type = "pubsub.googleapis.com/Topic", .patterns = {"topics/{topic}"}}));
    EXPECT_FALSE(db.register_resource({.type = "", .patterns = {"x/{x}"}}));
    EXPECT_EQ(db.size(), 4);
    EXPECT_TRUE(db.get_resources_by_pattern("topics/{topic}").empty());
}

TEST(resource_database, lookup_by_pattern) {
    auto db = pubsub_db();
    auto found = db.get_resources_by_pattern("projects/{project}");
    ASSERT_EQ(found.size(), 1);
    EXPECT_EQ(found[0]->type, "cloudresourcemanager.googleapis.com/Project");
    EXPECT_TRUE(db.get_resources_by_pattern("folders/{folder}").empty());
}

TEST(resource_database, parents_by_child_type) {
    auto db = pubsub_db();
    auto parents = db.get_parent_resources_by_child_type(
      "pubsub.googleapis.com/Topic");
    ASSERT_EQ(parents.size(), 1);
    EXPECT_EQ(parents[0]->type, "cloudresourcemanager.googleapis.com/Project");

    auto singleton_parents = db.get_parent_resources_by_child_type(
      "example.googleapis.com/Settings");
    ASSERT_EQ(singleton_parents.size(), 1);
    EXPECT_EQ(
      singleton_parents[0]->type,
      "cloudresourcemanager.googleapis.com/Project");
}

TEST(resource_database, parents_deduplicated) {
    resource_database db;
    db.register_resource(
      {.type = "a/Parent", .patterns = {"parents/{parent}"}});
    db.register_resource(
      {.type = "a/Child",
       .patterns = {"parents/{parent}/kids/{kid}", "parents/{parent}/pets/{pet}"}});
    auto parents = db.get_parent_resources_by_child_type("a/Child");
    ASSERT_EQ(parents.size(), 1);
    EXPECT_EQ(parents[0]->type, "a/Parent");
}

TEST(resource_database, unknown_child_has_no_parents) {
    auto db = pubsub_db();
    EXPECT_TRUE(
      db.get_parent_resources_by_child_type("pubsub.googleapis.com/Snapshot")
        .empty());
    EXPECT_TRUE(db.get_parent_resources_by_child_type(
                    "cloudresourcemanager.googleapis.com/Project")
                  .empty());
}

TEST(resource_database, empty_type_rejected) {
    auto db = pubsub_db();
    EXPECT_THROW(db.get_resource_by_type(""), std::invalid_argument);
    EXPECT_THROW(
      db.get_parent_resources_by_child_type(""), std::invalid_argument);
}
