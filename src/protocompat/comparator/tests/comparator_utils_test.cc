// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "comparator/entity_pair.h"
#include "comparator/options.h"
#include "comparator/type_names.h"
#include "config/configuration.h"

#include <gtest/gtest.h>

using namespace comparator;

TEST(type_names, identical) {
    EXPECT_TRUE(equivalent_type_names(
      ".pkg.v1.Enum", ".pkg.v1.Enum", std::nullopt, std::nullopt));
    EXPECT_TRUE(equivalent_type_names("string", "string", "v1", "v2"));
}

TEST(type_names, promoted) {
    EXPECT_TRUE(equivalent_type_names(
      ".pkg.v1.Enum", ".pkg.v1beta1.Enum", "v1", "v1beta1"));
    EXPECT_TRUE(equivalent_type_names(
      ".pkg.v1beta1.Outer.Inner", ".pkg.v1.Outer.Inner", "v1beta1", "v1"));
}

TEST(type_names, renamed) {
    EXPECT_FALSE(equivalent_type_names(
      ".pkg.v1.Enum", ".pkg.v2.EnumUpdate", "v1", "v2"));
}

TEST(type_names, segment_exact) {
    EXPECT_FALSE(equivalent_type_names(
      ".pkg.v1beta1.Enum", ".pkg.v2beta1.Enum", "v1", "v2"));
    EXPECT_FALSE(equivalent_type_names(
      ".pkg.v1.Enumv1", ".pkg.v2.Enumv2", "v1", "v2"));
}

TEST(type_names, missing_version) {
    EXPECT_FALSE(equivalent_type_names(
      ".pkg.v1.Enum", ".pkg.v1beta1.Enum", std::nullopt, "v1beta1"));
    EXPECT_FALSE(equivalent_type_names(
      ".pkg.v1.Enum", ".pkg.v1beta1.Enum", "v1", std::nullopt));
}

TEST(entity_pair, from_lookups) {
    descriptor::enum_value_view a{.name = "A"};
    descriptor::enum_value_view b{.name = "B"};

    EXPECT_FALSE(enum_value_pair::from(nullptr, nullptr).has_value());

    auto added = enum_value_pair::from(nullptr, &b);
    ASSERT_TRUE(added.has_value());
    EXPECT_EQ(added->original(), nullptr);
    EXPECT_EQ(added->updated(), &b);

    auto removed = enum_value_pair::from(&a, nullptr);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->original(), &a);
    EXPECT_EQ(removed->updated(), nullptr);

    auto matched = enum_value_pair::from(&a, &b);
    ASSERT_TRUE(matched.has_value());
    EXPECT_EQ(matched->original(), &a);
    EXPECT_EQ(matched->updated(), &b);
}

TEST(options, from_configuration) {
    config::configuration cfg;
    auto defaults = options::from(cfg);
    EXPECT_TRUE(defaults.allow_api_version_promotion);
    EXPECT_TRUE(defaults.check_resource_references);

    cfg.load(YAML::Load("allow_api_version_promotion: false\n"
                        "check_resource_references: false\n"));
    auto opts = options::from(cfg);
    EXPECT_FALSE(opts.allow_api_version_promotion);
    EXPECT_FALSE(opts.check_resource_references);
}
