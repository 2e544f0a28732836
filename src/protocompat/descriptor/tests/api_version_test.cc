// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "descriptor/api_version.h"

#include <gtest/gtest.h>

using namespace descriptor;

TEST(api_version, recognizes_version_segments) {
    for (auto v : {"v1", "v2", "v1p1", "v1alpha", "v1beta1", "v3p1beta2"}) {
        EXPECT_TRUE(is_api_version(v)) << v;
    }
    for (auto v : {"", "v", "version1", "v1.1", "1", "v1gamma", "pubsub"}) {
        EXPECT_FALSE(is_api_version(v)) << v;
    }
}

TEST(api_version, from_directory) {
    EXPECT_EQ(
      extract_api_version("google/pubsub/v1/pubsub.proto", "google.pubsub.v1"),
      "v1");
    EXPECT_EQ(
      extract_api_version(
        "google/cloud/v1beta1/speech.proto", "google.cloud.speech.v2"),
      "v1beta1");
}

TEST(api_version, file_name_is_not_a_directory) {
    EXPECT_EQ(extract_api_version("protos/v1.proto", ""), std::nullopt);
    EXPECT_EQ(extract_api_version("v1", ""), std::nullopt);
}

TEST(api_version, falls_back_to_package) {
    EXPECT_EQ(extract_api_version("pubsub.proto", "google.pubsub.v2beta"), "v2beta");
    EXPECT_EQ(extract_api_version("pubsub.proto", "google.pubsub"), std::nullopt);
}
