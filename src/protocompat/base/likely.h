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

// they must be macros or behavior is altered
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define likely(cond) __builtin_expect(cond, true)
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define unlikely(cond) __builtin_expect(cond, false)
