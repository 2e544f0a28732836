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

#include "base/seastarx.h"

#include <seastar/core/sstring.hh>

#include <exception>
#include <system_error>

namespace descriptor {

enum class errc {
    success = 0, // must be 0
    pool_build_failed,
    malformed_option,
    unknown_file,
};

struct errc_category final : public std::error_category {
    const char* name() const noexcept final { return "descriptor::errc"; }

    std::string message(int c) const final {
        switch (static_cast<errc>(c)) {
        case errc::success:
            return "descriptor::errc::success";
        case errc::pool_build_failed:
            return "descriptor::errc::pool_build_failed";
        case errc::malformed_option:
            return "descriptor::errc::malformed_option";
        case errc::unknown_file:
            return "descriptor::errc::unknown_file";
        }
        return "descriptor::errc::unknown(" + std::to_string(c) + ")";
    }
};
inline const std::error_category& error_category() noexcept {
    static errc_category e;
    return e;
}
inline std::error_code make_error_code(errc e) noexcept {
    return std::error_code(static_cast<int>(e), error_category());
}

/// Raised when a descriptor set cannot be turned into a schema tree, or
/// when a descriptor from another tree is handed to one.
class exception final : public std::exception {
public:
    exception(std::error_code ec, ss::sstring msg)
      : _ec(ec)
      , _msg(std::move(msg)) {}

    const std::error_code& code() const noexcept { return _ec; }
    const char* what() const noexcept final { return _msg.c_str(); }

private:
    std::error_code _ec;
    ss::sstring _msg;
};

} // namespace descriptor

namespace std {
template<>
struct is_error_code_enum<descriptor::errc> : true_type {};
} // namespace std
