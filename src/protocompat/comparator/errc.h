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

namespace comparator {

enum class errc {
    success = 0, // must be 0
    malformed_resource_reference,
};

struct errc_category final : public std::error_category {
    const char* name() const noexcept final { return "comparator::errc"; }

    std::string message(int c) const final {
        switch (static_cast<errc>(c)) {
        case errc::success:
            return "comparator::errc::success";
        case errc::malformed_resource_reference:
            return "comparator::errc::malformed_resource_reference";
        }
        return "comparator::errc::unknown(" + std::to_string(c) + ")";
    }
};
inline const std::error_category& error_category() noexcept {
    static errc_category e;
    return e;
}
inline std::error_code make_error_code(errc e) noexcept {
    return std::error_code(static_cast<int>(e), error_category());
}

class exception : public std::exception {
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

/// A `google.api.resource_reference` annotation that sets neither `type`
/// nor `child_type`.
class malformed_resource_reference final : public exception {
public:
    explicit malformed_resource_reference(ss::sstring msg)
      : exception(
          make_error_code(errc::malformed_resource_reference), std::move(msg)) {}
};

} // namespace comparator

namespace std {
template<>
struct is_error_code_enum<comparator::errc> : true_type {};
} // namespace std
