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
#include <fmt/ostream.h>

#include <compare>
#include <limits>
#include <ostream>
#include <type_traits>

namespace detail {

/// Strong typedef over an arithmetic type. Two named types with different
/// tags never compare or convert into each other, which keeps field
/// numbers and source lines apart in signatures that take both.
template<typename T, typename Tag>
requires std::is_arithmetic_v<T>
class base_named_type {
public:
    using type = T;
    constexpr base_named_type() = default;
    constexpr explicit base_named_type(const type& v)
      : _value(v) {}

    friend constexpr bool
    operator==(const base_named_type&, const base_named_type&) noexcept
      = default;
    friend constexpr auto
    operator<=>(const base_named_type&, const base_named_type&) noexcept
      = default;

    friend constexpr bool
    operator==(const base_named_type& lhs, const type& rhs) noexcept {
        return lhs._value == rhs;
    }
    friend constexpr auto
    operator<=>(const base_named_type& lhs, const type& rhs) noexcept {
        return lhs._value <=> rhs;
    }

    // explicit getter
    constexpr type operator()() const { return _value; }
    // implicit conversion operator
    constexpr operator type() const { return _value; }

    static constexpr base_named_type min() {
        return base_named_type(std::numeric_limits<type>::min());
    }

    static constexpr base_named_type max() {
        return base_named_type(std::numeric_limits<type>::max());
    }

    friend std::ostream& operator<<(std::ostream& o, const base_named_type& t) {
        fmt::print(o, "{}", t._value);
        return o;
    };

protected:
    type _value = std::numeric_limits<T>::min();
};

} // namespace detail

template<typename T, typename Tag>
using named_type = detail::base_named_type<T, Tag>;

namespace std {
template<typename T, typename Tag>
struct hash<::detail::base_named_type<T, Tag>> {
    size_t operator()(const ::detail::base_named_type<T, Tag>& x) const {
        return std::hash<T>{}(x());
    }
};
} // namespace std

template<typename T, typename Tag>
struct fmt::formatter<::detail::base_named_type<T, Tag>>
  : fmt::formatter<T> {
    template<typename FormatContext>
    auto format(const ::detail::base_named_type<T, Tag>& v, FormatContext& ctx)
      const {
        return fmt::formatter<T>::format(v(), ctx);
    }
};
