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

#include "descriptor/views.h"

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace comparator {

/**
 * One entity as seen in the original and in the updated schema tree.
 *
 * The driver pairs entities across the trees (fields by number, enum values
 * by name) and hands every pair to a comparator. A pair is one of:
 *
 *   added    only the updated tree declares the entity
 *   removed  only the original tree declares the entity
 *   matched  both trees declare it
 *
 * There is no way to build a pair with neither side present. The pair
 * refers to views owned by the caller and must not outlive them.
 */
template<typename T>
class entity_pair {
public:
    struct added {
        const T& updated;
    };
    struct removed {
        const T& original;
    };
    struct matched {
        const T& original;
        const T& updated;
    };

    static entity_pair make_added(const T& updated) {
        return entity_pair(added{updated});
    }
    static entity_pair make_removed(const T& original) {
        return entity_pair(removed{original});
    }
    static entity_pair make_matched(const T& original, const T& updated) {
        return entity_pair(matched{original, updated});
    }

    /// Pairs two lookups that may have missed. std::nullopt when neither
    /// tree has the entity.
    static std::optional<entity_pair> from(const T* original, const T* updated) {
        if (original && updated) {
            return make_matched(*original, *updated);
        }
        if (original) {
            return make_removed(*original);
        }
        if (updated) {
            return make_added(*updated);
        }
        return std::nullopt;
    }

    const T* original() const {
        return std::visit(
          [](const auto& p) -> const T* {
              using P = std::decay_t<decltype(p)>;
              if constexpr (std::is_same_v<P, added>) {
                  return nullptr;
              } else {
                  return &p.original;
              }
          },
          _pair);
    }

    const T* updated() const {
        return std::visit(
          [](const auto& p) -> const T* {
              using P = std::decay_t<decltype(p)>;
              if constexpr (std::is_same_v<P, removed>) {
                  return nullptr;
              } else {
                  return &p.updated;
              }
          },
          _pair);
    }

    template<typename Visitor>
    decltype(auto) visit(Visitor&& v) const {
        return std::visit(std::forward<Visitor>(v), _pair);
    }

private:
    using variant_t = std::variant<added, removed, matched>;

    explicit entity_pair(variant_t p)
      : _pair(p) {}

    variant_t _pair;
};

using field_pair = entity_pair<descriptor::field_view>;
using enum_value_pair = entity_pair<descriptor::enum_value_view>;

} // namespace comparator
