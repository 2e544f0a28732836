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
#include "config/base_property.h"
#include "config/convert.h"
#include "json/json.h"

#include <seastar/util/noncopyable_function.hh>

#include <optional>
#include <ostream>
#include <type_traits>

namespace config {

template<class T>
class property : public base_property {
public:
    using value_type = T;
    using validator =
      typename ss::noncopyable_function<std::optional<ss::sstring>(const T&)>;

    property(
      config_store& conf,
      std::string_view name,
      std::string_view desc,
      base_property::metadata meta = {},
      value_type def = value_type{},
      property::validator validator = property::noop_validator)
      : base_property(conf, name, desc, meta)
      , _value(def)
      , _default(std::move(def))
      , _validator(std::move(validator)) {}

    const value_type& value() const { return _value; }

    const value_type& default_value() const { return _default; }

    std::string_view type_name() const override {
        if constexpr (std::is_same_v<value_type, bool>) {
            return "boolean";
        } else {
            return "string";
        }
    }

    bool is_default() const override { return _value == _default; }

    const value_type& operator()() const { return value(); }

    void print(std::ostream& o) const override {
        o << name() << ":" << _value;
    }

    void to_json(json::Writer<json::StringBuffer>& w) const override {
        if constexpr (std::is_same_v<value_type, bool>) {
            json::rjson_serialize(w, _value);
        } else {
            json::rjson_serialize(w, std::string_view(_value));
        }
    }

    template<typename U>
    requires std::constructible_from<value_type, U>
    void set_value(U&& v) {
        _value = value_type(std::forward<U>(v));
    }

    bool set_value(YAML::Node n) override {
        return update_value(n.as<value_type>());
    }

    std::optional<validation_error> validate(const value_type& v) const {
        if (auto err = _validator(v); err) {
            return std::make_optional<validation_error>(
              ss::sstring(name()), *err);
        }
        return std::nullopt;
    }

    std::optional<validation_error> validate(YAML::Node n) const override {
        return validate(n.as<value_type>());
    }

    void reset() override { _value = _default; }

    std::optional<std::string_view> example() const override {
        if (!_meta.example.empty()) {
            return _meta.example;
        }
        if constexpr (std::is_same_v<value_type, bool>) {
            // the opposite of the default
            return _default ? "false" : "true";
        } else {
            return std::nullopt;
        }
    }

    constexpr static auto noop_validator = [](const auto&) {
        return std::optional<ss::sstring>{};
    };

private:
    bool update_value(value_type&& new_value) {
        if (new_value != _value) {
            _value = std::move(new_value);
            return true;
        }
        return false;
    }

    value_type _value;
    value_type _default;
    validator _validator;
};

} // namespace config
