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
#include "config/property.h"

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <map>
#include <ostream>
#include <stdexcept>
#include <unordered_map>

namespace config {
class config_store {
public:
    config_store() = default;
    config_store(const config_store&) = delete;
    config_store& operator=(const config_store&) = delete;
    config_store(config_store&&) = delete;
    config_store& operator=(config_store&&) = delete;

    bool contains(std::string_view name) const {
        return _properties.contains(name);
    }

    base_property& get(std::string_view name) {
        if (auto found = _properties.find(name); found != _properties.end()) {
            return *(found->second);
        }
        throw std::out_of_range(fmt::format("Property {} not found", name));
    }

    using error_map_t = std::map<ss::sstring, ss::sstring>;

    /**
     * Missing properties whose metadata specifies `required=yes` and
     * unknown keys are fatal errors, raised as std::invalid_argument.
     *
     * Other errors on property values are returned in a map of property
     * name to error message: bad YAML type, or an error flagged by the
     * property's validator. A value that fails validation is not applied.
     *
     * @return map of property name to error.  Empty on clean load.
     */
    error_map_t read_yaml(const YAML::Node& root_node) {
        error_map_t errors;

        for (const auto& [name, property] : _properties) {
            if (property->is_required() == required::no) {
                continue;
            }
            if (!root_node[std::string(name)]) {
                throw std::invalid_argument(
                  fmt::format("Property {} is required", name));
            }
        }

        for (const auto& node : root_node) {
            auto name = node.first.as<ss::sstring>();
            auto found = _properties.find(name);
            if (found == _properties.end()) {
                throw std::invalid_argument(
                  fmt::format("Unknown property {}", name));
            }
            auto* prop = found->second;
            try {
                if (auto err = prop->validate(node.second); err) {
                    errors[name] = fmt::format(
                      "Validation error: {}", err->error_message());
                    continue;
                }
                prop->set_value(node.second);
            } catch (const YAML::BadConversion& e) {
                errors[name] = fmt::format("Invalid value: {}", e.what());
            } catch (const YAML::InvalidNode& e) {
                errors[name] = fmt::format("Invalid syntax: {}", e.what());
            }
        }

        return errors;
    }

    template<typename Func>
    void for_each(Func&& f) const {
        for (const auto& [_, property] : _properties) {
            f(*property);
        }
    }

    void to_json(json::Writer<json::StringBuffer>& w) const {
        w.StartObject();
        for (const auto& [name, property] : _properties) {
            w.Key(name.data(), name.size());
            property->to_json(w);
        }
        w.EndObject();
    }

    friend std::ostream&
    operator<<(std::ostream& o, const config::config_store& c) {
        o << "{ ";
        c.for_each([&o](const auto& property) { o << property << " "; });
        o << "}";
        return o;
    }

    virtual ~config_store() noexcept = default;

private:
    friend class base_property;
    std::unordered_map<std::string_view, base_property*> _properties;
};

} // namespace config
