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
#include "config/validation_error.h"
#include "json/stringbuffer.h"
#include "json/writer.h"

#include <yaml-cpp/yaml.h>

#include <iosfwd>
#include <optional>
#include <string_view>

namespace config {

class config_store;

enum class required : char {
    yes,
    no,
};

/**
 * Type-erased half of a property: its name, its description and the hooks
 * config_store needs to load, validate and print it.
 *
 * A property registers itself with its store on construction, so it must
 * live exactly as long as the store.
 */
class base_property {
public:
    struct metadata {
        config::required required{config::required::no};
        std::string_view example;
    };

    base_property(
      config_store& conf,
      std::string_view name,
      std::string_view desc,
      metadata meta);

    const std::string_view& name() const { return _name; }
    const std::string_view& desc() const { return _desc; }

    required is_required() const { return _meta.required; }

    // the key is written by config_store::to_json
    virtual void to_json(json::Writer<json::StringBuffer>& w) const = 0;

    virtual void print(std::ostream&) const = 0;
    virtual bool set_value(YAML::Node) = 0;
    virtual void reset() = 0;
    virtual bool is_default() const = 0;

    virtual std::string_view type_name() const = 0;
    virtual std::optional<std::string_view> example() const = 0;

    /**
     * Validation of a proposed new value before it has been assigned
     * to this property.
     */
    virtual std::optional<validation_error> validate(YAML::Node) const = 0;
    virtual ~base_property() noexcept = default;

private:
    friend std::ostream& operator<<(std::ostream&, const base_property&);
    std::string_view _name;
    std::string_view _desc;

protected:
    metadata _meta;
};
} // namespace config
