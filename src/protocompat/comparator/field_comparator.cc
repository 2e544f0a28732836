// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0
#include "comparator/field_comparator.h"

#include "base/vlog.h"
#include "comparator/logger.h"
#include "comparator/resource_reference_comparator.h"
#include "comparator/type_names.h"

#include <fmt/format.h>

#include <string_view>
#include <type_traits>

namespace comparator {

using descriptor::field_view;
using findings::change_type;
using findings::finding_category;

namespace {

class field_checks {
public:
    field_checks(
      const field_view& original,
      const field_view& updated,
      findings::finding_container& out,
      const options& opts)
      : _original(original)
      , _updated(updated)
      , _out(out)
      , _opts(opts) {}

    void run() {
        if (_original.name != _updated.name) {
            report(
              finding_category::field_name_change,
              _updated.location,
              fmt::format(
                "Name of an existing field is changed from `{}` to `{}`.",
                _original.name,
                _updated.name),
              change_type::major);
            return;
        }
        if (_opts.check_resource_references) {
            // before anything is reported, so a malformed pair leaves no
            // partial findings behind
            require_well_formed_references(_original, _updated);
        }
        check_label();
        check_behavior();
        check_type();
        check_oneof();
        if (_opts.check_resource_references) {
            compare_resource_references(_original, _updated, _out);
        }
    }

private:
    void check_label() {
        if (_original.repeated() == _updated.repeated()) {
            return;
        }
        report(
          finding_category::field_repeated_change,
          _updated.label_location(),
          fmt::format(
            "Repeated state of an existing field `{}` is changed from `{}` "
            "to `{}`.",
            _original.name,
            _original.label,
            _updated.label),
          change_type::major);
    }

    // only optional -> required breaks clients
    void check_behavior() {
        if (_original.required || !_updated.required) {
            return;
        }
        report(
          finding_category::field_behavior_change,
          _updated.field_behavior_location(),
          fmt::format(
            "Field behavior of an existing field `{}` is changed.",
            _original.name),
          change_type::major);
    }

    void check_type() {
        if (_original.proto_type != _updated.proto_type) {
            type_changed(fmt::format(
              "from `{}` to `{}`", _original.proto_type, _updated.proto_type));
            return;
        }
        if (!_original.type_name) {
            // scalar of the same kind
            return;
        }
        const auto& from = *_original.type_name;
        const auto to = _updated.type_name.value_or(ss::sstring{});
        if (!same_type(from, to)) {
            type_changed(fmt::format("from `{}` to `{}`", from, to));
            return;
        }

        if (_original.is_map_type() && !_updated.is_map_type()) {
            type_changed(fmt::format("from a map to `{}`", to));
        } else if (!_original.is_map_type() && _updated.is_map_type()) {
            type_changed(fmt::format("from `{}` to a map", from));
        } else if (_original.is_map_type()) {
            const auto& o = *_original.map_entry;
            const auto& u = *_updated.map_entry;
            if (!same_type(o.key, u.key) || !same_type(o.value, u.value)) {
                type_changed(fmt::format(
                  "from `map<{}, {}>` to `map<{}, {}>`",
                  o.key,
                  o.value,
                  u.key,
                  u.value));
            }
        }
    }

    // membership is what matters; the oneof may be renamed freely
    void check_oneof() {
        if (_original.in_oneof() != _updated.in_oneof()) {
            if (_original.in_oneof()) {
                report(
                  finding_category::field_oneof_removal,
                  _updated.location,
                  fmt::format(
                    "An existing field `{}` is moved out of One-of.",
                    _original.name),
                  change_type::major);
            } else {
                report(
                  finding_category::field_oneof_addition,
                  _updated.location,
                  fmt::format(
                    "An existing field `{}` is moved into One-of.",
                    _original.name),
                  change_type::major);
            }
            return;
        }
        if (
          !_original.in_oneof()
          || _original.proto3_optional == _updated.proto3_optional) {
            return;
        }
        if (_original.proto3_optional) {
            report(
              finding_category::field_proto3_optional_change,
              _updated.location,
              fmt::format(
                "Proto3 optional state of an existing field `{}` is changed "
                "to required.",
                _original.name),
              change_type::major);
        } else {
            report(
              finding_category::field_proto3_optional_change,
              _updated.location,
              fmt::format(
                "An existing field `{}` is changed to proto3 optional.",
                _original.name),
              change_type::minor);
        }
    }

    bool same_type(std::string_view from, std::string_view to) const {
        if (!_opts.allow_api_version_promotion) {
            return from == to;
        }
        return equivalent_type_names(
          from, to, _original.api_version, _updated.api_version);
    }

    void type_changed(std::string_view change) {
        report(
          finding_category::field_type_change,
          _updated.type_location(),
          fmt::format(
            "Type of an existing field `{}` is changed {}.",
            _original.name,
            change),
          change_type::major);
    }

    void report(
      finding_category category,
      model::source_location location,
      ss::sstring message,
      change_type type) {
        vlog(
          cmplog.trace,
          "field {}: {} {} at {}",
          _original.name,
          category,
          type,
          location);
        _out.add_finding(category, std::move(location), std::move(message), type);
    }

    const field_view& _original;
    const field_view& _updated;
    findings::finding_container& _out;
    const options& _opts;
};

} // namespace

void compare(
  const field_pair& pair,
  findings::finding_container& out,
  const options& opts) {
    pair.visit([&out, &opts](const auto& p) {
        using P = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<P, field_pair::added>) {
            out.add_finding(
              finding_category::field_addition,
              p.updated.location,
              fmt::format("A new field `{}` is added.", p.updated.name),
              change_type::minor);
        } else if constexpr (std::is_same_v<P, field_pair::removed>) {
            out.add_finding(
              finding_category::field_removal,
              p.original.location,
              fmt::format(
                "An existing field `{}` is removed.", p.original.name),
              change_type::major);
        } else {
            field_checks(p.original, p.updated, out, opts).run();
        }
    });
}

} // namespace comparator
