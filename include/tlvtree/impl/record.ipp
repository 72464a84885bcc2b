#pragma once

#include <tlvtree/record.hpp>

#include <string>

namespace tlvtree {

inline auto record_type(registry const& reg) -> type {
  schema s{std::string{record_schema_name}};
  s.add("tag", type::u8());
  s.add(
    "length",
    [r = &reg](field_view const& fields) -> expected<type, error_info> {
      // An unbound tag stops the record before its length is read.
      auto tag = fields.uint("tag");
      if (!tag) {
        return unexpected(tag.error());
      }
      if (auto variant = r->lookup(static_cast<tag_type>(*tag)); !variant) {
        return unexpected(variant.error());
      }
      return type::u32();
    },
    field_role::record_length);
  s.add(
    "payload",
    [r = &reg](field_view const& fields) -> expected<type, error_info> {
      auto tag = fields.uint("tag");
      if (!tag) {
        return unexpected(tag.error());
      }
      auto variant = r->lookup(static_cast<tag_type>(*tag));
      if (!variant) {
        return unexpected(variant.error());
      }

      auto const& payload = (*variant)->payload;
      if (!payload.is_dynamic()) {
        return payload;
      }

      auto length = fields.uint("length");
      if (!length) {
        return unexpected(length.error());
      }
      if (*length < fields.consumed()) {
        return make_error(errc::invalid_length, "length " + std::to_string(*length) +
                                                  " is smaller than the " +
                                                  std::to_string(fields.consumed()) +
                                                  "-byte header");
      }
      return payload.with_size(static_cast<std::size_t>(*length - fields.consumed()));
    });
  return make_structure(std::move(s));
}

inline auto list_type(registry const& reg) -> type {
  schema s{std::string{list_schema_name}};
  s.add("count", type::u32(), field_role::element_count);
  s.add("elements", [element = record_type(reg)](field_view const& fields) -> expected<type, error_info> {
    auto count = fields.uint("count");
    if (!count) {
      return unexpected(count.error());
    }
    return type::array(element, static_cast<std::uint32_t>(*count));
  });
  return make_structure(std::move(s));
}

}  // namespace tlvtree
