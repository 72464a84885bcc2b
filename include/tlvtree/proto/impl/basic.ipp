#pragma once

#include <tlvtree/encoder.hpp>
#include <tlvtree/mutate.hpp>
#include <tlvtree/proto/basic.hpp>

namespace tlvtree::proto {

inline auto register_variants(registry& reg) -> expected<void, error_info> {
  if (auto ok = reg.add({.tag = integer_tag, .name = "integer", .payload = type::u32()}); !ok) {
    return ok;
  }
  if (auto ok = reg.add({.tag = text_tag, .name = "text", .payload = type::text()}); !ok) {
    return ok;
  }
  return reg.add({.tag = list_tag, .name = "list", .payload = list_type(reg)});
}

inline auto make_integer(registry const& reg, std::uint32_t value)
  -> expected<parse_tree, error_info> {
  return allocate(record_type(reg), {integer_tag, record_header_size + 4, value});
}

inline auto make_text(registry const& reg, std::string_view s) -> expected<parse_tree, error_info> {
  return allocate(record_type(reg), {text_tag, record_header_size + s.size(), s});
}

inline auto make_list(registry const& reg, std::vector<parse_tree> const& elements)
  -> expected<parse_tree, error_info> {
  auto tree = allocate(record_type(reg), {list_tag, record_header_size + 4, {0, {}}});
  if (!tree) {
    return tree;
  }

  auto array = tree->find("payload.elements");
  if (!array) {
    return make_error(errc::schema_mismatch, "list payload has no elements field");
  }
  for (auto const& element : elements) {
    if (auto id = append(*tree, *array, element); !id) {
      return unexpected(std::move(id).error());
    }
  }
  if (auto ok = resync(*tree); !ok) {
    return unexpected(std::move(ok).error());
  }
  return tree;
}

}  // namespace tlvtree::proto
