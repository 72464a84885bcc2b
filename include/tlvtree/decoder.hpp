#pragma once

#include <tlvtree/byte_source.hpp>
#include <tlvtree/config.hpp>
#include <tlvtree/error_info.hpp>
#include <tlvtree/expected.hpp>
#include <tlvtree/tree.hpp>
#include <tlvtree/type.hpp>

#include <cstddef>
#include <string>

namespace tlvtree {

/// Schema-driven decoder: walks a type against a byte source and builds a parse_tree.
///
/// Algorithm sketch:
/// - Structures decode their fields strictly in order. A resolver field is handed a
///   field_view over the fields already decoded and returns the concrete type to use.
/// - Leaves read exactly the bytes their type requires at the running offset.
/// - Arrays decode `count` elements, or elements until their byte extent is used.
/// - A `record_length` field is checked against the bytes available in the source as soon as
///   it is decoded, and against the structure's decoded size once the structure completes
///   (see decode_options::lengths).
/// - Every node records its offset and size; the running offset advances by the size.
///
/// Decoding is eager: the returned tree is fully materialized and does not reference the
/// source.
class decoder {
 public:
  explicit decoder(decode_options opts = {}) : opts_(opts) {}

  /// Decode one value of type `t` starting at `offset`.
  ///
  /// Returns:
  /// - the parse tree (root = the value)
  /// - errc::truncated_input (cause: the source error) when bytes run out
  /// - errc::unknown_tag / errc::invalid_length / errc::schema_mismatch from resolvers
  /// - errc::length_mismatch, errc::count_limit_exceeded, errc::nesting_too_deep
  [[nodiscard]] auto decode(type const& t, byte_source const& src, std::size_t offset = 0)
    -> expected<parse_tree, error_info>;

  [[nodiscard]] auto options() const noexcept -> decode_options const& { return opts_; }

 private:
  struct context {
    parse_tree& tree;
    byte_source const& src;
    std::size_t src_size;
  };

  struct slot {
    std::string name{};
    field_role role{field_role::none};
    node_id parent{no_node};
  };

  [[nodiscard]] auto decode_node(context& ctx, type const& t, slot s, std::size_t offset,
                                 std::size_t depth) -> expected<node_id, error_info>;
  [[nodiscard]] auto decode_leaf(context& ctx, type const& t, slot s, std::size_t offset)
    -> expected<node_id, error_info>;
  [[nodiscard]] auto decode_array(context& ctx, type const& t, slot s, std::size_t offset,
                                  std::size_t depth) -> expected<node_id, error_info>;
  [[nodiscard]] auto decode_structure(context& ctx, type const& t, slot s, std::size_t offset,
                                      std::size_t depth) -> expected<node_id, error_info>;

  [[nodiscard]] static auto describe(context const& ctx, slot const& s) -> std::string;

  decode_options opts_;
};

/// Convenience wrapper around decoder::decode.
[[nodiscard]] inline auto decode(type const& t, byte_source const& src, std::size_t offset = 0,
                                 decode_options opts = {}) -> expected<parse_tree, error_info> {
  return decoder{opts}.decode(t, src, offset);
}

}  // namespace tlvtree

#include <tlvtree/impl/decoder.ipp>
