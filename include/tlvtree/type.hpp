#pragma once

#include <tlvtree/error_info.hpp>
#include <tlvtree/expected.hpp>
#include <tlvtree/kind.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tlvtree {

class schema;
class field_view;

/// Decodable type descriptor (a value type; cheap to copy).
///
/// Conventions:
/// - integer kinds have a fixed width (1/2/4/8 bytes, little-endian)
/// - block/text are sized, or dynamic (no size) until a resolver clones them with with_size()
/// - arrays carry an element type and either a count or a byte extent (elements are decoded
///   until the extent is used); an array with neither is dynamic until a resolver bounds it
/// - structures refer to a shared, immutable schema
class type {
 public:
  type() = default;

  [[nodiscard]] static auto u8() -> type { return type{kind::u8}; }
  [[nodiscard]] static auto u16() -> type { return type{kind::u16}; }
  [[nodiscard]] static auto u32() -> type { return type{kind::u32}; }
  [[nodiscard]] static auto u64() -> type { return type{kind::u64}; }

  [[nodiscard]] static auto block(std::optional<std::size_t> size = std::nullopt) -> type;
  [[nodiscard]] static auto text(std::optional<std::size_t> size = std::nullopt) -> type;
  [[nodiscard]] static auto array(type element, std::optional<std::uint32_t> count = std::nullopt)
    -> type;
  [[nodiscard]] static auto structure(std::shared_ptr<schema const> fields) -> type;

  [[nodiscard]] auto get_kind() const noexcept -> kind { return kind_; }

  /// block/text without a size, or an array without a count or extent: must be bounded by a
  /// resolver before decoding.
  [[nodiscard]] auto is_dynamic() const noexcept -> bool {
    if (kind_ == kind::array) {
      return !count_.has_value() && !size_.has_value();
    }
    return is_bytes(kind_) && !size_.has_value();
  }

  /// Array bounded by its byte extent rather than a count.
  [[nodiscard]] auto is_byte_bounded() const noexcept -> bool {
    return kind_ == kind::array && size_.has_value() && !count_.has_value();
  }

  [[nodiscard]] auto size() const noexcept -> std::optional<std::size_t> { return size_; }
  [[nodiscard]] auto count() const noexcept -> std::optional<std::uint32_t> { return count_; }

  /// Clone with the byte size set (block/text size, or array extent).
  [[nodiscard]] auto with_size(std::size_t n) const -> type;

  /// Clone with the element count set (array only).
  [[nodiscard]] auto with_count(std::uint32_t n) const -> type;

  /// Clone with size/count removed: the shape a slot accepts regardless of extent.
  [[nodiscard]] auto erased() const -> type;

  /// Byte size known without looking at data (integers, sized blocks, counted arrays of fixed
  /// elements, byte-bounded arrays). Structures report nullopt.
  [[nodiscard]] auto fixed_size() const -> std::optional<std::size_t>;

  [[nodiscard]] auto element() const -> type const&;
  [[nodiscard]] auto fields() const -> schema const&;
  [[nodiscard]] auto fields_ptr() const noexcept -> std::shared_ptr<schema const> const& {
    return schema_;
  }

  /// Diagnostic name: "u32", "text[11]", "array<record>[3]", "array<record>{27}", "record".
  [[nodiscard]] auto name() const -> std::string;

 private:
  explicit type(kind k) : kind_(k) {}

  kind kind_{kind::u8};
  std::optional<std::size_t> size_{};
  std::optional<std::uint32_t> count_{};
  std::shared_ptr<type const> element_{};
  std::shared_ptr<schema const> schema_{};
};

/// Whether a value of type `candidate` may occupy a slot declared as `slot`.
///
/// Kinds must agree. A sized block/text slot requires the same size, a counted array slot the
/// same count, a byte-bounded array slot the same extent, and element types must match
/// recursively. Structures match by schema name.
[[nodiscard]] inline auto fits(type const& slot, type const& candidate) -> bool;

/// Computes the type of a field from the fields decoded before it.
using resolver = std::function<expected<type, error_info>(field_view const&)>;

/// Semantic role of a field, used to validate on decode and to rewrite on resync.
enum class field_role : std::uint8_t {
  none,
  /// Holds the total serialized size of the enclosing structure.
  record_length,
  /// Holds the element count of the next array field of the enclosing structure.
  element_count,
};

struct field {
  std::string name;
  std::variant<type, resolver> decl;
  field_role role{field_role::none};

  [[nodiscard]] auto is_resolved() const noexcept -> bool {
    return std::holds_alternative<resolver>(decl);
  }
};

/// Named, ordered list of fields.
///
/// A field is either a fixed type or a resolver. Resolvers only ever see fields declared
/// before them, so dependencies are acyclic by construction.
class schema {
 public:
  explicit schema(std::string name) : name_(std::move(name)) {}

  auto add(std::string name, type t, field_role role = field_role::none) -> schema&;
  auto add(std::string name, resolver r, field_role role = field_role::none) -> schema&;

  [[nodiscard]] auto name() const noexcept -> std::string const& { return name_; }
  [[nodiscard]] auto fields() const noexcept -> std::vector<field> const& { return fields_; }
  [[nodiscard]] auto size() const noexcept -> std::size_t { return fields_.size(); }
  [[nodiscard]] auto at(std::size_t i) const -> field const& { return fields_.at(i); }

  [[nodiscard]] auto index_of(std::string_view name) const -> std::optional<std::size_t>;
  [[nodiscard]] auto find_role(field_role role) const -> std::optional<std::size_t>;

 private:
  std::string name_;
  std::vector<field> fields_{};
};

/// Convenience: wrap a finished schema into a structure type.
[[nodiscard]] inline auto make_structure(schema s) -> type {
  return type::structure(std::make_shared<schema const>(std::move(s)));
}

}  // namespace tlvtree

#include <tlvtree/impl/type.ipp>
