#pragma once

#include <tlvtree/error_info.hpp>
#include <tlvtree/expected.hpp>
#include <tlvtree/type.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace tlvtree {

using tag_type = std::uint32_t;

/// Binds a tag to the type of the payload it selects.
///
/// A dynamic payload type (block()/text() without a size) is sized by the decoder from the
/// enclosing record's length field.
struct variant_descriptor {
  tag_type tag{};
  std::string name{};
  type payload{};
};

/// Tag -> variant mapping for one protocol family.
///
/// Owned by the caller and passed explicitly; independent registries may coexist. Record
/// schemas built from a registry keep a reference to it, so it must outlive them.
class registry {
 public:
  registry() = default;

  registry(registry const&) = delete;
  auto operator=(registry const&) -> registry& = delete;

  /// Returns errc::duplicate_tag if `d.tag` is already bound.
  auto add(variant_descriptor d) -> expected<void, error_info>;

  /// Returns errc::unknown_tag if `tag` is not bound.
  [[nodiscard]] auto lookup(tag_type tag) const -> expected<variant_descriptor const*, error_info>;

  [[nodiscard]] auto contains(tag_type tag) const -> bool { return variants_.contains(tag); }
  [[nodiscard]] auto size() const noexcept -> std::size_t { return variants_.size(); }

 private:
  std::map<tag_type, variant_descriptor> variants_{};
};

}  // namespace tlvtree

#include <tlvtree/impl/registry.ipp>
