#pragma once

#include <tlvtree/assert.hpp>
#include <tlvtree/type.hpp>

namespace tlvtree {

inline auto type::block(std::optional<std::size_t> size) -> type {
  type t{kind::block};
  t.size_ = size;
  return t;
}

inline auto type::text(std::optional<std::size_t> size) -> type {
  type t{kind::text};
  t.size_ = size;
  return t;
}

inline auto type::array(type element, std::optional<std::uint32_t> count) -> type {
  type t{kind::array};
  t.element_ = std::make_shared<type const>(std::move(element));
  t.count_ = count;
  return t;
}

inline auto type::structure(std::shared_ptr<schema const> fields) -> type {
  TLVTREE_ENSURE(fields != nullptr, "structure type requires a schema");
  type t{kind::structure};
  t.schema_ = std::move(fields);
  return t;
}

inline auto type::with_size(std::size_t n) const -> type {
  TLVTREE_ASSERT(is_bytes(kind_) || kind_ == kind::array,
                 "with_size() applies to block/text and arrays only");
  auto t = *this;
  t.size_ = n;
  if (kind_ == kind::array) {
    t.count_.reset();
  }
  return t;
}

inline auto type::with_count(std::uint32_t n) const -> type {
  TLVTREE_ASSERT(kind_ == kind::array, "with_count() applies to arrays only");
  auto t = *this;
  t.count_ = n;
  t.size_.reset();
  return t;
}

inline auto type::erased() const -> type {
  auto t = *this;
  t.size_.reset();
  t.count_.reset();
  if (element_) {
    t.element_ = std::make_shared<type const>(element_->erased());
  }
  return t;
}

inline auto type::fixed_size() const -> std::optional<std::size_t> {
  switch (kind_) {
    case kind::u8:
    case kind::u16:
    case kind::u32:
    case kind::u64:
      return integer_width(kind_);
    case kind::block:
    case kind::text:
      return size_;
    case kind::array: {
      if (!count_) {
        return size_;
      }
      auto elem = element_->fixed_size();
      if (!elem) {
        return std::nullopt;
      }
      return *elem * *count_;
    }
    case kind::structure:
      return std::nullopt;
  }
  return std::nullopt;
}

inline auto type::element() const -> type const& {
  TLVTREE_ENSURE(kind_ == kind::array && element_ != nullptr, "element() requires an array type");
  return *element_;
}

inline auto type::fields() const -> schema const& {
  TLVTREE_ENSURE(kind_ == kind::structure && schema_ != nullptr,
                 "fields() requires a structure type");
  return *schema_;
}

inline auto type::name() const -> std::string {
  switch (kind_) {
    case kind::block:
    case kind::text: {
      std::string out{kind_name(kind_)};
      if (size_) {
        out += "[" + std::to_string(*size_) + "]";
      }
      return out;
    }
    case kind::array: {
      auto out = "array<" + element_->name() + ">";
      if (count_) {
        out += "[" + std::to_string(*count_) + "]";
      } else if (size_) {
        out += "{" + std::to_string(*size_) + "}";
      }
      return out;
    }
    case kind::structure:
      return schema_->name();
    default:
      return std::string{kind_name(kind_)};
  }
}

inline auto fits(type const& slot, type const& candidate) -> bool {
  if (slot.get_kind() != candidate.get_kind()) {
    return false;
  }
  switch (slot.get_kind()) {
    case kind::block:
    case kind::text:
      return !slot.size() || slot.size() == candidate.size();
    case kind::array:
      if (slot.count() && slot.count() != candidate.count()) {
        return false;
      }
      if (slot.is_byte_bounded() && slot.size() != candidate.size()) {
        return false;
      }
      return fits(slot.element(), candidate.element());
    case kind::structure:
      return slot.fields().name() == candidate.fields().name();
    default:
      return true;
  }
}

inline auto schema::add(std::string name, type t, field_role role) -> schema& {
  fields_.push_back(field{.name = std::move(name), .decl = std::move(t), .role = role});
  return *this;
}

inline auto schema::add(std::string name, resolver r, field_role role) -> schema& {
  TLVTREE_ENSURE(static_cast<bool>(r), "resolver must be callable");
  fields_.push_back(field{.name = std::move(name), .decl = std::move(r), .role = role});
  return *this;
}

inline auto schema::index_of(std::string_view name) const -> std::optional<std::size_t> {
  for (std::size_t i = 0; i < fields_.size(); ++i) {
    if (fields_[i].name == name) {
      return i;
    }
  }
  return std::nullopt;
}

inline auto schema::find_role(field_role role) const -> std::optional<std::size_t> {
  for (std::size_t i = 0; i < fields_.size(); ++i) {
    if (fields_[i].role == role) {
      return i;
    }
  }
  return std::nullopt;
}

}  // namespace tlvtree
