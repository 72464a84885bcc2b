#pragma once

#include <tlvtree/logger.hpp>
#include <tlvtree/registry.hpp>

namespace tlvtree {

inline auto registry::add(variant_descriptor d) -> expected<void, error_info> {
  if (variants_.contains(d.tag)) {
    return make_error(errc::duplicate_tag, "tag " + std::to_string(d.tag) + " is already bound to '" +
                                             variants_.at(d.tag).name + "'");
  }
  TLVTREE_LOG_DEBUG("registry: tag {} -> '{}' ({})", d.tag, d.name, d.payload.name());
  auto tag = d.tag;
  variants_.emplace(tag, std::move(d));
  return {};
}

inline auto registry::lookup(tag_type tag) const
  -> expected<variant_descriptor const*, error_info> {
  auto it = variants_.find(tag);
  if (it == variants_.end()) {
    return make_error(errc::unknown_tag, "tag " + std::to_string(tag));
  }
  return &it->second;
}

}  // namespace tlvtree
