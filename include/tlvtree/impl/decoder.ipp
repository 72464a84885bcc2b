#pragma once

#include <tlvtree/decoder.hpp>
#include <tlvtree/logger.hpp>

#include <span>
#include <utility>
#include <vector>

namespace tlvtree {

namespace detail {

[[nodiscard]] inline auto source_failure(std::error_code ec, std::string detail) -> error_info {
  if (ec == errc::out_of_range) {
    return error_info{errc::truncated_input, std::move(detail)}.set_cause(ec);
  }
  return error_info{errc::io_error, std::move(detail)}.set_cause(ec);
}

}  // namespace detail

inline auto decoder::decode(type const& t, byte_source const& src, std::size_t offset)
  -> expected<parse_tree, error_info> {
  auto total = src.size();
  if (!total) {
    return unexpected(error_info{errc::io_error, "cannot size byte source"}.set_cause(total.error()));
  }

  parse_tree tree{};
  context ctx{.tree = tree, .src = src, .src_size = *total};

  auto root = decode_node(ctx, t, slot{}, offset, 0);
  if (!root) {
    TLVTREE_LOG_DEBUG("decode failed: {}", root.error().to_string());
    return unexpected(std::move(root).error());
  }
  tree.set_root(*root);
  return tree;
}

inline auto decoder::describe(context const& ctx, slot const& s) -> std::string {
  if (s.parent == no_node) {
    return s.name.empty() ? std::string{"<root>"} : s.name;
  }
  auto parent = ctx.tree.path_of(s.parent);
  if (s.name.empty()) {
    return parent + "[" + std::to_string(ctx.tree[s.parent].children.size()) + "]";
  }
  return parent == "<root>" ? s.name : parent + "." + s.name;
}

inline auto decoder::decode_node(context& ctx, type const& t, slot s, std::size_t offset,
                                 std::size_t depth) -> expected<node_id, error_info> {
  if (depth > opts_.max_depth) {
    return make_error(errc::nesting_too_deep,
                      describe(ctx, s) + " exceeds depth " + std::to_string(opts_.max_depth));
  }

  switch (t.get_kind()) {
    case kind::u8:
    case kind::u16:
    case kind::u32:
    case kind::u64:
    case kind::block:
    case kind::text:
      return decode_leaf(ctx, t, std::move(s), offset);
    case kind::array:
      return decode_array(ctx, t, std::move(s), offset, depth);
    case kind::structure:
      return decode_structure(ctx, t, std::move(s), offset, depth);
  }
  return make_error(errc::schema_mismatch, describe(ctx, s) + ": unknown type kind");
}

inline auto decoder::decode_leaf(context& ctx, type const& t, slot s, std::size_t offset)
  -> expected<node_id, error_info> {
  auto width = t.fixed_size();
  if (!width) {
    return make_error(errc::schema_mismatch,
                      describe(ctx, s) + ": " + t.name() + " has no size to decode with");
  }

  auto data = ctx.src.read(offset, *width);
  if (!data) {
    return unexpected(detail::source_failure(
      data.error(), describe(ctx, s) + " needs " + std::to_string(*width) + " bytes at offset " +
                      std::to_string(offset)));
  }

  node n{};
  n.ty = t;
  n.name = std::move(s.name);
  n.role = s.role;
  n.offset = offset;
  n.size = *width;
  n.parent = s.parent;
  if (is_integer(t.get_kind())) {
    n.value = load_le(*data);
  } else {
    n.value = std::move(*data);
  }
  return ctx.tree.add(std::move(n));
}

inline auto decoder::decode_array(context& ctx, type const& t, slot s, std::size_t offset,
                                  std::size_t depth) -> expected<node_id, error_info> {
  if (t.is_dynamic()) {
    return make_error(errc::schema_mismatch, describe(ctx, s) + ": array has no count or extent");
  }
  auto const limit = opts_.max_array_count;
  if (t.count() && limit != 0 && *t.count() > limit) {
    return make_error(errc::count_limit_exceeded,
                      describe(ctx, s) + ": count " + std::to_string(*t.count()) + " exceeds " +
                        std::to_string(limit));
  }

  node n{};
  n.ty = t;
  n.name = std::move(s.name);
  n.role = s.role;
  n.offset = offset;
  n.parent = s.parent;
  auto id = ctx.tree.add(std::move(n));

  auto cur = offset;
  if (t.count()) {
    for (std::uint32_t i = 0; i < *t.count(); ++i) {
      auto child = decode_node(ctx, t.element(), slot{.parent = id}, cur, depth + 1);
      if (!child) {
        return unexpected(std::move(child).error());
      }
      cur += ctx.tree[*child].size;
      ctx.tree[id].children.push_back(*child);
    }
    ctx.tree[id].size = cur - offset;
    return id;
  }

  // Byte-bounded: elements until the extent is used exactly.
  auto const end = offset + *t.size();
  while (cur < end) {
    if (limit != 0 && ctx.tree[id].children.size() >= limit) {
      return make_error(errc::count_limit_exceeded,
                        ctx.tree.path_of(id) + ": more than " + std::to_string(limit) +
                          " elements");
    }
    auto child = decode_node(ctx, t.element(), slot{.parent = id}, cur, depth + 1);
    if (!child) {
      return unexpected(std::move(child).error());
    }
    auto size = ctx.tree[*child].size;
    if (size == 0) {
      return make_error(errc::schema_mismatch,
                        ctx.tree.path_of(id) + ": element at offset " + std::to_string(cur) +
                          " decoded no bytes");
    }
    cur += size;
    ctx.tree[id].children.push_back(*child);
  }
  if (cur != end) {
    return make_error(errc::length_mismatch,
                      ctx.tree.path_of(id) + " spans " + std::to_string(*t.size()) +
                        " bytes, last element ends at " + std::to_string(cur - offset));
  }
  ctx.tree[id].size = cur - offset;
  return id;
}

inline auto decoder::decode_structure(context& ctx, type const& t, slot s, std::size_t offset,
                                      std::size_t depth) -> expected<node_id, error_info> {
  auto const& fields = t.fields();

  node n{};
  n.ty = t;
  n.name = std::move(s.name);
  n.role = s.role;
  n.offset = offset;
  n.parent = s.parent;
  auto id = ctx.tree.add(std::move(n));

  std::vector<node_id> decoded{};
  decoded.reserve(fields.size());
  std::optional<std::uint64_t> declared_length{};

  auto cur = offset;
  for (auto const& f : fields.fields()) {
    type resolved{};
    if (auto const* fixed = std::get_if<type>(&f.decl)) {
      resolved = *fixed;
    } else {
      field_view view{ctx.tree, std::span<node_id const>{decoded}, cur - offset};
      auto r = std::get<resolver>(f.decl)(view);
      if (!r) {
        auto err = std::move(r).error();
        err.append_detail("while resolving " + describe(ctx, slot{.name = f.name, .parent = id}) +
                          " at offset " + std::to_string(cur));
        return unexpected(std::move(err));
      }
      resolved = std::move(*r);
    }

    auto child = decode_node(ctx, resolved, slot{.name = f.name, .role = f.role, .parent = id}, cur,
                             depth + 1);
    if (!child) {
      return unexpected(std::move(child).error());
    }
    decoded.push_back(*child);
    ctx.tree[id].children.push_back(*child);
    cur += ctx.tree[*child].size;

    if (f.role == field_role::record_length) {
      auto const* v = std::get_if<std::uint64_t>(&ctx.tree[*child].value);
      if (v == nullptr) {
        return make_error(errc::schema_mismatch,
                          describe(ctx, slot{.name = f.name, .parent = id}) +
                            ": length field must be an integer");
      }
      declared_length = *v;
      if (offset > ctx.src_size || *v > ctx.src_size - offset) {
        auto available = offset < ctx.src_size ? ctx.src_size - offset : 0;
        return unexpected(error_info{errc::truncated_input,
                                     ctx.tree.path_of(id) + " declares " + std::to_string(*v) +
                                       " bytes at offset " + std::to_string(offset) +
                                       ", source holds " + std::to_string(available)}
                            .set_cause(make_error_code(errc::out_of_range)));
      }
    }
  }

  auto size = cur - offset;
  ctx.tree[id].size = size;

  if (declared_length && *declared_length != size) {
    if (opts_.lengths == length_policy::validate) {
      return make_error(errc::length_mismatch, ctx.tree.path_of(id) + " declares " +
                                                 std::to_string(*declared_length) +
                                                 " bytes, decoded " + std::to_string(size));
    }
    TLVTREE_LOG_WARNING("{} at offset {} declares {} bytes, decoded {}; trusting structure",
                        ctx.tree.path_of(id), offset, *declared_length, size);
  }

  if (get_logger().enabled(log_level::debug)) {
    TLVTREE_LOG_DEBUG("decoded {} '{}' at offset {} ({} bytes)", t.name(), ctx.tree.path_of(id),
                      offset, size);
  }
  return id;
}

}  // namespace tlvtree
