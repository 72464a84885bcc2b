#pragma once

#include <tlvtree/byte_source.hpp>

#include <fstream>
#include <ios>

namespace tlvtree {

inline auto memory_source::read(std::size_t offset, std::size_t n) const
  -> expected<bytes, std::error_code> {
  if (offset > data_.size() || n > data_.size() - offset) {
    return unexpected(make_error_code(errc::out_of_range));
  }
  auto first = data_.begin() + static_cast<std::ptrdiff_t>(offset);
  return bytes(first, first + static_cast<std::ptrdiff_t>(n));
}

inline auto file_source::size() const -> expected<std::size_t, std::error_code> {
  std::error_code ec;
  auto n = std::filesystem::file_size(path_, ec);
  if (ec) {
    return unexpected(ec);
  }
  return static_cast<std::size_t>(n);
}

inline auto file_source::read(std::size_t offset, std::size_t n) const
  -> expected<bytes, std::error_code> {
  auto total = size();
  if (!total) {
    return unexpected(total.error());
  }
  if (offset > *total || n > *total - offset) {
    return unexpected(make_error_code(errc::out_of_range));
  }

  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    return unexpected(make_error_code(errc::io_error));
  }

  bytes out(n);
  in.seekg(static_cast<std::streamoff>(offset));
  if (n > 0) {
    in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(n));
  }
  if (!in || static_cast<std::size_t>(in.gcount()) != n) {
    return unexpected(make_error_code(errc::io_error));
  }
  return out;
}

}  // namespace tlvtree
