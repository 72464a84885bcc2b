#pragma once

#include <tlvtree/endian.hpp>
#include <tlvtree/error.hpp>
#include <tlvtree/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <system_error>

namespace tlvtree {

/// Read-only, seekable view over bytes.
///
/// Contract:
/// - read(offset, n) returns exactly n bytes or fails with errc::out_of_range
/// - the source is not modified by decoding and is not referenced by the resulting tree
class byte_source {
 public:
  virtual ~byte_source() = default;

  /// Total number of bytes available.
  [[nodiscard]] virtual auto size() const -> expected<std::size_t, std::error_code> = 0;

  /// Copy `n` bytes starting at `offset`.
  [[nodiscard]] virtual auto read(std::size_t offset, std::size_t n) const
    -> expected<bytes, std::error_code> = 0;
};

/// In-memory source owning its buffer.
class memory_source final : public byte_source {
 public:
  memory_source() = default;
  explicit memory_source(bytes data) : data_(std::move(data)) {}
  explicit memory_source(std::span<std::uint8_t const> data) : data_(data.begin(), data.end()) {}

  [[nodiscard]] auto size() const -> expected<std::size_t, std::error_code> override {
    return data_.size();
  }

  [[nodiscard]] auto read(std::size_t offset, std::size_t n) const
    -> expected<bytes, std::error_code> override;

  [[nodiscard]] auto data() const noexcept -> bytes const& { return data_; }

 private:
  bytes data_{};
};

/// File-backed source.
///
/// The file is opened for each call and closed before returning, so no handle is held
/// across decode/mutate cycles.
class file_source final : public byte_source {
 public:
  explicit file_source(std::filesystem::path path) : path_(std::move(path)) {}

  [[nodiscard]] auto size() const -> expected<std::size_t, std::error_code> override;

  [[nodiscard]] auto read(std::size_t offset, std::size_t n) const
    -> expected<bytes, std::error_code> override;

  [[nodiscard]] auto path() const noexcept -> std::filesystem::path const& { return path_; }

 private:
  std::filesystem::path path_;
};

}  // namespace tlvtree

#include <tlvtree/impl/byte_source.ipp>
