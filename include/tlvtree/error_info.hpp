#pragma once

#include <tlvtree/error.hpp>
#include <tlvtree/expected.hpp>

#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace tlvtree {

/// A compact error object with:
/// - a stable error_code (domain + value)
/// - an optional detail string (field path, offsets, tag values)
/// - an optional underlying std::error_code (e.g. the byte-source failure behind a truncation)
struct error_info {
  std::error_code code{};
  std::string detail{};
  std::error_code cause_ec{};

  error_info() = default;

  error_info(errc e, std::string d = {}) : code(make_error_code(e)), detail(std::move(d)) {}

  auto append_detail(std::string_view s) -> error_info& {
    if (s.empty()) {
      return *this;
    }
    if (!detail.empty()) {
      detail += " ";
    }
    detail.append(s.data(), s.size());
    return *this;
  }

  auto set_cause(std::error_code ec) -> error_info& {
    cause_ec = ec;
    return *this;
  }

  [[nodiscard]] auto to_string() const -> std::string {
    std::string out;

    if (code) {
      out += code.category().name();
      out += ": ";
      out += code.message();
    } else {
      out += "unknown error";
    }

    if (!detail.empty()) {
      out += " (";
      out += detail;
      out += ")";
    }

    if (cause_ec) {
      out += " (cause=";
      out += cause_ec.category().name();
      out += ": ";
      out += cause_ec.message();
      out += ")";
    }

    return out;
  }
};

/// Shorthand for `return make_error(errc::x, "...");` at fallible call sites.
[[nodiscard]] inline auto make_error(errc e, std::string detail = {}) -> unexpected<error_info> {
  return unexpected<error_info>(error_info{e, std::move(detail)});
}

}  // namespace tlvtree
