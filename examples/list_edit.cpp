#include <tlvtree/proto/basic.hpp>
#include <tlvtree/tlvtree.hpp>

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>

namespace {

void dump(tlvtree::parse_tree const& t, tlvtree::node_id id, int indent) {
  auto const& n = t[id];
  std::cout << std::string(static_cast<std::size_t>(indent) * 2, ' ')
            << (n.name.empty() ? "-" : n.name) << " : " << n.ty.name() << " @" << n.offset
            << " +" << n.size;
  if (auto const* v = std::get_if<std::uint64_t>(&n.value)) {
    std::cout << " = " << *v;
  } else if (std::holds_alternative<tlvtree::bytes>(n.value)) {
    std::cout << " = \"" << n.as_string() << "\"";
  }
  std::cout << (n.dirty ? " (dirty)" : "") << "\n";
  for (auto c : n.children) {
    dump(t, c, indent + 1);
  }
}

void print_hex(tlvtree::bytes const& b) {
  for (auto byte : b) {
    std::cout << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte) << ' ';
  }
  std::cout << std::dec << "\n";
}

}  // namespace

// Usage: list_edit [file]
// Decodes a list record (from `file`, or a built-in list of three integers), replaces its
// second element with a text record and prints the tree before and after resync.
int main(int argc, char** argv) {
  tlvtree::set_log_level(tlvtree::log_level::info);

  tlvtree::registry reg{};
  if (auto ok = tlvtree::proto::register_variants(reg); !ok) {
    std::cerr << "register failed: " << ok.error().to_string() << "\n";
    return 1;
  }

  tlvtree::expected<tlvtree::parse_tree, tlvtree::error_info> decoded{};
  if (argc > 1) {
    decoded = tlvtree::decode(tlvtree::record_type(reg), tlvtree::file_source{argv[1]});
  } else {
    tlvtree::bytes data{0x02, 0x24, 0x00, 0x00, 0x00, 0x03, 0x00, 0x00, 0x00};
    for (int i = 0; i < 3; ++i) {
      data.insert(data.end(), {0x00, 0x09, 0x00, 0x00, 0x00, 0x78, 0x56, 0x34, 0x12});
    }
    decoded = tlvtree::decode(tlvtree::record_type(reg), tlvtree::memory_source{data});
  }
  if (!decoded) {
    std::cerr << "decode failed: " << decoded.error().to_string() << "\n";
    return 1;
  }
  auto& tree = *decoded;
  dump(tree, tree.root(), 0);

  auto elements = tree.find("payload.elements");
  if (!elements || tree[*elements].children.size() < 2) {
    std::cerr << "not a list with at least two elements\n";
    return 1;
  }

  auto text = tlvtree::proto::make_text(reg, "hello world");
  if (!text) {
    std::cerr << "make_text failed: " << text.error().to_string() << "\n";
    return 1;
  }
  if (auto r = tlvtree::replace(tree, *elements, 1, *text); !r) {
    std::cerr << "replace failed: " << r.error().to_string() << "\n";
    return 1;
  }
  std::cout << "\nafter replace:\n";
  dump(tree, tree.root(), 0);

  if (auto r = tlvtree::resync(tree); !r) {
    std::cerr << "resync failed: " << r.error().to_string() << "\n";
    return 1;
  }
  std::cout << "\nafter resync:\n";
  dump(tree, tree.root(), 0);

  auto out = tlvtree::serialize(tree);
  if (!out) {
    std::cerr << "serialize failed: " << out.error().to_string() << "\n";
    return 1;
  }
  print_hex(*out);
  return 0;
}
