#include "tests/test_schema.h"

#include <contig.hpp>

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace {

bool points_into(const void* ptr, std::span<const std::byte> buffer) {
  const auto* p = static_cast<const std::byte*>(ptr);
  return p >= buffer.data() && p < buffer.data() + buffer.size();
}

Sample make_sample(std::vector<std::int32_t>& values, std::string& name) {
  Sample s;
  s.id = 42;
  s.weight = 2.5;
  s.origin = Point{-3, 7};
  s.values = contig::as_slice(values);
  s.name = contig::slice<char>(name.data(), name.size());
  s.triple = {1, -2, 3};
  s.kind = Kind::Real;
  return s;
}

void check_round_trip(std::vector<std::int32_t> values, std::string name) {
  const Sample src = make_sample(values, name);

  std::vector<std::byte> buffer;
  const auto dumped = contig::Dumper::dump(src, buffer);
  assert(dumped.size() == contig::Dumper::length(src));
  assert(dumped.size() == sizeof(Sample) + 2 * sizeof(std::size_t) + values.size() * sizeof(std::int32_t) +
                              name.size());

  const contig::Loader loader;

  // Loading a copy leaves the dumped bytes untouched.
  std::vector<std::byte> copy_dst;
  const std::vector<std::byte> pristine = buffer;
  auto copied = loader.load_copy<Sample>(copy_dst, buffer);
  assert(copied.has_value());
  assert(buffer == pristine);
  assert(**copied == src);
  assert(copy_dst.size() == buffer.size());
  if (!values.empty()) {
    assert(points_into((*copied)->values.data(), copy_dst));
  } else {
    assert((*copied)->values.empty());
    assert((*copied)->values.data() == nullptr);
  }

  // In place, the record and its arrays alias the input.
  auto loaded = loader.load<Sample>(buffer);
  assert(loaded.has_value());
  assert(static_cast<void*>(*loaded) == static_cast<void*>(buffer.data()));
  assert(**loaded == src);
  assert((*loaded)->kind == Kind::Real);
  assert((*loaded)->origin == (Point{-3, 7}));
  if (!name.empty()) {
    assert(points_into((*loaded)->name.data(), buffer));
    assert(contig::as_string_view((*loaded)->name) == name);
  }

  // Loading the same buffer twice is harmless.
  auto again = loader.load<Sample>(buffer);
  assert(again.has_value());
  assert(**again == src);

  std::size_t extra = 1;
  auto consumed = loader.slice_arrays_bytes<Sample>(buffer, extra);
  assert(consumed.has_value());
  assert(*consumed == buffer.size());
  assert(extra == 0);
}

void check_tree() {
  std::vector<TreeNode> leaves{{1, {}}, {2, {}}};
  std::vector<TreeNode> middle{{10, contig::as_slice(leaves)}, {20, {}}};
  const TreeNode root{100, contig::as_slice(middle)};

  std::vector<TreeNode> other_leaves{{1, {}}, {3, {}}};
  std::vector<TreeNode> other_middle{{10, contig::as_slice(other_leaves)}, {20, {}}};
  const TreeNode other{100, contig::as_slice(other_middle)};
  assert(!(root == other));

  std::vector<std::byte> buffer;
  contig::Dumper::dump(root, buffer);

  const contig::Loader loader;
  auto loaded = loader.load<TreeNode>(buffer);
  assert(loaded.has_value());
  assert(**loaded == root);
  assert((*loaded)->children[0].children[1].value == 2);
  assert(points_into((*loaded)->children[0].children.data(), buffer));
}

void check_buffered_dumper() {
  std::vector<std::int32_t> many(64, 9);
  std::vector<std::int32_t> few{1};
  std::string name = "n";

  contig::BufferedDumper dumper;
  dumper.extend_only = true;
  const std::size_t long_size = dumper(make_sample(many, name)).size();
  const std::size_t short_size = dumper(make_sample(few, name)).size();
  assert(short_size < long_size);
  assert(dumper.data().size() == short_size);

  const contig::Loader loader;
  std::vector<std::byte> dst;
  auto loaded = loader.load_copy<Sample>(dst, dumper.data());
  assert(loaded.has_value());
  assert((*loaded)->values.size() == 1);

  dumper.minimize();
  assert(dumper.data().size() == short_size);
}

}  // namespace

int main() {
  check_round_trip({}, "");
  check_round_trip({5}, "x");
  check_round_trip({1, 2, 3, 4, 5, 6, 7, 8, 9, 10, -11, 12}, "a longer name for the sample");
  check_tree();
  check_buffered_dumper();
  return 0;
}
