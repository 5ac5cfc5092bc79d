#include "tests/test_schema.h"
#include "tests/version_schema.h"

#include <contig.hpp>

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

std::vector<std::byte> read_all_bytes(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  in.seekg(0, std::ios::end);
  const auto size = static_cast<std::size_t>(in.tellg());
  in.seekg(0, std::ios::beg);

  std::vector<std::byte> data(size);
  if (size > 0) {
    in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
  }
  return data;
}

void write_all_bytes(const std::filesystem::path& path, const std::vector<std::byte>& data) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

}  // namespace

int main() {
  const std::filesystem::path base = std::filesystem::temp_directory_path() / "contig_io";
  const std::filesystem::path good = base.string() + "_good.bin";
  const std::filesystem::path versioned = base.string() + "_versioned.bin";
  const std::filesystem::path bad_magic = base.string() + "_bad_magic.bin";
  const std::filesystem::path bad_header = base.string() + "_bad_header.bin";
  const std::filesystem::path truncated = base.string() + "_truncated.bin";
  const std::filesystem::path corrupt = base.string() + "_corrupt.bin";

  contig::VersionDecorator decorator;

  {
    contig::Contiguous<Sample> missing;
    const auto result = contig::read_binary(base.string() + "_missing.bin", missing, decorator);
    assert(!result.has_value());
    assert(result.error() == contig::io_error::open_failed);
  }

  std::vector<std::int32_t> values{4, 5, 6};
  std::string name = "persisted";
  Sample src;
  src.id = 77;
  src.values = contig::as_slice(values);
  src.name = contig::slice<char>(name.data(), name.size());
  src.kind = Kind::Real;

  assert(contig::write_binary(good, src).has_value());

  {
    contig::Contiguous<Sample> dst;
    const auto result = contig::read_binary(good, dst, decorator);
    assert(result.has_value());
    assert(**result == src);
    assert(dst.ptr() == *result);
    assert(dst.enforce_integrity().has_value());
  }

  {
    assert(contig::write_binary(versioned, RecordV0{10}).has_value());
    contig::Contiguous<RecordV2> dst;
    const auto result = contig::read_binary(versioned, dst, decorator);
    assert(result.has_value());
    assert((*result)->b == 15);
    assert((*result)->c == 16);
  }

  const auto good_bytes = read_all_bytes(good);
  assert(good_bytes.size() == contig::k_binary_header_size + contig::Dumper::length(src));

  {
    auto data = good_bytes;
    data[0] = static_cast<std::byte>('X');
    write_all_bytes(bad_magic, data);

    contig::Contiguous<Sample> dst;
    const auto result = contig::read_binary(bad_magic, dst, decorator);
    assert(!result.has_value());
    assert(result.error() == contig::io_error::invalid_header);
  }

  {
    std::vector<std::byte> data(good_bytes.begin(), good_bytes.begin() + 5);
    write_all_bytes(bad_header, data);

    contig::Contiguous<Sample> dst;
    const auto result = contig::read_binary(bad_header, dst, decorator);
    assert(!result.has_value());
    assert(result.error() == contig::io_error::read_failed);
  }

  {
    auto data = good_bytes;
    data.pop_back();
    write_all_bytes(truncated, data);

    contig::Contiguous<Sample> dst;
    const auto result = contig::read_binary(truncated, dst, decorator);
    assert(!result.has_value());
    assert(result.error() == contig::io_error::truncated_payload);
  }

  {
    auto data = good_bytes;
    contig::detail::store_length(data.data() + contig::k_binary_header_size + sizeof(Sample), 1U << 20U);
    write_all_bytes(corrupt, data);

    contig::Contiguous<Sample> dst;
    const auto result = contig::read_binary(corrupt, dst, decorator);
    assert(!result.has_value());
    assert(result.error() == contig::io_error::load_failed);
    assert(dst.empty());
  }

  std::filesystem::remove(good);
  std::filesystem::remove(versioned);
  std::filesystem::remove(bad_magic);
  std::filesystem::remove(bad_header);
  std::filesystem::remove(truncated);
  std::filesystem::remove(corrupt);

  return 0;
}
