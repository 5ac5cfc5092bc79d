#include "examples/example.h"

#include <contig.hpp>

#include <bitsery/adapter/buffer.h>
#include <bitsery/deserializer.h>
#include <bitsery/serializer.h>
#include <bitsery/traits/string.h>
#include <bitsery/traits/vector.h>

#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

struct RawTrack {
  std::uint32_t id{};
  double length_seconds{};
  std::vector<std::int16_t> samples;
  std::vector<std::string> tags;
};

namespace bitsery {

template <typename S>
void serialize(S& s, RawTrack& v) {
  s.value4b(v.id);
  s.value8b(v.length_seconds);
  s.container2b(v.samples, 1U << 20U);
  s.container(v.tags, 1U << 10U, [](S& s2, std::string& tag) { s2.text1b(tag, 1U << 10U); });
}

}  // namespace bitsery

namespace {

std::uint32_t next_lcg(std::uint32_t& state) {
  state = state * 1664525U + 1013904223U;
  return state;
}

// Keeps the storage the contig views point at alive next to the raw record.
struct Source {
  RawTrack raw;
  std::vector<contig::slice<char>> tag_views;
  Track track{};
};

void build_source(std::size_t samples, std::size_t tags, Source& src) {
  std::uint32_t rng = 0xC0FFEE42U;
  src.raw.id = next_lcg(rng);
  src.raw.length_seconds = static_cast<double>(samples) / 44100.0;
  src.raw.samples.resize(samples);
  for (auto& sample : src.raw.samples) {
    sample = static_cast<std::int16_t>(next_lcg(rng) & 0xFFFFU);
  }
  src.raw.tags.clear();
  for (std::size_t i = 0; i < tags; ++i) {
    src.raw.tags.push_back("tag-" + std::to_string(next_lcg(rng) % 1000U));
  }

  src.tag_views.clear();
  for (auto& tag : src.raw.tags) {
    src.tag_views.emplace_back(tag.data(), tag.size());
  }

  src.track.id = src.raw.id;
  src.track.length_seconds = src.raw.length_seconds;
  src.track.samples = contig::as_slice(src.raw.samples);
  src.track.tags = contig::as_slice(src.tag_views);
}

template <typename F>
double measure_seconds(std::size_t iterations, F&& fn) {
  const auto start = std::chrono::steady_clock::now();
  for (std::size_t i = 0; i < iterations; ++i) {
    fn();
  }
  const auto end = std::chrono::steady_clock::now();
  return std::chrono::duration<double>(end - start).count();
}

double throughput_mib_per_s(std::size_t bytes_per_iteration, std::size_t iterations, double seconds) {
  const double total_bytes = static_cast<double>(bytes_per_iteration) * static_cast<double>(iterations);
  const double total_mib = total_bytes / (1024.0 * 1024.0);
  return total_mib / seconds;
}

}  // namespace

int main(int argc, char** argv) {
  std::size_t samples = 1 << 16;
  std::size_t iterations = 2000;
  if (argc >= 2) {
    samples = static_cast<std::size_t>(std::strtoull(argv[1], nullptr, 10));
  }
  if (argc >= 3) {
    iterations = static_cast<std::size_t>(std::strtoull(argv[2], nullptr, 10));
  }
  if (samples == 0 || iterations == 0) {
    std::cerr << "samples and iterations must be > 0\n";
    return 1;
  }

  Source src;
  build_source(samples, 16, src);

  std::vector<std::uint8_t> raw_blob;
  std::size_t raw_bytes = bitsery::quickSerialization(
      bitsery::OutputBufferAdapter<std::vector<std::uint8_t>>(raw_blob), src.raw);
  raw_blob.resize(raw_bytes);

  contig::BufferedDumper dumper;
  std::size_t contig_bytes = dumper(src.track).size();

  RawTrack raw_dst;
  contig::BufferedLoader<Track> buffered;
  contig::VersionDecorator decorator;
  std::uint64_t sink = 0;

  const double raw_ser_s = measure_seconds(iterations, [&] {
    raw_bytes = bitsery::quickSerialization(
        bitsery::OutputBufferAdapter<std::vector<std::uint8_t>>(raw_blob), src.raw);
    sink ^= static_cast<std::uint64_t>(raw_bytes);
  });

  const double contig_ser_s = measure_seconds(iterations, [&] {
    contig_bytes = dumper(src.track).size();
    sink ^= static_cast<std::uint64_t>(contig_bytes);
  });

  const double raw_des_s = measure_seconds(iterations, [&] {
    const auto [error, completed] = bitsery::quickDeserialization(
        bitsery::InputBufferAdapter<std::vector<std::uint8_t>>(raw_blob.begin(), raw_blob.begin() + raw_bytes),
        raw_dst);
    assert(error == bitsery::ReaderError::NoError && completed);
    sink ^= static_cast<std::uint64_t>(raw_dst.samples.back());
  });

  const double buffered_des_s = measure_seconds(iterations, [&] {
    auto loaded = buffered.load(dumper.data());
    assert(loaded.has_value());
    sink ^= static_cast<std::uint64_t>((*loaded)->samples.back());
  });

  const double fresh_des_s = measure_seconds(iterations, [&] {
    std::vector<std::byte> dst;
    auto loaded = decorator.load_copy<Track>(dst, dumper.data());
    assert(loaded.has_value());
    sink ^= static_cast<std::uint64_t>((*loaded)->samples.back());
  });

  std::cout << std::fixed << std::setprecision(2);
  std::cout << "samples=" << samples << " iterations=" << iterations << "\n";
  std::cout << "raw_blob_bytes=" << raw_bytes << " contig_blob_bytes=" << contig_bytes << "\n";
  std::cout << "serialize_bitsery_mib_s=" << throughput_mib_per_s(raw_bytes, iterations, raw_ser_s) << "\n";
  std::cout << "serialize_contig_mib_s=" << throughput_mib_per_s(contig_bytes, iterations, contig_ser_s) << "\n";
  std::cout << "deserialize_bitsery_mib_s=" << throughput_mib_per_s(raw_bytes, iterations, raw_des_s) << "\n";
  std::cout << "load_buffered_mib_s=" << throughput_mib_per_s(contig_bytes, iterations, buffered_des_s) << "\n";
  std::cout << "load_copy_fresh_mib_s=" << throughput_mib_per_s(contig_bytes, iterations, fresh_des_s) << "\n";
  std::cout << "checksum_sink=" << sink << "\n";

  return 0;
}
