#pragma once

#include <cstdint>

#include <contig.hpp>

// An audio track as it is stored on disk: fixed header plus sample data and
// a list of free-form tags.
struct Track {
  static constexpr contig::version_type contig_version = 1;

  std::uint32_t id = 0;
  double length_seconds = 0.0;
  contig::slice<std::int16_t> samples;
  contig::slice<contig::slice<char>> tags;

  static constexpr auto contig_fields() {
    return contig::fields(CONTIG_FIELD(Track, id), CONTIG_FIELD(Track, length_seconds),
                          CONTIG_FIELD(Track, samples), CONTIG_FIELD(Track, tags));
  }
};
