#pragma once

#include <cstdint>

#include <contig.hpp>

struct RecordV0 {
  static constexpr contig::version_type contig_version = 0;

  std::int32_t a = 0;

  static constexpr auto contig_fields() { return contig::fields(CONTIG_FIELD(RecordV0, a)); }
};

struct RecordV1 {
  static constexpr contig::version_type contig_version = 1;
  using contig_previous = RecordV0;

  std::int32_t a = 0;
  std::int32_t b = 0;

  static constexpr auto contig_fields() { return contig::fields(CONTIG_FIELD(RecordV1, a), CONTIG_FIELD(RecordV1, b)); }

  static void contig_convert(const RecordV0& from, RecordV1& to, contig::ScratchArena&) { to.b = from.a + 5; }
};

struct RecordV2 {
  static constexpr contig::version_type contig_version = 2;
  using contig_previous = RecordV1;

  std::int32_t a = 0;
  std::int32_t b = 0;
  std::int32_t c = 0;

  static constexpr auto contig_fields() {
    return contig::fields(CONTIG_FIELD(RecordV2, a), CONTIG_FIELD(RecordV2, b), CONTIG_FIELD(RecordV2, c));
  }

  static void contig_convert(const RecordV1& from, RecordV2& to, contig::ScratchArena&) { to.c = from.b + 1; }
};

// A version 2 record whose chain stops at version 1.
struct Orphan {
  static constexpr contig::version_type contig_version = 2;

  std::int32_t a = 0;

  static constexpr auto contig_fields() { return contig::fields(CONTIG_FIELD(Orphan, a)); }
};

// Nested records and arrays of records that change between versions.
struct StopV0 {
  std::int32_t id = 0;
  contig::slice<char> name;

  static constexpr auto contig_fields() { return contig::fields(CONTIG_FIELD(StopV0, id), CONTIG_FIELD(StopV0, name)); }
};

struct StopV1 {
  std::int32_t id = 0;
  contig::slice<char> name;
  std::int32_t platform = -1;

  static constexpr auto contig_fields() {
    return contig::fields(CONTIG_FIELD(StopV1, id), CONTIG_FIELD(StopV1, name), CONTIG_FIELD(StopV1, platform));
  }

  static void contig_convert(const StopV0& from, StopV1& to, contig::ScratchArena&) { to.platform = from.id % 4; }
};

struct RouteV0 {
  static constexpr contig::version_type contig_version = 3;

  std::uint32_t line = 0;
  contig::slice<StopV0> stops;
  contig::slice<contig::slice<std::int32_t>> timetable;

  static constexpr auto contig_fields() {
    return contig::fields(CONTIG_FIELD(RouteV0, line), CONTIG_FIELD(RouteV0, stops),
                          CONTIG_FIELD(RouteV0, timetable));
  }
};

struct RouteV1 {
  static constexpr contig::version_type contig_version = 4;
  using contig_previous = RouteV0;

  std::uint32_t line = 0;
  contig::slice<StopV1> stops;
  contig::slice<contig::slice<std::int32_t>> timetable;
  StopV1 terminus{};

  static constexpr auto contig_fields() {
    return contig::fields(CONTIG_FIELD(RouteV1, line), CONTIG_FIELD(RouteV1, stops),
                          CONTIG_FIELD(RouteV1, timetable), CONTIG_FIELD(RouteV1, terminus));
  }

  static void contig_convert(const RouteV0& from, RouteV1& to, contig::ScratchArena& arena) {
    if (!from.stops.empty()) {
      contig::struct_copy(from.stops.back(), to.terminus, arena);
    }
  }
};

// A name carried unchanged through two conversions.
struct LabelV0 {
  static constexpr contig::version_type contig_version = 5;

  contig::slice<char> name;

  static constexpr auto contig_fields() { return contig::fields(CONTIG_FIELD(LabelV0, name)); }
};

struct LabelV1 {
  static constexpr contig::version_type contig_version = 6;
  using contig_previous = LabelV0;

  std::uint64_t x = 0;
  contig::slice<char> name;

  static constexpr auto contig_fields() { return contig::fields(CONTIG_FIELD(LabelV1, x), CONTIG_FIELD(LabelV1, name)); }

  static void contig_convert(const LabelV0& from, LabelV1& to, contig::ScratchArena&) { to.x = from.name.size(); }
};

struct LabelV2 {
  static constexpr contig::version_type contig_version = 7;
  using contig_previous = LabelV1;

  std::uint64_t y = 0;
  std::uint64_t x = 0;
  contig::slice<char> name;

  static constexpr auto contig_fields() {
    return contig::fields(CONTIG_FIELD(LabelV2, y), CONTIG_FIELD(LabelV2, x), CONTIG_FIELD(LabelV2, name));
  }

  static void contig_convert(const LabelV1& from, LabelV2& to, contig::ScratchArena&) { to.y = from.x * 2; }
};
