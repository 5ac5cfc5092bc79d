#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <limits>
#include <memory>
#include <source_location>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <bitsery/deserializer.h>
#include <bitsery/serializer.h>
#include <bitsery/traits/vector.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <tl/expected.hpp>

namespace contig {

// Type of the tag byte that leads the serialized data of a versioned record.
using version_type = std::uint8_t;

enum class load_errc {
  truncated_input,
  array_too_long,
  unknown_version,
  dangling_slice,
  nesting_too_deep,
};

inline constexpr std::string_view load_errc_message(load_errc code) {
  switch (code) {
    case load_errc::truncated_input:
      return "truncated_input";
    case load_errc::array_too_long:
      return "array_too_long";
    case load_errc::unknown_version:
      return "unknown_version";
    case load_errc::dangling_slice:
      return "dangling_slice";
    case load_errc::nesting_too_deep:
      return "nesting_too_deep";
  }
  return "unknown";
}

enum class io_error {
  open_failed,
  write_failed,
  read_failed,
  invalid_header,
  truncated_payload,
  load_failed,
};

inline constexpr std::string_view io_error_message(io_error error) {
  switch (error) {
    case io_error::open_failed:
      return "open_failed";
    case io_error::write_failed:
      return "write_failed";
    case io_error::read_failed:
      return "read_failed";
    case io_error::invalid_header:
      return "invalid_header";
    case io_error::truncated_payload:
      return "truncated_payload";
    case io_error::load_failed:
      return "load_failed";
  }
  return "unknown";
}

// Describes why a buffer could not be loaded. Holds no owned memory, so
// failing a load never allocates; message() formats on demand.
//
// required/available depend on the code:
//   truncated_input  bytes needed / bytes present
//   array_too_long   max_length / length prefix found
//   unknown_version  version expected / version tag found
//   dangling_slice   bytes referenced / size of the owning buffer
//   nesting_too_deep max_depth / depth of the rejected array
struct load_error {
  load_errc code = load_errc::truncated_input;
  std::string_view type{};
  std::size_t required = 0;
  std::size_t available = 0;
  const char* file = "";
  std::uint_least32_t line = 0;

  [[nodiscard]] std::string message() const;
};

inline std::string load_error::message() const {
  switch (code) {
    case load_errc::truncated_input:
      return fmt::format("Error loading {}: input data too short (need {} bytes, have {}) [{}:{}]",
                         type, required, available, file, line);
    case load_errc::array_too_long:
      return fmt::format("Error loading {}: array too long (length {}, max_length {}) [{}:{}]",
                         type, available, required, file, line);
    case load_errc::unknown_version:
      return fmt::format("Got version {} for {}, expected {}. Can't convert between these [{}:{}]",
                         available, type, required, file, line);
    case load_errc::dangling_slice:
      return fmt::format("Error checking {}: {} bytes referenced outside of the {} byte buffer [{}:{}]",
                         type, required, available, file, line);
    case load_errc::nesting_too_deep:
      return fmt::format("Error loading {}: arrays nested deeper than max_depth {} [{}:{}]",
                         type, required, file, line);
  }
  return std::string(load_errc_message(code));
}

namespace detail {

inline constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

template <typename T>
consteval std::string_view type_signature() {
#if defined(__clang__) || defined(__GNUC__)
  return __PRETTY_FUNCTION__;
#elif defined(_MSC_VER)
  return __FUNCSIG__;
#else
  return "contig::detail::type_signature";
#endif
}

template <typename T>
consteval std::string_view type_name() {
  const std::string_view signature = type_signature<T>();
  const std::size_t marker = signature.find("T = ");
  if (marker == std::string_view::npos) {
    return signature;
  }
  const std::size_t first = marker + 4;
  const std::size_t last = signature.find_first_of(";]", first);
  if (last == std::string_view::npos) {
    return signature.substr(first);
  }
  return signature.substr(first, last - first);
}

constexpr std::size_t align_up(std::size_t value, std::size_t alignment) {
  return (value + alignment - 1) / alignment * alignment;
}

constexpr std::size_t mul_sat(std::size_t lhs, std::size_t rhs) {
  if (lhs != 0 && rhs > std::numeric_limits<std::size_t>::max() / lhs) {
    return std::numeric_limits<std::size_t>::max();
  }
  return lhs * rhs;
}

constexpr std::size_t add_sat(std::size_t lhs, std::size_t rhs) {
  return rhs > std::numeric_limits<std::size_t>::max() - lhs ? std::numeric_limits<std::size_t>::max()
                                                             : lhs + rhs;
}

// Array length prefixes use the host's native size_t representation.
inline std::size_t load_length(const std::byte* ptr) {
  std::size_t value = 0;
  std::memcpy(&value, ptr, sizeof(value));
  return value;
}

inline void store_length(std::byte* ptr, std::size_t value) {
  std::memcpy(ptr, &value, sizeof(value));
}

inline void store_u64_le(std::byte* ptr, std::uint64_t value) {
  for (std::size_t i = 0; i < sizeof(std::uint64_t); ++i) {
    ptr[i] = static_cast<std::byte>((value >> (8U * i)) & 0xFFU);
  }
}

inline std::uint64_t load_u64_le(const std::byte* ptr) {
  std::uint64_t value = 0;
  for (std::size_t i = 0; i < sizeof(std::uint64_t); ++i) {
    value |= static_cast<std::uint64_t>(std::to_integer<std::uint8_t>(ptr[i])) << (8U * i);
  }
  return value;
}

template <typename T>
load_error make_error(load_errc code,
                      std::size_t required,
                      std::size_t available,
                      std::source_location where = std::source_location::current()) {
  return load_error{code, type_name<T>(), required, available, where.file_name(), where.line()};
}

inline tl::unexpected<load_error> log_failure(std::string_view operation, const load_error& error) {
  if (spdlog::default_logger_raw()->should_log(spdlog::level::debug)) {
    spdlog::debug("contig: {} failed: {}", operation, error.message());
  }
  return tl::make_unexpected(error);
}

template <typename T>
tl::expected<T, load_error> logged(tl::expected<T, load_error> result, std::string_view operation) {
  if (!result) {
    return log_failure(operation, result.error());
  }
  return result;
}

template <typename... Ts>
struct type_list {};

}  // namespace detail

// View of a dynamic array inside a record: a pointer and an element count.
// Which buffer it points into is decided by the loader entry point used; the
// view is only valid while that buffer is neither resized nor released.
template <typename T>
class slice {
 public:
  using value_type = T;
  using size_type = std::size_t;
  using iterator = T*;
  using const_iterator = const T*;

  constexpr slice() noexcept = default;
  constexpr slice(T* data, std::size_t size) noexcept : data_(data), size_(size) {}
  constexpr slice(std::span<T> elements) noexcept : data_(elements.data()), size_(elements.size()) {}

  [[nodiscard]] constexpr T* data() const noexcept { return data_; }
  [[nodiscard]] constexpr std::size_t size() const noexcept { return size_; }
  [[nodiscard]] constexpr std::size_t size_bytes() const noexcept { return size_ * sizeof(T); }
  [[nodiscard]] constexpr bool empty() const noexcept { return size_ == 0; }

  constexpr T* begin() const noexcept { return data_; }
  constexpr T* end() const noexcept { return data_ + size_; }

  constexpr T& operator[](std::size_t index) const { return data_[index]; }
  constexpr T& front() const { return data_[0]; }
  constexpr T& back() const { return data_[size_ - 1]; }

  constexpr operator std::span<T>() const noexcept { return {data_, size_}; }

  friend bool operator==(const slice& lhs, const slice& rhs) {
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
  }

 private:
  T* data_ = nullptr;
  std::size_t size_ = 0;
};

template <typename T>
slice<T> as_slice(std::vector<T>& values) {
  return slice<T>(values.data(), values.size());
}

inline std::string_view as_string_view(slice<char> text) {
  return std::string_view(text.data(), text.size());
}

template <typename S, typename T>
struct field_desc {
  using record_type = S;
  using value_type = T;

  std::string_view name;
  T S::*member;
};

template <typename S, typename T>
constexpr field_desc<S, T> field(std::string_view name, T S::*member) {
  return field_desc<S, T>{name, member};
}

template <typename... Fields>
constexpr std::tuple<Fields...> fields(Fields... descriptors) {
  return std::tuple<Fields...>{descriptors...};
}

#define CONTIG_FIELD(record, member) ::contig::field(#member, &record::member)

template <typename T, typename = void>
struct record_traits {};

template <typename T>
struct record_traits<T, std::void_t<decltype(T::contig_fields())>> {
  static constexpr auto fields = T::contig_fields();
  static constexpr std::size_t field_count = std::tuple_size_v<std::remove_cv_t<decltype(fields)>>;
};

template <typename T, typename = void>
struct has_record_traits : std::false_type {};

template <typename T>
struct has_record_traits<T, std::void_t<decltype(record_traits<T>::field_count)>> : std::true_type {};

template <typename T>
inline constexpr bool is_record_v = has_record_traits<std::remove_cv_t<T>>::value;

template <typename T>
struct is_slice : std::false_type {};

template <typename T>
struct is_slice<slice<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_slice_v = is_slice<std::remove_cv_t<T>>::value;

template <typename T>
struct is_static_array : std::false_type {};

template <typename T, std::size_t N>
struct is_static_array<std::array<T, N>> : std::true_type {};

template <typename T>
inline constexpr bool is_static_array_v = is_static_array<std::remove_cv_t<T>>::value;

template <typename S, std::size_t I>
using field_type_t =
    typename std::tuple_element_t<I, std::remove_cv_t<decltype(record_traits<S>::fields)>>::value_type;

namespace detail {

template <typename D>
using descriptor_value_t = typename std::remove_cvref_t<D>::value_type;

template <typename T>
constexpr bool contains_slice();

template <typename S, std::size_t... I>
constexpr bool any_field_contains_slice(std::index_sequence<I...>) {
  return (contains_slice<field_type_t<S, I>>() || ...);
}

template <typename T>
constexpr bool contains_slice() {
  using U = std::remove_cv_t<T>;
  if constexpr (is_slice_v<U>) {
    return true;
  } else if constexpr (is_static_array_v<U>) {
    return contains_slice<typename U::value_type>();
  } else if constexpr (is_record_v<U>) {
    return any_field_contains_slice<U>(std::make_index_sequence<record_traits<U>::field_count>{});
  } else {
    return false;
  }
}

template <typename T, typename... Seen>
constexpr bool has_branched_slices(type_list<Seen...> seen);

template <typename S, typename... Seen, std::size_t... I>
constexpr bool any_field_has_branched_slices(type_list<Seen...>, std::index_sequence<I...>) {
  return (has_branched_slices<field_type_t<S, I>>(type_list<S, Seen...>{}) || ...);
}

// Records may refer to themselves through a slice, so visited records are
// tracked to end the recursion.
template <typename T, typename... Seen>
constexpr bool has_branched_slices(type_list<Seen...> seen) {
  using U = std::remove_cv_t<T>;
  if constexpr ((std::is_same_v<U, Seen> || ...)) {
    return false;
  } else if constexpr (is_slice_v<U>) {
    if constexpr (is_slice_v<typename U::value_type>) {
      return true;
    } else {
      return has_branched_slices<typename U::value_type>(seen);
    }
  } else if constexpr (is_static_array_v<U>) {
    return has_branched_slices<typename U::value_type>(seen);
  } else if constexpr (is_record_v<U>) {
    return any_field_has_branched_slices<U>(seen, std::make_index_sequence<record_traits<U>::field_count>{});
  } else {
    return false;
  }
}

// Calls fn with every field descriptor of S in declaration order until fn
// returns false.
template <typename S, typename F>
constexpr bool for_each_field(F&& fn) {
  return [&]<std::size_t... I>(std::index_sequence<I...>) {
    return (fn(std::get<I>(record_traits<S>::fields)) && ...);
  }(std::make_index_sequence<record_traits<S>::field_count>{});
}

}  // namespace detail

// True if a dynamic array is reachable from T.
template <typename T>
inline constexpr bool contains_slice_v = detail::contains_slice<T>();

// True if T reaches a slice<slice<U>>, whose element views have no bytes in
// the serialized data and need extra storage at load time.
template <typename T>
inline constexpr bool has_branched_slices_v = detail::has_branched_slices<T>(detail::type_list<>{});

template <typename S>
constexpr void check_record() {
  static_assert(is_record_v<S>, "contig records must declare static constexpr contig_fields()");
  static_assert(std::is_trivially_copyable_v<S>, "contig records must be trivially copyable");
  static_assert(std::is_standard_layout_v<S>, "contig records must have standard layout");
}

template <typename T, typename = void>
struct version_traits {
  static constexpr bool exists = false;
};

template <typename T>
struct version_traits<T, std::void_t<decltype(T::contig_version)>> {
  static_assert(T::contig_version >= 0 && T::contig_version <= std::numeric_limits<version_type>::max(),
                "contig_version must fit into contig::version_type");

  static constexpr bool exists = true;
  static constexpr version_type number = static_cast<version_type>(T::contig_version);
};

template <typename T>
inline constexpr bool has_version_v = version_traits<T>::exists;

template <typename T, typename = void>
struct has_previous_version : std::false_type {};

template <typename T>
struct has_previous_version<T, std::void_t<typename T::contig_previous>> : std::true_type {};

template <typename T>
inline constexpr bool has_previous_version_v = has_previous_version<T>::value;

template <typename T>
using previous_version_t = typename T::contig_previous;

template <typename S>
class Contiguous;

namespace detail {

inline constexpr std::size_t k_slice_alignment = alignof(slice<std::byte>);

// Bump allocator handing out element storage for branched arrays, strictly in
// the order the patch pass asks for it.
class slice_allocator {
 public:
  slice_allocator(std::byte* base, std::size_t begin, std::size_t end) : base_(base), pos_(begin), end_(end) {}

  template <typename T>
  tl::expected<std::byte*, load_error> allocate(std::size_t bytes) {
    if (pos_ > end_ || end_ - pos_ < bytes) {
      return tl::make_unexpected(make_error<T>(load_errc::truncated_input, add_sat(pos_, bytes), end_));
    }
    std::byte* out = base_ + pos_;
    pos_ += bytes;
    return out;
  }

 private:
  std::byte* base_;
  std::size_t pos_;
  std::size_t end_;
};

struct no_slice_storage {
  template <typename T>
  tl::expected<std::byte*, load_error> allocate(std::size_t bytes) const {
    return tl::make_unexpected(make_error<T>(load_errc::truncated_input, bytes, 0));
  }
};

}  // namespace detail

// Loads records from data produced by Dumper by pointing their dynamic arrays
// at the right parts of a buffer.
//
// Every entry point states which buffer backs the returned record. A record
// pointer becomes dangling as soon as that buffer is resized or released, so
// never resize a loaded buffer without zeroing it or dropping the record
// first. A Loader has no shared state; use one instance per thread.
//
// The format has no padding between arrays, so the elements of a value array
// may start at an address that is not aligned for their type. Loaded records
// are only usable on platforms that allow unaligned loads, such as x86-64 and
// AArch64.
class Loader {
 public:
  // Longest dynamic array accepted. A longer length prefix is corrupt data.
  std::size_t max_length = std::numeric_limits<std::size_t>::max();

  // Deepest chain of arrays inside arrays accepted; the top-level arrays of a
  // record are at depth 0. Bounds the recursion of self-referential records.
  std::size_t max_depth = 1024;

  // Patches src in place. The record and all of its arrays alias src, which
  // must be suitably aligned for S. S must not contain branched arrays.
  template <typename S>
  [[nodiscard]] tl::expected<S*, load_error> load(std::span<std::byte> src) const {
    static_assert(!has_branched_slices_v<S>,
                  "load() cannot place branched arrays; use load_extend, load_copy or load_slice");
    return detail::logged(set_slices_impl<S, false>(src), "load").map([](std::span<std::byte> data) {
      return reinterpret_cast<S*>(data.data());
    });
  }

  // Like load(), but resizes src to exactly the consumed bytes plus the
  // storage of the branched arrays, which is carved from the new tail.
  template <typename S>
  [[nodiscard]] tl::expected<S*, load_error> load_extend(std::vector<std::byte>& src) const {
    std::size_t extra = 0;
    auto data_len = measure<S>(src, extra);
    if (!data_len) {
      return detail::log_failure("load_extend", data_len.error());
    }
    src.resize(*data_len + extra);
    return detail::logged(set_slices_impl<S, true>(src), "load_extend").map([](std::span<std::byte> data) {
      return reinterpret_cast<S*>(data.data());
    });
  }

  // Patches src in place and returns the prefix of src backing the record.
  // With AllowBranched, src must already hold the branched array storage
  // behind the consumed bytes, as left by load_extend or load_copy; this
  // re-targets the views after such a buffer was copied or moved.
  template <typename S, bool AllowBranched = false>
  [[nodiscard]] tl::expected<std::span<std::byte>, load_error> set_slices(std::span<std::byte> src) const {
    return detail::logged(set_slices_impl<S, AllowBranched>(src), "set_slices");
  }

  // Copies the consumed part of src into dst and loads the record there.
  // dst is allocated when empty and grown when too small. With
  // only_extend_dst a larger dst keeps its size and its stale tail is zeroed.
  // The record and all arrays alias dst; src is left untouched and must not
  // alias dst.
  template <typename S>
  [[nodiscard]] tl::expected<S*, load_error> load_copy(std::vector<std::byte>& dst,
                                                       std::span<const std::byte> src,
                                                       bool only_extend_dst = false) const {
    return load_copy_raw<S>(dst, src, only_extend_dst).map([](std::span<std::byte> data) {
      return reinterpret_cast<S*>(data.data());
    });
  }

  template <typename S>
  [[nodiscard]] tl::expected<std::span<std::byte>, load_error> load_copy_raw(std::vector<std::byte>& dst,
                                                                             std::span<const std::byte> src,
                                                                             bool only_extend_dst = false) const {
    std::size_t extra = 0;
    auto data_len = measure<S>(src, extra);
    if (!data_len) {
      return detail::log_failure("load_copy", data_len.error());
    }

    auto actual = init_dst(dst, src.first(*data_len), extra, only_extend_dst);
    detail::slice_allocator allocator(
        actual.data(), detail::align_up(*data_len, detail::k_slice_alignment), actual.size());
    auto used = patch<S, true>(actual.first(*data_len), allocator);
    if (!used) {
      return detail::log_failure("load_copy", used.error());
    }
    return actual;
  }

  // Loads the record without ever resizing src: value arrays alias src while
  // the element views of branched arrays live in slices_buffer, which is
  // resized to fit (only grown with only_extend_buffer).
  template <typename S>
  [[nodiscard]] tl::expected<S*, load_error> load_slice(std::span<std::byte> src,
                                                        std::vector<std::byte>& slices_buffer,
                                                        bool only_extend_buffer = false) const {
    return load_slice_raw<S>(src, slices_buffer, only_extend_buffer).map([](std::span<std::byte> data) {
      return reinterpret_cast<S*>(data.data());
    });
  }

  template <typename S>
  [[nodiscard]] tl::expected<std::span<std::byte>, load_error> load_slice_raw(
      std::span<std::byte> src,
      std::vector<std::byte>& slices_buffer,
      bool only_extend_buffer = false) const {
    std::size_t extra = 0;
    auto data_len = measure<S>(src, extra);
    if (!data_len) {
      return detail::log_failure("load_slice", data_len.error());
    }

    if (slices_buffer.size() != extra && (slices_buffer.size() < extra || !only_extend_buffer)) {
      slices_buffer.resize(extra);
    }
    detail::slice_allocator allocator(slices_buffer.data(), 0, extra);
    auto used = patch<S, true>(src.first(*data_len), allocator);
    if (!used) {
      return detail::log_failure("load_slice", used.error());
    }
    return src.first(*data_len);
  }

  // Size pass. Returns the number of bytes of data the record occupies and
  // sets extra to the bytes needed behind them for branched array storage,
  // including the padding that aligns that storage.
  template <typename S>
  [[nodiscard]] tl::expected<std::size_t, load_error> slice_arrays_bytes(std::span<const std::byte> data,
                                                                         std::size_t& extra) const {
    return detail::logged(measure<S>(data, extra), "slice_arrays_bytes");
  }

  // Deep copy of a loaded record; dst's arrays are re-targeted to dst.
  template <typename S>
  [[nodiscard]] tl::expected<S*, load_error> copy(const Contiguous<S>& src, Contiguous<S>& dst) const {
    return load_copy<S>(dst.buffer(), src.bytes());
  }

  // Sets dst to src followed by extra_bytes zero bytes and returns that
  // prefix. With only_extend_dst a longer dst keeps its length; everything
  // behind src is zeroed either way.
  static std::span<std::byte> init_dst(std::vector<std::byte>& dst,
                                       std::span<const std::byte> src,
                                       std::size_t extra_bytes,
                                       bool only_extend_dst = false) {
    const std::size_t total_len = src.size() + extra_bytes;
    if (dst.size() < total_len || !only_extend_dst) {
      dst.resize(total_len);
    }
    if (!src.empty()) {
      std::memmove(dst.data(), src.data(), src.size());
    }
    std::fill(dst.begin() + static_cast<std::ptrdiff_t>(src.size()), dst.end(), std::byte{0});
    return std::span<std::byte>(dst).first(total_len);
  }

 private:
  template <typename S>
  tl::expected<std::size_t, load_error> measure(std::span<const std::byte> data, std::size_t& extra) const {
    check_record<S>();
    extra = 0;
    if (data.size() < sizeof(S)) {
      return tl::make_unexpected(detail::make_error<S>(load_errc::truncated_input, sizeof(S), data.size()));
    }

    std::size_t slices_len = 0;
    auto arrays_len = arrays_bytes<S>(data.subspan(sizeof(S)), slices_len, 0);
    if (!arrays_len) {
      return arrays_len;
    }

    const std::size_t data_len = sizeof(S) + *arrays_len;
    if (slices_len != 0) {
      extra = detail::align_up(data_len, detail::k_slice_alignment) - data_len + slices_len;
    }
    return data_len;
  }

  template <typename S, bool AllowBranched>
  tl::expected<std::span<std::byte>, load_error> set_slices_impl(std::span<std::byte> src) const {
    check_record<S>();
    if (src.size() < sizeof(S)) {
      return tl::make_unexpected(detail::make_error<S>(load_errc::truncated_input, sizeof(S), src.size()));
    }

    if constexpr (AllowBranched) {
      std::size_t extra = 0;
      auto data_len = measure<S>(src, extra);
      if (!data_len) {
        return tl::make_unexpected(data_len.error());
      }

      const std::size_t total_len = *data_len + extra;
      if (src.size() < total_len) {
        return tl::make_unexpected(detail::make_error<S>(load_errc::truncated_input, total_len, src.size()));
      }

      detail::slice_allocator allocator(
          src.data(), detail::align_up(*data_len, detail::k_slice_alignment), total_len);
      auto used = patch<S, true>(src.first(*data_len), allocator);
      if (!used) {
        return tl::make_unexpected(used.error());
      }
      return src.first(total_len);
    } else {
      detail::no_slice_storage allocator;
      auto used = patch<S, false>(src, allocator);
      if (!used) {
        return tl::make_unexpected(used.error());
      }
      return src.first(*used);
    }
  }

  template <typename S, bool AllowBranched, typename Allocator>
  tl::expected<std::size_t, load_error> patch(std::span<std::byte> data, Allocator& allocator) const {
    auto used = slice_value<AllowBranched>(*reinterpret_cast<S*>(data.data()), data.subspan(sizeof(S)), allocator, 0);
    if (!used) {
      return used;
    }
    return sizeof(S) + *used;
  }

  // Validates the length prefix of a slice<T> block at the start of data.
  template <typename T>
  tl::expected<std::size_t, load_error> read_length(std::span<const std::byte> data) const {
    constexpr std::size_t prefix = sizeof(std::size_t);
    if (data.size() < prefix) {
      return tl::make_unexpected(detail::make_error<slice<T>>(load_errc::truncated_input, prefix, data.size()));
    }

    const std::size_t len = detail::load_length(data.data());
    if (len > max_length) {
      return tl::make_unexpected(detail::make_error<slice<T>>(load_errc::array_too_long, max_length, len));
    }

    // An element of a branched array occupies at least its own length prefix.
    constexpr std::size_t min_element_bytes = is_slice_v<T> ? prefix : sizeof(T);
    if (len > (data.size() - prefix) / min_element_bytes) {
      return tl::make_unexpected(detail::make_error<slice<T>>(
          load_errc::truncated_input, detail::add_sat(prefix, detail::mul_sat(len, min_element_bytes)),
          data.size()));
    }
    return len;
  }

  template <typename T>
  tl::expected<std::size_t, load_error> arrays_bytes(std::span<const std::byte> data,
                                                     std::size_t& extra,
                                                     std::size_t depth) const {
    if constexpr (is_slice_v<T>) {
      return array_bytes<typename T::value_type>(data, extra, depth);
    } else if constexpr (is_static_array_v<T>) {
      return elements_arrays_bytes<typename T::value_type>(std::tuple_size_v<T>, data, extra, depth);
    } else {
      std::size_t pos = 0;
      load_error error{};
      const bool ok = detail::for_each_field<T>([&]([[maybe_unused]] const auto& field) {
        using F = detail::descriptor_value_t<decltype(field)>;
        if constexpr (contains_slice_v<F>) {
          auto consumed = arrays_bytes<F>(data.subspan(pos), extra, depth);
          if (!consumed) {
            error = consumed.error();
            return false;
          }
          pos += *consumed;
        }
        return true;
      });
      if (!ok) {
        return tl::make_unexpected(error);
      }
      return pos;
    }
  }

  template <typename T>
  tl::expected<std::size_t, load_error> elements_arrays_bytes(std::size_t count,
                                                              std::span<const std::byte> data,
                                                              std::size_t& extra,
                                                              std::size_t depth) const {
    std::size_t pos = 0;
    for (std::size_t i = 0; i < count; ++i) {
      auto consumed = arrays_bytes<T>(data.subspan(pos), extra, depth);
      if (!consumed) {
        return consumed;
      }
      pos += *consumed;
    }
    return pos;
  }

  template <typename T>
  tl::expected<std::size_t, load_error> array_bytes(std::span<const std::byte> data,
                                                    std::size_t& extra,
                                                    std::size_t depth) const {
    if (depth >= max_depth) {
      return tl::make_unexpected(detail::make_error<slice<T>>(load_errc::nesting_too_deep, max_depth, depth));
    }
    auto len = read_length<T>(data);
    if (!len) {
      return len;
    }

    std::size_t pos = sizeof(std::size_t);
    if constexpr (is_slice_v<T>) {
      extra += *len * sizeof(T);
    } else {
      pos += *len * sizeof(T);
    }

    if constexpr (contains_slice_v<T>) {
      auto sub = elements_arrays_bytes<T>(*len, data.subspan(pos), extra, depth + 1);
      if (!sub) {
        return sub;
      }
      pos += *sub;
    }
    return pos;
  }

  template <bool AllowBranched, typename T, typename Allocator>
  tl::expected<std::size_t, load_error> slice_value(T& value,
                                                    std::span<std::byte> data,
                                                    Allocator& allocator,
                                                    std::size_t depth) const {
    if constexpr (is_slice_v<T>) {
      return slice_array<AllowBranched>(value, data, allocator, depth);
    } else if constexpr (is_static_array_v<T>) {
      return slice_elements<AllowBranched>(std::span<typename T::value_type>(value), data, allocator, depth);
    } else {
      std::size_t pos = 0;
      load_error error{};
      const bool ok = detail::for_each_field<T>([&]([[maybe_unused]] const auto& field) {
        using F = detail::descriptor_value_t<decltype(field)>;
        if constexpr (contains_slice_v<F>) {
          auto consumed = slice_value<AllowBranched>(value.*(field.member), data.subspan(pos), allocator, depth);
          if (!consumed) {
            error = consumed.error();
            return false;
          }
          pos += *consumed;
        }
        return true;
      });
      if (!ok) {
        return tl::make_unexpected(error);
      }
      return pos;
    }
  }

  template <bool AllowBranched, typename T, typename Allocator>
  tl::expected<std::size_t, load_error> slice_elements(std::span<T> elements,
                                                       std::span<std::byte> data,
                                                       Allocator& allocator,
                                                       std::size_t depth) const {
    std::size_t pos = 0;
    for (T& element : elements) {
      auto consumed = slice_value<AllowBranched>(element, data.subspan(pos), allocator, depth);
      if (!consumed) {
        return consumed;
      }
      pos += *consumed;
    }
    return pos;
  }

  template <bool AllowBranched, typename T, typename Allocator>
  tl::expected<std::size_t, load_error> slice_array(slice<T>& array,
                                                    std::span<std::byte> data,
                                                    Allocator& allocator,
                                                    std::size_t depth) const {
    if (depth >= max_depth) {
      return tl::make_unexpected(detail::make_error<slice<T>>(load_errc::nesting_too_deep, max_depth, depth));
    }
    auto len = read_length<T>(data);
    if (!len) {
      return len;
    }

    std::size_t pos = sizeof(std::size_t);
    array = slice<T>{};
    if constexpr (is_slice_v<T>) {
      static_assert(AllowBranched, "branched dynamic array found where branched arrays are not allowed");
      if (*len != 0) {
        auto storage = allocator.template allocate<slice<T>>(*len * sizeof(T));
        if (!storage) {
          return tl::make_unexpected(storage.error());
        }
        T* elements = reinterpret_cast<T*>(*storage);
        std::uninitialized_value_construct_n(elements, *len);
        array = slice<T>(elements, *len);
      }
    } else {
      if (*len != 0) {
        array = slice<T>(reinterpret_cast<T*>(data.data() + pos), *len);
      }
      pos += *len * sizeof(T);
    }

    if constexpr (contains_slice_v<T>) {
      auto sub = slice_elements<AllowBranched>(
          std::span<T>(array.data(), array.size()), data.subspan(pos), allocator, depth + 1);
      if (!sub) {
        return sub;
      }
      pos += *sub;
    }
    return pos;
  }
};

// Writes records in the layout Loader reads: an optional version byte, the
// record bytes with every dynamic array view zeroed, then one length-prefixed
// block per dynamic array in field declaration order.
class Dumper {
 public:
  template <typename S>
  static std::size_t length(const S& input) {
    return version_tag_size<S>() + raw_length(input);
  }

  template <typename S>
  static std::size_t raw_length(const S& input) {
    check_record<S>();
    return sizeof(S) + arrays_length(input);
  }

  // Serializes input into buffer, preceded by the version tag if S declares
  // one. With extend_only a longer buffer is not shrunk.
  template <typename S>
  static std::span<std::byte> dump(const S& input, std::vector<std::byte>& buffer, bool extend_only = false) {
    auto out = resize(buffer, length(input), extend_only);
    if constexpr (has_version_v<S>) {
      out[0] = static_cast<std::byte>(version_traits<S>::number);
    }
    write(input, out.data() + version_tag_size<S>());
    return out;
  }

  // Serializes input without a version tag.
  template <typename S>
  static std::span<std::byte> dump_raw(const S& input, std::vector<std::byte>& buffer, bool extend_only = false) {
    auto out = resize(buffer, raw_length(input), extend_only);
    write(input, out.data());
    return out;
  }

 private:
  template <typename S>
  static constexpr std::size_t version_tag_size() {
    return has_version_v<S> ? sizeof(version_type) : 0;
  }

  static std::span<std::byte> resize(std::vector<std::byte>& buffer, std::size_t len, bool extend_only) {
    if (len > buffer.size() || (len < buffer.size() && !extend_only)) {
      buffer.resize(len);
    }
    return std::span<std::byte>(buffer).first(len);
  }

  template <typename S>
  static void write(const S& input, std::byte* out) {
    S header = input;
    reset_slices(header);
    std::memcpy(out, &header, sizeof(S));
    dump_arrays(input, out + sizeof(S));
  }

  template <typename T>
  static std::size_t arrays_length(const T& value) {
    if constexpr (!contains_slice_v<T>) {
      return 0;
    } else if constexpr (is_slice_v<T>) {
      using E = typename T::value_type;
      std::size_t len = sizeof(std::size_t);
      if constexpr (!is_slice_v<E>) {
        len += value.size() * sizeof(E);
      }
      if constexpr (contains_slice_v<E>) {
        for (const E& element : value) {
          len += arrays_length(element);
        }
      }
      return len;
    } else if constexpr (is_static_array_v<T>) {
      std::size_t len = 0;
      for (const auto& element : value) {
        len += arrays_length(element);
      }
      return len;
    } else {
      std::size_t len = 0;
      detail::for_each_field<T>([&](const auto& field) {
        len += arrays_length(value.*(field.member));
        return true;
      });
      return len;
    }
  }

  template <typename T>
  static void reset_slices(T& value) {
    if constexpr (!contains_slice_v<T>) {
      return;
    } else if constexpr (is_slice_v<T>) {
      value = T{};
    } else if constexpr (is_static_array_v<T>) {
      for (auto& element : value) {
        reset_slices(element);
      }
    } else {
      detail::for_each_field<T>([&](const auto& field) {
        reset_slices(value.*(field.member));
        return true;
      });
    }
  }

  template <typename T>
  static std::byte* dump_arrays(const T& value, std::byte* out) {
    if constexpr (!contains_slice_v<T>) {
      return out;
    } else if constexpr (is_slice_v<T>) {
      return dump_array(value, out);
    } else if constexpr (is_static_array_v<T>) {
      for (const auto& element : value) {
        out = dump_arrays(element, out);
      }
      return out;
    } else {
      detail::for_each_field<T>([&](const auto& field) {
        out = dump_arrays(value.*(field.member), out);
        return true;
      });
      return out;
    }
  }

  template <typename E>
  static std::byte* dump_array(const slice<E>& array, std::byte* out) {
    detail::store_length(out, array.size());
    out += sizeof(std::size_t);

    if constexpr (is_slice_v<E>) {
      for (const E& element : array) {
        out = dump_array(element, out);
      }
    } else if constexpr (contains_slice_v<E>) {
      for (const E& element : array) {
        E copy = element;
        reset_slices(copy);
        std::memcpy(out, &copy, sizeof(E));
        out += sizeof(E);
      }
      for (const E& element : array) {
        out = dump_arrays(element, out);
      }
    } else if (!array.empty()) {
      std::memcpy(out, array.data(), array.size_bytes());
      out += array.size_bytes();
    }
    return out;
  }
};

// Dumper bundled with one output buffer that is reused across calls.
class BufferedDumper {
 public:
  // Never shrink the buffer when a shorter record is dumped.
  bool extend_only = false;

  explicit BufferedDumper(std::size_t bytes_reserved = 0) : buffer_(bytes_reserved) {}

  template <typename S>
  std::span<const std::byte> operator()(const S& input) {
    used_ = Dumper::dump(input, buffer_, extend_only).size();
    return data();
  }

  [[nodiscard]] std::span<const std::byte> data() const { return std::span<const std::byte>(buffer_).first(used_); }

  void minimize() {
    buffer_.resize(used_);
    buffer_.shrink_to_fit();
  }

 private:
  std::vector<std::byte> buffer_;
  std::size_t used_ = 0;
};

namespace detail {

template <typename T>
tl::expected<void, load_error> check_slices(const T& value, std::uintptr_t begin, std::uintptr_t end) {
  if constexpr (!contains_slice_v<T>) {
    return {};
  } else if constexpr (is_slice_v<T>) {
    using E = typename T::value_type;
    if (!value.empty()) {
      const auto first = reinterpret_cast<std::uintptr_t>(value.data());
      if (first < begin || first > end || end - first < value.size_bytes()) {
        return tl::make_unexpected(make_error<T>(load_errc::dangling_slice, value.size_bytes(), end - begin));
      }
    }
    if constexpr (contains_slice_v<E>) {
      for (const E& element : value) {
        auto checked = check_slices(element, begin, end);
        if (!checked) {
          return checked;
        }
      }
    }
    return {};
  } else if constexpr (is_static_array_v<T>) {
    for (const auto& element : value) {
      auto checked = check_slices(element, begin, end);
      if (!checked) {
        return checked;
      }
    }
    return {};
  } else {
    tl::expected<void, load_error> result{};
    for_each_field<T>([&](const auto& field) {
      result = check_slices(value.*(field.member), begin, end);
      return result.has_value();
    });
    return result;
  }
}

}  // namespace detail

// Owns a buffer whose prefix is a loaded S with every array pointing into the
// same buffer. Moving keeps the heap storage and therefore the views; copying
// bytes would not, so copies go through Loader::copy.
template <typename S>
class Contiguous {
 public:
  Contiguous() = default;
  Contiguous(const Contiguous&) = delete;
  Contiguous& operator=(const Contiguous&) = delete;
  Contiguous(Contiguous&&) noexcept = default;
  Contiguous& operator=(Contiguous&&) noexcept = default;

  [[nodiscard]] S* ptr() { return data_.empty() ? nullptr : reinterpret_cast<S*>(data_.data()); }
  [[nodiscard]] const S* ptr() const { return data_.empty() ? nullptr : reinterpret_cast<const S*>(data_.data()); }

  S* operator->() { return ptr(); }
  const S* operator->() const { return ptr(); }
  S& operator*() { return *ptr(); }
  const S& operator*() const { return *ptr(); }

  [[nodiscard]] std::span<const std::byte> bytes() const { return data_; }
  [[nodiscard]] bool empty() const { return data_.empty(); }

  // Storage handed to loaders as destination buffer.
  std::vector<std::byte>& buffer() { return data_; }

  void reset() { data_.clear(); }

  // Fails with dangling_slice if any non-empty array of the record points
  // outside of the owned buffer.
  [[nodiscard]] tl::expected<void, load_error> enforce_integrity() const {
    if (data_.empty()) {
      return {};
    }
    if (data_.size() < sizeof(S)) {
      return tl::make_unexpected(detail::make_error<S>(load_errc::truncated_input, sizeof(S), data_.size()));
    }
    const auto begin = reinterpret_cast<std::uintptr_t>(data_.data());
    return detail::check_slices(*ptr(), begin, begin + data_.size());
  }

 private:
  std::vector<std::byte> data_;
};

// Scratch memory for struct conversions. Allocations keep their address until
// clear(); chunks are kept for reuse.
class ScratchArena {
 public:
  explicit ScratchArena(std::size_t chunk_size = 512) : chunk_size_(chunk_size == 0 ? 1 : chunk_size) {}

  std::span<std::byte> allocate(std::size_t bytes) {
    if (bytes == 0) {
      return {};
    }
    while (current_ < chunks_.size()) {
      chunk& c = chunks_[current_];
      const std::size_t offset = detail::align_up(used_, alignof(std::max_align_t));
      if (offset <= c.size && c.size - offset >= bytes) {
        used_ = offset + bytes;
        return std::span<std::byte>(c.data.get() + offset, bytes);
      }
      ++current_;
      used_ = 0;
    }

    const std::size_t size = std::max(chunk_size_, bytes);
    chunks_.push_back(chunk{std::make_unique<std::byte[]>(size), size});
    current_ = chunks_.size() - 1;
    used_ = bytes;
    return std::span<std::byte>(chunks_.back().data.get(), bytes);
  }

  template <typename T>
  slice<T> make_slice(std::size_t count) {
    static_assert(alignof(T) <= alignof(std::max_align_t), "over-aligned element type");
    if (count == 0) {
      return {};
    }
    auto storage = allocate(count * sizeof(T));
    T* elements = reinterpret_cast<T*>(storage.data());
    std::uninitialized_value_construct_n(elements, count);
    return slice<T>(elements, count);
  }

  void clear() {
    current_ = 0;
    used_ = 0;
  }

 private:
  struct chunk {
    std::unique_ptr<std::byte[]> data;
    std::size_t size;
  };

  std::vector<chunk> chunks_;
  std::size_t current_ = 0;
  std::size_t used_ = 0;
  std::size_t chunk_size_;
};

template <typename To, typename From>
concept has_convert_hook = requires(const From& from, To& to, ScratchArena& arena) {
  To::contig_convert(from, to, arena);
};

template <typename From, typename To>
void struct_copy(const From& from, To& to, ScratchArena& arena);

namespace detail {

template <typename S>
consteval auto field_names() {
  return std::apply(
      [](const auto&... descriptors) { return std::array<std::string_view, sizeof...(descriptors)>{descriptors.name...}; },
      record_traits<S>::fields);
}

template <typename S>
consteval std::size_t field_index(std::string_view name) {
  const auto names = field_names<S>();
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (names[i] == name) {
      return i;
    }
  }
  return npos;
}

template <typename From, typename To>
void copy_field(const From& from, To& to, ScratchArena& arena) {
  if constexpr (std::is_same_v<From, To>) {
    to = from;
  } else if constexpr (is_record_v<From> && is_record_v<To>) {
    struct_copy(from, to, arena);
  } else if constexpr (is_slice_v<From> && is_slice_v<To>) {
    using FromElement = std::remove_cv_t<typename From::value_type>;
    using ToElement = std::remove_cv_t<typename To::value_type>;
    if constexpr (is_record_v<FromElement> && is_record_v<ToElement>) {
      to = arena.make_slice<ToElement>(from.size());
      for (std::size_t i = 0; i < from.size(); ++i) {
        struct_copy(from[i], to[i], arena);
      }
    }
  } else if constexpr (is_static_array_v<From> && is_static_array_v<To>) {
    if constexpr (std::tuple_size_v<From> == std::tuple_size_v<To>) {
      for (std::size_t i = 0; i < from.size(); ++i) {
        copy_field(from[i], to[i], arena);
      }
    }
  }
}

template <typename From, typename To, std::size_t I>
void copy_named_field(const From& from, To& to, ScratchArena& arena) {
  constexpr auto target = std::get<I>(record_traits<To>::fields);
  constexpr std::size_t source = field_index<From>(target.name);
  if constexpr (source != npos) {
    constexpr auto origin = std::get<source>(record_traits<From>::fields);
    copy_field(from.*(origin.member), to.*(target.member), arena);
  }
}

template <typename From, typename To, std::size_t... I>
void copy_fields(const From& from, To& to, ScratchArena& arena, std::index_sequence<I...>) {
  (copy_named_field<From, To, I>(from, to, arena), ...);
}

}  // namespace detail

// Fills the fields of `to` from the equally named fields of `from`. Equal
// types are assigned, so dynamic arrays keep referencing from's memory.
// Records of different types are converted recursively, arrays of them
// element by element with storage from arena. Other fields keep their
// default value. Finally To::contig_convert(from, to, arena) runs if
// declared.
template <typename From, typename To>
void struct_copy(const From& from, To& to, ScratchArena& arena) {
  static_assert(is_record_v<From> && is_record_v<To>, "struct_copy works on contig records only");
  detail::copy_fields(from, to, arena, std::make_index_sequence<record_traits<To>::field_count>{});
  if constexpr (has_convert_hook<To, From>) {
    To::contig_convert(from, to, arena);
  }
}

// Adds the version tag to Loader. A record is versioned when it declares
//
//   static constexpr contig::version_type contig_version = N;
//   using contig_previous = PreviousVersion;            // optional
//   static void contig_convert(const PreviousVersion&, Record&,
//                              contig::ScratchArena&);  // optional
//
// Data of an older version is loaded as the previous version first (which
// may recurse further back), converted with struct_copy, dumped and loaded
// again. Two scratch buffers alternate along the chain so that no hop writes
// into the buffer it reads from.
class VersionDecorator {
 public:
  explicit VersionDecorator(std::size_t conversion_limit = std::numeric_limits<std::size_t>::max(),
                            std::size_t arena_chunk_size = 512)
      : conversion_limit_(conversion_limit), arena_(arena_chunk_size) {}

  Loader& loader() { return loader_; }
  [[nodiscard]] const Loader& loader() const { return loader_; }

  [[nodiscard]] std::size_t conversion_limit() const { return conversion_limit_; }

  template <typename S>
  static std::span<std::byte> store(const S& input, std::vector<std::byte>& buffer) {
    static_assert(has_version_v<S>, "store() expects a record declaring contig_version");
    return Dumper::dump(input, buffer);
  }

  // Loads in place. The version tag is stripped and buffer is resized; the
  // record and its arrays alias buffer afterwards.
  template <typename S>
  [[nodiscard]] tl::expected<S*, load_error> load(std::vector<std::byte>& buffer) {
    if constexpr (!has_version_v<S>) {
      return loader_.load_extend<S>(buffer);
    } else {
      if (buffer.size() <= sizeof(version_type)) {
        return detail::log_failure(
            "versioned load",
            detail::make_error<S>(load_errc::truncated_input, sizeof(version_type) + 1, buffer.size()));
      }

      const auto input_version = std::to_integer<version_type>(buffer.front());
      if (input_version == version_traits<S>::number) {
        std::memmove(buffer.data(), buffer.data() + sizeof(version_type), buffer.size() - sizeof(version_type));
        buffer.pop_back();
        return loader_.load_extend<S>(buffer);
      }

      return handle_version<S>(std::span<const std::byte>(buffer).subspan(sizeof(version_type)), input_version,
                               buffer, false, 0)
          .map([](std::span<std::byte> data) { return reinterpret_cast<S*>(data.data()); });
    }
  }

  // Loads a copy into dst; src is left untouched. The record and its arrays
  // alias dst afterwards.
  template <typename S>
  [[nodiscard]] tl::expected<S*, load_error> load_copy(std::vector<std::byte>& dst,
                                                       std::span<const std::byte> src,
                                                       bool only_extend_dst = false) {
    return load_copy_raw<S>(dst, src, only_extend_dst).map([](std::span<std::byte> data) {
      return reinterpret_cast<S*>(data.data());
    });
  }

  template <typename S>
  [[nodiscard]] tl::expected<std::span<std::byte>, load_error> load_copy_raw(std::vector<std::byte>& dst,
                                                                             std::span<const std::byte> src,
                                                                             bool only_extend_dst = false) {
    if constexpr (!has_version_v<S>) {
      return loader_.load_copy_raw<S>(dst, src, only_extend_dst);
    } else {
      if (src.size() <= sizeof(version_type)) {
        return detail::log_failure(
            "versioned load",
            detail::make_error<S>(load_errc::truncated_input, sizeof(version_type) + 1, src.size()));
      }
      const auto input_version = std::to_integer<version_type>(src.front());
      return handle_version<S>(src.subspan(sizeof(version_type)), input_version, dst, only_extend_dst, 0);
    }
  }

 private:
  static std::vector<std::byte>& other_of(const std::vector<std::byte>& current,
                                          std::vector<std::byte>& a,
                                          std::vector<std::byte>& b) {
    return &current == &a ? b : a;
  }

  template <typename S>
  tl::expected<std::span<std::byte>, load_error> handle_version(std::span<const std::byte> src,
                                                                version_type input_version,
                                                                std::vector<std::byte>& dst,
                                                                bool only_extend_dst,
                                                                std::size_t hops) {
    static_assert(has_version_v<S>, "every record of a version chain must declare contig_version");
    constexpr version_type expected_version = version_traits<S>::number;

    if (input_version == expected_version) {
      return loader_.load_copy_raw<S>(dst, src, only_extend_dst);
    }

    if constexpr (has_previous_version_v<S>) {
      if (input_version < expected_version && hops < conversion_limit_) {
        return convert<S, previous_version_t<S>>(src, input_version, dst, hops);
      }
    }

    return detail::log_failure("versioned load",
                               detail::make_error<S>(load_errc::unknown_version, expected_version, input_version));
  }

  template <typename S, typename Previous>
  tl::expected<std::span<std::byte>, load_error> convert(std::span<const std::byte> src,
                                                         version_type input_version,
                                                         std::vector<std::byte>& dst,
                                                         std::size_t hops) {
    static_assert(version_traits<Previous>::number < version_traits<S>::number,
                  "contig_previous must declare a lower contig_version");

    std::vector<std::byte>& scratch = other_of(dst, buffer_a_, buffer_b_);
    auto previous = handle_version<Previous>(src, input_version, scratch, true, hops + 1);
    if (!previous) {
      return tl::make_unexpected(previous.error());
    }

    spdlog::debug("contig: converting {} version {} to {} version {}", detail::type_name<Previous>(),
                  static_cast<unsigned>(version_traits<Previous>::number), detail::type_name<S>(),
                  static_cast<unsigned>(version_traits<S>::number));

    S converted{};
    struct_copy(*reinterpret_cast<const Previous*>(previous->data()), converted, arena_);
    Dumper::dump_raw(converted, dst);
    arena_.clear();

    auto loaded = loader_.load_extend<S>(dst);
    if (!loaded) {
      return tl::make_unexpected(loaded.error());
    }
    return std::span<std::byte>(dst);
  }

  Loader loader_;
  std::size_t conversion_limit_;
  ScratchArena arena_;
  std::vector<std::byte> buffer_a_;
  std::vector<std::byte> buffer_b_;
};

// Loader bundled with one destination buffer for records of type S, reused by
// every load so that decoding a stream of S stops allocating once the buffer
// has grown to the largest record seen.
//
// Each load overwrites the buffer: a record pointer obtained from an earlier
// load may dangle afterwards.
template <typename S>
class BufferedLoader {
 public:
  using record_type = S;

  // Do not shrink the buffer when a shorter record is loaded.
  bool extend_only = false;

  // bytes_reserved is the initial buffer length, at least sizeof(S).
  explicit BufferedLoader(std::size_t bytes_reserved = sizeof(S),
                          std::size_t conversion_limit = std::numeric_limits<std::size_t>::max())
      : decorator_(conversion_limit) {
    reset_buffer(bytes_reserved);
  }

  [[nodiscard]] tl::expected<S*, load_error> load(std::span<const std::byte> src) {
    return decorator_.template load_copy<S>(buffer_, src, extend_only);
  }

  [[nodiscard]] tl::expected<std::span<std::byte>, load_error> load_raw(std::span<const std::byte> src) {
    return decorator_.template load_copy_raw<S>(buffer_, src, extend_only);
  }

  // Copies the most recently loaded record into dst.
  [[nodiscard]] tl::expected<S*, load_error> copy_to(Contiguous<S>& dst) const {
    return decorator_.loader().template load_copy<S>(dst.buffer(), buffer_);
  }

  // Resets the record to S{} without releasing memory. Arrays obtained
  // before stay addressable but no longer hold the loaded data.
  BufferedLoader& clear() {
    const S init{};
    std::memcpy(buffer_.data(), &init, sizeof(S));
    std::fill(buffer_.begin() + static_cast<std::ptrdiff_t>(sizeof(S)), buffer_.end(), std::byte{0});
    return *this;
  }

  // Shrinks the buffer to max(sizeof(S), bytes_reserved) and resets it to S{}.
  BufferedLoader& minimize(std::size_t bytes_reserved = 0) {
    const std::size_t before = buffer_.capacity();
    reset_buffer(bytes_reserved);
    buffer_.shrink_to_fit();
    spdlog::trace("contig: minimized buffer of {} from {} to {} bytes", detail::type_name<S>(), before,
                  buffer_.capacity());
    return *this;
  }

  [[nodiscard]] S* get() { return reinterpret_cast<S*>(buffer_.data()); }
  [[nodiscard]] const S* get() const { return reinterpret_cast<const S*>(buffer_.data()); }

  [[nodiscard]] std::span<const std::byte> data() const { return buffer_; }

  VersionDecorator& decorator() { return decorator_; }

 private:
  void reset_buffer(std::size_t bytes_reserved) {
    const S init{};
    const std::size_t extra = bytes_reserved > sizeof(S) ? bytes_reserved - sizeof(S) : 0;
    Loader::init_dst(buffer_, std::as_bytes(std::span<const S, 1>(&init, 1)), extra);
  }

  VersionDecorator decorator_;
  std::vector<std::byte> buffer_;
};

inline constexpr std::array<char, 8> k_binary_magic = {'C', 'O', 'N', 'T', 'I', 'G', '0', '1'};
inline constexpr std::size_t k_binary_header_size = 8 + sizeof(std::uint64_t);

// Writes the dumped record, with its version tag if it has one, behind a
// small file header.
template <typename S>
tl::expected<void, io_error> write_binary(const std::filesystem::path& path, const S& record) {
  std::vector<std::byte> payload;
  Dumper::dump(record, payload);

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return tl::make_unexpected(io_error::open_failed);
  }

  std::array<std::byte, k_binary_header_size> header{};
  std::memcpy(header.data(), k_binary_magic.data(), k_binary_magic.size());
  detail::store_u64_le(header.data() + 8, static_cast<std::uint64_t>(payload.size()));

  out.write(reinterpret_cast<const char*>(header.data()), static_cast<std::streamsize>(header.size()));
  if (!out) {
    return tl::make_unexpected(io_error::write_failed);
  }

  out.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
  if (!out) {
    return tl::make_unexpected(io_error::write_failed);
  }

  return {};
}

// Reads a file written by write_binary into dst, converting older versions.
template <typename S>
tl::expected<S*, io_error> read_binary(const std::filesystem::path& path,
                                       Contiguous<S>& dst,
                                       VersionDecorator& decorator) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return tl::make_unexpected(io_error::open_failed);
  }

  std::array<std::byte, k_binary_header_size> header{};
  in.read(reinterpret_cast<char*>(header.data()), static_cast<std::streamsize>(header.size()));
  if (!in) {
    return tl::make_unexpected(io_error::read_failed);
  }

  if (std::memcmp(header.data(), k_binary_magic.data(), k_binary_magic.size()) != 0) {
    return tl::make_unexpected(io_error::invalid_header);
  }

  const std::uint64_t payload_size = detail::load_u64_le(header.data() + 8);
  if (payload_size > static_cast<std::uint64_t>(std::numeric_limits<std::streamsize>::max())) {
    return tl::make_unexpected(io_error::invalid_header);
  }

  std::vector<std::byte> payload(static_cast<std::size_t>(payload_size));
  if (!payload.empty()) {
    in.read(reinterpret_cast<char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
    if (in.gcount() != static_cast<std::streamsize>(payload.size())) {
      return tl::make_unexpected(io_error::truncated_payload);
    }
  }

  auto loaded = decorator.load_copy<S>(dst.buffer(), payload);
  if (!loaded) {
    spdlog::warn("contig: {} holds no loadable {}: {}", path.string(), detail::type_name<S>(),
                 loaded.error().message());
    dst.reset();
    return tl::make_unexpected(io_error::load_failed);
  }
  return *loaded;
}

inline constexpr std::size_t k_bitsery_max_payload_bytes = 0x3FFFFFFFU;

namespace detail {

template <typename S>
concept bitsery_reader = requires(S& archive, bitsery::ReaderError error) {
  archive.adapter().error();
  archive.adapter().error(error);
};

// Decodes the size bitsery writes in front of a container: one byte below
// 0x80, two bytes below 0x4000, four bytes otherwise.
template <bitsery_reader S>
tl::expected<std::size_t, bitsery::ReaderError> read_container_size(S& archive) {
  auto& input = archive.adapter();
  std::uint8_t first = 0;
  input.template readBytes<1>(first);
  if (input.error() != bitsery::ReaderError::NoError) {
    return tl::make_unexpected(input.error());
  }
  if ((first & 0x80U) == 0U) {
    return first;
  }

  std::uint8_t second = 0;
  input.template readBytes<1>(second);
  if (input.error() != bitsery::ReaderError::NoError) {
    return tl::make_unexpected(input.error());
  }
  const bool wide = (first & 0x40U) != 0U;
  std::size_t size = (static_cast<std::size_t>(first & (wide ? 0x3FU : 0x7FU)) << 8U) | second;
  if (!wide) {
    return size;
  }

  std::uint16_t low = 0;
  input.template readBytes<2>(low);
  if (input.error() != bitsery::ReaderError::NoError) {
    return tl::make_unexpected(input.error());
  }
  return (size << 16U) | low;
}

}  // namespace detail

}  // namespace contig

namespace bitsery {

// A loaded record travels through a bitsery stream as its dumped bytes; the
// reading side loads them again, so the arrays point into the receiving
// Contiguous.
template <typename S, typename T>
void serialize(S& s, contig::Contiguous<T>& record) {
  if constexpr (contig::detail::bitsery_reader<S>) {
    auto payload_size = contig::detail::read_container_size(s);
    if (!payload_size) {
      record.reset();
      return;
    }
    if (*payload_size > contig::k_bitsery_max_payload_bytes) {
      record.reset();
      s.adapter().error(bitsery::ReaderError::InvalidData);
      return;
    }

    auto& buffer = record.buffer();
    buffer.resize(*payload_size);
    if (buffer.empty()) {
      return;
    }

    s.adapter().template readBuffer<1>(reinterpret_cast<std::uint8_t*>(buffer.data()), buffer.size());
    if (s.adapter().error() != bitsery::ReaderError::NoError) {
      record.reset();
      return;
    }

    const contig::Loader loader;
    if (!loader.load_extend<T>(buffer)) {
      record.reset();
      s.adapter().error(bitsery::ReaderError::InvalidData);
    }
  } else {
    std::vector<std::byte> payload{};
    if (!record.empty()) {
      contig::Dumper::dump_raw(*record, payload);
    }
    s.container1b(payload, contig::k_bitsery_max_payload_bytes);
  }
}

}  // namespace bitsery
