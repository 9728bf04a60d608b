#include "minser/wire/decoder.hpp"

#include <bit>
#include <cstddef>
#include <type_traits>

namespace minser::wire {
namespace {

// 严格 UTF-8 校验：拒绝过长编码、代理区码点与 > U+10FFFF。
bool is_valid_utf8(const std::vector<byte>& s) noexcept {
  std::size_t i = 0;
  const std::size_t n = s.size();
  while (i < n) {
    const byte c = s[i];
    if (c < 0x80u) {
      ++i;
      continue;
    }
    std::size_t len = 0;
    std::uint32_t cp = 0;
    if ((c & 0xE0u) == 0xC0u) {
      len = 2;
      cp = c & 0x1Fu;
    } else if ((c & 0xF0u) == 0xE0u) {
      len = 3;
      cp = c & 0x0Fu;
    } else if ((c & 0xF8u) == 0xF0u) {
      len = 4;
      cp = c & 0x07u;
    } else {
      return false;
    }
    if (n - i < len) {
      return false;
    }
    for (std::size_t k = 1; k < len; ++k) {
      const byte cc = s[i + k];
      if ((cc & 0xC0u) != 0x80u) {
        return false;
      }
      cp = (cp << 6) | (cc & 0x3Fu);
    }
    if ((len == 2 && cp < 0x80u) || (len == 3 && cp < 0x800u) || (len == 4 && cp < 0x10000u)) {
      return false;
    }
    if (cp > 0x10FFFFu || (cp >= 0xD800u && cp <= 0xDFFFu)) {
      return false;
    }
    i += len;
  }
  return true;
}

constexpr bool is_scalar_value(std::uint32_t cp) noexcept {
  return cp <= 0x10FFFFu && !(cp >= 0xD800u && cp <= 0xDFFFu);
}

}  // namespace

template <class UInt>
std::error_code Decoder::read_le(UInt& out) noexcept {
  static_assert(std::is_unsigned_v<UInt>);
  bytes_view raw{};
  auto ec = cursor_.read_exact(sizeof(UInt), raw);
  if (ec) {
    return ec;
  }
  UInt v = 0;
  for (std::size_t i = 0; i < sizeof(UInt); ++i) {
    v = static_cast<UInt>(v | (static_cast<UInt>(raw[i]) << (8u * i)));
  }
  out = v;
  return {};
}

std::error_code Decoder::expect(byte delim) noexcept {
  byte b = 0;
  auto ec = cursor_.read_u8(b);
  if (ec) {
    return ec;
  }
  if (b != delim) {
    return make_error_code(errc::malformed_delimiter);
  }
  return {};
}

std::error_code Decoder::open_composite(byte start) noexcept {
  if (depth_ >= options_.max_depth) {
    return make_error_code(errc::depth_exceeded);
  }
  auto ec = expect(start);
  if (ec) {
    return ec;
  }
  ++depth_;
  return {};
}

std::error_code Decoder::element_or_end(byte end, bool& more) noexcept {
  byte b = 0;
  if (cursor_.peek(b)) {
    // 已打开的组合值在输入结束前没有闭合。
    return make_error_code(errc::unterminated_span);
  }
  if (b != end) {
    more = true;
    return {};
  }
  more = false;
  --depth_;
  return cursor_.skip(1);
}

std::error_code Decoder::expect_separator(byte separator) noexcept {
  byte b = 0;
  if (cursor_.read_u8(b)) {
    return make_error_code(errc::unterminated_span);
  }
  if (b != separator) {
    return make_error_code(errc::malformed_delimiter);
  }
  return {};
}

std::error_code Decoder::read_span(byte delim, std::vector<byte>& out) noexcept {
  auto ec = expect(delim);
  if (ec) {
    return ec;
  }
  out.clear();
  for (;;) {
    byte b = 0;
    if (cursor_.read_u8(b)) {
      return make_error_code(errc::unterminated_span);
    }
    if (b != delim) {
      out.push_back(b);
      continue;
    }
    // 连续两个边界字节表示内容中的一个字面量字节。
    byte next = 0;
    if (!cursor_.peek(next) && next == delim) {
      ec = cursor_.skip(1);
      if (ec) {
        return ec;
      }
      out.push_back(b);
      continue;
    }
    return {};
  }
}

std::error_code Decoder::read_bool(bool& out) noexcept {
  byte b = 0;
  auto ec = cursor_.read_u8(b);
  if (ec) {
    return ec;
  }
  if (b > 1u) {
    return make_error_code(errc::invalid_value);
  }
  out = (b == 1u);
  return {};
}

std::error_code Decoder::read_i8(std::int8_t& out) noexcept {
  std::uint8_t bits = 0;
  auto ec = read_le(bits);
  if (ec) {
    return ec;
  }
  out = std::bit_cast<std::int8_t>(bits);
  return {};
}

std::error_code Decoder::read_i16(std::int16_t& out) noexcept {
  std::uint16_t bits = 0;
  auto ec = read_le(bits);
  if (ec) {
    return ec;
  }
  out = std::bit_cast<std::int16_t>(bits);
  return {};
}

std::error_code Decoder::read_i32(std::int32_t& out) noexcept {
  std::uint32_t bits = 0;
  auto ec = read_le(bits);
  if (ec) {
    return ec;
  }
  out = std::bit_cast<std::int32_t>(bits);
  return {};
}

std::error_code Decoder::read_i64(std::int64_t& out) noexcept {
  std::uint64_t bits = 0;
  auto ec = read_le(bits);
  if (ec) {
    return ec;
  }
  out = std::bit_cast<std::int64_t>(bits);
  return {};
}

std::error_code Decoder::read_u8(std::uint8_t& out) noexcept { return read_le(out); }
std::error_code Decoder::read_u16(std::uint16_t& out) noexcept { return read_le(out); }
std::error_code Decoder::read_u32(std::uint32_t& out) noexcept { return read_le(out); }
std::error_code Decoder::read_u64(std::uint64_t& out) noexcept { return read_le(out); }

std::error_code Decoder::read_f32(float& out) noexcept {
  std::uint32_t bits = 0;
  auto ec = read_le(bits);
  if (ec) {
    return ec;
  }
  out = std::bit_cast<float>(bits);
  return {};
}

std::error_code Decoder::read_f64(double& out) noexcept {
  std::uint64_t bits = 0;
  auto ec = read_le(bits);
  if (ec) {
    return ec;
  }
  out = std::bit_cast<double>(bits);
  return {};
}

std::error_code Decoder::read_char(char32_t& out) noexcept {
  std::uint32_t cp = 0;
  auto ec = read_le(cp);
  if (ec) {
    return ec;
  }
  if (!is_scalar_value(cp)) {
    return make_error_code(errc::invalid_value);
  }
  out = static_cast<char32_t>(cp);
  return {};
}

std::error_code Decoder::read_str(std::string& out) noexcept {
  std::vector<byte> raw;
  auto ec = read_span(kString, raw);
  if (ec) {
    return ec;
  }
  if (options_.validate_utf8 && !is_valid_utf8(raw)) {
    return make_error_code(errc::invalid_value);
  }
  out.assign(reinterpret_cast<const char*>(raw.data()), raw.size());
  return {};
}

std::error_code Decoder::read_bytes(std::vector<byte>& out) noexcept { return read_span(kBytes, out); }

std::error_code Decoder::read_unit() noexcept { return expect(kUnit); }

std::error_code Decoder::option_present(presence hint, bool& present) noexcept {
  switch (hint) {
    case presence::absent:
      present = false;
      return read_unit();
    case presence::present:
      present = true;
      return {};
    case presence::unknown:
      break;
  }
  if (!options_.infer_option_from_unit) {
    return make_error_code(errc::ambiguous_option);
  }
  byte next = 0;
  auto ec = cursor_.peek(next);
  if (ec) {
    return ec;
  }
  if (next == kUnit) {
    present = false;
    return cursor_.skip(1);
  }
  present = true;
  return {};
}

std::error_code Decoder::read_variant_index(std::uint32_t variant_count, std::uint32_t& index) noexcept {
  std::uint32_t v = 0;
  auto ec = read_le(v);
  if (ec) {
    return ec;
  }
  if (v >= variant_count) {
    return make_error_code(errc::unknown_variant_index);
  }
  index = v;
  return {};
}

std::error_code Decoder::begin_seq() noexcept { return open_composite(kSeq); }

std::error_code Decoder::next_element(bool& more) noexcept { return element_or_end(kSeqValue, more); }

std::error_code Decoder::expect_element() noexcept {
  bool more = false;
  auto ec = element_or_end(kSeqValue, more);
  if (ec) {
    return ec;
  }
  // 固定元数：提前出现终止符说明元素个数不符。
  return more ? std::error_code{} : make_error_code(errc::malformed_delimiter);
}

std::error_code Decoder::seq_element() noexcept { return expect_separator(kSeqValue); }

std::error_code Decoder::end_seq() noexcept {
  bool more = false;
  auto ec = element_or_end(kSeqValue, more);
  if (ec) {
    return ec;
  }
  return more ? make_error_code(errc::malformed_delimiter) : std::error_code{};
}

std::error_code Decoder::begin_map() noexcept { return open_composite(kMap); }

std::error_code Decoder::next_entry(bool& more) noexcept { return element_or_end(kMap, more); }

std::error_code Decoder::expect_entry() noexcept {
  bool more = false;
  auto ec = element_or_end(kMap, more);
  if (ec) {
    return ec;
  }
  return more ? std::error_code{} : make_error_code(errc::malformed_delimiter);
}

std::error_code Decoder::map_key() noexcept { return expect_separator(kMapKey); }

std::error_code Decoder::map_value() noexcept { return expect_separator(kMapValue); }

std::error_code Decoder::end_map() noexcept {
  bool more = false;
  auto ec = element_or_end(kMap, more);
  if (ec) {
    return ec;
  }
  return more ? make_error_code(errc::malformed_delimiter) : std::error_code{};
}

}  // namespace minser::wire
