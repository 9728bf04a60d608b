#include "minser/wire/encoder.hpp"

#include "../core/log_internal.hpp"

#include <array>
#include <bit>
#include <cstddef>
#include <type_traits>

namespace minser::wire {

namespace {

std::error_code report_sink_exhausted(const core::ByteSink& sink) noexcept {
  core::detail::logger().warn("encoder: sink exhausted at {} bytes (max {})", sink.size(), sink.max_capacity());
  return make_error_code(errc::sink_exhausted);
}

}  // namespace

std::error_code Encoder::put(byte b) noexcept {
  if (sink_.push_back(b)) {
    return report_sink_exhausted(sink_);
  }
  return {};
}

std::error_code Encoder::put_raw(bytes_view v) noexcept {
  if (sink_.append(v)) {
    return report_sink_exhausted(sink_);
  }
  return {};
}

template <class UInt>
std::error_code Encoder::write_le(UInt v) noexcept {
  static_assert(std::is_unsigned_v<UInt>);
  std::array<byte, sizeof(UInt)> raw{};
  for (std::size_t i = 0; i < sizeof(UInt); ++i) {
    raw[i] = static_cast<byte>((v >> (8u * i)) & 0xFFu);
  }
  return put_raw(bytes_view{raw.data(), raw.size()});
}

std::error_code Encoder::put_span(Delimiter boundary, bytes_view content) noexcept {
  const auto delim = to_byte(boundary);
  auto ec = put(delim);
  if (ec) {
    return ec;
  }
  // 内容中与边界相同的字节写两次；其余字节成段追加。
  std::size_t run_start = 0;
  for (std::size_t i = 0; i < content.size(); ++i) {
    if (content[i] != delim) {
      continue;
    }
    ec = put_raw(content.subspan(run_start, i + 1 - run_start));
    if (ec) {
      return ec;
    }
    ec = put(delim);
    if (ec) {
      return ec;
    }
    run_start = i + 1;
  }
  ec = put_raw(content.subspan(run_start));
  if (ec) {
    return ec;
  }
  return put(delim);
}

std::error_code Encoder::write_bool(bool v) noexcept { return put(static_cast<byte>(v ? 0x01 : 0x00)); }

std::error_code Encoder::write_i8(std::int8_t v) noexcept { return put(static_cast<byte>(v)); }
std::error_code Encoder::write_i16(std::int16_t v) noexcept {
  return write_le<std::uint16_t>(static_cast<std::uint16_t>(v));
}
std::error_code Encoder::write_i32(std::int32_t v) noexcept {
  return write_le<std::uint32_t>(static_cast<std::uint32_t>(v));
}
std::error_code Encoder::write_i64(std::int64_t v) noexcept {
  return write_le<std::uint64_t>(static_cast<std::uint64_t>(v));
}

std::error_code Encoder::write_u8(std::uint8_t v) noexcept { return put(v); }
std::error_code Encoder::write_u16(std::uint16_t v) noexcept { return write_le(v); }
std::error_code Encoder::write_u32(std::uint32_t v) noexcept { return write_le(v); }
std::error_code Encoder::write_u64(std::uint64_t v) noexcept { return write_le(v); }

std::error_code Encoder::write_f32(float v) noexcept { return write_le(std::bit_cast<std::uint32_t>(v)); }
std::error_code Encoder::write_f64(double v) noexcept { return write_le(std::bit_cast<std::uint64_t>(v)); }

std::error_code Encoder::write_char(char32_t v) noexcept { return write_le(static_cast<std::uint32_t>(v)); }

std::error_code Encoder::write_str(std::string_view v) noexcept {
  return put_span(Delimiter::string, bytes_view{reinterpret_cast<const byte*>(v.data()), v.size()});
}

std::error_code Encoder::write_bytes(bytes_view v) noexcept { return put_span(Delimiter::bytes, v); }

std::error_code Encoder::write_unit() noexcept { return put(kUnit); }

std::error_code Encoder::write_variant_index(std::uint32_t index) noexcept { return write_le(index); }

std::error_code Encoder::begin_seq() noexcept { return put(kSeq); }
std::error_code Encoder::seq_element() noexcept { return put(kSeqValue); }
// 值分隔符出现在元素位置即为序列终止符。
std::error_code Encoder::end_seq() noexcept { return put(kSeqValue); }

std::error_code Encoder::begin_map() noexcept { return put(kMap); }
std::error_code Encoder::map_key() noexcept { return put(kMapKey); }
std::error_code Encoder::map_value() noexcept { return put(kMapValue); }
std::error_code Encoder::end_map() noexcept { return put(kMap); }

}  // namespace minser::wire
