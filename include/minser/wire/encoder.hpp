#pragma once

#include "minser/core/buffer.hpp"
#include "minser/wire/cursor.hpp"
#include "minser/wire/delimiter.hpp"
#include "minser/wire/error.hpp"

#include <cstdint>
#include <string_view>
#include <system_error>

namespace minser::wire {

/**
 * @brief 数据模型的编码访问器：把每种形状翻译成原始字节与分隔符，按顺序写入 ByteSink。
 *
 * 说明：
 * - 定宽原语一律小端序，不带任何分隔符；
 * - 组合形状由调用方按顺序驱动，分隔符总是跟在元素之后，例如序列：
 * @code
 * enc.begin_seq();
 * for (auto v : values) { enc.write_u8(v); enc.seq_element(); }
 * enc.end_seq();
 * @endcode
 *   映射：begin_map()，每项 键 map_key() 值 map_value()，最后 end_map()。
 * - Encoder 本身无状态，所有位置信息都在 ByteSink 中；
 * - 唯一的失败是 ByteSink 达到上限，返回 errc::sink_exhausted。
 */
class Encoder final {
 public:
  explicit Encoder(core::ByteSink& sink) noexcept : sink_(sink) {}

  [[nodiscard]] core::ByteSink& sink() noexcept { return sink_; }

  std::error_code write_bool(bool v) noexcept;

  std::error_code write_i8(std::int8_t v) noexcept;
  std::error_code write_i16(std::int16_t v) noexcept;
  std::error_code write_i32(std::int32_t v) noexcept;
  std::error_code write_i64(std::int64_t v) noexcept;

  std::error_code write_u8(std::uint8_t v) noexcept;
  std::error_code write_u16(std::uint16_t v) noexcept;
  std::error_code write_u32(std::uint32_t v) noexcept;
  std::error_code write_u64(std::uint64_t v) noexcept;

  std::error_code write_f32(float v) noexcept;
  std::error_code write_f64(double v) noexcept;

  // 码点按 u32 写出。
  std::error_code write_char(char32_t v) noexcept;

  std::error_code write_str(std::string_view v) noexcept;
  std::error_code write_bytes(bytes_view v) noexcept;

  std::error_code write_unit() noexcept;
  std::error_code write_none() noexcept { return write_unit(); }

  std::error_code write_variant_index(std::uint32_t index) noexcept;

  std::error_code begin_seq() noexcept;
  std::error_code seq_element() noexcept;
  std::error_code end_seq() noexcept;

  std::error_code begin_map() noexcept;
  std::error_code map_key() noexcept;
  std::error_code map_value() noexcept;
  std::error_code end_map() noexcept;

 private:
  template <class UInt>
  std::error_code write_le(UInt v) noexcept;

  std::error_code put(byte b) noexcept;
  std::error_code put_raw(bytes_view v) noexcept;
  std::error_code put_span(Delimiter boundary, bytes_view content) noexcept;

  core::ByteSink& sink_;
};

}  // namespace minser::wire
