#pragma once

#include "minser/wire/cursor.hpp"
#include "minser/wire/delimiter.hpp"
#include "minser/wire/error.hpp"
#include "minser/wire/options.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

namespace minser::wire {

/**
 * @brief 数据模型的解码器：按调用方给出的期望形状，从 ByteCursor 消费对应字节。
 *
 * 说明：
 * - 解码器从不根据字节猜测形状；调用方先决定要读什么，再调用对应 read_xxx；
 * - 任一方法失败后游标位置不再有意义，调用方必须放弃整个解码；
 * - 变长序列/映射用 next_element()/next_entry() 驱动：
 * @code
 * dec.begin_seq();
 * bool more = false;
 * while (!dec.next_element(more) && more) { dec.read_u8(v); dec.seq_element(); ... }
 * @endcode
 *   固定元数（tuple/struct）用 expect_element()/end_seq()、expect_entry()/end_map()。
 *
 * 状态机（seq/map）：
 *   ExpectStart --起始分隔符--> ExpectElementOrEnd
 *   ExpectElementOrEnd --终止字节--> 终态（seq 为 kSeqValue，map 为 kMap）
 *   ExpectElementOrEnd --其他字节--> 元素 --> ExpectSeparator
 *   ExpectSeparator --分隔符--> ExpectElementOrEnd（map 为 键 kMapKey 值 kMapValue）
 *   分隔符位置出现其他字节：errc::malformed_delimiter
 *   组合值未闭合即输入结束：errc::unterminated_span
 */
class Decoder final {
 public:
  explicit Decoder(ByteCursor& cursor, const DecodeOptions& options = {}) noexcept
      : cursor_(cursor), options_(options) {}

  [[nodiscard]] const DecodeOptions& options() const noexcept { return options_; }
  [[nodiscard]] ByteCursor& cursor() noexcept { return cursor_; }
  [[nodiscard]] std::size_t depth() const noexcept { return depth_; }

  std::error_code read_bool(bool& out) noexcept;

  std::error_code read_i8(std::int8_t& out) noexcept;
  std::error_code read_i16(std::int16_t& out) noexcept;
  std::error_code read_i32(std::int32_t& out) noexcept;
  std::error_code read_i64(std::int64_t& out) noexcept;

  std::error_code read_u8(std::uint8_t& out) noexcept;
  std::error_code read_u16(std::uint16_t& out) noexcept;
  std::error_code read_u32(std::uint32_t& out) noexcept;
  std::error_code read_u64(std::uint64_t& out) noexcept;

  std::error_code read_f32(float& out) noexcept;
  std::error_code read_f64(double& out) noexcept;

  // 仅接受 Unicode 标量值（<= 0x10FFFF 且非代理区）。
  std::error_code read_char(char32_t& out) noexcept;

  std::error_code read_str(std::string& out) noexcept;
  std::error_code read_bytes(std::vector<byte>& out) noexcept;

  std::error_code read_unit() noexcept;

  /**
   * @brief 按 presence 约定确定 Option 是否存在。
   *
   * absent 时会同时消费 UNIT；present 时不消费任何字节（随后按内层形状解码）。
   */
  std::error_code option_present(presence hint, bool& present) noexcept;

  /**
   * @brief 读取 u32 变体序号；index >= variant_count 返回 errc::unknown_variant_index。
   */
  std::error_code read_variant_index(std::uint32_t variant_count, std::uint32_t& index) noexcept;

  std::error_code begin_seq() noexcept;
  std::error_code next_element(bool& more) noexcept;
  std::error_code expect_element() noexcept;
  std::error_code seq_element() noexcept;
  std::error_code end_seq() noexcept;

  std::error_code begin_map() noexcept;
  std::error_code next_entry(bool& more) noexcept;
  std::error_code expect_entry() noexcept;
  std::error_code map_key() noexcept;
  std::error_code map_value() noexcept;
  std::error_code end_map() noexcept;

 private:
  template <class UInt>
  std::error_code read_le(UInt& out) noexcept;

  std::error_code expect(byte delim) noexcept;
  std::error_code open_composite(byte start) noexcept;
  std::error_code element_or_end(byte end, bool& more) noexcept;
  std::error_code expect_separator(byte separator) noexcept;
  std::error_code read_span(byte delim, std::vector<byte>& out) noexcept;

  ByteCursor& cursor_;
  DecodeOptions options_;
  std::size_t depth_{0};
};

}  // namespace minser::wire
