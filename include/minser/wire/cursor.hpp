#pragma once

#include "minser/core/common.hpp"
#include "minser/wire/error.hpp"

#include <cstddef>
#include <system_error>

namespace minser::wire {

using byte = minser::core::byte;
using bytes_view = minser::core::bytes_view;

/**
 * @brief 只读游标（解码器的 Byte Cursor）。
 *
 * 不拥有数据；读位置只前进不后退。数据不足时返回 errc::unexpected_end_of_input，
 * 且游标位置保持不变。
 */
class ByteCursor final {
 public:
  explicit ByteCursor(bytes_view in) noexcept : in_(in) {}

  [[nodiscard]] std::size_t remaining() const noexcept { return in_.size() - pos_; }
  [[nodiscard]] std::size_t position() const noexcept { return pos_; }
  [[nodiscard]] bool at_end() const noexcept { return pos_ >= in_.size(); }

  std::error_code peek(byte& out) const noexcept;

  /**
   * @brief 查看当前位置之后第 offset 个字节（offset=0 等价于 peek）。
   */
  std::error_code peek_at(std::size_t offset, byte& out) const noexcept;

  std::error_code read_u8(byte& out) noexcept;
  std::error_code read_exact(std::size_t n, bytes_view& out) noexcept;
  std::error_code skip(std::size_t n) noexcept;

 private:
  bytes_view in_{};
  std::size_t pos_{0};
};

}  // namespace minser::wire
