#pragma once

#include <system_error>

namespace minser::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 所有编解码接口返回 std::error_code，避免异常路径。
 * - 格式相关的错误（分隔符、截断等）见 minser::wire::errc。
 */
enum class errc : int {
  ok = 0,
  buffer_overflow = 1,
  invalid_argument = 2,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace minser::core

namespace std {
template <>
struct is_error_code_enum<minser::core::errc> : true_type {};
}  // namespace std
