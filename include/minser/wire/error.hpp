#pragma once

#include <system_error>

namespace minser::wire {

/**
 * @brief 编解码错误码（"minser.wire" 错误域）。
 *
 * 约定：
 * - 解码侧任一错误都会立即终止整个解码调用，不返回部分结果；
 * - 编码侧只会因输出上限失败（sink_exhausted），同样终止本次调用。
 */
enum class errc : int {
  ok = 0,
  unexpected_end_of_input = 1,
  malformed_delimiter = 2,
  unterminated_span = 3,
  unknown_variant_index = 4,
  sink_exhausted = 5,
  invalid_value = 6,
  field_mismatch = 7,
  depth_exceeded = 8,
  ambiguous_option = 9,
  trailing_bytes = 10,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace minser::wire

namespace std {
template <>
struct is_error_code_enum<minser::wire::errc> : true_type {};
}  // namespace std
