#pragma once

#include "minser/core/common.hpp"

#include <cstddef>
#include <cstdint>

namespace minser::wire {

/**
 * @brief Option 的 presence 约定。
 *
 * Some(v) 与 v 的编码完全相同，字节流本身无法区分 None/Some，
 * 因此由调用方在期望形状里声明：
 * - absent  : 期望 UNIT，解码为 None
 * - present : 直接按内层形状解码
 * - unknown : 仅在 DecodeOptions::infer_option_from_unit 打开时窥视 UNIT 推断
 */
enum class presence : std::uint8_t {
    absent = 0,
    present = 1,
    unknown = 2,
};

// 解码深度上限：防止恶意输入构造极深嵌套导致栈溢出。
inline constexpr std::size_t kMaxDecodeDepth = 64;

struct EncodeOptions final {
    // 输出缓冲区初始容量（字节）。
    std::size_t initial_capacity{core::kDefaultSinkCapacity};

    // 单次编码输出上限（字节）。超出返回 errc::sink_exhausted。
    std::size_t max_capacity{core::kDefaultSinkMaxCapacity};
};

struct DecodeOptions final {
    // seq/map/tuple/struct/enum 载荷的最大嵌套层数。
    std::size_t max_depth{kMaxDecodeDepth};

    // Option 的 presence 未知时，是否通过“下一个字节是否为 UNIT”推断 None。
    // 注意：当 Some 的值首字节恰好为 0x05（例如 u8 5）时该推断会出错，
    // 因此默认关闭，未知 presence 直接返回 errc::ambiguous_option。
    bool infer_option_from_unit{false};

    // 是否校验字符串为合法 UTF-8。
    bool validate_utf8{true};

    // decode()/from_bytes() 是否允许值之后还有剩余字节。
    bool allow_trailing_bytes{false};
};

} // namespace minser::wire
