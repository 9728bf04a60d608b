#pragma once

#include "minser/core/common.hpp"

#include <array>
#include <cstdint>
#include <string_view>

namespace minser::wire {

/**
 * @brief 分隔符表：每个结构角色一个固定字节值（编码格式的一部分，修改即不兼容）。
 *
 * 帧格式（唯一约定）：
 * - str   : kString 内容 kString   （内容中的 kString 写两次）
 * - bytes : kBytes  内容 kBytes    （内容中的 kBytes 写两次）
 * - unit  : kUnit
 * - seq   : kSeq (元素 kSeqValue)* kSeqValue   （元素位置上的 kSeqValue 即终止符）
 * - map   : kMap (键 kMapKey 值 kMapValue)* kMap
 * - enum  : u32 变体序号 + 载荷（unit 变体无载荷）
 *
 * 约束：
 * - 0xFE/0xFF 不会出现在合法 UTF-8 中，字符串内容与边界天然不冲突；
 * - seq/map 内部，闭合边界之后只可能是结构分隔符，因此“连续两个边界字节”只能是转义；
 *   顶层连续写入两个同类 str/bytes 会产生歧义，调用方需自行分隔；
 * - “还有元素还是已结束”由元素位置的首字节判定：seq 元素编码若以 0x2E 开头
 *   （例如 u8 46、低字节为 0x2E 的整数/浮点），map 键编码若以 0x3A 开头
 *   （例如 u8 58、以 Map/结构体为键），会被误读为终止符，这类值无法往返；
 *   str/bytes/seq/unit 元素与 str 键不受影响，嵌套序列也可区分。
 */
enum class Delimiter : std::uint8_t {
  string = 0xFE,
  bytes = 0xFF,
  unit = 0x05,
  seq = 0x26,
  seq_value = 0x2E,
  map = 0x3A,
  map_key = 0x3B,
  map_value = 0x3C,
};

inline constexpr core::byte kString = static_cast<core::byte>(Delimiter::string);
inline constexpr core::byte kBytes = static_cast<core::byte>(Delimiter::bytes);
inline constexpr core::byte kUnit = static_cast<core::byte>(Delimiter::unit);
inline constexpr core::byte kSeq = static_cast<core::byte>(Delimiter::seq);
inline constexpr core::byte kSeqValue = static_cast<core::byte>(Delimiter::seq_value);
inline constexpr core::byte kMap = static_cast<core::byte>(Delimiter::map);
inline constexpr core::byte kMapKey = static_cast<core::byte>(Delimiter::map_key);
inline constexpr core::byte kMapValue = static_cast<core::byte>(Delimiter::map_value);

inline constexpr std::array<Delimiter, 8> kAllDelimiters = {
  Delimiter::string,
  Delimiter::bytes,
  Delimiter::unit,
  Delimiter::seq,
  Delimiter::seq_value,
  Delimiter::map,
  Delimiter::map_key,
  Delimiter::map_value,
};

[[nodiscard]] constexpr core::byte to_byte(Delimiter d) noexcept { return static_cast<core::byte>(d); }

/**
 * @brief 分隔符的可读名称（调试/日志用途），例如 "MAP_KEY"。
 */
[[nodiscard]] std::string_view delimiter_name(Delimiter d) noexcept;

}  // namespace minser::wire
