#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace minser::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;
using mutable_bytes_view = std::span<byte>;

// ByteSink 默认初始容量：小对象编码优先走 inline 预分配，减少频繁堆分配。
inline constexpr std::size_t kDefaultSinkCapacity = 1024;

// ByteSink 默认最大容量：用于避免极端输入下无上限扩容导致内存耗尽。
inline constexpr std::size_t kDefaultSinkMaxCapacity = 64 * 1024 * 1024;  // 64MB

}  // 命名空间 minser::core
