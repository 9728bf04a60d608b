#pragma once

#include "minser/core/common.hpp"
#include "minser/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace minser::utils {

/**
 * @brief 16 进制解析/格式化工具。
 *
 * 典型使用场景：
 * - 把测试或日志里的 “3A 3B FE ...” 解析为 bytes；
 * - 将编码结果以 hexdump 形式输出，并标出定界符字节，便于对照格式表排查。
 */

struct HexDumpOptions final {
    // 每行字节数（典型 16/32）。
    std::size_t bytes_per_line{16};

    // 输出的最大字节数（0 表示不限制）。超出部分会打印截断提示。
    std::size_t max_bytes{256};

    // 是否输出行首偏移（0000:）。
    bool show_offset{true};

    // 是否输出 ASCII 侧栏（仅展示可打印字符，其余用 '.'）。
    bool show_ascii{false};

    // 是否在行尾列出本行出现的定界符名字（例如 "MAP MAP_KEY STRING"）。
    bool annotate_delimiters{false};

    // 是否输出 ANSI 颜色控制码；开启后定界符字节单独着色。
    bool enable_color{false};
};

/**
 * @brief 将 bytes 以 hexdump 形式格式化为字符串（多行）。
 */
[[nodiscard]] std::string hex_dump(minser::core::bytes_view bytes,
                                   HexDumpOptions options = {});

/**
 * @brief 单行紧凑形式："3a 3b fe"（小写，空格分隔，无偏移）。
 */
[[nodiscard]] std::string to_hex(minser::core::bytes_view bytes);

/**
 * @brief 解析 16 进制字符串为 bytes。
 *
 * 支持：
 * - 大小写 hex；
 * - 分隔符：空白、逗号、冒号、连字符、下划线、方括号等；
 * - 可选的 0x/0X 前缀（会被忽略）。
 *
 * 失败返回 core::errc::invalid_argument，out 被清空。
 */
std::error_code parse_hex(std::string_view text,
                          std::vector<minser::core::byte> &out) noexcept;

} // namespace minser::utils
