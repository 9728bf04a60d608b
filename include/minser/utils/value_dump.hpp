#pragma once

#include "minser/wire/value.hpp"

#include <cstddef>
#include <string>

namespace minser::utils {

/**
 * @brief wire::Value 的可读化输出（调试/日志用途）。
 *
 * 说明：
 * - 输出形如 `map{ "name": "Ayush", "age": u8 19 }`，不是可回读的格式；
 * - 默认会对超长内容做截断，避免日志被巨量 payload 淹没；
 * - 如需从字节流得到 Value，请先用 `minser::wire::decode()` 按形状解码。
 */
struct ValueDumpOptions final {
    // 递归最大深度（0 表示只输出根节点）。
    std::size_t max_depth{16};

    // Seq/Map 最大输出元素数（0 表示不限制）。
    std::size_t max_items{128};

    // String/Bytes 最大输出字节数（0 表示不限制）。
    std::size_t max_payload_bytes{256};

    // Seq/Map 是否使用多行缩进格式。
    bool multiline{false};

    // 每层缩进空格数（multiline=true 时生效）。
    std::size_t indent_spaces{2};

    // 是否输出 ANSI 颜色控制码（终端更易读；写入日志/文件时建议关闭）。
    bool enable_color{false};
};

[[nodiscard]] std::string dump_value(const minser::wire::Value &value,
                                     ValueDumpOptions options = {});

} // namespace minser::utils
