#pragma once

#include <cstdint>

namespace minser::core {

/**
 * @brief 日志级别（用于库内 spdlog 日志的统一控制）。
 *
 * 说明：
 * - 本库内部日志使用 spdlog，但不把 spdlog 类型暴露到 public headers；
 * - 编解码失败时以 debug 级别记录偏移与错误，输出上限触发时以 warn 级别记录；
 * - 业务侧可通过 set_log_level 调整库内 logger（名为 "minser"）的级别。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

} // namespace minser::core
