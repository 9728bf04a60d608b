#pragma once

#include <spdlog/logger.h>

#include <memory>

namespace minser::core::detail {

// 库内部使用的具名 logger（"minser"）。仅在 src/ 内可见，不进入 public headers。
[[nodiscard]] spdlog::logger &logger() noexcept;

} // namespace minser::core::detail
