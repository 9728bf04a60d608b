#include "minser/serde/serde.hpp"

#include "../core/log_internal.hpp"

namespace minser::serde::detail {

std::error_code finish_decode(const wire::ByteCursor& cursor,
                              std::error_code ec,
                              const wire::DecodeOptions& options) noexcept {
  if (ec) {
    core::detail::logger().debug("from_bytes failed at offset {}: {}", cursor.position(), ec.message());
    return ec;
  }
  if (!cursor.at_end() && !options.allow_trailing_bytes) {
    core::detail::logger().debug("from_bytes: {} trailing bytes at offset {}", cursor.remaining(),
                                 cursor.position());
    return wire::make_error_code(wire::errc::trailing_bytes);
  }
  return {};
}

std::error_code finish_encode(const core::ByteSink& sink, std::error_code ec, std::vector<byte>& out) noexcept {
  if (ec) {
    return ec;
  }
  // 仅在成功时追加，失败不会留下半截编码。
  sink.copy_to(out);
  return {};
}

}  // namespace minser::serde::detail
