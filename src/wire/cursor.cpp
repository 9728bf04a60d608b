#include "minser/wire/cursor.hpp"

namespace minser::wire {

std::error_code ByteCursor::peek(byte& out) const noexcept { return peek_at(0, out); }

std::error_code ByteCursor::peek_at(std::size_t offset, byte& out) const noexcept {
  if (offset >= remaining()) {
    return make_error_code(errc::unexpected_end_of_input);
  }
  out = in_[pos_ + offset];
  return {};
}

std::error_code ByteCursor::read_u8(byte& out) noexcept {
  if (pos_ >= in_.size()) {
    return make_error_code(errc::unexpected_end_of_input);
  }
  out = in_[pos_++];
  return {};
}

std::error_code ByteCursor::read_exact(std::size_t n, bytes_view& out) noexcept {
  if (remaining() < n) {
    return make_error_code(errc::unexpected_end_of_input);
  }
  out = in_.subspan(pos_, n);
  pos_ += n;
  return {};
}

std::error_code ByteCursor::skip(std::size_t n) noexcept {
  if (remaining() < n) {
    return make_error_code(errc::unexpected_end_of_input);
  }
  pos_ += n;
  return {};
}

}  // namespace minser::wire
