#include "minser/core/error.hpp"

#include <string>

namespace minser::core {
namespace {

// core::errc 的 std::error_category 实现：
// - name() 用于区分错误域
// - message() 返回可读的英文描述（便于调试与日志；不参与编码格式）
class minser_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "minser.core"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::buffer_overflow:
        return "buffer overflow";
      case errc::invalid_argument:
        return "invalid argument";
      default:
        return "unknown minser.core error";
    }
  }
};

}  // 匿名命名空间

const std::error_category& error_category() noexcept {
  static minser_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // 命名空间 minser::core
