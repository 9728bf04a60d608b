#include "minser/wire/error.hpp"

#include <string>

namespace minser::wire {
namespace {

class minser_wire_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "minser.wire"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::unexpected_end_of_input:
        return "unexpected end of input";
      case errc::malformed_delimiter:
        return "malformed delimiter";
      case errc::unterminated_span:
        return "unterminated span";
      case errc::unknown_variant_index:
        return "unknown variant index";
      case errc::sink_exhausted:
        return "output sink exhausted";
      case errc::invalid_value:
        return "invalid primitive value";
      case errc::field_mismatch:
        return "struct field name mismatch";
      case errc::depth_exceeded:
        return "nesting depth exceeded";
      case errc::ambiguous_option:
        return "option presence is not known";
      case errc::trailing_bytes:
        return "trailing bytes after value";
      default:
        return "unknown minser.wire error";
    }
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static minser_wire_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // namespace minser::wire
