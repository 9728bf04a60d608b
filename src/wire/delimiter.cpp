#include "minser/wire/delimiter.hpp"

namespace minser::wire {

std::string_view delimiter_name(Delimiter d) noexcept {
  switch (d) {
    case Delimiter::string:
      return "STRING";
    case Delimiter::bytes:
      return "BYTES";
    case Delimiter::unit:
      return "UNIT";
    case Delimiter::seq:
      return "SEQ";
    case Delimiter::seq_value:
      return "SEQ_VALUE";
    case Delimiter::map:
      return "MAP";
    case Delimiter::map_key:
      return "MAP_KEY";
    case Delimiter::map_value:
      return "MAP_VALUE";
  }
  return "UNKNOWN";
}

}  // namespace minser::wire
