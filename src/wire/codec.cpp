#include "minser/wire/codec.hpp"

#include "../core/log_internal.hpp"

#include <string>
#include <type_traits>
#include <utility>

namespace minser::wire {
namespace {

std::error_code encode_seq(Encoder& enc, const std::vector<Value>& values) noexcept {
  auto ec = enc.begin_seq();
  if (ec) {
    return ec;
  }
  for (const auto& v : values) {
    ec = encode_value(enc, v);
    if (ec) {
      return ec;
    }
    ec = enc.seq_element();
    if (ec) {
      return ec;
    }
  }
  return enc.end_seq();
}

std::error_code encode_map(Encoder& enc, const std::vector<MapEntry>& entries) noexcept {
  auto ec = enc.begin_map();
  if (ec) {
    return ec;
  }
  for (const auto& e : entries) {
    ec = encode_value(enc, e.key);
    if (ec) {
      return ec;
    }
    ec = enc.map_key();
    if (ec) {
      return ec;
    }
    ec = encode_value(enc, e.value);
    if (ec) {
      return ec;
    }
    ec = enc.map_value();
    if (ec) {
      return ec;
    }
  }
  return enc.end_map();
}

template <class T, class Read>
std::error_code decode_primitive(Decoder& dec, Value& out, Read read) noexcept {
  T v{};
  auto ec = (dec.*read)(v);
  if (ec) {
    return ec;
  }
  out = Value(Value::storage_type{std::in_place_type<T>, v});
  return {};
}

std::error_code decode_seq(Decoder& dec, const Shape& element, Value& out) noexcept {
  auto ec = dec.begin_seq();
  if (ec) {
    return ec;
  }
  std::vector<Value> values;
  for (;;) {
    bool more = false;
    ec = dec.next_element(more);
    if (ec) {
      return ec;
    }
    if (!more) {
      break;
    }
    Value child = Value::unit();  // 占位，后续会被覆盖
    ec = decode_value(dec, element, child);
    if (ec) {
      return ec;
    }
    ec = dec.seq_element();
    if (ec) {
      return ec;
    }
    values.push_back(std::move(child));
  }
  out = Value::seq(std::move(values));
  return {};
}

std::error_code decode_tuple(Decoder& dec, const std::vector<Shape>& elements, Value& out) noexcept {
  auto ec = dec.begin_seq();
  if (ec) {
    return ec;
  }
  std::vector<Value> values;
  values.reserve(elements.size());
  for (const auto& element : elements) {
    ec = dec.expect_element();
    if (ec) {
      return ec;
    }
    Value child = Value::unit();
    ec = decode_value(dec, element, child);
    if (ec) {
      return ec;
    }
    ec = dec.seq_element();
    if (ec) {
      return ec;
    }
    values.push_back(std::move(child));
  }
  ec = dec.end_seq();
  if (ec) {
    return ec;
  }
  out = Value::seq(std::move(values));
  return {};
}

std::error_code decode_map(Decoder& dec, const Shape& key, const Shape& value, Value& out) noexcept {
  auto ec = dec.begin_map();
  if (ec) {
    return ec;
  }
  std::vector<MapEntry> entries;
  for (;;) {
    bool more = false;
    ec = dec.next_entry(more);
    if (ec) {
      return ec;
    }
    if (!more) {
      break;
    }
    MapEntry entry{Value::unit(), Value::unit()};
    ec = decode_value(dec, key, entry.key);
    if (ec) {
      return ec;
    }
    ec = dec.map_key();
    if (ec) {
      return ec;
    }
    ec = decode_value(dec, value, entry.value);
    if (ec) {
      return ec;
    }
    ec = dec.map_value();
    if (ec) {
      return ec;
    }
    entries.push_back(std::move(entry));
  }
  out = Value::map(std::move(entries));
  return {};
}

std::error_code decode_structure(Decoder& dec, const Shape& shape, Value& out) noexcept {
  const auto& names = shape.field_names();
  const auto& fields = shape.children();

  auto ec = dec.begin_map();
  if (ec) {
    return ec;
  }
  std::vector<MapEntry> entries;
  entries.reserve(fields.size());
  for (std::size_t i = 0; i < fields.size(); ++i) {
    ec = dec.expect_entry();
    if (ec) {
      return ec;
    }
    std::string name;
    ec = dec.read_str(name);
    if (ec) {
      return ec;
    }
    // 字段按类型定义顺序出现，名字不符说明双方类型不一致。
    if (name != names[i]) {
      return make_error_code(errc::field_mismatch);
    }
    ec = dec.map_key();
    if (ec) {
      return ec;
    }
    MapEntry entry{Value::string(std::move(name)), Value::unit()};
    ec = decode_value(dec, fields[i], entry.value);
    if (ec) {
      return ec;
    }
    ec = dec.map_value();
    if (ec) {
      return ec;
    }
    entries.push_back(std::move(entry));
  }
  ec = dec.end_map();
  if (ec) {
    return ec;
  }
  out = Value::map(std::move(entries));
  return {};
}

std::error_code decode_enumeration(Decoder& dec, const std::vector<Shape>& variants, Value& out) noexcept {
  std::uint32_t index = 0;
  auto ec = dec.read_variant_index(static_cast<std::uint32_t>(variants.size()), index);
  if (ec) {
    return ec;
  }
  const auto& payload_shape = variants[index];
  if (payload_shape.kind_of() == kind::none) {
    out = Value::variant(index);
    return {};
  }
  Value payload = Value::unit();
  ec = decode_value(dec, payload_shape, payload);
  if (ec) {
    return ec;
  }
  out = Value::variant(index, std::move(payload));
  return {};
}

std::error_code decode_option(Decoder& dec, const Shape& shape, Value& out) noexcept {
  bool present = false;
  auto ec = dec.option_present(shape.presence_of(), present);
  if (ec) {
    return ec;
  }
  if (!present) {
    out = Value::none();
    return {};
  }
  Value inner = Value::unit();
  ec = decode_value(dec, shape.children().front(), inner);
  if (ec) {
    return ec;
  }
  out = Value::some(std::move(inner));
  return {};
}

}  // namespace

std::error_code encode_value(Encoder& enc, const Value& value) noexcept {
  return std::visit(
    [&](const auto& v) -> std::error_code {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, Unit>) {
        return enc.write_unit();
      } else if constexpr (std::is_same_v<T, bool>) {
        return enc.write_bool(v);
      } else if constexpr (std::is_same_v<T, std::int8_t>) {
        return enc.write_i8(v);
      } else if constexpr (std::is_same_v<T, std::int16_t>) {
        return enc.write_i16(v);
      } else if constexpr (std::is_same_v<T, std::int32_t>) {
        return enc.write_i32(v);
      } else if constexpr (std::is_same_v<T, std::int64_t>) {
        return enc.write_i64(v);
      } else if constexpr (std::is_same_v<T, std::uint8_t>) {
        return enc.write_u8(v);
      } else if constexpr (std::is_same_v<T, std::uint16_t>) {
        return enc.write_u16(v);
      } else if constexpr (std::is_same_v<T, std::uint32_t>) {
        return enc.write_u32(v);
      } else if constexpr (std::is_same_v<T, std::uint64_t>) {
        return enc.write_u64(v);
      } else if constexpr (std::is_same_v<T, float>) {
        return enc.write_f32(v);
      } else if constexpr (std::is_same_v<T, double>) {
        return enc.write_f64(v);
      } else if constexpr (std::is_same_v<T, char32_t>) {
        return enc.write_char(v);
      } else if constexpr (std::is_same_v<T, String>) {
        return enc.write_str(v.value);
      } else if constexpr (std::is_same_v<T, Bytes>) {
        return enc.write_bytes(bytes_view{v.value.data(), v.value.size()});
      } else if constexpr (std::is_same_v<T, Optional>) {
        // Some(v) 直接编码为 v，不带任何标记。
        return v.value ? encode_value(enc, *v.value) : enc.write_none();
      } else if constexpr (std::is_same_v<T, Seq>) {
        return encode_seq(enc, v.values);
      } else if constexpr (std::is_same_v<T, Map>) {
        return encode_map(enc, v.entries);
      } else if constexpr (std::is_same_v<T, Variant>) {
        auto ec = enc.write_variant_index(v.index);
        if (ec || !v.payload) {
          return ec;
        }
        return encode_value(enc, *v.payload);
      } else {
        static_assert(!sizeof(T), "unhandled Value alternative");
      }
    },
    value.storage());
}

std::error_code decode_value(Decoder& dec, const Shape& shape, Value& out) noexcept {
  switch (shape.kind_of()) {
    case kind::none:
      // none 只能作为 unit 枚举变体的载荷出现，单独使用时不消费任何字节。
      out = Value::unit();
      return {};
    case kind::boolean:
      return decode_primitive<bool>(dec, out, &Decoder::read_bool);
    case kind::i8:
      return decode_primitive<std::int8_t>(dec, out, &Decoder::read_i8);
    case kind::i16:
      return decode_primitive<std::int16_t>(dec, out, &Decoder::read_i16);
    case kind::i32:
      return decode_primitive<std::int32_t>(dec, out, &Decoder::read_i32);
    case kind::i64:
      return decode_primitive<std::int64_t>(dec, out, &Decoder::read_i64);
    case kind::u8:
      return decode_primitive<std::uint8_t>(dec, out, &Decoder::read_u8);
    case kind::u16:
      return decode_primitive<std::uint16_t>(dec, out, &Decoder::read_u16);
    case kind::u32:
      return decode_primitive<std::uint32_t>(dec, out, &Decoder::read_u32);
    case kind::u64:
      return decode_primitive<std::uint64_t>(dec, out, &Decoder::read_u64);
    case kind::f32:
      return decode_primitive<float>(dec, out, &Decoder::read_f32);
    case kind::f64:
      return decode_primitive<double>(dec, out, &Decoder::read_f64);
    case kind::character:
      return decode_primitive<char32_t>(dec, out, &Decoder::read_char);
    case kind::string: {
      std::string s;
      auto ec = dec.read_str(s);
      if (ec) {
        return ec;
      }
      out = Value::string(std::move(s));
      return {};
    }
    case kind::bytes: {
      std::vector<byte> b;
      auto ec = dec.read_bytes(b);
      if (ec) {
        return ec;
      }
      out = Value::bytes(std::move(b));
      return {};
    }
    case kind::unit: {
      auto ec = dec.read_unit();
      if (ec) {
        return ec;
      }
      out = Value::unit();
      return {};
    }
    case kind::option:
      return decode_option(dec, shape, out);
    case kind::seq:
      return decode_seq(dec, shape.children().front(), out);
    case kind::tuple:
      return decode_tuple(dec, shape.children(), out);
    case kind::map:
      return decode_map(dec, shape.children()[0], shape.children()[1], out);
    case kind::structure:
      return decode_structure(dec, shape, out);
    case kind::enumeration:
      return decode_enumeration(dec, shape.children(), out);
  }
  return make_error_code(errc::malformed_delimiter);
}

std::error_code encode_to(core::ByteSink& sink, const Value& value) noexcept {
  const auto mark = sink.size();
  Encoder enc(sink);
  auto ec = encode_value(enc, value);
  if (ec) {
    // 撤销本次写入的半截编码；mark 不大于当前 size，truncate 不会失败。
    if (sink.truncate(mark)) {
      sink.clear();
    }
    return ec;
  }
  return {};
}

std::error_code encode(const Value& value, std::vector<byte>& out, const EncodeOptions& options) noexcept {
  core::ByteSink sink(options.initial_capacity, options.max_capacity);
  auto ec = encode_to(sink, value);
  if (ec) {
    return ec;
  }
  sink.copy_to(out);
  return {};
}

std::error_code decode_one(bytes_view in,
                           const Shape& shape,
                           Value& out,
                           std::size_t& consumed,
                           const DecodeOptions& options) noexcept {
  ByteCursor cursor(in);
  Decoder dec(cursor, options);
  Value decoded = Value::unit();
  auto ec = decode_value(dec, shape, decoded);
  if (ec) {
    core::detail::logger().debug("decode {} failed at offset {}/{}: {}", kind_name(shape.kind_of()),
                                 cursor.position(), in.size(), ec.message());
    consumed = 0;
    return ec;
  }
  out = std::move(decoded);
  consumed = cursor.position();
  return {};
}

std::error_code decode(bytes_view in, const Shape& shape, Value& out, const DecodeOptions& options) noexcept {
  std::size_t consumed = 0;
  Value decoded = Value::unit();
  auto ec = decode_one(in, shape, decoded, consumed, options);
  if (ec) {
    return ec;
  }
  if (consumed != in.size() && !options.allow_trailing_bytes) {
    core::detail::logger().debug("decode {}: {} trailing bytes", kind_name(shape.kind_of()), in.size() - consumed);
    return make_error_code(errc::trailing_bytes);
  }
  out = std::move(decoded);
  return {};
}

}  // namespace minser::wire
