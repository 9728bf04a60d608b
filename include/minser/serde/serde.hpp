#pragma once

#include "minser/core/buffer.hpp"
#include "minser/wire/cursor.hpp"
#include "minser/wire/decoder.hpp"
#include "minser/wire/encoder.hpp"
#include "minser/wire/error.hpp"
#include "minser/wire/options.hpp"

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace minser::serde {

using byte = minser::core::byte;
using bytes_view = minser::core::bytes_view;

/**
 * @brief 字节串包装：以 Bytes 形状（0xFF 两侧定界）编码。
 *
 * 裸 std::vector<std::uint8_t> 按 u8 序列编码；需要紧凑字节串时用此包装。
 */
struct Bytes final {
  std::vector<byte> value;
  friend bool operator==(const Bytes&, const Bytes&) = default;
};

/**
 * @brief 类型映射特化点。
 *
 * 每个特化提供：
 * - static std::error_code serialize(wire::Encoder&, const T&) noexcept
 * - static std::error_code deserialize(wire::Decoder&, T&) noexcept
 *
 * 未特化的类型无成员，不满足 Serializable。
 */
template <class T>
struct Serde {};

/**
 * @brief Concept 约束：用户类型通过成员函数自描述其编码形状。
 *
 * 满足此约束的类型自动获得 Serde<T> 特化；成员实现通常委托给
 * encode_struct / decode_struct（见 fields.hpp）。
 */
template <typename T>
concept Mapped = requires(const T& cv, T& v, wire::Encoder& enc, wire::Decoder& dec) {
  { cv.serialize(enc) } -> std::same_as<std::error_code>;
  { v.deserialize(dec) } -> std::same_as<std::error_code>;
};

template <typename T>
concept Serializable = requires(const T& cv, T& v, wire::Encoder& enc, wire::Decoder& dec) {
  { Serde<T>::serialize(enc, cv) } -> std::same_as<std::error_code>;
  { Serde<T>::deserialize(dec, v) } -> std::same_as<std::error_code>;
};

template <class T>
std::error_code serialize(wire::Encoder& enc, const T& value) noexcept {
  return Serde<T>::serialize(enc, value);
}

template <class T>
std::error_code deserialize(wire::Decoder& dec, T& value) noexcept {
  return Serde<T>::deserialize(dec, value);
}

namespace detail {

template <class T, auto Write, auto Read>
struct PrimitiveSerde {
  static std::error_code serialize(wire::Encoder& enc, const T& v) noexcept { return (enc.*Write)(v); }
  static std::error_code deserialize(wire::Decoder& dec, T& v) noexcept { return (dec.*Read)(v); }
};

template <class T>
std::error_code serialize_element(wire::Encoder& enc, const T& v) noexcept {
  auto ec = Serde<T>::serialize(enc, v);
  if (ec) {
    return ec;
  }
  return enc.seq_element();
}

template <class T>
std::error_code deserialize_element(wire::Decoder& dec, T& v) noexcept {
  auto ec = dec.expect_element();
  if (ec) {
    return ec;
  }
  ec = Serde<T>::deserialize(dec, v);
  if (ec) {
    return ec;
  }
  return dec.seq_element();
}

template <class Container>
std::error_code serialize_seq(wire::Encoder& enc, const Container& values) noexcept {
  auto ec = enc.begin_seq();
  if (ec) {
    return ec;
  }
  for (const auto& v : values) {
    ec = serialize_element(enc, v);
    if (ec) {
      return ec;
    }
  }
  return enc.end_seq();
}

template <class MapLike>
std::error_code serialize_map(wire::Encoder& enc, const MapLike& entries) noexcept {
  using K = typename MapLike::key_type;
  using V = typename MapLike::mapped_type;
  auto ec = enc.begin_map();
  if (ec) {
    return ec;
  }
  for (const auto& [k, v] : entries) {
    ec = Serde<K>::serialize(enc, k);
    if (ec) {
      return ec;
    }
    ec = enc.map_key();
    if (ec) {
      return ec;
    }
    ec = Serde<V>::serialize(enc, v);
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

// 重复键：后出现的覆盖先出现的。
template <class MapLike>
std::error_code deserialize_map(wire::Decoder& dec, MapLike& out) noexcept {
  using K = typename MapLike::key_type;
  using V = typename MapLike::mapped_type;
  auto ec = dec.begin_map();
  if (ec) {
    return ec;
  }
  MapLike decoded;
  for (;;) {
    bool more = false;
    ec = dec.next_entry(more);
    if (ec) {
      return ec;
    }
    if (!more) {
      break;
    }
    K key{};
    ec = Serde<K>::deserialize(dec, key);
    if (ec) {
      return ec;
    }
    ec = dec.map_key();
    if (ec) {
      return ec;
    }
    V value{};
    ec = Serde<V>::deserialize(dec, value);
    if (ec) {
      return ec;
    }
    ec = dec.map_value();
    if (ec) {
      return ec;
    }
    decoded.insert_or_assign(std::move(key), std::move(value));
  }
  out = std::move(decoded);
  return {};
}

template <std::size_t I, class Var>
std::error_code deserialize_alternative(wire::Decoder& dec, Var& out) noexcept {
  using Alt = std::variant_alternative_t<I, Var>;
  if constexpr (std::is_same_v<Alt, std::monostate>) {
    out.template emplace<I>();
    return {};
  } else {
    Alt alt{};
    auto ec = Serde<Alt>::deserialize(dec, alt);
    if (ec) {
      return ec;
    }
    out.template emplace<I>(std::move(alt));
    return {};
  }
}

template <class Var, std::size_t... I>
std::error_code deserialize_variant(wire::Decoder& dec,
                                    std::uint32_t index,
                                    Var& out,
                                    std::index_sequence<I...>) noexcept {
  std::error_code ec;
  (void)((index == I ? (ec = deserialize_alternative<I>(dec, out), true) : false) || ...);
  return ec;
}

/**
 * @brief 检查整段输入是否已被完全消费，并在失败时记录调试日志。
 */
std::error_code finish_decode(const wire::ByteCursor& cursor,
                              std::error_code ec,
                              const wire::DecodeOptions& options) noexcept;

/**
 * @brief 将 sink 内容追加到 out；sink 已满时记录告警。
 */
std::error_code finish_encode(const core::ByteSink& sink, std::error_code ec, std::vector<byte>& out) noexcept;

}  // namespace detail

// clang-format off
template <> struct Serde<bool> : detail::PrimitiveSerde<bool, &wire::Encoder::write_bool, &wire::Decoder::read_bool> {};
template <> struct Serde<std::int8_t> : detail::PrimitiveSerde<std::int8_t, &wire::Encoder::write_i8, &wire::Decoder::read_i8> {};
template <> struct Serde<std::int16_t> : detail::PrimitiveSerde<std::int16_t, &wire::Encoder::write_i16, &wire::Decoder::read_i16> {};
template <> struct Serde<std::int32_t> : detail::PrimitiveSerde<std::int32_t, &wire::Encoder::write_i32, &wire::Decoder::read_i32> {};
template <> struct Serde<std::int64_t> : detail::PrimitiveSerde<std::int64_t, &wire::Encoder::write_i64, &wire::Decoder::read_i64> {};
template <> struct Serde<std::uint8_t> : detail::PrimitiveSerde<std::uint8_t, &wire::Encoder::write_u8, &wire::Decoder::read_u8> {};
template <> struct Serde<std::uint16_t> : detail::PrimitiveSerde<std::uint16_t, &wire::Encoder::write_u16, &wire::Decoder::read_u16> {};
template <> struct Serde<std::uint32_t> : detail::PrimitiveSerde<std::uint32_t, &wire::Encoder::write_u32, &wire::Decoder::read_u32> {};
template <> struct Serde<std::uint64_t> : detail::PrimitiveSerde<std::uint64_t, &wire::Encoder::write_u64, &wire::Decoder::read_u64> {};
template <> struct Serde<float> : detail::PrimitiveSerde<float, &wire::Encoder::write_f32, &wire::Decoder::read_f32> {};
template <> struct Serde<double> : detail::PrimitiveSerde<double, &wire::Encoder::write_f64, &wire::Decoder::read_f64> {};
template <> struct Serde<char32_t> : detail::PrimitiveSerde<char32_t, &wire::Encoder::write_char, &wire::Decoder::read_char> {};
// clang-format on

template <>
struct Serde<std::string> {
  static std::error_code serialize(wire::Encoder& enc, const std::string& v) noexcept { return enc.write_str(v); }
  static std::error_code deserialize(wire::Decoder& dec, std::string& v) noexcept { return dec.read_str(v); }
};

template <>
struct Serde<Bytes> {
  static std::error_code serialize(wire::Encoder& enc, const Bytes& v) noexcept {
    return enc.write_bytes(bytes_view{v.value.data(), v.value.size()});
  }
  static std::error_code deserialize(wire::Decoder& dec, Bytes& v) noexcept { return dec.read_bytes(v.value); }
};

template <>
struct Serde<std::monostate> {
  static std::error_code serialize(wire::Encoder& enc, const std::monostate&) noexcept { return enc.write_unit(); }
  static std::error_code deserialize(wire::Decoder& dec, std::monostate&) noexcept { return dec.read_unit(); }
};

template <class T>
struct Serde<std::vector<T>> {
  static std::error_code serialize(wire::Encoder& enc, const std::vector<T>& v) noexcept {
    return detail::serialize_seq(enc, v);
  }

  static std::error_code deserialize(wire::Decoder& dec, std::vector<T>& out) noexcept {
    auto ec = dec.begin_seq();
    if (ec) {
      return ec;
    }
    std::vector<T> decoded;
    for (;;) {
      bool more = false;
      ec = dec.next_element(more);
      if (ec) {
        return ec;
      }
      if (!more) {
        break;
      }
      T element{};
      ec = Serde<T>::deserialize(dec, element);
      if (ec) {
        return ec;
      }
      ec = dec.seq_element();
      if (ec) {
        return ec;
      }
      decoded.push_back(std::move(element));
    }
    out = std::move(decoded);
    return {};
  }
};

template <class T, std::size_t N>
struct Serde<std::array<T, N>> {
  static std::error_code serialize(wire::Encoder& enc, const std::array<T, N>& v) noexcept {
    return detail::serialize_seq(enc, v);
  }

  static std::error_code deserialize(wire::Decoder& dec, std::array<T, N>& out) noexcept {
    auto ec = dec.begin_seq();
    if (ec) {
      return ec;
    }
    std::array<T, N> decoded{};
    for (auto& element : decoded) {
      ec = detail::deserialize_element(dec, element);
      if (ec) {
        return ec;
      }
    }
    ec = dec.end_seq();
    if (ec) {
      return ec;
    }
    out = std::move(decoded);
    return {};
  }
};

template <class... Ts>
struct Serde<std::tuple<Ts...>> {
  static std::error_code serialize(wire::Encoder& enc, const std::tuple<Ts...>& v) noexcept {
    auto ec = enc.begin_seq();
    if (ec) {
      return ec;
    }
    std::apply([&](const Ts&... elements) { (void)((ec = detail::serialize_element(enc, elements)) || ...); }, v);
    if (ec) {
      return ec;
    }
    return enc.end_seq();
  }

  static std::error_code deserialize(wire::Decoder& dec, std::tuple<Ts...>& out) noexcept {
    auto ec = dec.begin_seq();
    if (ec) {
      return ec;
    }
    std::tuple<Ts...> decoded{};
    std::apply([&](Ts&... elements) { (void)((ec = detail::deserialize_element(dec, elements)) || ...); }, decoded);
    if (!ec) {
      ec = dec.end_seq();
    }
    if (ec) {
      return ec;
    }
    out = std::move(decoded);
    return {};
  }
};

template <class A, class B>
struct Serde<std::pair<A, B>> {
  static std::error_code serialize(wire::Encoder& enc, const std::pair<A, B>& v) noexcept {
    auto ec = enc.begin_seq();
    if (!ec) {
      ec = detail::serialize_element(enc, v.first);
    }
    if (!ec) {
      ec = detail::serialize_element(enc, v.second);
    }
    return ec ? ec : enc.end_seq();
  }

  static std::error_code deserialize(wire::Decoder& dec, std::pair<A, B>& out) noexcept {
    std::pair<A, B> decoded{};
    auto ec = dec.begin_seq();
    if (!ec) {
      ec = detail::deserialize_element(dec, decoded.first);
    }
    if (!ec) {
      ec = detail::deserialize_element(dec, decoded.second);
    }
    if (!ec) {
      ec = dec.end_seq();
    }
    if (ec) {
      return ec;
    }
    out = std::move(decoded);
    return {};
  }
};

template <class K, class V, class Compare, class Alloc>
struct Serde<std::map<K, V, Compare, Alloc>> {
  using map_type = std::map<K, V, Compare, Alloc>;
  static std::error_code serialize(wire::Encoder& enc, const map_type& v) noexcept {
    return detail::serialize_map(enc, v);
  }
  static std::error_code deserialize(wire::Decoder& dec, map_type& out) noexcept {
    return detail::deserialize_map(dec, out);
  }
};

// 编码顺序即容器迭代顺序（不保证跨进程稳定）。
template <class K, class V, class Hash, class Eq, class Alloc>
struct Serde<std::unordered_map<K, V, Hash, Eq, Alloc>> {
  using map_type = std::unordered_map<K, V, Hash, Eq, Alloc>;
  static std::error_code serialize(wire::Encoder& enc, const map_type& v) noexcept {
    return detail::serialize_map(enc, v);
  }
  static std::error_code deserialize(wire::Decoder& dec, map_type& out) noexcept {
    return detail::deserialize_map(dec, out);
  }
};

/**
 * @brief Option 映射。
 *
 * 编码：None 写 unit 字节，Some(v) 写裸 v。
 * 解码：presence 未知，仅在 DecodeOptions::infer_option_from_unit 打开时可解；
 * 已知 presence 的字段请用 decode_optional（见 fields.hpp）。
 */
template <class T>
struct Serde<std::optional<T>> {
  static std::error_code serialize(wire::Encoder& enc, const std::optional<T>& v) noexcept {
    return v ? Serde<T>::serialize(enc, *v) : enc.write_none();
  }

  static std::error_code deserialize(wire::Decoder& dec, std::optional<T>& out) noexcept {
    return deserialize(dec, wire::presence::unknown, out);
  }

  static std::error_code deserialize(wire::Decoder& dec, wire::presence hint, std::optional<T>& out) noexcept {
    bool present = false;
    auto ec = dec.option_present(hint, present);
    if (ec) {
      return ec;
    }
    if (!present) {
      out.reset();
      return {};
    }
    T inner{};
    ec = Serde<T>::deserialize(dec, inner);
    if (ec) {
      return ec;
    }
    out = std::move(inner);
    return {};
  }
};

/**
 * @brief 枚举映射：变体序号为 std::variant::index()。
 *
 * std::monostate 备选项视为 unit 变体（只写序号，无载荷）。
 */
template <class... Ts>
struct Serde<std::variant<Ts...>> {
  static std::error_code serialize(wire::Encoder& enc, const std::variant<Ts...>& v) noexcept {
    auto ec = enc.write_variant_index(static_cast<std::uint32_t>(v.index()));
    if (ec) {
      return ec;
    }
    return std::visit(
      [&](const auto& alt) -> std::error_code {
        using Alt = std::decay_t<decltype(alt)>;
        if constexpr (std::is_same_v<Alt, std::monostate>) {
          return {};
        } else {
          return Serde<Alt>::serialize(enc, alt);
        }
      },
      v);
  }

  static std::error_code deserialize(wire::Decoder& dec, std::variant<Ts...>& out) noexcept {
    std::uint32_t index = 0;
    auto ec = dec.read_variant_index(static_cast<std::uint32_t>(sizeof...(Ts)), index);
    if (ec) {
      return ec;
    }
    return detail::deserialize_variant(dec, index, out, std::index_sequence_for<Ts...>{});
  }
};

template <Mapped T>
struct Serde<T> {
  static std::error_code serialize(wire::Encoder& enc, const T& v) noexcept { return v.serialize(enc); }
  static std::error_code deserialize(wire::Decoder& dec, T& v) noexcept { return v.deserialize(dec); }
};

/**
 * @brief 将值编码并追加到 out。
 *
 * 失败时 out 保持调用前内容不变。
 */
template <Serializable T>
std::error_code to_bytes(const T& value, std::vector<byte>& out, const wire::EncodeOptions& options = {}) noexcept {
  core::ByteSink sink(options.initial_capacity, options.max_capacity);
  wire::Encoder enc(sink);
  return detail::finish_encode(sink, Serde<T>::serialize(enc, value), out);
}

/**
 * @brief 从整段输入解码一个值。
 *
 * 值之后仍有剩余字节时返回 wire::errc::trailing_bytes（除非 allow_trailing_bytes）。
 * 解码在 out 的副本上进行（保留调用方预置的状态，例如字段的 presence），
 * 成功后整体写回；失败时 out 保持调用前内容不变。
 */
template <Serializable T>
  requires std::copy_constructible<T>
std::error_code from_bytes(bytes_view in, T& out, const wire::DecodeOptions& options = {}) noexcept {
  wire::ByteCursor cursor(in);
  wire::Decoder dec(cursor, options);
  T decoded = out;
  auto ec = detail::finish_decode(cursor, Serde<T>::deserialize(dec, decoded), options);
  if (ec) {
    return ec;
  }
  out = std::move(decoded);
  return {};
}

}  // namespace minser::serde
