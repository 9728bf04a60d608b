#pragma once

#include "minser/serde/serde.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>

namespace minser::serde {

/**
 * @brief 结构体字段描述：字段名 + 成员引用。
 *
 * hint 只对 std::optional 成员生效，用于声明该字段的 Option 是否存在
 * （编码时忽略）。
 */
template <class T>
struct FieldRef final {
  std::string_view name;
  T& value;
  wire::presence hint{wire::presence::unknown};
};

template <class T>
[[nodiscard]] FieldRef<T> field(std::string_view name, T& value, wire::presence hint = wire::presence::unknown) noexcept {
  return FieldRef<T>{name, value, hint};
}

/**
 * @brief 已知 presence 的 Option 解码（presence 由模式层提供）。
 */
template <class T>
std::error_code decode_optional(wire::Decoder& dec, wire::presence present, std::optional<T>& value) noexcept {
  return Serde<std::optional<T>>::deserialize(dec, present, value);
}

namespace detail {

template <class T>
struct is_optional : std::false_type {};

template <class T>
struct is_optional<std::optional<T>> : std::true_type {};

template <class T>
std::error_code encode_field(wire::Encoder& enc, const FieldRef<T>& f) noexcept {
  using U = std::remove_const_t<T>;
  auto ec = enc.write_str(f.name);
  if (ec) {
    return ec;
  }
  ec = enc.map_key();
  if (ec) {
    return ec;
  }
  ec = Serde<U>::serialize(enc, f.value);
  if (ec) {
    return ec;
  }
  return enc.map_value();
}

template <class T>
std::error_code decode_field(wire::Decoder& dec, std::string_view expected, wire::presence hint, T& slot) noexcept {
  auto ec = dec.expect_entry();
  if (ec) {
    return ec;
  }
  std::string name;
  ec = dec.read_str(name);
  if (ec) {
    return ec;
  }
  if (name != expected) {
    return wire::make_error_code(wire::errc::field_mismatch);
  }
  ec = dec.map_key();
  if (ec) {
    return ec;
  }
  if constexpr (is_optional<T>::value) {
    ec = Serde<T>::deserialize(dec, hint, slot);
  } else {
    ec = Serde<T>::deserialize(dec, slot);
  }
  if (ec) {
    return ec;
  }
  return dec.map_value();
}

template <class... Ts, std::size_t... I>
std::error_code decode_fields(wire::Decoder& dec,
                              std::tuple<Ts...>& staged,
                              std::index_sequence<I...>,
                              const FieldRef<Ts>&... fields) noexcept {
  std::error_code ec;
  (void)((ec = decode_field(dec, fields.name, fields.hint, std::get<I>(staged))) || ...);
  return ec;
}

template <class... Ts, std::size_t... I>
void commit_fields(std::tuple<Ts...>& staged, std::index_sequence<I...>, const FieldRef<Ts>&... fields) noexcept {
  ((fields.value = std::move(std::get<I>(staged))), ...);
}

}  // namespace detail

/**
 * @brief 结构体编码：按给定顺序写成键为字段名的 Map。
 *
 * @code
 * std::error_code serialize(wire::Encoder& enc) const {
 *   return serde::encode_struct(enc, serde::field("name", name), serde::field("age", age));
 * }
 * @endcode
 */
template <class... Ts>
std::error_code encode_struct(wire::Encoder& enc, const FieldRef<Ts>&... fields) noexcept {
  auto ec = enc.begin_map();
  if (ec) {
    return ec;
  }
  (void)((ec = detail::encode_field(enc, fields)) || ...);
  if (ec) {
    return ec;
  }
  return enc.end_map();
}

/**
 * @brief 结构体解码：字段名与顺序必须与 encode_struct 一致，否则 errc::field_mismatch。
 *
 * 任一字段失败时成员保持原值。
 */
template <class... Ts>
std::error_code decode_struct(wire::Decoder& dec, const FieldRef<Ts>&... fields) noexcept {
  static_assert((!std::is_const_v<Ts> && ...), "decode_struct needs mutable fields");
  auto ec = dec.begin_map();
  if (ec) {
    return ec;
  }
  // 先解码到 staged，整个 Map 闭合后再写回成员。
  std::tuple<Ts...> staged{};
  ec = detail::decode_fields(dec, staged, std::index_sequence_for<Ts...>{}, fields...);
  if (!ec) {
    ec = dec.end_map();
  }
  if (ec) {
    return ec;
  }
  detail::commit_fields(staged, std::index_sequence_for<Ts...>{}, fields...);
  return {};
}

/**
 * @brief unit 变体：只写序号。
 */
inline std::error_code encode_variant(wire::Encoder& enc, std::uint32_t index) noexcept {
  return enc.write_variant_index(index);
}

/**
 * @brief 带载荷的变体：序号 + 载荷（newtype 为值本身，tuple 为序列，struct 为 Map）。
 */
template <class Payload>
std::error_code encode_variant(wire::Encoder& enc, std::uint32_t index, const Payload& payload) noexcept {
  auto ec = enc.write_variant_index(index);
  if (ec) {
    return ec;
  }
  if constexpr (std::is_invocable_r_v<std::error_code, const Payload&, wire::Encoder&>) {
    return payload(enc);
  } else {
    return Serde<Payload>::serialize(enc, payload);
  }
}

/**
 * @brief 变体解码：读出序号（>= variant_count 时 errc::unknown_variant_index），
 * 再由 on_index(index) 按该变体的期望形状解码载荷。
 */
template <class OnIndex>
std::error_code decode_variant(wire::Decoder& dec, std::uint32_t variant_count, OnIndex&& on_index) noexcept {
  std::uint32_t index = 0;
  auto ec = dec.read_variant_index(variant_count, index);
  if (ec) {
    return ec;
  }
  return std::forward<OnIndex>(on_index)(index);
}

}  // namespace minser::serde
