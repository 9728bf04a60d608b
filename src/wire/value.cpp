#include "minser/wire/value.hpp"

#include <bit>
#include <type_traits>

namespace minser::wire {
namespace {

// 浮点比较采用“按位相等”而不是“按值相等”：
// - 编解码以字节为单位，关注的是位模式是否一致
// - 这样可以正确处理 NaN、-0/+0 等边界情况
bool float_bits_equal(float a, float b) noexcept {
  return std::bit_cast<std::uint32_t>(a) == std::bit_cast<std::uint32_t>(b);
}

bool double_bits_equal(double a, double b) noexcept {
  return std::bit_cast<std::uint64_t>(a) == std::bit_cast<std::uint64_t>(b);
}

bool boxed_equal(const std::shared_ptr<const Value>& lhs, const std::shared_ptr<const Value>& rhs) noexcept {
  if (!lhs || !rhs) {
    return !lhs && !rhs;
  }
  return *lhs == *rhs;
}

}  // namespace

bool operator==(const Optional& lhs, const Optional& rhs) noexcept { return boxed_equal(lhs.value, rhs.value); }

bool operator==(const Seq& lhs, const Seq& rhs) noexcept { return lhs.values == rhs.values; }

bool operator==(const Map& lhs, const Map& rhs) noexcept { return lhs.entries == rhs.entries; }

bool operator==(const Variant& lhs, const Variant& rhs) noexcept {
  return lhs.index == rhs.index && boxed_equal(lhs.payload, rhs.payload);
}

Value::Value(storage_type v) : storage_(std::move(v)) {}

Value Value::unit() { return Value(Unit{}); }
Value Value::boolean(bool v) { return Value(storage_type{std::in_place_type<bool>, v}); }

Value Value::i8(std::int8_t v) { return Value(storage_type{std::in_place_type<std::int8_t>, v}); }
Value Value::i16(std::int16_t v) { return Value(storage_type{std::in_place_type<std::int16_t>, v}); }
Value Value::i32(std::int32_t v) { return Value(storage_type{std::in_place_type<std::int32_t>, v}); }
Value Value::i64(std::int64_t v) { return Value(storage_type{std::in_place_type<std::int64_t>, v}); }

Value Value::u8(std::uint8_t v) { return Value(storage_type{std::in_place_type<std::uint8_t>, v}); }
Value Value::u16(std::uint16_t v) { return Value(storage_type{std::in_place_type<std::uint16_t>, v}); }
Value Value::u32(std::uint32_t v) { return Value(storage_type{std::in_place_type<std::uint32_t>, v}); }
Value Value::u64(std::uint64_t v) { return Value(storage_type{std::in_place_type<std::uint64_t>, v}); }

Value Value::f32(float v) { return Value(storage_type{std::in_place_type<float>, v}); }
Value Value::f64(double v) { return Value(storage_type{std::in_place_type<double>, v}); }
Value Value::character(char32_t v) { return Value(storage_type{std::in_place_type<char32_t>, v}); }

Value Value::string(std::string v) { return Value(String{std::move(v)}); }
Value Value::bytes(std::vector<byte> v) { return Value(Bytes{std::move(v)}); }

Value Value::none() { return Value(Optional{}); }
Value Value::some(Value v) { return Value(Optional{std::make_shared<const Value>(std::move(v))}); }

Value Value::seq(std::vector<Value> values) { return Value(Seq{std::move(values)}); }
Value Value::map(std::vector<MapEntry> entries) { return Value(Map{std::move(entries)}); }

Value Value::variant(std::uint32_t index) { return Value(Variant{index, nullptr}); }
Value Value::variant(std::uint32_t index, Value payload) {
  return Value(Variant{index, std::make_shared<const Value>(std::move(payload))});
}

bool operator==(const Value& lhs, const Value& rhs) noexcept {
  if (lhs.storage_.index() != rhs.storage_.index()) {
    return false;
  }
  return std::visit(
    [&](const auto& a) -> bool {
      using T = std::decay_t<decltype(a)>;
      const auto* b = std::get_if<T>(&rhs.storage_);
      if (!b) {
        return false;
      }
      if constexpr (std::is_same_v<T, float>) {
        return float_bits_equal(a, *b);
      } else if constexpr (std::is_same_v<T, double>) {
        return double_bits_equal(a, *b);
      } else {
        return a == *b;
      }
    },
    lhs.storage_);
}

}  // namespace minser::wire
