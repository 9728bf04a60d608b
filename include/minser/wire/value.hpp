#pragma once

#include "minser/core/common.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace minser::wire {

using byte = minser::core::byte;

class Value;
struct MapEntry;

struct Unit final {
  friend bool operator==(const Unit&, const Unit&) = default;
};

struct String final {
  std::string value;
  friend bool operator==(const String&, const String&) = default;
};

struct Bytes final {
  std::vector<byte> value;
  friend bool operator==(const Bytes&, const Bytes&) = default;
};

/**
 * @brief Option：value 为空表示 None。
 */
struct Optional final {
  std::shared_ptr<const Value> value;
  friend bool operator==(const Optional& lhs, const Optional& rhs) noexcept;
};

struct Seq final {
  std::vector<Value> values;
  friend bool operator==(const Seq& lhs, const Seq& rhs) noexcept;
};

struct Map final {
  std::vector<MapEntry> entries;
  friend bool operator==(const Map& lhs, const Map& rhs) noexcept;
};

/**
 * @brief 枚举选择：变体序号 + 载荷（unit 变体 payload 为空）。
 */
struct Variant final {
  std::uint32_t index{0};
  std::shared_ptr<const Value> payload;
  friend bool operator==(const Variant& lhs, const Variant& rhs) noexcept;
};

/**
 * @brief 数据模型值（强类型，支持嵌套 Seq/Map/Optional/Variant）。
 *
 * 约定：
 * - 元组、数组、元组结构体都用 Seq 表示；结构体用键为 String 的 Map 表示；
 * - 浮点比较按位进行（NaN、-0/+0 可精确往返）；
 * - Map 保持插入顺序，不排序、不去重。
 */
class Value final {
 public:
  using storage_type = std::variant<Unit,
                                    bool,
                                    std::int8_t,
                                    std::int16_t,
                                    std::int32_t,
                                    std::int64_t,
                                    std::uint8_t,
                                    std::uint16_t,
                                    std::uint32_t,
                                    std::uint64_t,
                                    float,
                                    double,
                                    char32_t,
                                    String,
                                    Bytes,
                                    Optional,
                                    Seq,
                                    Map,
                                    Variant>;

  Value() = delete;

  explicit Value(storage_type v);

  [[nodiscard]] const storage_type& storage() const noexcept { return storage_; }
  [[nodiscard]] storage_type& storage() noexcept { return storage_; }

  template <class T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&storage_);
  }

  template <class T>
  [[nodiscard]] T* get_if() noexcept {
    return std::get_if<T>(&storage_);
  }

  static Value unit();
  static Value boolean(bool v);

  static Value i8(std::int8_t v);
  static Value i16(std::int16_t v);
  static Value i32(std::int32_t v);
  static Value i64(std::int64_t v);

  static Value u8(std::uint8_t v);
  static Value u16(std::uint16_t v);
  static Value u32(std::uint32_t v);
  static Value u64(std::uint64_t v);

  static Value f32(float v);
  static Value f64(double v);
  static Value character(char32_t v);

  static Value string(std::string v);
  static Value bytes(std::vector<byte> v);

  static Value none();
  static Value some(Value v);

  static Value seq(std::vector<Value> values);
  static Value map(std::vector<MapEntry> entries);

  static Value variant(std::uint32_t index);
  static Value variant(std::uint32_t index, Value payload);

  friend bool operator==(const Value& lhs, const Value& rhs) noexcept;
  friend bool operator!=(const Value& lhs, const Value& rhs) noexcept { return !(lhs == rhs); }

 private:
  storage_type storage_;
};

struct MapEntry final {
  Value key;
  Value value;
  friend bool operator==(const MapEntry& lhs, const MapEntry& rhs) noexcept {
    return lhs.key == rhs.key && lhs.value == rhs.value;
  }
};

}  // namespace minser::wire
