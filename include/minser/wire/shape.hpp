#pragma once

#include "minser/wire/options.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace minser::wire {

enum class kind : std::uint8_t {
  none = 0,  // 无载荷（仅用于 unit 枚举变体）
  boolean,
  i8,
  i16,
  i32,
  i64,
  u8,
  u16,
  u32,
  u64,
  f32,
  f64,
  character,
  string,
  bytes,
  unit,
  option,
  seq,
  tuple,
  map,
  structure,
  enumeration,
};

[[nodiscard]] std::string_view kind_name(kind k) noexcept;

/**
 * @brief 解码时的期望形状（调用方事先已知的“类型”）。
 *
 * children 的含义随 kind 而定：
 * - option      : [内层形状]，presence 描述 None/Some 约定
 * - seq         : [元素形状]（变长）
 * - tuple       : 每个位置一个形状（定长，编码为 seq）
 * - map         : [键形状, 值形状]
 * - structure   : 每个字段一个形状，field_names 同序（编码为键为字符串的 map）
 * - enumeration : 每个变体的载荷形状；unit 变体用 Shape::none()
 *
 * 典型用法：
 * @code
 * const auto human = Shape::structure({{"name", Shape::string()}, {"age", Shape::u8()}});
 * @endcode
 */
class Shape final {
 public:
  struct Field;

  [[nodiscard]] kind kind_of() const noexcept { return kind_; }
  [[nodiscard]] wire::presence presence_of() const noexcept { return presence_; }
  [[nodiscard]] const std::vector<Shape>& children() const noexcept { return children_; }
  [[nodiscard]] const std::vector<std::string>& field_names() const noexcept { return field_names_; }

  static Shape none();
  static Shape boolean();

  static Shape i8();
  static Shape i16();
  static Shape i32();
  static Shape i64();

  static Shape u8();
  static Shape u16();
  static Shape u32();
  static Shape u64();

  static Shape f32();
  static Shape f64();
  static Shape character();

  static Shape string();
  static Shape bytes();
  static Shape unit();

  static Shape option(Shape inner, wire::presence p = wire::presence::unknown);
  static Shape seq(Shape element);
  static Shape tuple(std::vector<Shape> elements);
  static Shape map(Shape key, Shape value);
  static Shape structure(std::vector<Field> fields);
  static Shape enumeration(std::vector<Shape> variants);

 private:
  explicit Shape(kind k) noexcept : kind_(k) {}

  kind kind_{kind::none};
  wire::presence presence_{wire::presence::unknown};
  std::vector<Shape> children_;
  std::vector<std::string> field_names_;
};

struct Shape::Field final {
  std::string name;
  Shape shape;
};

}  // namespace minser::wire
