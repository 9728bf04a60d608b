#include "minser/wire/shape.hpp"

#include <utility>

namespace minser::wire {

std::string_view kind_name(kind k) noexcept {
  switch (k) {
    case kind::none:
      return "none";
    case kind::boolean:
      return "bool";
    case kind::i8:
      return "i8";
    case kind::i16:
      return "i16";
    case kind::i32:
      return "i32";
    case kind::i64:
      return "i64";
    case kind::u8:
      return "u8";
    case kind::u16:
      return "u16";
    case kind::u32:
      return "u32";
    case kind::u64:
      return "u64";
    case kind::f32:
      return "f32";
    case kind::f64:
      return "f64";
    case kind::character:
      return "char";
    case kind::string:
      return "string";
    case kind::bytes:
      return "bytes";
    case kind::unit:
      return "unit";
    case kind::option:
      return "option";
    case kind::seq:
      return "seq";
    case kind::tuple:
      return "tuple";
    case kind::map:
      return "map";
    case kind::structure:
      return "struct";
    case kind::enumeration:
      return "enum";
  }
  return "unknown";
}

Shape Shape::none() { return Shape(kind::none); }
Shape Shape::boolean() { return Shape(kind::boolean); }

Shape Shape::i8() { return Shape(kind::i8); }
Shape Shape::i16() { return Shape(kind::i16); }
Shape Shape::i32() { return Shape(kind::i32); }
Shape Shape::i64() { return Shape(kind::i64); }

Shape Shape::u8() { return Shape(kind::u8); }
Shape Shape::u16() { return Shape(kind::u16); }
Shape Shape::u32() { return Shape(kind::u32); }
Shape Shape::u64() { return Shape(kind::u64); }

Shape Shape::f32() { return Shape(kind::f32); }
Shape Shape::f64() { return Shape(kind::f64); }
Shape Shape::character() { return Shape(kind::character); }

Shape Shape::string() { return Shape(kind::string); }
Shape Shape::bytes() { return Shape(kind::bytes); }
Shape Shape::unit() { return Shape(kind::unit); }

Shape Shape::option(Shape inner, wire::presence p) {
  Shape s(kind::option);
  s.presence_ = p;
  s.children_.push_back(std::move(inner));
  return s;
}

Shape Shape::seq(Shape element) {
  Shape s(kind::seq);
  s.children_.push_back(std::move(element));
  return s;
}

Shape Shape::tuple(std::vector<Shape> elements) {
  Shape s(kind::tuple);
  s.children_ = std::move(elements);
  return s;
}

Shape Shape::map(Shape key, Shape value) {
  Shape s(kind::map);
  s.children_.reserve(2);
  s.children_.push_back(std::move(key));
  s.children_.push_back(std::move(value));
  return s;
}

Shape Shape::structure(std::vector<Field> fields) {
  Shape s(kind::structure);
  s.children_.reserve(fields.size());
  s.field_names_.reserve(fields.size());
  for (auto& f : fields) {
    s.field_names_.push_back(std::move(f.name));
    s.children_.push_back(std::move(f.shape));
  }
  return s;
}

Shape Shape::enumeration(std::vector<Shape> variants) {
  Shape s(kind::enumeration);
  s.children_ = std::move(variants);
  return s;
}

}  // namespace minser::wire
