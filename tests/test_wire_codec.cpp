#include "minser/core/buffer.hpp"
#include "minser/wire/codec.hpp"

#include "test_main.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace {

using minser::wire::DecodeOptions;
using minser::wire::EncodeOptions;
using minser::wire::MapEntry;
using minser::wire::Shape;
using minser::wire::Value;
using minser::wire::byte;
using minser::wire::errc;
using minser::wire::make_error_code;
using minser::wire::presence;

Value human_value() {
  return Value::map({
    MapEntry{Value::string("name"), Value::string("Ayush")},
    MapEntry{Value::string("age"), Value::u8(19)},
  });
}

Shape human_shape() {
  return Shape::structure({
    Shape::Field{"name", Shape::string()},
    Shape::Field{"age", Shape::u8()},
  });
}

// 编码 -> 解码 -> 再编码，要求值相等且字节完全一致。
void expect_round_trip(const Value& value, const Shape& shape, const DecodeOptions& options = {}) {
  std::vector<byte> first;
  TEST_EXPECT_OK(minser::wire::encode(value, first));

  Value decoded = Value::unit();
  TEST_EXPECT_OK(minser::wire::decode(first, shape, decoded, options));
  TEST_EXPECT(decoded == value);

  std::vector<byte> second;
  TEST_EXPECT_OK(minser::wire::encode(decoded, second));
  TEST_EXPECT_EQ(first, second);
}

void test_struct_example_bytes() {
  std::vector<byte> out;
  TEST_EXPECT_OK(minser::wire::encode(human_value(), out));
  const std::vector<byte> expected{0x3A, 0xFE, 0x6E, 0x61, 0x6D, 0x65, 0xFE, 0x3B, 0xFE,
                                   0x41, 0x79, 0x75, 0x73, 0x68, 0xFE, 0x3C, 0xFE, 0x61,
                                   0x67, 0x65, 0xFE, 0x3B, 0x13, 0x3C, 0x3A};
  TEST_EXPECT_EQ(out, expected);

  Value decoded = Value::unit();
  TEST_EXPECT_OK(minser::wire::decode(out, human_shape(), decoded));
  TEST_EXPECT(decoded == human_value());
}

void test_encode_appends_to_output() {
  std::vector<byte> out{0xAA};
  TEST_EXPECT_OK(minser::wire::encode(Value::unit(), out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{0xAA, 0x05}));
}

void test_primitive_round_trips() {
  expect_round_trip(Value::boolean(true), Shape::boolean());
  expect_round_trip(Value::i8(-128), Shape::i8());
  expect_round_trip(Value::i16(-12345), Shape::i16());
  expect_round_trip(Value::i32(std::numeric_limits<std::int32_t>::min()), Shape::i32());
  expect_round_trip(Value::i64(-1), Shape::i64());
  expect_round_trip(Value::u16(0xFFFF), Shape::u16());
  expect_round_trip(Value::u32(0x3A3B3C26u), Shape::u32());
  expect_round_trip(Value::u64(std::numeric_limits<std::uint64_t>::max()), Shape::u64());
  expect_round_trip(Value::f32(-0.0f), Shape::f32());
  expect_round_trip(Value::f64(std::numeric_limits<double>::quiet_NaN()), Shape::f64());
  expect_round_trip(Value::character(U'\U0001F600'), Shape::character());
  expect_round_trip(Value::unit(), Shape::unit());
}

void test_float_equality_is_bitwise() {
  TEST_EXPECT(Value::f64(0.0) != Value::f64(-0.0));
  const double nan = std::numeric_limits<double>::quiet_NaN();
  TEST_EXPECT(Value::f64(nan) == Value::f64(nan));
}

void test_delimiter_bytes_inside_content() {
  expect_round_trip(Value::string("&.:;<"), Shape::string());
  expect_round_trip(Value::bytes({0xFF}), Shape::bytes());
  expect_round_trip(Value::bytes({0xFF, 0xFF, 0xFE, 0x26, 0x3A, 0x05}), Shape::bytes());
  expect_round_trip(Value::bytes({}), Shape::bytes());

  // 序列中的 bytes 以 0xFF 结尾，紧跟序列分隔符。
  expect_round_trip(Value::seq({Value::bytes({0x01, 0xFF}), Value::bytes({0xFF})}), Shape::seq(Shape::bytes()));

  // 键为 bytes 的 Map。
  expect_round_trip(Value::map({MapEntry{Value::bytes({0x3B, 0x3C}), Value::string("")}}),
                    Shape::map(Shape::bytes(), Shape::string()));

  // 以其他分隔符值开头的整数元素。
  expect_round_trip(Value::seq({Value::u8(0x26), Value::u8(0x3A), Value::u8(0x3C), Value::u8(0x05)}),
                    Shape::seq(Shape::u8()));
  expect_round_trip(Value::map({MapEntry{Value::u8(0x3B), Value::u8(0x3A)}}), Shape::map(Shape::u8(), Shape::u8()));
}

void test_separators_follow_items() {
  std::vector<byte> out;
  TEST_EXPECT_OK(minser::wire::encode(Value::map({MapEntry{Value::string("k"), Value::u8(1)}}), out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{0x3A, 0xFE, 0x6B, 0xFE, 0x3B, 0x01, 0x3C, 0x3A}));

  out.clear();
  TEST_EXPECT_OK(minser::wire::encode(Value::seq({Value::u8(1), Value::u8(2)}), out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{0x26, 0x01, 0x2E, 0x02, 0x2E, 0x2E}));

  out.clear();
  const Value nested = Value::seq({Value::seq({Value::u8(7)}), Value::seq({})});
  TEST_EXPECT_OK(minser::wire::encode(nested, out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{0x26, 0x26, 0x07, 0x2E, 0x2E, 0x2E, 0x26, 0x2E, 0x2E, 0x2E}));
}

void test_terminator_lookalike_elements() {
  // 元素位置上的 0x2E 即序列终止符：以它开头的元素无法往返。
  std::vector<byte> out;
  TEST_EXPECT_OK(minser::wire::encode(Value::seq({Value::u8(0x2E)}), out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{0x26, 0x2E, 0x2E, 0x2E}));
  Value decoded = Value::unit();
  TEST_EXPECT_EQ(minser::wire::decode(out, Shape::seq(Shape::u8()), decoded),
                 make_error_code(errc::trailing_bytes));

  // 键位置上的 0x3A 即 Map 结束符。
  out.clear();
  TEST_EXPECT_OK(minser::wire::encode(Value::map({MapEntry{Value::u8(0x3A), Value::u8(1)}}), out));
  TEST_EXPECT_EQ(minser::wire::decode(out, Shape::map(Shape::u8(), Shape::u8()), decoded),
                 make_error_code(errc::trailing_bytes));
}

void test_nested_composites() {
  const Value nested = Value::seq({
    Value::seq({}),
    Value::seq({Value::seq({Value::i32(-1)})}),
  });
  expect_round_trip(nested, Shape::seq(Shape::seq(Shape::seq(Shape::i32()))));

  const Value tuple = Value::seq({Value::u8(1), Value::string("x"), Value::boolean(false)});
  expect_round_trip(tuple, Shape::tuple({Shape::u8(), Shape::string(), Shape::boolean()}));

  // Map 保持插入顺序。
  const Value map = Value::map({
    MapEntry{Value::string("two"), Value::i32(2)},
    MapEntry{Value::string("one"), Value::i32(1)},
  });
  expect_round_trip(map, Shape::map(Shape::string(), Shape::i32()));
}

void test_empty_composites() {
  std::vector<byte> out;
  TEST_EXPECT_OK(minser::wire::encode(Value::seq({}), out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{0x26, 0x2E}));
  out.clear();
  TEST_EXPECT_OK(minser::wire::encode(Value::map({}), out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{0x3A, 0x3A}));
}

void test_enumerations() {
  const Shape some_enum = Shape::enumeration({
    Shape::structure({Shape::Field{"a", Shape::u8()}, Shape::Field{"b", Shape::u16()}}),
    Shape::u8(),
    Shape::none(),
  });

  std::vector<byte> out;
  TEST_EXPECT_OK(minser::wire::encode(Value::variant(2), out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{0x02, 0x00, 0x00, 0x00}));

  expect_round_trip(Value::variant(2), some_enum);
  expect_round_trip(Value::variant(1, Value::u8(7)), some_enum);
  expect_round_trip(Value::variant(0,
                                   Value::map({
                                     MapEntry{Value::string("a"), Value::u8(1)},
                                     MapEntry{Value::string("b"), Value::u16(2)},
                                   })),
                    some_enum);

  Value decoded = Value::unit();
  const std::vector<byte> unknown{0x03, 0x00, 0x00, 0x00};
  TEST_EXPECT_EQ(minser::wire::decode(unknown, some_enum, decoded), make_error_code(errc::unknown_variant_index));
}

void test_options() {
  std::vector<byte> out;
  TEST_EXPECT_OK(minser::wire::encode(Value::none(), out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{0x05}));
  out.clear();
  TEST_EXPECT_OK(minser::wire::encode(Value::some(Value::u16(0x0102)), out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{0x02, 0x01}));

  expect_round_trip(Value::none(), Shape::option(Shape::u16(), presence::absent));
  expect_round_trip(Value::some(Value::u16(0x0102)), Shape::option(Shape::u16(), presence::present));

  Value decoded = Value::unit();
  TEST_EXPECT_EQ(minser::wire::decode(out, Shape::option(Shape::u16()), decoded),
                 make_error_code(errc::ambiguous_option));

  DecodeOptions infer;
  infer.infer_option_from_unit = true;
  expect_round_trip(Value::none(), Shape::option(Shape::u16()), infer);
  expect_round_trip(Value::some(Value::u16(0x0102)), Shape::option(Shape::u16()), infer);
}

void test_struct_field_mismatch() {
  std::vector<byte> out;
  TEST_EXPECT_OK(minser::wire::encode(human_value(), out));

  const Shape renamed = Shape::structure({
    Shape::Field{"nom", Shape::string()},
    Shape::Field{"age", Shape::u8()},
  });
  Value decoded = Value::unit();
  TEST_EXPECT_EQ(minser::wire::decode(out, renamed, decoded), make_error_code(errc::field_mismatch));

  // 期望字段少于实际字段：第二个键位置出现的不是 Map 结束符。
  const Shape shorter = Shape::structure({Shape::Field{"name", Shape::string()}});
  TEST_EXPECT_EQ(minser::wire::decode(out, shorter, decoded), make_error_code(errc::malformed_delimiter));
}

void test_every_prefix_of_map_fails() {
  std::vector<byte> out;
  TEST_EXPECT_OK(minser::wire::encode(human_value(), out));
  for (std::size_t n = 0; n < out.size(); ++n) {
    const std::vector<byte> prefix(out.begin(), out.begin() + static_cast<std::ptrdiff_t>(n));
    Value decoded = Value::unit();
    const auto ec = minser::wire::decode(prefix, human_shape(), decoded);
    TEST_EXPECT(ec == errc::unterminated_span || ec == errc::unexpected_end_of_input);
    TEST_EXPECT(decoded == Value::unit());
  }
}

void test_trailing_bytes() {
  std::vector<byte> out;
  TEST_EXPECT_OK(minser::wire::encode(Value::u8(1), out));
  out.push_back(0x00);

  Value decoded = Value::unit();
  TEST_EXPECT_EQ(minser::wire::decode(out, Shape::u8(), decoded), make_error_code(errc::trailing_bytes));

  DecodeOptions lenient;
  lenient.allow_trailing_bytes = true;
  TEST_EXPECT_OK(minser::wire::decode(out, Shape::u8(), decoded, lenient));
  TEST_EXPECT(decoded == Value::u8(1));
}

void test_decode_one_concatenated_values() {
  std::vector<byte> stream;
  TEST_EXPECT_OK(minser::wire::encode(human_value(), stream));
  TEST_EXPECT_OK(minser::wire::encode(Value::seq({Value::u8(1), Value::u8(2), Value::u8(3)}), stream));
  TEST_EXPECT_OK(minser::wire::encode(Value::variant(1, Value::u8(9)), stream));

  const Shape enum_shape = Shape::enumeration({Shape::none(), Shape::u8()});

  std::size_t offset = 0;
  std::size_t consumed = 0;
  Value v = Value::unit();

  TEST_EXPECT_OK(minser::wire::decode_one(minser::wire::bytes_view{stream}.subspan(offset), human_shape(), v, consumed));
  TEST_EXPECT(v == human_value());
  TEST_EXPECT_EQ(consumed, 25u);
  offset += consumed;

  TEST_EXPECT_OK(
    minser::wire::decode_one(minser::wire::bytes_view{stream}.subspan(offset), Shape::seq(Shape::u8()), v, consumed));
  TEST_EXPECT(v == Value::seq({Value::u8(1), Value::u8(2), Value::u8(3)}));
  TEST_EXPECT_EQ(consumed, 8u);
  offset += consumed;

  TEST_EXPECT_OK(minser::wire::decode_one(minser::wire::bytes_view{stream}.subspan(offset), enum_shape, v, consumed));
  TEST_EXPECT(v == Value::variant(1, Value::u8(9)));
  offset += consumed;
  TEST_EXPECT_EQ(offset, stream.size());
}

void test_decode_one_failure_reports_zero_consumed() {
  // 元素之后缺少分隔符。
  const std::vector<byte> in{0x26, 0x01};
  std::size_t consumed = 99;
  Value v = Value::u8(5);
  TEST_EXPECT_EQ(minser::wire::decode_one(in, Shape::seq(Shape::u8()), v, consumed),
                 make_error_code(errc::unterminated_span));
  TEST_EXPECT_EQ(consumed, 0u);
  TEST_EXPECT(v == Value::u8(5));
}

void test_encode_sink_limit_rolls_back() {
  EncodeOptions tiny;
  tiny.initial_capacity = 4;
  tiny.max_capacity = 4;

  std::vector<byte> out{0x01};
  const auto ec = minser::wire::encode(human_value(), out, tiny);
  TEST_EXPECT_EQ(ec, make_error_code(errc::sink_exhausted));
  TEST_EXPECT_EQ(out, (std::vector<byte>{0x01}));

  // encode_to：失败时 sink 恢复到调用前长度。
  minser::core::ByteSink sink(16, 16);
  TEST_EXPECT_OK(minser::wire::encode_to(sink, Value::u8(7)));
  TEST_EXPECT_EQ(minser::wire::encode_to(sink, human_value()), make_error_code(errc::sink_exhausted));
  TEST_EXPECT_EQ(sink.size(), 1u);
}

void test_depth_limit_through_codec() {
  Value deep = Value::seq({});
  Shape deep_shape = Shape::seq(Shape::u8());
  for (int i = 0; i < 4; ++i) {
    deep = Value::seq({deep});
    deep_shape = Shape::seq(deep_shape);
  }
  std::vector<byte> out;
  TEST_EXPECT_OK(minser::wire::encode(deep, out));

  DecodeOptions limited;
  limited.max_depth = 4;
  Value decoded = Value::unit();
  TEST_EXPECT_EQ(minser::wire::decode(out, deep_shape, decoded, limited), make_error_code(errc::depth_exceeded));

  limited.max_depth = 5;
  TEST_EXPECT_OK(minser::wire::decode(out, deep_shape, decoded, limited));
  TEST_EXPECT(decoded == deep);
}

}  // namespace

int main() {
  test_struct_example_bytes();
  test_encode_appends_to_output();
  test_primitive_round_trips();
  test_float_equality_is_bitwise();
  test_delimiter_bytes_inside_content();
  test_separators_follow_items();
  test_terminator_lookalike_elements();
  test_nested_composites();
  test_empty_composites();
  test_enumerations();
  test_options();
  test_struct_field_mismatch();
  test_every_prefix_of_map_fails();
  test_trailing_bytes();
  test_decode_one_concatenated_values();
  test_decode_one_failure_reports_zero_consumed();
  test_encode_sink_limit_rolls_back();
  test_depth_limit_through_codec();
  return ::minser::tests::run_and_report();
}
