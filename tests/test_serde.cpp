#include "minser/serde/fields.hpp"
#include "minser/serde/serde.hpp"

#include "test_main.hpp"

#include <array>
#include <cmath>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace {

namespace serde = minser::serde;
namespace wire = minser::wire;

using serde::field;
using wire::byte;
using wire::errc;
using wire::make_error_code;

struct Human {
  std::string name;
  std::uint8_t age{};

  std::error_code serialize(wire::Encoder& enc) const noexcept {
    return serde::encode_struct(enc, field("name", name), field("age", age));
  }
  std::error_code deserialize(wire::Decoder& dec) noexcept {
    return serde::decode_struct(dec, field("name", name), field("age", age));
  }
  friend bool operator==(const Human&, const Human&) = default;
};

struct SomeStruct {
  std::uint8_t a{};
  std::uint16_t b{};

  std::error_code serialize(wire::Encoder& enc) const noexcept {
    return serde::encode_struct(enc, field("a", a), field("b", b));
  }
  std::error_code deserialize(wire::Decoder& dec) noexcept {
    return serde::decode_struct(dec, field("a", a), field("b", b));
  }
  friend bool operator==(const SomeStruct&, const SomeStruct&) = default;
};

// 变体 0：struct 载荷；1：newtype u8；2：unit。
using SomeEnum = std::variant<SomeStruct, std::uint8_t, std::monostate>;

struct Person {
  std::string name;
  std::uint8_t age{};
  bool is_human{};
  std::vector<std::string> languages;
  std::int32_t hey{};
  std::unordered_map<std::string, std::int32_t> hash_map;
  SomeEnum field1;
  std::optional<SomeEnum> field2;
  SomeStruct some_struct;

  std::error_code serialize(wire::Encoder& enc) const noexcept {
    return serde::encode_struct(enc,
                                field("name", name),
                                field("age", age),
                                field("is_human", is_human),
                                field("languages", languages),
                                field("hey", hey),
                                field("hash_map", hash_map),
                                field("field1", field1),
                                field("field2", field2),
                                field("some_struct", some_struct));
  }
  std::error_code deserialize(wire::Decoder& dec) noexcept {
    return serde::decode_struct(dec,
                                field("name", name),
                                field("age", age),
                                field("is_human", is_human),
                                field("languages", languages),
                                field("hey", hey),
                                field("hash_map", hash_map),
                                field("field1", field1),
                                field("field2", field2),
                                field("some_struct", some_struct));
  }
  friend bool operator==(const Person&, const Person&) = default;
};

// Option 的存在性由上层协议告知（例如消息头里的标志位）。
struct Reading {
  std::uint16_t id{};
  std::optional<std::string> label;
  wire::presence label_presence{wire::presence::unknown};

  std::error_code serialize(wire::Encoder& enc) const noexcept {
    return serde::encode_struct(enc, field("id", id), field("label", label));
  }
  std::error_code deserialize(wire::Decoder& dec) noexcept {
    return serde::decode_struct(dec, field("id", id), field("label", label, label_presence));
  }
};

// 手写枚举：encode_variant / decode_variant。
struct Shape2d {
  enum class Kind : std::uint32_t { point = 0, circle = 1, rect = 2 };
  Kind kind{Kind::point};
  double radius{};
  std::pair<double, double> size{};

  std::error_code serialize(wire::Encoder& enc) const noexcept {
    switch (kind) {
      case Kind::point:
        return serde::encode_variant(enc, 0);
      case Kind::circle:
        return serde::encode_variant(enc, 1, radius);
      case Kind::rect:
        return serde::encode_variant(enc, 2, size);
    }
    return serde::encode_variant(enc, 0);
  }

  std::error_code deserialize(wire::Decoder& dec) noexcept {
    return serde::decode_variant(dec, 3, [&](std::uint32_t index) -> std::error_code {
      kind = static_cast<Kind>(index);
      switch (kind) {
        case Kind::point:
          return {};
        case Kind::circle:
          return serde::deserialize(dec, radius);
        case Kind::rect:
          return serde::deserialize(dec, size);
      }
      return {};
    });
  }
};

static_assert(serde::Mapped<Human>);
static_assert(serde::Serializable<Person>);
static_assert(serde::Serializable<std::vector<std::map<std::string, std::optional<double>>>>);
static_assert(!serde::Serializable<long double>);

Person sample_person() {
  Person p;
  p.name = "Ayush";
  p.age = 19;
  p.is_human = true;
  p.languages = {"English", "Hindi"};
  p.hey = -123;
  p.hash_map = {{"one", 1}, {"two", 2}};
  p.field1 = SomeStruct{1, 2};
  p.field2 = std::nullopt;
  p.some_struct = SomeStruct{1, 2};
  return p;
}

void test_human_pinned_bytes() {
  const Human human{"Ayush", 19};
  std::vector<byte> out;
  TEST_EXPECT_OK(serde::to_bytes(human, out));
  const std::vector<byte> expected{0x3A, 0xFE, 0x6E, 0x61, 0x6D, 0x65, 0xFE, 0x3B, 0xFE,
                                   0x41, 0x79, 0x75, 0x73, 0x68, 0xFE, 0x3C, 0xFE, 0x61,
                                   0x67, 0x65, 0xFE, 0x3B, 0x13, 0x3C, 0x3A};
  TEST_EXPECT_EQ(out, expected);

  Human decoded;
  TEST_EXPECT_OK(serde::from_bytes(out, decoded));
  TEST_EXPECT(decoded == human);
}

void test_u8_vector_pinned_bytes() {
  const std::vector<std::uint8_t> values{1, 2, 3};
  std::vector<byte> out;
  TEST_EXPECT_OK(serde::to_bytes(values, out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{0x26, 0x01, 0x2E, 0x02, 0x2E, 0x03, 0x2E, 0x2E}));

  std::vector<std::uint8_t> decoded;
  TEST_EXPECT_OK(serde::from_bytes(out, decoded));
  TEST_EXPECT_EQ(decoded, values);

  // Bytes 包装使用紧凑的字节串形式。
  out.clear();
  TEST_EXPECT_OK(serde::to_bytes(serde::Bytes{{1, 2, 3}}, out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{0xFF, 0x01, 0x02, 0x03, 0xFF}));
}

void test_person_round_trip() {
  const Person person = sample_person();
  std::vector<byte> out;
  TEST_EXPECT_OK(serde::to_bytes(person, out));

  // field2 为 None，需要按 unit 字节推断。
  Person strict;
  TEST_EXPECT_EQ(serde::from_bytes(out, strict), make_error_code(errc::ambiguous_option));

  wire::DecodeOptions options;
  options.infer_option_from_unit = true;
  Person decoded;
  TEST_EXPECT_OK(serde::from_bytes(out, decoded, options));
  TEST_EXPECT(decoded == person);

  // unordered_map 的迭代顺序不固定，这里只比较长度。
  std::vector<byte> again;
  TEST_EXPECT_OK(serde::to_bytes(decoded, again));
  TEST_EXPECT_EQ(again.size(), out.size());
}

void test_enum_variants() {
  std::vector<byte> out;
  TEST_EXPECT_OK(serde::to_bytes(SomeEnum{std::monostate{}}, out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{0x02, 0x00, 0x00, 0x00}));

  out.clear();
  TEST_EXPECT_OK(serde::to_bytes(SomeEnum{std::uint8_t{7}}, out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{0x01, 0x00, 0x00, 0x00, 0x07}));

  SomeEnum decoded;
  TEST_EXPECT_OK(serde::from_bytes(out, decoded));
  TEST_EXPECT(decoded == SomeEnum{std::uint8_t{7}});

  out.clear();
  TEST_EXPECT_OK(serde::to_bytes(SomeEnum{SomeStruct{1, 2}}, out));
  TEST_EXPECT_OK(serde::from_bytes(out, decoded));
  TEST_EXPECT((decoded == SomeEnum{SomeStruct{1, 2}}));

  const std::vector<byte> unknown{0x03, 0x00, 0x00, 0x00};
  TEST_EXPECT_EQ(serde::from_bytes(unknown, decoded), make_error_code(errc::unknown_variant_index));
}

void test_hand_written_variant() {
  Shape2d rect;
  rect.kind = Shape2d::Kind::rect;
  rect.size = {2.0, 3.5};

  std::vector<byte> out;
  TEST_EXPECT_OK(serde::to_bytes(rect, out));
  TEST_EXPECT_EQ(out[0], 0x02);
  TEST_EXPECT_EQ(out[4], 0x26);

  Shape2d decoded;
  TEST_EXPECT_OK(serde::from_bytes(out, decoded));
  TEST_EXPECT(decoded.kind == Shape2d::Kind::rect);
  TEST_EXPECT_EQ(decoded.size.first, 2.0);
  TEST_EXPECT_EQ(decoded.size.second, 3.5);

  out.clear();
  TEST_EXPECT_OK(serde::to_bytes(Shape2d{}, out));
  TEST_EXPECT_EQ(out.size(), 4u);
  TEST_EXPECT_OK(serde::from_bytes(out, decoded));
  TEST_EXPECT(decoded.kind == Shape2d::Kind::point);
}

void test_containers() {
  {
    const std::map<std::string, std::int32_t> m{{"b", 2}, {"a", 1}};
    std::vector<byte> out;
    TEST_EXPECT_OK(serde::to_bytes(m, out));
    std::map<std::string, std::int32_t> decoded;
    TEST_EXPECT_OK(serde::from_bytes(out, decoded));
    TEST_EXPECT_EQ(decoded, m);
  }
  {
    const std::tuple<std::uint8_t, std::string, bool> t{1, "x", true};
    std::vector<byte> out;
    TEST_EXPECT_OK(serde::to_bytes(t, out));
    TEST_EXPECT_EQ(out, (std::vector<byte>{0x26, 0x01, 0x2E, 0xFE, 'x', 0xFE, 0x2E, 0x01, 0x2E, 0x2E}));
    std::tuple<std::uint8_t, std::string, bool> decoded;
    TEST_EXPECT_OK(serde::from_bytes(out, decoded));
    TEST_EXPECT(decoded == t);

    // 元数不符：按 2 元组解码 3 元组。
    std::pair<std::uint8_t, std::string> pair;
    TEST_EXPECT_EQ(serde::from_bytes(out, pair), make_error_code(errc::malformed_delimiter));
  }
  {
    const std::array<std::int16_t, 3> a{-1, 0, 1};
    std::vector<byte> out;
    TEST_EXPECT_OK(serde::to_bytes(a, out));
    std::array<std::int16_t, 3> decoded{};
    TEST_EXPECT_OK(serde::from_bytes(out, decoded));
    TEST_EXPECT(decoded == a);
  }
  {
    const std::vector<std::vector<std::string>> nested{{}, {"a", "b"}, {""}};
    std::vector<byte> out;
    TEST_EXPECT_OK(serde::to_bytes(nested, out));
    std::vector<std::vector<std::string>> decoded;
    TEST_EXPECT_OK(serde::from_bytes(out, decoded));
    TEST_EXPECT(decoded == nested);
  }
  {
    const std::vector<double> floats{0.0, -0.0, 1e300};
    std::vector<byte> out;
    TEST_EXPECT_OK(serde::to_bytes(floats, out));
    std::vector<double> decoded;
    TEST_EXPECT_OK(serde::from_bytes(out, decoded));
    TEST_EXPECT(decoded.size() == 3 && std::signbit(decoded[1]));
  }
}

void test_optional_presence() {
  Reading reading;
  reading.id = 7;
  reading.label = "north";
  std::vector<byte> out;
  TEST_EXPECT_OK(serde::to_bytes(reading, out));

  Reading decoded;
  decoded.label_presence = wire::presence::present;
  TEST_EXPECT_OK(serde::from_bytes(out, decoded));
  TEST_EXPECT_EQ(decoded.id, 7);
  TEST_EXPECT(decoded.label == std::optional<std::string>("north"));

  Reading empty;
  empty.id = 8;
  out.clear();
  TEST_EXPECT_OK(serde::to_bytes(empty, out));
  Reading decoded_empty;
  decoded_empty.label = "stale";
  decoded_empty.label_presence = wire::presence::absent;
  TEST_EXPECT_OK(serde::from_bytes(out, decoded_empty));
  TEST_EXPECT(!decoded_empty.label.has_value());

  // 直接使用 decode_optional。
  const std::vector<byte> some_five{0x05};
  wire::ByteCursor cursor(some_five);
  wire::Decoder dec(cursor);
  std::optional<std::uint8_t> value;
  TEST_EXPECT_OK(serde::decode_optional(dec, wire::presence::present, value));
  TEST_EXPECT(value == std::optional<std::uint8_t>(5));
}

void test_inferred_option_ambiguity() {
  // 推断模式下 Some(5u8) 会被读成 None：这是格式本身的歧义。
  std::vector<byte> out;
  TEST_EXPECT_OK(serde::to_bytes(std::optional<std::uint8_t>(5), out));
  TEST_EXPECT_EQ(out, (std::vector<byte>{0x05}));

  wire::DecodeOptions options;
  options.infer_option_from_unit = true;
  std::optional<std::uint8_t> decoded;
  TEST_EXPECT_OK(serde::from_bytes(out, decoded, options));
  TEST_EXPECT(!decoded.has_value());
}

void test_struct_errors() {
  std::vector<byte> out;
  TEST_EXPECT_OK(serde::to_bytes(Human{"A", 1}, out));

  SomeStruct wrong;
  TEST_EXPECT_EQ(serde::from_bytes(out, wrong), make_error_code(errc::field_mismatch));

  out.push_back(0x00);
  Human human;
  TEST_EXPECT_EQ(serde::from_bytes(out, human), make_error_code(errc::trailing_bytes));

  wire::DecodeOptions lenient;
  lenient.allow_trailing_bytes = true;
  TEST_EXPECT_OK(serde::from_bytes(out, human, lenient));
  TEST_EXPECT(human == (Human{"A", 1}));
}

void test_failed_decode_leaves_target() {
  std::vector<byte> out;
  TEST_EXPECT_OK(serde::to_bytes(Human{"A", 1}, out));

  // 缺少 Map 结束符：所有字段都已读出，但整体失败。
  const std::vector<byte> cut(out.begin(), out.end() - 1);
  Human human{"keep", 9};
  TEST_EXPECT_EQ(serde::from_bytes(cut, human), make_error_code(errc::unterminated_span));
  TEST_EXPECT(human == (Human{"keep", 9}));

  // 值本身完整，但后面还有多余字节。
  out.push_back(0x00);
  TEST_EXPECT_EQ(serde::from_bytes(out, human), make_error_code(errc::trailing_bytes));
  TEST_EXPECT(human == (Human{"keep", 9}));

  // 元组/数组/pair 元数不符。
  out.clear();
  TEST_EXPECT_OK(serde::to_bytes(std::tuple<std::uint8_t, std::string, bool>{1, "x", true}, out));
  std::pair<std::uint8_t, std::string> pair{9, "keep"};
  TEST_EXPECT_EQ(serde::from_bytes(out, pair), make_error_code(errc::malformed_delimiter));
  TEST_EXPECT(pair == (std::pair<std::uint8_t, std::string>{9, "keep"}));

  out.clear();
  TEST_EXPECT_OK(serde::to_bytes(std::pair<std::uint8_t, std::string>{1, "x"}, out));
  std::tuple<std::uint8_t, std::string, bool> triple{9, "keep", false};
  TEST_EXPECT_EQ(serde::from_bytes(out, triple), make_error_code(errc::malformed_delimiter));
  TEST_EXPECT((triple == std::tuple<std::uint8_t, std::string, bool>{9, "keep", false}));

  out.clear();
  TEST_EXPECT_OK(serde::to_bytes(std::array<std::int16_t, 2>{5, 6}, out));
  std::array<std::int16_t, 3> three{7, 7, 7};
  TEST_EXPECT_EQ(serde::from_bytes(out, three), make_error_code(errc::malformed_delimiter));
  TEST_EXPECT((three == std::array<std::int16_t, 3>{7, 7, 7}));
}

void test_to_bytes_failure_leaves_output() {
  wire::EncodeOptions tiny;
  tiny.initial_capacity = 8;
  tiny.max_capacity = 8;
  std::vector<byte> out{0x42};
  TEST_EXPECT_EQ(serde::to_bytes(sample_person(), out, tiny), make_error_code(errc::sink_exhausted));
  TEST_EXPECT_EQ(out, (std::vector<byte>{0x42}));
}

}  // namespace

int main() {
  test_human_pinned_bytes();
  test_u8_vector_pinned_bytes();
  test_person_round_trip();
  test_enum_variants();
  test_hand_written_variant();
  test_containers();
  test_optional_presence();
  test_inferred_option_ambiguity();
  test_struct_errors();
  test_failed_decode_leaves_target();
  test_to_bytes_failure_leaves_output();
  return ::minser::tests::run_and_report();
}
