/**
 * @file person_dump.cpp
 * @brief 演示 minser 的类型映射、编码结果查看与按形状解码
 *
 * 流程：
 * - 构造一个包含字符串、整数、列表、哈希表、枚举、Option、嵌套结构体的 Person；
 * - serde::to_bytes 编码，输出长度与带定界符标注的 hexdump；
 * - serde::from_bytes 解码回 Person（Option 按 unit 字节推断）；
 * - 同一段字节再按 wire::Shape 解码为 wire::Value，并以可读格式输出。
 *
 * 运行：
 * - ./build/examples/person_dump [--color] [--debug]
 */

#include <minser/core/log.hpp>
#include <minser/serde/fields.hpp>
#include <minser/serde/serde.hpp>
#include <minser/utils/hex.hpp>
#include <minser/utils/value_dump.hpp>
#include <minser/wire/codec.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

using namespace minser;
using serde::field;

namespace {

struct SomeStruct {
    std::uint8_t a{};
    std::uint16_t b{};

    std::error_code serialize(wire::Encoder &enc) const noexcept {
        return serde::encode_struct(enc, field("a", a), field("b", b));
    }
    std::error_code deserialize(wire::Decoder &dec) noexcept {
        return serde::decode_struct(dec, field("a", a), field("b", b));
    }
};

// A { a, b } / B(u8) / C
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

    std::error_code serialize(wire::Encoder &enc) const noexcept {
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
    std::error_code deserialize(wire::Decoder &dec) noexcept {
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
};

wire::Shape some_struct_shape() {
    return wire::Shape::structure({
        wire::Shape::Field{"a", wire::Shape::u8()},
        wire::Shape::Field{"b", wire::Shape::u16()},
    });
}

wire::Shape some_enum_shape() {
    return wire::Shape::enumeration({some_struct_shape(), wire::Shape::u8(), wire::Shape::none()});
}

wire::Shape person_shape() {
    using wire::Shape;
    return Shape::structure({
        Shape::Field{"name", Shape::string()},
        Shape::Field{"age", Shape::u8()},
        Shape::Field{"is_human", Shape::boolean()},
        Shape::Field{"languages", Shape::seq(Shape::string())},
        Shape::Field{"hey", Shape::i32()},
        Shape::Field{"hash_map", Shape::map(Shape::string(), Shape::i32())},
        Shape::Field{"field1", some_enum_shape()},
        Shape::Field{"field2", Shape::option(some_enum_shape())},
        Shape::Field{"some_struct", some_struct_shape()},
    });
}

[[nodiscard]] bool has_flag(int argc, char **argv, std::string_view flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == flag) {
            return true;
        }
    }
    return false;
}

void print_person(const Person &p) {
    std::cout << "Person { name: \"" << p.name << "\", age: " << static_cast<int>(p.age)
              << ", is_human: " << (p.is_human ? "true" : "false") << ", languages: [";
    for (std::size_t i = 0; i < p.languages.size(); ++i) {
        std::cout << (i == 0 ? "" : ", ") << '"' << p.languages[i] << '"';
    }
    std::cout << "], hey: " << p.hey << ", hash_map: {";
    bool first = true;
    for (const auto &[k, v] : p.hash_map) {
        std::cout << (first ? "" : ", ") << '"' << k << "\": " << v;
        first = false;
    }
    std::cout << "}, field1: #" << p.field1.index() << ", field2: "
              << (p.field2 ? "Some" : "None") << ", some_struct: { a: "
              << static_cast<int>(p.some_struct.a) << ", b: " << p.some_struct.b << " } }\n";
}

} // namespace

int main(int argc, char **argv) {
    const bool color = has_flag(argc, argv, "--color");
    if (has_flag(argc, argv, "--debug")) {
        core::set_log_level(core::LogLevel::debug);
    }

    Person person;
    person.name = "Ayush";
    person.age = 19;
    person.is_human = true;
    person.languages = {"English", "Hindi"};
    person.hey = -123;
    person.hash_map = {{"one", 1}, {"two", 2}};
    person.field1 = SomeStruct{1, 2};
    person.field2 = std::nullopt;
    person.some_struct = SomeStruct{1, 2};

    std::cout << "Data:\n";
    print_person(person);
    std::cout << '\n';

    std::vector<core::byte> bytes;
    if (auto ec = serde::to_bytes(person, bytes)) {
        std::cerr << "encode failed: " << ec.message() << '\n';
        return 1;
    }
    std::cout << "Serialized Length:\n" << bytes.size() << "\n\n";

    utils::HexDumpOptions hex_opt;
    hex_opt.annotate_delimiters = true;
    hex_opt.enable_color = color;
    hex_opt.max_bytes = 0;
    std::cout << "Serialized Bytes (hex):\n" << utils::hex_dump(bytes, hex_opt) << '\n';

    // field2 为 None 时编码为单个 unit 字节，解码端需要推断 Option 是否存在。
    wire::DecodeOptions options;
    options.infer_option_from_unit = true;

    Person decoded;
    if (auto ec = serde::from_bytes(bytes, decoded, options)) {
        std::cerr << "decode failed: " << ec.message() << '\n';
        return 1;
    }
    std::cout << "Deserialized:\n";
    print_person(decoded);
    std::cout << '\n';

    wire::Value value = wire::Value::unit();
    if (auto ec = wire::decode(bytes, person_shape(), value, options)) {
        std::cerr << "shape decode failed: " << ec.message() << '\n';
        return 1;
    }
    utils::ValueDumpOptions dump_opt;
    dump_opt.multiline = true;
    dump_opt.enable_color = color;
    std::cout << "Decoded Value:\n" << utils::dump_value(value, dump_opt) << '\n';
    return 0;
}
