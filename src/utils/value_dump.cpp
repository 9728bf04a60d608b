#include "minser/utils/value_dump.hpp"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <type_traits>
#include <variant>

namespace minser::utils {
namespace {

struct Ansi final {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *type = "\033[1;35m";
    static constexpr const char *string = "\033[1;32m";
    static constexpr const char *value = "\033[1;33m";
    static constexpr const char *dim = "\033[2m";
};

[[nodiscard]] const char *ansi_(bool enable, const char *code) noexcept {
    return enable ? code : "";
}

struct DumpContext final {
    std::ostringstream oss;
    ValueDumpOptions options{};

    [[nodiscard]] const char *color(const char *code) const noexcept {
        return ansi_(options.enable_color, code);
    }
};

[[nodiscard]] std::string indent_(std::size_t depth, std::size_t spaces) {
    return std::string(depth * spaces, ' ');
}

// 非可打印字节（含 UTF-8 多字节序列）一律输出 \xHH，保证输出为纯 ASCII。
void append_escaped_(DumpContext &ctx, const std::string &s) {
    const std::size_t max_bytes = ctx.options.max_payload_bytes;
    const std::size_t n = (max_bytes == 0 ? s.size() : std::min(s.size(), max_bytes));

    ctx.oss << ctx.color(Ansi::string) << '"';
    for (std::size_t i = 0; i < n; ++i) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c == '\\' || c == '"') {
            ctx.oss << '\\' << static_cast<char>(c);
        } else if (c >= 0x20 && c <= 0x7E) {
            ctx.oss << static_cast<char>(c);
        } else {
            ctx.oss << "\\x" << std::hex << std::setw(2) << std::setfill('0')
                    << static_cast<int>(c) << std::dec;
        }
    }
    if (n < s.size()) {
        ctx.oss << "...";
    }
    ctx.oss << '"' << ctx.color(Ansi::reset);
}

void append_bytes_(DumpContext &ctx, const std::vector<wire::byte> &bytes) {
    const std::size_t max_bytes = ctx.options.max_payload_bytes;
    const std::size_t n =
        (max_bytes == 0 ? bytes.size() : std::min(bytes.size(), max_bytes));

    ctx.oss << ctx.color(Ansi::type) << "bytes[" << bytes.size() << ']'
            << ctx.color(Ansi::reset);
    if (bytes.empty()) {
        return;
    }
    ctx.oss << ' ' << ctx.color(Ansi::value);
    for (std::size_t i = 0; i < n; ++i) {
        ctx.oss << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(bytes[i]) << std::dec;
        if (i + 1 != n) {
            ctx.oss << ' ';
        }
    }
    ctx.oss << ctx.color(Ansi::reset);
    if (n < bytes.size()) {
        ctx.oss << ' ' << ctx.color(Ansi::dim) << "..." << ctx.color(Ansi::reset);
    }
}

template <class T>
void append_number_(DumpContext &ctx, const char *type_name, T v) {
    ctx.oss << ctx.color(Ansi::type) << type_name << ctx.color(Ansi::reset) << ' '
            << ctx.color(Ansi::value);
    if constexpr (std::is_floating_point_v<T>) {
        // 浮点默认用较高精度，便于定位差异。
        ctx.oss << std::setprecision(17) << v;
    } else if constexpr (sizeof(T) == 1) {
        // int8/uint8 按数字输出，不当作字符。
        ctx.oss << static_cast<int>(v);
    } else {
        ctx.oss << v;
    }
    ctx.oss << ctx.color(Ansi::reset);
}

void append_value_(DumpContext &ctx, const wire::Value &value, std::size_t depth);

// Seq 与 Map 共用：open/close 为括号，append_one(i) 输出第 i 项。
template <class AppendOne>
void append_composite_(DumpContext &ctx,
                       const char *type_name,
                       char open,
                       char close,
                       std::size_t total,
                       std::size_t depth,
                       AppendOne append_one) {
    const auto &opt = ctx.options;
    const std::size_t n =
        (opt.max_items == 0 ? total : std::min(total, opt.max_items));

    ctx.oss << ctx.color(Ansi::type) << type_name << ctx.color(Ansi::reset)
            << ctx.color(Ansi::dim) << open << ctx.color(Ansi::reset);
    if (total == 0) {
        ctx.oss << ctx.color(Ansi::dim) << close << ctx.color(Ansi::reset);
        return;
    }
    if (depth >= opt.max_depth) {
        ctx.oss << ctx.color(Ansi::dim) << " ... " << close << ctx.color(Ansi::reset);
        return;
    }

    for (std::size_t i = 0; i < n; ++i) {
        if (opt.multiline) {
            ctx.oss << '\n' << indent_(depth + 1, opt.indent_spaces);
        } else {
            ctx.oss << (i == 0 ? " " : ", ");
        }
        append_one(i);
    }
    if (n < total) {
        if (opt.multiline) {
            ctx.oss << '\n' << indent_(depth + 1, opt.indent_spaces);
        } else {
            ctx.oss << ", ";
        }
        ctx.oss << ctx.color(Ansi::dim) << "..." << ctx.color(Ansi::reset);
    }
    if (opt.multiline) {
        ctx.oss << '\n' << indent_(depth, opt.indent_spaces);
    } else {
        ctx.oss << ' ';
    }
    ctx.oss << ctx.color(Ansi::dim) << close << ctx.color(Ansi::reset);
}

void append_value_(DumpContext &ctx, const wire::Value &value, std::size_t depth) {
    std::visit(
        [&](const auto &v) {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, wire::Unit>) {
                ctx.oss << ctx.color(Ansi::type) << "()" << ctx.color(Ansi::reset);
            } else if constexpr (std::is_same_v<T, bool>) {
                ctx.oss << ctx.color(Ansi::value) << (v ? "true" : "false")
                        << ctx.color(Ansi::reset);
            } else if constexpr (std::is_same_v<T, std::int8_t>) {
                append_number_(ctx, "i8", v);
            } else if constexpr (std::is_same_v<T, std::int16_t>) {
                append_number_(ctx, "i16", v);
            } else if constexpr (std::is_same_v<T, std::int32_t>) {
                append_number_(ctx, "i32", v);
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                append_number_(ctx, "i64", v);
            } else if constexpr (std::is_same_v<T, std::uint8_t>) {
                append_number_(ctx, "u8", v);
            } else if constexpr (std::is_same_v<T, std::uint16_t>) {
                append_number_(ctx, "u16", v);
            } else if constexpr (std::is_same_v<T, std::uint32_t>) {
                append_number_(ctx, "u32", v);
            } else if constexpr (std::is_same_v<T, std::uint64_t>) {
                append_number_(ctx, "u64", v);
            } else if constexpr (std::is_same_v<T, float>) {
                append_number_(ctx, "f32", v);
            } else if constexpr (std::is_same_v<T, double>) {
                append_number_(ctx, "f64", v);
            } else if constexpr (std::is_same_v<T, char32_t>) {
                ctx.oss << ctx.color(Ansi::type) << "char" << ctx.color(Ansi::reset)
                        << ' ' << ctx.color(Ansi::value) << "U+" << std::hex
                        << std::uppercase << std::setw(4) << std::setfill('0')
                        << static_cast<std::uint32_t>(v) << std::nouppercase
                        << std::dec << ctx.color(Ansi::reset);
            } else if constexpr (std::is_same_v<T, wire::String>) {
                append_escaped_(ctx, v.value);
            } else if constexpr (std::is_same_v<T, wire::Bytes>) {
                append_bytes_(ctx, v.value);
            } else if constexpr (std::is_same_v<T, wire::Optional>) {
                if (!v.value) {
                    ctx.oss << ctx.color(Ansi::type) << "none" << ctx.color(Ansi::reset);
                } else {
                    ctx.oss << ctx.color(Ansi::type) << "some" << ctx.color(Ansi::reset)
                            << '(';
                    append_value_(ctx, *v.value, depth);
                    ctx.oss << ')';
                }
            } else if constexpr (std::is_same_v<T, wire::Seq>) {
                append_composite_(ctx, "seq", '[', ']', v.values.size(), depth,
                                  [&](std::size_t i) {
                                      append_value_(ctx, v.values[i], depth + 1);
                                  });
            } else if constexpr (std::is_same_v<T, wire::Map>) {
                append_composite_(ctx, "map", '{', '}', v.entries.size(), depth,
                                  [&](std::size_t i) {
                                      append_value_(ctx, v.entries[i].key, depth + 1);
                                      ctx.oss << ": ";
                                      append_value_(ctx, v.entries[i].value, depth + 1);
                                  });
            } else if constexpr (std::is_same_v<T, wire::Variant>) {
                ctx.oss << ctx.color(Ansi::type) << "variant#" << v.index
                        << ctx.color(Ansi::reset);
                if (v.payload) {
                    ctx.oss << '(';
                    append_value_(ctx, *v.payload, depth);
                    ctx.oss << ')';
                }
            }
        },
        value.storage());
}

} // namespace

std::string dump_value(const wire::Value &value, ValueDumpOptions options) {
    DumpContext ctx;
    ctx.options = options;

    append_value_(ctx, value, 0);
    return ctx.oss.str();
}

} // namespace minser::utils
