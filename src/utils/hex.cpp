#include "minser/utils/hex.hpp"

#include "minser/wire/delimiter.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <optional>
#include <sstream>

namespace minser::utils {
namespace {

struct Ansi final {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *dim = "\033[2m";
    static constexpr const char *bytes = "\033[1;33m";
    static constexpr const char *delimiter = "\033[1;36m";
    static constexpr const char *ascii = "\033[1;32m";
    static constexpr const char *error = "\033[1;31m";
};

[[nodiscard]] const char *ansi_(bool enable, const char *code) noexcept {
    return enable ? code : "";
}

[[nodiscard]] std::optional<wire::Delimiter>
as_delimiter_(minser::core::byte b) noexcept {
    for (const auto d : wire::kAllDelimiters) {
        if (wire::to_byte(d) == b) {
            return d;
        }
    }
    return std::nullopt;
}

[[nodiscard]] int hex_value_(unsigned char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

[[nodiscard]] bool is_separator_(unsigned char c) noexcept {
    if (std::isspace(c) != 0) {
        return true;
    }
    switch (c) {
    case ',':
    case ';':
    case ':':
    case '-':
    case '_':
    case '|':
    case '[':
    case ']':
    case '(':
    case ')':
    case '{':
    case '}':
        return true;
    default:
        return false;
    }
}

[[nodiscard]] char to_printable_ascii_(minser::core::byte b) noexcept {
    if (b >= 0x20 && b <= 0x7E) {
        return static_cast<char>(b);
    }
    return '.';
}

void append_byte_(std::ostringstream &oss, minser::core::byte b) {
    oss << std::setw(2) << std::setfill('0') << std::hex << static_cast<int>(b)
        << std::dec;
}

} // namespace

std::string hex_dump(minser::core::bytes_view bytes, HexDumpOptions options) {
    std::ostringstream oss;
    const bool enable_color = options.enable_color;
    const auto *reset = ansi_(enable_color, Ansi::reset);
    const auto *dim = ansi_(enable_color, Ansi::dim);
    const auto *bytes_color = ansi_(enable_color, Ansi::bytes);
    const auto *delim_color = ansi_(enable_color, Ansi::delimiter);
    const auto *ascii_color = ansi_(enable_color, Ansi::ascii);
    const auto *error = ansi_(enable_color, Ansi::error);

    const std::size_t total = bytes.size();
    const std::size_t max_bytes =
        (options.max_bytes == 0 ? total : std::min(total, options.max_bytes));
    const std::size_t per_line =
        (options.bytes_per_line == 0 ? std::size_t{16} : options.bytes_per_line);

    for (std::size_t offset = 0; offset < max_bytes; offset += per_line) {
        const std::size_t line_n = std::min(per_line, max_bytes - offset);
        const auto line = bytes.subspan(offset, line_n);

        if (options.show_offset) {
            oss << dim << std::setw(4) << std::setfill('0') << std::hex << offset
                << std::dec << ": " << reset;
        }

        for (std::size_t i = 0; i < line_n; ++i) {
            const bool is_delim = as_delimiter_(line[i]).has_value();
            oss << (is_delim ? delim_color : bytes_color);
            append_byte_(oss, line[i]);
            oss << reset;
            if (i + 1 != line_n) {
                oss << ' ';
            }
        }

        if (options.show_ascii) {
            // 补齐最后一行缺少的 "HH " 宽度，保证 ASCII 列对齐。
            oss << std::string((per_line - line_n) * 3, ' ') << "   ";
            oss << ascii_color;
            for (const auto b : line) {
                oss << to_printable_ascii_(b);
            }
            oss << reset;
        }

        if (options.annotate_delimiters) {
            // 只按字节值匹配：字符串/整数内容里的同值字节也会被列出。
            bool first = true;
            for (const auto b : line) {
                const auto d = as_delimiter_(b);
                if (!d) {
                    continue;
                }
                oss << (first ? "  ; " : " ") << delim_color
                    << wire::delimiter_name(*d) << reset;
                first = false;
            }
        }

        oss << '\n';
    }

    if (options.max_bytes != 0 && total > options.max_bytes) {
        oss << error << "... (truncated, total=" << total << " bytes)" << reset
            << '\n';
    }

    return oss.str();
}

std::string to_hex(minser::core::bytes_view bytes) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i != 0) {
            oss << ' ';
        }
        append_byte_(oss, bytes[i]);
    }
    return oss.str();
}

std::error_code parse_hex(std::string_view text,
                          std::vector<minser::core::byte> &out) noexcept {
    out.clear();

    int hi_nibble = -1;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);

        if (is_separator_(c)) {
            continue;
        }

        // 可选 0x/0X 前缀只允许出现在字节边界上。
        if (c == '0' && hi_nibble < 0 && (i + 1) < text.size() &&
            (text[i + 1] == 'x' || text[i + 1] == 'X')) {
            ++i;
            continue;
        }

        const int v = hex_value_(c);
        if (v < 0) {
            out.clear();
            return minser::core::make_error_code(
                minser::core::errc::invalid_argument);
        }

        if (hi_nibble < 0) {
            hi_nibble = v;
            continue;
        }

        out.push_back(static_cast<minser::core::byte>((hi_nibble << 4) | v));
        hi_nibble = -1;
    }

    // 奇数个 nibble 无法组成完整字节。
    if (hi_nibble >= 0) {
        out.clear();
        return minser::core::make_error_code(minser::core::errc::invalid_argument);
    }

    return {};
}

} // namespace minser::utils
