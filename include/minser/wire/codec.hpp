#pragma once

#include "minser/core/buffer.hpp"
#include "minser/wire/decoder.hpp"
#include "minser/wire/encoder.hpp"
#include "minser/wire/error.hpp"
#include "minser/wire/options.hpp"
#include "minser/wire/shape.hpp"
#include "minser/wire/value.hpp"

#include <cstddef>
#include <system_error>
#include <vector>

namespace minser::wire {

/**
 * @brief 编码 Value 并追加到 out。
 *
 * 失败时 out 恢复为调用前的长度（不会留下半截编码）。
 */
std::error_code encode(const Value& value, std::vector<byte>& out, const EncodeOptions& options = {}) noexcept;

/**
 * @brief 编码 Value 到调用方提供的 ByteSink（可连续写入多个值）。
 */
std::error_code encode_to(core::ByteSink& sink, const Value& value) noexcept;

/**
 * @brief 用已构造的 Encoder 编码 Value（供手写映射层混合使用）。
 */
std::error_code encode_value(Encoder& enc, const Value& value) noexcept;

/**
 * @brief 按期望形状从输入缓冲区解码一个值（流式 API）。
 *
 * 成功时：
 * - out 被填充
 * - consumed 为消耗的输入字节数（可用于从连续的多个值中逐个解码）
 *
 * 失败时：
 * - 返回非零 error_code，consumed 为 0，out 不变
 */
std::error_code decode_one(bytes_view in,
                           const Shape& shape,
                           Value& out,
                           std::size_t& consumed,
                           const DecodeOptions& options = {}) noexcept;

/**
 * @brief 按期望形状解码整个输入。
 *
 * 值之后仍有剩余字节时返回 errc::trailing_bytes（除非 allow_trailing_bytes）。
 */
std::error_code decode(bytes_view in, const Shape& shape, Value& out, const DecodeOptions& options = {}) noexcept;

/**
 * @brief 用已构造的 Decoder 按形状解码（供手写映射层混合使用）。
 */
std::error_code decode_value(Decoder& dec, const Shape& shape, Value& out) noexcept;

}  // namespace minser::wire
