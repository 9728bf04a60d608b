#pragma once

#include "minser/core/common.hpp"
#include "minser/core/error.hpp"

#include <array>
#include <cstddef>
#include <memory>
#include <system_error>
#include <vector>

namespace minser::core {

/**
 * @brief 只追加的输出缓冲区（编码器的 Byte Sink）。
 *
 * 设计目标：
 * - 小对象优先走 inline 预分配（kDefaultSinkCapacity）
 * - 必要时 grow（扩容到 heap），并保持已写入数据
 * - 写入总量受 max_capacity 约束，超出返回 errc::buffer_overflow
 *
 * 注意：
 * - 本类不做线程安全保证；一个 ByteSink 只属于一次编码调用。
 */
class ByteSink final {
public:
    explicit ByteSink(std::size_t initial_capacity = kDefaultSinkCapacity,
                      std::size_t max_capacity = kDefaultSinkMaxCapacity);

    ByteSink(ByteSink &&other) noexcept;
    ByteSink &operator=(ByteSink &&other) noexcept;

    ByteSink(const ByteSink &) = delete;
    ByteSink &operator=(const ByteSink &) = delete;

    ~ByteSink() = default;

    [[nodiscard]] std::size_t capacity() const noexcept;
    [[nodiscard]] std::size_t max_capacity() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

    void clear() noexcept;

    /**
     * @brief 回退到 n 字节（n 必须不大于当前 size）。用于失败时撤销部分写入。
     */
    std::error_code truncate(std::size_t n) noexcept;

    [[nodiscard]] bytes_view bytes() const noexcept;

    std::error_code push_back(byte b) noexcept;
    std::error_code append(bytes_view data) noexcept;
    std::error_code reserve(std::size_t new_capacity) noexcept;

    /**
     * @brief 将已写入内容追加到 out 尾部。
     */
    void copy_to(std::vector<byte> &out) const;

private:
    [[nodiscard]] byte *data_mutable() noexcept;
    [[nodiscard]] const byte *data_const() const noexcept;

    std::error_code ensure_writable(std::size_t n) noexcept;
    std::error_code grow(std::size_t min_capacity) noexcept;

    std::array<byte, kDefaultSinkCapacity> inline_{};
    std::unique_ptr<byte[]> heap_;

    std::size_t max_capacity_{0};
    std::size_t capacity_{0};
    std::size_t write_pos_{0};
};

} // namespace minser::core
