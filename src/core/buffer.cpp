#include "minser/core/buffer.hpp"

#include <algorithm>
#include <cstring>
#include <limits>

namespace minser::core {
namespace {

std::size_t clamp_capacity(std::size_t requested,
                           std::size_t max_capacity) noexcept {
    if (requested == 0 || max_capacity == 0) {
        return 0;
    }
    return std::min(requested, max_capacity);
}

} // namespace

/*
 * ByteSink 的实现模型：
 * - 只有写指针 write_pos_；[0, write_pos_) 为已写入数据。
 * - 小对象优先走 inline_（固定数组）；必要时切换到 heap_ 并按需扩容。
 * - ensure_writable(n) 先看尾部空间，不够时 grow()
 *   （按 2 倍增长，且受 max_capacity_ 上限约束）。
 */
ByteSink::ByteSink(std::size_t initial_capacity, std::size_t max_capacity)
    : max_capacity_(max_capacity),
      capacity_(clamp_capacity(initial_capacity, max_capacity_)) {
    if (capacity_ > inline_.size()) {
        heap_ = std::make_unique<byte[]>(capacity_);
    }
}

ByteSink::ByteSink(ByteSink &&other) noexcept
    : heap_(std::move(other.heap_)), max_capacity_(other.max_capacity_),
      capacity_(other.capacity_), write_pos_(other.write_pos_) {
    // inline_ 场景只复制实际写入的前缀。
    if (!heap_ && write_pos_ > 0) {
        std::memcpy(inline_.data(), other.inline_.data(), write_pos_);
    }
    other.max_capacity_ = 0;
    other.capacity_ = 0;
    other.write_pos_ = 0;
}

ByteSink &ByteSink::operator=(ByteSink &&other) noexcept {
    if (this == &other) {
        return *this;
    }
    heap_ = std::move(other.heap_);
    max_capacity_ = other.max_capacity_;
    capacity_ = other.capacity_;
    write_pos_ = other.write_pos_;

    if (!heap_ && write_pos_ > 0) {
        std::memcpy(inline_.data(), other.inline_.data(), write_pos_);
    }

    other.max_capacity_ = 0;
    other.capacity_ = 0;
    other.write_pos_ = 0;
    return *this;
}

std::size_t ByteSink::capacity() const noexcept { return capacity_; }

std::size_t ByteSink::max_capacity() const noexcept { return max_capacity_; }

std::size_t ByteSink::size() const noexcept { return write_pos_; }

bool ByteSink::empty() const noexcept { return write_pos_ == 0; }

byte *ByteSink::data_mutable() noexcept {
    if (heap_) {
        return heap_.get();
    }
    return inline_.data();
}

const byte *ByteSink::data_const() const noexcept {
    if (heap_) {
        return heap_.get();
    }
    return inline_.data();
}

void ByteSink::clear() noexcept { write_pos_ = 0; }

std::error_code ByteSink::truncate(std::size_t n) noexcept {
    if (n > write_pos_) {
        return make_error_code(errc::invalid_argument);
    }
    write_pos_ = n;
    return {};
}

bytes_view ByteSink::bytes() const noexcept {
    return bytes_view{data_const(), write_pos_};
}

void ByteSink::copy_to(std::vector<byte> &out) const {
    const auto view = bytes();
    out.insert(out.end(), view.begin(), view.end());
}

std::error_code ByteSink::reserve(std::size_t new_capacity) noexcept {
    if (new_capacity <= capacity_) {
        return {};
    }
    if (new_capacity > max_capacity_) {
        return make_error_code(errc::buffer_overflow);
    }
    return grow(new_capacity);
}

std::error_code ByteSink::ensure_writable(std::size_t n) noexcept {
    if (n == 0) {
        return {};
    }
    if (capacity_ - write_pos_ >= n) {
        return {};
    }
    if (n > (std::numeric_limits<std::size_t>::max() - write_pos_)) {
        return make_error_code(errc::buffer_overflow);
    }
    const auto required = write_pos_ + n;
    if (required > max_capacity_) {
        return make_error_code(errc::buffer_overflow);
    }
    return grow(required);
}

std::error_code ByteSink::grow(std::size_t min_capacity) noexcept {
    if (min_capacity <= capacity_) {
        return {};
    }
    if (min_capacity > max_capacity_) {
        return make_error_code(errc::buffer_overflow);
    }

    if (!heap_ && min_capacity <= inline_.size()) {
        // 仍可容纳在 inline_ 中：只更新可用容量，不做堆分配。
        capacity_ = min_capacity;
        return {};
    }

    // 扩容策略：按 2 倍增长，直到 >= min_capacity，且不超过 max_capacity_。
    // capacity_ 为 0 时从 1 起步，否则倍增无效。
    std::size_t new_capacity =
        std::max<std::size_t>(capacity_ == 0 ? 1 : capacity_, 1);
    while (new_capacity < min_capacity) {
        if (new_capacity > (std::numeric_limits<std::size_t>::max() / 2)) {
            return make_error_code(errc::buffer_overflow);
        }
        new_capacity *= 2;
        new_capacity = std::min(new_capacity, max_capacity_);
    }

    auto new_heap = std::make_unique<byte[]>(new_capacity);
    if (write_pos_ != 0) {
        std::memcpy(new_heap.get(), data_const(), write_pos_);
    }
    heap_ = std::move(new_heap);
    capacity_ = new_capacity;
    return {};
}

std::error_code ByteSink::push_back(byte b) noexcept {
    auto ec = ensure_writable(1);
    if (ec) {
        return ec;
    }
    data_mutable()[write_pos_++] = b;
    return {};
}

std::error_code ByteSink::append(bytes_view data) noexcept {
    if (data.empty()) {
        return {};
    }
    auto ec = ensure_writable(data.size());
    if (ec) {
        return ec;
    }
    std::memcpy(data_mutable() + write_pos_, data.data(), data.size());
    write_pos_ += data.size();
    return {};
}

} // namespace minser::core
