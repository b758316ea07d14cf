#include "bitwire/core/bit_buffer.hpp"

#include "bitwire/core/log.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <utility>

namespace bitwire::core {
namespace {

constexpr unsigned kMaxBitWidth = 64;

[[nodiscard]] constexpr std::uint64_t low_mask(unsigned width) noexcept {
    return width >= 64 ? ~std::uint64_t{0} : ((std::uint64_t{1} << width) - 1u);
}

} // namespace

/*
 * BitBuffer 的实现模型：
 * - storage_ 的 size 就是容量；写游标之后的字节保持为 0，写入只做按位或。
 * - 逐字节处理：每一轮最多写/读到当前字节的边界（8 - bit_offset 位）。
 * - ensure_writable_bits(n) 不够时 grow()，按 2 倍增长直到 >= 需求。
 */
BitBuffer::BitBuffer(std::size_t initial_capacity) : storage_(initial_capacity, byte{0}) {}

BitBuffer BitBuffer::from_bytes(bytes_view bytes) {
    if (bytes.size() > std::numeric_limits<std::size_t>::max() / 8) {
        throw std::length_error("bitwire: input too large");
    }
    BitBuffer buf(0);
    buf.storage_.assign(bytes.begin(), bytes.end());
    buf.write_pos_ = bytes.size() * 8;
    return buf;
}

void BitBuffer::assign(bytes_view bytes) {
    if (bytes.size() > std::numeric_limits<std::size_t>::max() / 8) {
        throw std::length_error("bitwire: input too large");
    }
    const std::size_t n = bytes.size();
    const std::size_t used = byte_size();
    if (n > storage_.size()) {
        // 自身视图不可能比容量更大，这里不会与 storage_ 重叠。
        std::vector<byte> next(n, byte{0});
        std::memcpy(next.data(), bytes.data(), n);
        storage_ = std::move(next);
    } else {
        if (n != 0) {
            std::memmove(storage_.data(), bytes.data(), n);
        }
        if (used > n) {
            std::fill(storage_.begin() + static_cast<std::ptrdiff_t>(n),
                      storage_.begin() + static_cast<std::ptrdiff_t>(used), byte{0});
        }
    }
    write_pos_ = n * 8;
    read_pos_ = 0;
    invalid_utf8_offset_.reset();
}

BitBuffer::BitBuffer(BitBuffer &&other) noexcept
    : storage_(std::move(other.storage_)), write_pos_(other.write_pos_),
      read_pos_(other.read_pos_),
      max_sequence_length_(other.max_sequence_length_),
      invalid_utf8_offset_(other.invalid_utf8_offset_) {
    other.storage_.clear();
    other.write_pos_ = 0;
    other.read_pos_ = 0;
}

BitBuffer &BitBuffer::operator=(BitBuffer &&other) noexcept {
    if (this == &other) {
        return *this;
    }
    storage_ = std::move(other.storage_);
    write_pos_ = other.write_pos_;
    read_pos_ = other.read_pos_;
    max_sequence_length_ = other.max_sequence_length_;
    invalid_utf8_offset_ = other.invalid_utf8_offset_;

    other.storage_.clear();
    other.write_pos_ = 0;
    other.read_pos_ = 0;
    return *this;
}

void BitBuffer::write_bits(std::uint64_t value, unsigned width) {
    if (width == 0) {
        return;
    }
    width = std::min(width, kMaxBitWidth);
    value &= low_mask(width);
    ensure_writable_bits(width);

    byte *data = storage_.data();
    std::size_t pos = write_pos_;
    unsigned left = width;
    while (left > 0) {
        const auto bit_offset = static_cast<unsigned>(pos & 7u);
        const auto take = std::min(8u - bit_offset, left);
        const auto chunk = static_cast<unsigned>(value & low_mask(take));
        data[pos >> 3] = static_cast<byte>(data[pos >> 3] | (chunk << bit_offset));
        // take == 8 时 value 右移 8 位仍然合法（value 为 64 位）。
        value >>= take;
        pos += take;
        left -= take;
    }
    write_pos_ = pos;
}

void BitBuffer::write_bit(bool value) { write_bits(value ? 1u : 0u, 1); }

void BitBuffer::write_bytes(bytes_view data) {
    if (data.empty()) {
        return;
    }
    if (data.size() > std::numeric_limits<std::size_t>::max() / 8) {
        throw std::length_error("bitwire: write too large");
    }
    if (!is_byte_aligned()) {
        ensure_writable_bits(data.size() * 8);
        for (byte b : data) {
            write_bits(b, 8);
        }
        return;
    }
    ensure_writable_bits(data.size() * 8);
    std::memcpy(storage_.data() + (write_pos_ >> 3), data.data(), data.size());
    write_pos_ += data.size() * 8;
}

void BitBuffer::reserve_bits(std::size_t bits) {
    if (bits == 0) {
        return;
    }
    ensure_writable_bits(bits);
}

std::vector<byte> BitBuffer::finish() {
    storage_.resize(byte_size());
    std::vector<byte> out = std::move(storage_);
    storage_.clear();
    write_pos_ = 0;
    read_pos_ = 0;
    invalid_utf8_offset_.reset();
    return out;
}

std::error_code BitBuffer::read_bits(unsigned width, std::uint64_t &out) noexcept {
    if (width == 0) {
        out = 0;
        return {};
    }
    if (width > kMaxBitWidth) {
        return make_error_code(errc::invalid_argument);
    }
    if (remaining_bits() < width) {
        return make_error_code(errc::unexpected_end);
    }

    const byte *data = storage_.data();
    std::size_t pos = read_pos_;
    std::uint64_t v = 0;
    unsigned got = 0;
    while (got < width) {
        const auto bit_offset = static_cast<unsigned>(pos & 7u);
        const auto take = std::min(8u - bit_offset, width - got);
        const auto chunk = (static_cast<unsigned>(data[pos >> 3]) >> bit_offset) &
                           static_cast<unsigned>(low_mask(take));
        v |= static_cast<std::uint64_t>(chunk) << got;
        got += take;
        pos += take;
    }
    read_pos_ = pos;
    out = v;
    return {};
}

std::error_code BitBuffer::read_bit(bool &out) noexcept {
    std::uint64_t v = 0;
    auto ec = read_bits(1, v);
    if (ec) {
        return ec;
    }
    out = (v != 0);
    return {};
}

std::error_code BitBuffer::read_bytes(mutable_bytes_view out) noexcept {
    if (out.empty()) {
        return {};
    }
    if (out.size() > remaining_bits() / 8) {
        return make_error_code(errc::unexpected_end);
    }
    if ((read_pos_ & 7u) == 0) {
        std::memcpy(out.data(), storage_.data() + (read_pos_ >> 3), out.size());
        read_pos_ += out.size() * 8;
        return {};
    }
    for (auto &b : out) {
        std::uint64_t v = 0;
        auto ec = read_bits(8, v);
        if (ec) {
            return ec;
        }
        b = static_cast<byte>(v);
    }
    return {};
}

bytes_view BitBuffer::bytes() const noexcept {
    return bytes_view{storage_.data(), byte_size()};
}

void BitBuffer::clear() noexcept {
    // 只需清零已写过的字节，其余部分本来就是 0。
    std::fill_n(storage_.begin(), static_cast<std::ptrdiff_t>(byte_size()), byte{0});
    write_pos_ = 0;
    read_pos_ = 0;
    invalid_utf8_offset_.reset();
}

void BitBuffer::ensure_writable_bits(std::size_t bits) {
    if (bits > std::numeric_limits<std::size_t>::max() - write_pos_ - 7) {
        throw std::length_error("bitwire: bit buffer size overflow");
    }
    const std::size_t required_bytes = (write_pos_ + bits + 7) / 8;
    if (required_bytes <= storage_.size()) {
        return;
    }
    grow(required_bytes);
}

void BitBuffer::grow(std::size_t min_bytes) {
    const auto old_capacity = storage_.size();
    // 扩容策略：按 2 倍增长，直到 >= min_bytes；容量为 0 时从 1 开始。
    std::size_t new_capacity = std::max<std::size_t>(old_capacity, 1);
    while (new_capacity < min_bytes) {
        if (new_capacity > std::numeric_limits<std::size_t>::max() / 2) {
            new_capacity = min_bytes;
            break;
        }
        new_capacity *= 2;
    }
    storage_.resize(new_capacity, byte{0});
    detail::log_buffer_growth(old_capacity, new_capacity);
}

} // namespace bitwire::core
