#pragma once

#include "bitwire/core/common.hpp"
#include "bitwire/core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>

namespace bitwire::core {

/**
 * @brief 按位寻址、可扩容的缓冲区（读写游标模型）。
 *
 * 位序约定（线格式版本 1）：
 * - 低位优先：流中第 i 位是第 i / 8 个字节的第 i % 8 位；
 * - write_bits(v, w) 先写 v 的 bit0；因此字节对齐处写 8 位，结果就是该字节本身。
 *
 * 游标：
 * - write_pos_（位）：下一个待写位置，同时也是可读数据的总位数；
 * - read_pos_（位）：下一个待读位置，永远不超过 write_pos_，越界读返回
 *   errc::unexpected_end 且游标不前进。
 *
 * 存储：
 * - storage_.size() 即当前容量，写游标之后的字节始终为 0，finish() 因此天然
 *   以 0 补齐最后一个不完整字节；
 * - 扩容按 2 倍增长，保证大对象编码的均摊复杂度为线性。
 *
 * 注意：
 * - 本类不做线程安全保证；每次编解码调用独占一个实例。
 */
class BitBuffer final {
public:
    explicit BitBuffer(std::size_t initial_capacity = kDefaultBitBufferCapacity);

    /**
     * @brief 以只读视角包装收到的字节：总位数为 8 * bytes.size()。
     */
    [[nodiscard]] static BitBuffer from_bytes(bytes_view bytes);

    /**
     * @brief 用 bytes 替换全部内容并重置两个游标，尽量复用已有存储。
     *
     * bytes 允许指向本缓冲区自身（例如上一次 bytes() 返回的视图）。
     */
    void assign(bytes_view bytes);

    BitBuffer(BitBuffer &&other) noexcept;
    BitBuffer &operator=(BitBuffer &&other) noexcept;

    BitBuffer(const BitBuffer &) = delete;
    BitBuffer &operator=(const BitBuffer &) = delete;

    ~BitBuffer() = default;

    // ---- 写入侧 ----

    /**
     * @brief 追加 value 的低 width 位。
     *
     * width == 0 为空操作；width > 64 按 64 处理；value 中高于 width 的位被忽略。
     */
    void write_bits(std::uint64_t value, unsigned width);
    void write_bit(bool value);

    /**
     * @brief 追加一段原始字节；写游标字节对齐时走 memcpy 快路径，输出与逐字节写一致。
     */
    void write_bytes(bytes_view data);

    void reserve_bits(std::size_t bits);

    /**
     * @brief 取走已写入的字节（末尾不足 8 位的部分以 0 补齐），缓冲区随后为空。
     */
    [[nodiscard]] std::vector<byte> finish();

    // ---- 读取侧 ----

    std::error_code read_bits(unsigned width, std::uint64_t &out) noexcept;
    std::error_code read_bit(bool &out) noexcept;

    /**
     * @brief 读取 out.size() 个字节；剩余不足时返回 unexpected_end，out 不被修改。
     */
    std::error_code read_bytes(mutable_bytes_view out) noexcept;

    /**
     * @brief 读游标回到起点（写入内容保持不变）。
     */
    void rewind() noexcept { read_pos_ = 0; }

    // ---- 状态 ----

    [[nodiscard]] std::size_t bit_size() const noexcept { return write_pos_; }
    [[nodiscard]] std::size_t byte_size() const noexcept { return (write_pos_ + 7) / 8; }
    [[nodiscard]] std::size_t read_position() const noexcept { return read_pos_; }
    [[nodiscard]] std::size_t remaining_bits() const noexcept { return write_pos_ - read_pos_; }
    [[nodiscard]] std::size_t capacity_bits() const noexcept { return storage_.size() * 8; }
    [[nodiscard]] bool empty() const noexcept { return write_pos_ == 0; }
    [[nodiscard]] bool is_byte_aligned() const noexcept { return (write_pos_ & 7u) == 0; }

    [[nodiscard]] bytes_view bytes() const noexcept;

    /**
     * @brief 清空内容与两个游标，保留已分配的容量（用于复用）。
     */
    void clear() noexcept;

    // 序列解码（vector/string/map）时允许的最大长度前缀。
    [[nodiscard]] std::size_t max_sequence_length() const noexcept { return max_sequence_length_; }
    void set_max_sequence_length(std::size_t n) noexcept { max_sequence_length_ = n; }

    /**
     * @brief 最近一次文本解码失败（errc::invalid_utf8）时，首个非法序列在该字符串内的字节偏移。
     *
     * 复合类型解码只返回错误码；调用方可在解码失败后从这里取得定位信息。
     * assign()/clear()/finish() 会清除该记录。
     */
    [[nodiscard]] std::optional<std::size_t> invalid_utf8_offset() const noexcept {
        return invalid_utf8_offset_;
    }
    void note_invalid_utf8(std::size_t offset) noexcept { invalid_utf8_offset_ = offset; }

private:
    void ensure_writable_bits(std::size_t bits);
    void grow(std::size_t min_bytes);

    std::vector<byte> storage_;
    std::size_t write_pos_{0};
    std::size_t read_pos_{0};
    std::size_t max_sequence_length_{kDefaultMaxSequenceLength};
    std::optional<std::size_t> invalid_utf8_offset_;
};

} // namespace bitwire::core

namespace bitwire {

using core::BitBuffer;

} // namespace bitwire
