#include "bench_main.hpp"

#include "bitwire/core/bit_buffer.hpp"

#include <cstddef>
#include <cstdint>
#include <system_error>
#include <vector>

using namespace bitwire::benchmarks;
using bitwire::byte;
using bitwire::core::BitBuffer;

namespace {

constexpr std::size_t kBytes = 64 * 1024;

} // namespace

// 字节对齐写入：write_bits(v, 8) 逐字节走通用路径。
static void bench_write_aligned_bytes() {
    BitBuffer buf;
    BENCH_RUN("BitBuffer write_bits(8) aligned x64K", kBytes, 200, {
        buf.clear();
        for (std::size_t i = 0; i < kBytes; ++i) {
            buf.write_bits(static_cast<std::uint64_t>(i), 8);
        }
        do_not_optimize(buf.bit_size());
    });
}

// 非对齐写入：先写 3 位让后续每次写入都跨越字节边界。
static void bench_write_unaligned_bytes() {
    BitBuffer buf;
    BENCH_RUN("BitBuffer write_bits(8) unaligned x64K", kBytes, 200, {
        buf.clear();
        buf.write_bits(5, 3);
        for (std::size_t i = 0; i < kBytes; ++i) {
            buf.write_bits(static_cast<std::uint64_t>(i), 8);
        }
        do_not_optimize(buf.bit_size());
    });
}

static void bench_write_bytes_memcpy() {
    const std::vector<byte> payload(kBytes, byte{0x5A});
    BitBuffer buf;
    BENCH_RUN("BitBuffer write_bytes aligned 64KB", kBytes, 1000, {
        buf.clear();
        buf.write_bytes(payload);
        do_not_optimize(buf.bit_size());
    });
}

static void bench_write_single_bits() {
    constexpr std::size_t kBits = kBytes * 8;
    BitBuffer buf;
    BENCH_RUN("BitBuffer write_bit x512K", kBytes, 50, {
        buf.clear();
        for (std::size_t i = 0; i < kBits; ++i) {
            buf.write_bit((i & 3u) == 1u);
        }
        do_not_optimize(buf.bit_size());
    });
}

static void bench_read_unaligned() {
    BitBuffer buf;
    buf.write_bits(1, 1);
    for (std::size_t i = 0; i < kBytes; ++i) {
        buf.write_bits(static_cast<std::uint64_t>(i * 31u), 13);
    }
    const std::size_t total_bytes = buf.byte_size();

    BENCH_RUN("BitBuffer read_bits(13) unaligned x64K", total_bytes, 200, {
        buf.rewind();
        std::uint64_t v = 0;
        std::uint64_t sum = 0;
        (void)buf.read_bits(1, v);
        for (std::size_t i = 0; i < kBytes; ++i) {
            if (buf.read_bits(13, v)) {
                break;
            }
            sum += v;
        }
        do_not_optimize(sum);
    });
}

static void bench_grow_from_zero() {
    BENCH_RUN("BitBuffer grow from capacity 0 to 64KB", kBytes, 200, {
        BitBuffer buf(0);
        for (std::size_t i = 0; i < kBytes / 8; ++i) {
            buf.write_bits(static_cast<std::uint64_t>(i) * 0x0101010101010101ULL, 64);
        }
        do_not_optimize(buf.capacity_bits());
    });
}

int main() {
    bench_write_aligned_bytes();
    bench_write_unaligned_bytes();
    bench_write_bytes_memcpy();
    bench_write_single_bits();
    bench_read_unaligned();
    bench_grow_from_zero();

    print_results();
    return 0;
}
