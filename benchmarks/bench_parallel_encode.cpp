#include "bench_main.hpp"

#include "bitwire/serialize.hpp"

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

using namespace bitwire::benchmarks;
using bitwire::byte;

namespace {

struct Record {
    std::uint32_t key{};
    std::int64_t delta{};
    std::vector<std::uint8_t> payload;
    std::string tag;
    BITWIRE_FIELDS(key, delta, payload, tag)
};

constexpr std::size_t kRecords = 4096;

std::vector<Record> make_records() {
    std::vector<Record> records(kRecords);
    for (std::size_t i = 0; i < kRecords; ++i) {
        records[i].key = static_cast<std::uint32_t>(i);
        records[i].delta = static_cast<std::int64_t>(i) * -7919;
        records[i].payload.assign(64 + i % 64, static_cast<std::uint8_t>(i));
        records[i].tag = "rec" + std::to_string(i);
    }
    return records;
}

std::size_t total_size(const std::vector<Record> &records) {
    std::size_t n = 0;
    for (const auto &r : records) {
        n += bitwire::encode(r).size();
    }
    return n;
}

} // namespace

static void bench_serial() {
    const auto records = make_records();
    std::vector<std::vector<byte>> out(records.size());
    BENCH_RUN("encode 4K records serial", total_size(records), 50, {
        for (std::size_t i = 0; i < records.size(); ++i) {
            out[i] = bitwire::encode(records[i]);
        }
    });
}

// 每个分片一个任务，分片内复用同一个 Buffer。
static void bench_thread_pool(unsigned threads) {
    const auto records = make_records();
    std::vector<std::vector<byte>> out(records.size());
    const std::string name = "encode 4K records asio::thread_pool(" + std::to_string(threads) + ")";

    BENCH_RUN(name, total_size(records), 50, {
        asio::thread_pool pool(threads);
        const std::size_t chunk = (records.size() + threads - 1) / threads;
        for (std::size_t begin = 0; begin < records.size(); begin += chunk) {
            const std::size_t end = std::min(records.size(), begin + chunk);
            asio::post(pool, [&records, &out, begin, end] {
                bitwire::Buffer buffer;
                for (std::size_t i = begin; i < end; ++i) {
                    const auto view = buffer.encode(records[i]);
                    out[i].assign(view.begin(), view.end());
                }
            });
        }
        pool.join();
    });
}

int main() {
    bench_serial();
    const unsigned hw = std::max(2u, std::thread::hardware_concurrency());
    bench_thread_pool(2);
    bench_thread_pool(hw);

    print_results();
    return 0;
}
