#include "bench_main.hpp"

#include "bitwire/codec/varint.hpp"
#include "bitwire/schema/dynamic.hpp"
#include "bitwire/serialize.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

using namespace bitwire::benchmarks;
using bitwire::byte;

namespace {

struct Sample {
    std::uint16_t channel{};
    std::int32_t value{};
    bool valid{};
    BITWIRE_FIELDS(channel, value, valid)
};

struct Batch {
    std::uint64_t id{};
    std::vector<Sample> samples;
    std::map<std::string, std::int64_t> counters;
    std::optional<std::string> label;
    BITWIRE_FIELDS(id, samples, counters, label)
};

Batch make_batch(std::size_t n) {
    Batch b;
    b.id = 0xC0FFEE;
    b.samples.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        b.samples.push_back({static_cast<std::uint16_t>(i % 32),
                             static_cast<std::int32_t>(i * 37) - 20000, (i % 5) != 0});
    }
    for (int i = 0; i < 16; ++i) {
        b.counters.emplace("counter_" + std::to_string(i), i * -1234567LL);
    }
    b.label = "bench";
    return b;
}

bitwire::schema::DescriptorPtr batch_descriptor() {
    using bitwire::schema::Descriptor;
    auto sample = Descriptor::structure({{"channel", Descriptor::u16()},
                                         {"value", Descriptor::i32()},
                                         {"valid", Descriptor::boolean()}});
    auto counter = Descriptor::structure({{"key", Descriptor::string()},
                                          {"value", Descriptor::i64()}});
    return Descriptor::structure({{"id", Descriptor::u64()},
                                  {"samples", Descriptor::sequence(sample)},
                                  {"counters", Descriptor::sequence(counter)},
                                  {"label", Descriptor::optional(Descriptor::string())}});
}

} // namespace

static void bench_varint_roundtrip() {
    constexpr std::size_t kCount = 100000;
    bitwire::BitBuffer buf;
    BENCH_RUN("varint write+read x100K", kCount * 8, 50, {
        buf.clear();
        for (std::size_t i = 0; i < kCount; ++i) {
            bitwire::codec::write_varint(buf, static_cast<std::uint64_t>(i) * 2654435761ULL);
        }
        std::uint64_t v = 0;
        std::uint64_t sum = 0;
        for (std::size_t i = 0; i < kCount; ++i) {
            if (bitwire::codec::read_varint(buf, v)) {
                break;
            }
            sum += v;
        }
        do_not_optimize(sum);
    });
}

static void bench_static_encode() {
    for (std::size_t n : {16u, 1024u, 16384u}) {
        const auto batch = make_batch(n);
        const auto size = bitwire::encode(batch).size();
        bitwire::Buffer buffer;

        if (n == 16) {
            BENCH_RUN("static encode Batch (16 samples)", size, 20000,
                      { do_not_optimize(buffer.encode(batch).size()); });
        } else if (n == 1024) {
            BENCH_RUN("static encode Batch (1K samples)", size, 2000,
                      { do_not_optimize(buffer.encode(batch).size()); });
        } else {
            BENCH_RUN("static encode Batch (16K samples)", size, 200,
                      { do_not_optimize(buffer.encode(batch).size()); });
        }
    }
}

static void bench_static_decode() {
    const auto bytes = bitwire::encode(make_batch(1024));
    bitwire::Buffer buffer;
    BENCH_RUN("static decode Batch (1K samples)", bytes.size(), 2000, {
        Batch out;
        const auto ec = buffer.decode(bytes, out);
        do_not_optimize(ec.value());
    });
}

// 动态描述符路径与静态路径输出一致，这里对比两者的开销。
static void bench_dynamic_encode_decode() {
    const auto desc = batch_descriptor();
    const auto bytes = bitwire::encode(make_batch(1024));

    bitwire::schema::Value value = bitwire::schema::Value::boolean(false);
    if (bitwire::schema::decode_value(*desc, bytes, value)) {
        return;
    }

    BENCH_RUN("dynamic decode Batch (1K samples)", bytes.size(), 500, {
        bitwire::schema::Value out = bitwire::schema::Value::boolean(false);
        const auto ec = bitwire::schema::decode_value(*desc, bytes, out);
        do_not_optimize(ec.value());
    });

    std::vector<byte> out;
    BENCH_RUN("dynamic encode Batch (1K samples)", bytes.size(), 500, {
        const auto ec = bitwire::schema::encode_value(*desc, value, out);
        do_not_optimize(ec.value());
    });
}

int main() {
    bench_varint_roundtrip();
    bench_static_encode();
    bench_static_decode();
    bench_dynamic_encode_decode();

    print_results();
    return 0;
}
