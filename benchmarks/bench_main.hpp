#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace bitwire::benchmarks {

struct BenchmarkResult {
    std::string name;
    std::size_t data_size;
    double mean_ms;
    double best_ms;
    double throughput_mbps;
};

class BenchmarkTimer {
public:
    void start() { start_ = std::chrono::steady_clock::now(); }

    void stop() { end_ = std::chrono::steady_clock::now(); }

    [[nodiscard]] double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(end_ - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point end_;
};

inline std::vector<BenchmarkResult> &results() {
    static std::vector<BenchmarkResult> results_;
    return results_;
}

// 防止编译器把只用于计时的结果整个优化掉。
template <class T>
inline void do_not_optimize(const T &value) {
    asm volatile("" : : "r,m"(value) : "memory");
}

template <typename Func>
inline void run_benchmark(std::string name,
                          std::size_t data_size,
                          int iterations,
                          Func &&func) {
    // 先空跑一次：让 BitBuffer 等复用型对象完成首次扩容。
    func();

    double total_ms = 0.0;
    double best_ms = 0.0;
    for (int i = 0; i < iterations; ++i) {
        BenchmarkTimer timer;
        timer.start();
        func();
        timer.stop();
        const double ms = timer.elapsed_ms();
        total_ms += ms;
        best_ms = (i == 0) ? ms : std::min(best_ms, ms);
    }
    const double mean_ms = iterations > 0 ? total_ms / iterations : 0.0;

    // 吞吐按平均耗时计算（MB/s）。
    double throughput_mbps = 0.0;
    if (mean_ms > 0.0) {
        throughput_mbps = (static_cast<double>(data_size) / (1024.0 * 1024.0)) / (mean_ms / 1000.0);
    }
    results().push_back({std::move(name), data_size, mean_ms, best_ms, throughput_mbps});
}

[[nodiscard]] inline std::string format_size(std::size_t bytes) {
    if (bytes >= 1024 * 1024) {
        return std::to_string(bytes / (1024 * 1024)) + " MB";
    }
    if (bytes >= 1024) {
        return std::to_string(bytes / 1024) + " KB";
    }
    return std::to_string(bytes) + " B";
}

inline void print_results() {
    const std::string rule(104, '=');
    std::cout << "\n" << rule << "\nBENCHMARK RESULTS\n" << rule << "\n";
    std::cout << std::left << std::setw(50) << "Benchmark" << std::setw(12) << "Size"
              << std::setw(14) << "Mean (ms)" << std::setw(14) << "Best (ms)"
              << "Throughput (MB/s)\n";
    std::cout << std::string(104, '-') << "\n";

    for (const auto &result : results()) {
        std::cout << std::left << std::setw(50) << result.name << std::setw(12)
                  << format_size(result.data_size) << std::fixed << std::setprecision(3)
                  << std::setw(14) << result.mean_ms << std::setw(14) << result.best_ms;
        if (result.throughput_mbps > 0.0) {
            std::cout << result.throughput_mbps;
        } else {
            std::cout << "N/A";
        }
        std::cout << "\n";
    }
    std::cout << rule << "\n\n";
}

} // namespace bitwire::benchmarks

#define BENCH_RUN(name, size, iterations, code)                                \
    ::bitwire::benchmarks::run_benchmark(name, size, iterations, [&]() { code; })
