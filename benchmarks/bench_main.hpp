#pragma once

#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace arev::benchmarks {

struct BenchmarkResult {
    std::string_view name;
    std::size_t operations;
    double elapsed_ms;
    double ops_per_second;
};

class BenchmarkTimer {
public:
    void start() { start_ = std::chrono::steady_clock::now(); }

    void stop() { end_ = std::chrono::steady_clock::now(); }

    [[nodiscard]] double elapsed_ms() const {
        auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end_ - start_);
        return static_cast<double>(duration.count()) / 1'000'000.0;
    }

private:
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point end_;
};

inline std::vector<BenchmarkResult> &results() {
    static std::vector<BenchmarkResult> results_;
    return results_;
}

// operations：单次 func() 内完成的操作数（wait/set 周期、入队条目等）。
template <typename Func>
inline void run_benchmark(std::string_view name, std::size_t operations, int iterations, Func &&func) {
    double total_ms = 0.0;
    for (int i = 0; i < iterations; ++i) {
        BenchmarkTimer timer;
        timer.start();
        func();
        timer.stop();
        total_ms += timer.elapsed_ms();
    }
    const double avg_ms = total_ms / iterations;

    double ops_per_second = 0.0;
    if (avg_ms > 0.0) {
        ops_per_second = static_cast<double>(operations) / (avg_ms / 1000.0);
    }

    results().push_back({name, operations, avg_ms, ops_per_second});
}

inline void print_results() {
    std::cout << "\n";
    std::cout << std::string(90, '=') << "\n";
    std::cout << "BENCHMARK RESULTS\n";
    std::cout << std::string(90, '=') << "\n";
    std::cout << std::left << std::setw(45) << "Benchmark" << std::setw(15) << "Ops" << std::setw(15)
              << "Time (ms)" << std::setw(15) << "Ops/s"
              << "\n";
    std::cout << std::string(90, '-') << "\n";

    for (const auto &result : results()) {
        std::cout << std::left << std::setw(45) << result.name << std::setw(15) << result.operations;
        std::cout << std::fixed << std::setprecision(3) << std::setw(15) << result.elapsed_ms;
        if (result.ops_per_second > 0.0) {
            std::cout << std::setprecision(0) << std::setw(15) << result.ops_per_second;
        } else {
            std::cout << std::setw(15) << "N/A";
        }
        std::cout << "\n";
    }

    std::cout << std::string(90, '=') << "\n\n";
}

} // namespace arev::benchmarks

#define BENCH_RUN(name, ops, iterations, code)                                 \
    ::arev::benchmarks::run_benchmark(name, ops, iterations, [&]() { code; })
