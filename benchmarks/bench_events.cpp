#include "bench_main.hpp"
#include "arev/event/auto_reset_event.hpp"
#include "arev/event/manual_reset_event.hpp"

#include <asio/io_context.hpp>

#include <chrono>
#include <stop_token>

using namespace arev;
using namespace std::chrono_literals;

static void bench_auto_reset_fast_path() {
    // 已置位时的 wait：不入队、不分配竞赛对象
    constexpr std::size_t cycles = 200'000;

    asio::io_context ioc;
    event::AutoResetEvent ev(ioc.get_executor());

    BENCH_RUN("AutoResetEvent: set + wait (signaled)", cycles, 5, {
        for (std::size_t i = 0; i < cycles; ++i) {
            ev.set();
            (void)ev.wait();
        }
    });
}

static void bench_auto_reset_queued() {
    constexpr std::size_t cycles = 200'000;

    asio::io_context ioc;
    event::AutoResetEvent ev(ioc.get_executor());

    BENCH_RUN("AutoResetEvent: wait (queued) + set", cycles, 5, {
        for (std::size_t i = 0; i < cycles; ++i) {
            auto w = ev.wait();
            ev.set();
        }
    });
}

static void bench_auto_reset_deadline() {
    // 带超时与取消的等待：每次都有一场定时器/取消竞赛
    constexpr std::size_t cycles = 200'000;

    asio::io_context ioc;
    event::AutoResetEvent ev(ioc.get_executor());
    std::stop_source source;

    BENCH_RUN("AutoResetEvent: wait(5s, token) + set", cycles, 3, {
        for (std::size_t i = 0; i < cycles; ++i) {
            auto w = ev.wait(5s, source.get_token());
            ev.set();
            if (i % 1000 == 0) {
                ioc.poll();
            }
        }
        ioc.run();
        ioc.restart();
    });
}

static void bench_manual_reset_cycle() {
    constexpr std::size_t cycles = 200'000;

    asio::io_context ioc;
    event::ManualResetEvent ev(ioc.get_executor());

    BENCH_RUN("ManualResetEvent: wait + set + reset", cycles, 5, {
        for (std::size_t i = 0; i < cycles; ++i) {
            auto w = ev.wait();
            ev.set();
            ev.reset();
        }
    });
}

int main() {
    bench_auto_reset_fast_path();
    bench_auto_reset_queued();
    bench_auto_reset_deadline();
    bench_manual_reset_cycle();

    arev::benchmarks::print_results();
    return 0;
}
