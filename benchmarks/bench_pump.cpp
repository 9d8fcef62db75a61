#include "bench_main.hpp"
#include "arev/pump/delegate_pump.hpp"
#include "arev/pump/message_pump.hpp"

#include <asio/io_context.hpp>

#include <chrono>
#include <cstdint>

using namespace arev;
using namespace std::chrono_literals;

static void bench_message_pump_sync() {
    constexpr std::size_t items = 100'000;

    asio::io_context ioc;
    std::uint64_t sum = 0;
    pump::MessagePump<std::uint64_t> p(ioc.get_executor(), [&](std::uint64_t v) { sum += v; });

    BENCH_RUN("MessagePump: 100k sync items", items, 5, {
        for (std::size_t i = 0; i < items; ++i) {
            p.post(i);
        }
        ioc.run();
        ioc.restart();
    });

    if (sum == 0) {
        std::cerr << "MessagePump: nothing processed\n";
    }
}

static void bench_message_pump_pending() {
    // 投递已完成的 Future：每个条目额外经过一次 async_wait
    constexpr std::size_t items = 100'000;

    asio::io_context ioc;
    std::uint64_t sum = 0;
    pump::MessagePump<std::uint64_t> p(ioc.get_executor(), [&](std::uint64_t v) -> asio::awaitable<void> {
        sum += v;
        co_return;
    });

    BENCH_RUN("MessagePump: 100k ready futures", items, 3, {
        for (std::size_t i = 0; i < items; ++i) {
            p.post(core::make_ready_future<std::uint64_t>(i));
        }
        ioc.run();
        ioc.restart();
    });
}

static void bench_delegate_send() {
    constexpr std::size_t sends = 50'000;

    asio::io_context ioc;
    pump::DelegatePump p(ioc.get_executor());
    std::uint64_t sum = 0;

    BENCH_RUN("DelegatePump: 50k send(5s timeout)", sends, 3, {
        for (std::size_t i = 0; i < sends; ++i) {
            (void)p.send(
                [&sum, i]() -> asio::awaitable<void> {
                    sum += i;
                    co_return;
                },
                5s);
        }
        ioc.run();
        ioc.restart();
    });
}

int main() {
    bench_message_pump_sync();
    bench_message_pump_pending();
    bench_delegate_send();

    arev::benchmarks::print_results();
    return 0;
}
