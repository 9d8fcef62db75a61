#include "arev/core/error.hpp"
#include "arev/event/auto_reset_event.hpp"

#include "test_main.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace {

using arev::core::errc;
using arev::core::Future;
using arev::event::AutoResetEvent;

using namespace std::chrono_literals;

void test_signal_is_consumed_once() {
  asio::io_context ioc;
  AutoResetEvent ev(ioc.get_executor());

  TEST_EXPECT(ev.wait(0ms) == arev::core::ready_false());

  ev.set();
  ev.set();  // 没有等待者时多次 set 只保留一个信号
  TEST_EXPECT(ev.is_set());

  TEST_EXPECT(ev.wait() == arev::core::ready_true());
  TEST_EXPECT(!ev.is_set());
  TEST_EXPECT(ev.wait(0ms) == arev::core::ready_false());
}

void test_argument_validation() {
  asio::io_context ioc;
  AutoResetEvent ev(ioc.get_executor());
  ev.set();

  TEST_EXPECT_ERR(ev.wait(-3ms).error(), errc::invalid_argument);

  std::stop_source source;
  source.request_stop();
  TEST_EXPECT_ERR(ev.wait(source.get_token()).error(), errc::cancelled);

  // 失败的调用不会消耗信号。
  TEST_EXPECT(ev.is_set());
}

void test_fifo_release() {
  asio::io_context ioc;
  AutoResetEvent ev(ioc.get_executor());

  std::vector<int> order;
  std::vector<Future<bool>> waits;
  for (int i = 0; i < 3; ++i) {
    waits.push_back(ev.wait());
    waits.back().then([&order, i](const Future<bool>& f) {
      if (!f.error() && f.value()) {
        order.push_back(i);
      }
    });
  }
  TEST_EXPECT_EQ(ev.waiter_count(), std::size_t{3});

  ev.set();
  TEST_EXPECT(waits[0].ready());
  TEST_EXPECT(!waits[1].ready());
  ev.set();
  ev.set();
  TEST_EXPECT_EQ(order, (std::vector<int>{0, 1, 2}));
  TEST_EXPECT_EQ(ev.waiter_count(), std::size_t{0});
  TEST_EXPECT(!ev.is_set());

  ev.set();
  TEST_EXPECT(ev.is_set());
}

void test_timed_out_waiter_forwards_release() {
  asio::io_context ioc;
  AutoResetEvent ev(ioc.get_executor());

  auto first = ev.wait(5ms);
  auto second = ev.wait();
  TEST_EXPECT_EQ(ev.waiter_count(), std::size_t{2});

  ioc.run();
  TEST_EXPECT(first.ready());
  TEST_EXPECT(!first.value());
  // 超时的等待者仍在队列中（不会从中间移除）。
  TEST_EXPECT_EQ(ev.waiter_count(), std::size_t{2});

  // 轮到超时的等待者时，放行被转发给下一个等待者。
  ev.set();
  TEST_EXPECT(second.ready());
  TEST_EXPECT(second.value());
  TEST_EXPECT_EQ(ev.waiter_count(), std::size_t{0});
  TEST_EXPECT(!ev.is_set());
}

void test_cancelled_waiter_forwards_release() {
  asio::io_context ioc;
  AutoResetEvent ev(ioc.get_executor());
  std::stop_source source;

  auto cancelled = ev.wait(1s, source.get_token());
  source.request_stop();
  TEST_EXPECT_ERR(cancelled.error(), errc::cancelled);

  // 没有其他等待者：转发的放行变成置位，信号不会丢失。
  ev.set();
  TEST_EXPECT_EQ(ev.waiter_count(), std::size_t{0});
  TEST_EXPECT(ev.is_set());
  TEST_EXPECT(ev.wait(0ms) == arev::core::ready_true());

  ioc.run();
}

void test_set_in_background() {
  asio::io_context ioc;
  AutoResetEvent ev(ioc.get_executor());

  auto waiter = ev.wait();
  ev.set(false);
  // 出队同步完成，完成动作在执行器上。
  TEST_EXPECT_EQ(ev.waiter_count(), std::size_t{0});
  TEST_EXPECT(!ev.is_set());
  TEST_EXPECT(!waiter.ready());

  ioc.run();
  TEST_EXPECT(waiter.ready());
  TEST_EXPECT(waiter.value());
}

void test_concurrent_waits_then_sets_release_min() {
  constexpr int kWaiters = 40;
  constexpr int kSets = 25;
  constexpr int kThreads = 4;

  asio::io_context ioc;
  AutoResetEvent ev(ioc.get_executor());

  std::mutex mu;
  std::vector<Future<bool>> waits;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kWaiters / kThreads; ++i) {
        auto w = ev.wait();
        std::lock_guard lk(mu);
        waits.push_back(std::move(w));
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }
  threads.clear();

  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = t; i < kSets; i += kThreads) {
        ev.set();
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }

  const auto released = std::count_if(waits.begin(), waits.end(), [](const Future<bool>& f) { return f.ready(); });
  TEST_EXPECT_EQ(released, static_cast<std::ptrdiff_t>(std::min(kWaiters, kSets)));
  TEST_EXPECT_EQ(ev.waiter_count(), static_cast<std::size_t>(kWaiters - kSets));
  TEST_EXPECT(!ev.is_set());
}

void test_coroutines_on_thread_pool() {
  constexpr int kWaiters = 16;

  asio::io_context ioc;
  AutoResetEvent ev(ioc.get_executor());
  std::atomic<int> woke{0};

  for (int i = 0; i < kWaiters; ++i) {
    asio::co_spawn(
      ioc,
      [&]() -> asio::awaitable<void> {
        auto ec = co_await ev.async_wait(5s);
        TEST_EXPECT_OK(ec);
        ++woke;
      },
      asio::detached);
  }

  // 等待者全部入队后再逐个放行。
  asio::steady_timer setter(ioc);
  setter.expires_after(20ms);
  setter.async_wait([&](const std::error_code&) {
    for (int i = 0; i < kWaiters; ++i) {
      ev.set(false);
    }
  });

  std::vector<std::thread> pool;
  for (int t = 0; t < 4; ++t) {
    pool.emplace_back([&] { ioc.run(); });
  }
  for (auto& th : pool) {
    th.join();
  }

  TEST_EXPECT_EQ(woke.load(), kWaiters);
  TEST_EXPECT_EQ(ev.waiter_count(), std::size_t{0});
  TEST_EXPECT(!ev.is_set());
}

void test_event_destroyed_before_background_release_runs() {
  asio::io_context ioc;
  std::stop_source source;
  Future<bool> abandoned;
  Future<bool> queued;
  {
    auto ev = std::make_unique<AutoResetEvent>(ioc.get_executor());
    abandoned = ev->wait(1s, source.get_token());
    queued = ev->wait();
    source.request_stop();
    // 放行落到已放弃的等待者上，完成动作排在执行器中。
    ev->set(false);
    TEST_EXPECT_EQ(ev->waiter_count(), std::size_t{1});
  }
  TEST_EXPECT_ERR(queued.error(), errc::broken_promise);

  // 排队的完成动作在事件销毁后执行：转发找不到事件，直接结束。
  ioc.run();
  TEST_EXPECT_ERR(abandoned.error(), errc::cancelled);
}

void test_many_abandoned_waiters_are_skipped_in_one_set() {
  constexpr int kAbandoned = 50'000;

  asio::io_context ioc;
  AutoResetEvent ev(ioc.get_executor());
  std::stop_source source;
  for (int i = 0; i < kAbandoned; ++i) {
    (void)ev.wait(source.get_token());
  }
  auto live = ev.wait();
  source.request_stop();
  TEST_EXPECT_EQ(ev.waiter_count(), static_cast<std::size_t>(kAbandoned + 1));

  // 每个已放弃的等待者把放行转发给下一个，最终只放行 live，不会逐层递归。
  ev.set();
  TEST_EXPECT(live.ready());
  TEST_EXPECT(live.value());
  TEST_EXPECT_EQ(ev.waiter_count(), std::size_t{0});
  TEST_EXPECT(!ev.is_set());
  ioc.run();
}

}  // namespace

int main() {
  test_signal_is_consumed_once();
  test_argument_validation();
  test_fifo_release();
  test_timed_out_waiter_forwards_release();
  test_cancelled_waiter_forwards_release();
  test_set_in_background();
  test_concurrent_waits_then_sets_release_min();
  test_coroutines_on_thread_pool();
  test_event_destroyed_before_background_release_runs();
  test_many_abandoned_waiters_are_skipped_in_one_set();
  return ::arev::tests::run_and_report();
}
