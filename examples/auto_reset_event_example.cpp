/**
 * @file auto_reset_event_example.cpp
 * @brief 演示 AutoResetEvent 作为“单次放行闸门”的用法
 *
 * 本示例展示如何：
 * 1. 多个协程排队等待同一个事件（FIFO 放行）
 * 2. 给等待加超时，超时的等待者收到 errc::timeout
 * 3. 用 std::stop_source 取消一个等待
 * 4. 由生产者按节奏 set()，每次只放行一个等待者
 */

#include "arev/core/error.hpp"
#include "arev/core/log.hpp"
#include "arev/event/auto_reset_event.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <chrono>
#include <iostream>
#include <stop_token>
#include <string>

using namespace arev;
using namespace std::chrono_literals;

namespace {

asio::awaitable<void> worker(event::AutoResetEvent& gate, std::string name, core::duration timeout, std::stop_token token) {
  std::cout << "[" << name << "] waiting\n";
  auto ec = co_await gate.async_wait(timeout, std::move(token));
  if (!ec) {
    std::cout << "[" << name << "] released\n";
  } else {
    std::cout << "[" << name << "] gave up: " << ec.message() << "\n";
  }
}

asio::awaitable<void> producer(event::AutoResetEvent& gate, int releases) {
  asio::steady_timer timer(co_await asio::this_coro::executor);
  for (int i = 0; i < releases; ++i) {
    timer.expires_after(30ms);
    co_await timer.async_wait(asio::use_awaitable);
    std::cout << "[producer] set #" << (i + 1) << " (queued waiters: " << gate.waiter_count() << ")\n";
    gate.set();
  }
}

}  // namespace

int main() {
  core::set_log_level(core::LogLevel::debug);

  asio::io_context ioc;
  event::AutoResetEvent gate(ioc.get_executor());
  std::stop_source cancel_c;

  asio::co_spawn(ioc, worker(gate, "A", core::kInfinite, {}), asio::detached);
  asio::co_spawn(ioc, worker(gate, "B", 10ms, {}), asio::detached);  // 第一次 set 之前超时
  asio::co_spawn(ioc, worker(gate, "C", 1s, cancel_c.get_token()), asio::detached);
  asio::co_spawn(ioc, worker(gate, "D", 1s, {}), asio::detached);

  // C 在 15ms 时被取消
  asio::steady_timer canceller(ioc);
  canceller.expires_after(15ms);
  canceller.async_wait([&](const std::error_code&) { cancel_c.request_stop(); });

  // 两次 set：A 被放行；B、C 已放弃，它们收到的放行被转发，最终放行 D
  asio::co_spawn(ioc, producer(gate, 2), asio::detached);

  ioc.run();
  std::cout << "done, signaled=" << std::boolalpha << gate.is_set() << "\n";
  return 0;
}
