/**
 * @file delegate_pump_example.cpp
 * @brief 演示 DelegatePump / MessagePump 串行处理并发提交的工作
 *
 * 本示例展示如何：
 * 1. 多个线程并发 send，执行顺序严格等于提交顺序
 * 2. 带超时的 send 在排队期间过期，action 不会运行
 * 3. 通过 PumpOptions::on_error 接收 post 的失败
 * 4. MessagePump 把发布者的 core::Context 交给回调
 */

#include "arev/core/context.hpp"
#include "arev/core/error.hpp"
#include "arev/pump/delegate_pump.hpp"
#include "arev/pump/message_pump.hpp"

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace arev;
using namespace std::chrono_literals;

namespace {

asio::awaitable<void> sleep_for(std::chrono::milliseconds d) {
  asio::steady_timer t(co_await asio::this_coro::executor);
  t.expires_after(d);
  co_await t.async_wait(asio::use_awaitable);
}

void run_delegate_pump() {
  asio::io_context ioc;

  pump::PumpOptions options;
  options.on_error = [](std::exception_ptr ex) -> asio::awaitable<void> {
    std::cout << "[on_error] " << core::describe_exception(ex) << "\n";
    co_return;
  };
  pump::DelegatePump delegates(ioc.get_executor(), options);

  // 慢任务在前、快任务在后：快任务的效果一定在慢任务之后
  auto slow = delegates.send([]() -> asio::awaitable<std::string> {
    co_await sleep_for(100ms);
    std::cout << "[slow] finished\n";
    co_return std::string{"slow result"};
  });
  auto fast = delegates.send([]() -> asio::awaitable<int> {
    co_await sleep_for(10ms);
    std::cout << "[fast] finished\n";
    co_return 42;
  });

  // 排在慢任务之后，20ms 内轮不到 -> errc::timeout
  auto expired = delegates.send(
    []() -> asio::awaitable<void> {
      std::cout << "[expired] must not run\n";
      co_return;
    },
    20ms);

  delegates.post([]() -> asio::awaitable<void> {
    throw std::runtime_error("posted work failed");
    co_return;
  });

  // 其他线程并发提交
  std::vector<std::thread> submitters;
  for (int t = 0; t < 3; ++t) {
    submitters.emplace_back([&delegates, t] {
      (void)delegates.send([t]() -> asio::awaitable<void> {
        std::cout << "[thread " << t << "] ran on pump\n";
        co_return;
      });
    });
  }
  for (auto& th : submitters) {
    th.join();
  }

  ioc.run();

  std::cout << "slow  -> " << slow.value() << "\n";
  std::cout << "fast  -> " << fast.value() << "\n";
  std::cout << "expired -> " << expired.error().message() << "\n";
}

void run_message_pump() {
  asio::io_context ioc;

  pump::MessagePump<std::string> messages(ioc.get_executor(), [](std::string text, core::Context ctx) {
    std::cout << "[message] " << text << " (request=" << ctx.get("request").value_or("-") << ")\n";
  });

  {
    core::Context::Scope scope(core::Context{}.with("request", "r-100"));
    messages.post(std::string{"hello"});
  }
  messages.post(std::string{"world"});

  auto drained = messages.drain();
  ioc.run();
  std::cout << "drained=" << std::boolalpha << drained.ready() << "\n";
}

}  // namespace

int main() {
  run_delegate_pump();
  run_message_pump();
  return 0;
}
