#include "arev/core/deadline.hpp"
#include "arev/core/error.hpp"

#include "test_main.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <stdexcept>
#include <stop_token>

namespace {

using arev::core::errc;
using arev::core::Future;
using arev::core::kInfinite;
using arev::core::Promise;
using arev::core::wait_with_deadline;

using namespace std::chrono_literals;

using Clock = std::chrono::steady_clock;

void test_fast_paths() {
  asio::io_context ioc;
  auto ex = ioc.get_executor();

  Promise<bool> pending;
  auto op = pending.get_future();

  auto invalid = wait_with_deadline(ex, op, -5ms);
  TEST_EXPECT_ERR(invalid.error(), errc::invalid_argument);

  // 无限等待且 token 不可停止：原样返回 op。
  TEST_EXPECT(wait_with_deadline(ex, op, kInfinite) == op);

  // 超时为 0：共享的 false 常量。
  TEST_EXPECT(wait_with_deadline(ex, op, 0ms) == arev::core::ready_false());

  std::stop_source stopped;
  stopped.request_stop();
  auto cancelled = wait_with_deadline(ex, op, 50ms, stopped.get_token());
  TEST_EXPECT_ERR(cancelled.error(), errc::cancelled);

  // op 已完成：即使有超时也直接返回 op。
  auto done = arev::core::make_ready_future<bool>(true);
  TEST_EXPECT(wait_with_deadline(ex, done, 50ms) == done);

  // 快速路径不产生任何定时器。
  TEST_EXPECT_EQ(ioc.run(), std::size_t{0});
}

void test_timeout_wins() {
  asio::io_context ioc;
  Promise<bool> pending;

  auto result = wait_with_deadline(ioc.get_executor(), pending.get_future(), 10ms);
  TEST_EXPECT(!result.ready());

  ioc.run();
  TEST_EXPECT(result.ready());
  TEST_EXPECT_OK(result.error());
  TEST_EXPECT(!result.value());

  // 迟到的完成不会改写结果。
  pending.try_set_value(true);
  TEST_EXPECT(!result.value());
}

void test_operation_wins_and_cancels_timer() {
  asio::io_context ioc;
  Promise<bool> pending;

  auto result = wait_with_deadline(ioc.get_executor(), pending.get_future(), 5s);

  asio::steady_timer trigger(ioc);
  trigger.expires_after(10ms);
  trigger.async_wait([&](const std::error_code&) { pending.try_set_value(true); });

  const auto start = Clock::now();
  ioc.run();
  // 定时器被取消后 io_context 没有剩余工作，run() 立即返回。
  TEST_EXPECT(Clock::now() - start < 2s);
  TEST_EXPECT(result.ready());
  TEST_EXPECT(result.value());
}

void test_stop_wins_and_cancels_timer() {
  asio::io_context ioc;
  Promise<bool> pending;
  std::stop_source source;

  auto result = wait_with_deadline(ioc.get_executor(), pending.get_future(), 5s, source.get_token());

  asio::steady_timer trigger(ioc);
  trigger.expires_after(10ms);
  trigger.async_wait([&](const std::error_code&) { source.request_stop(); });

  const auto start = Clock::now();
  ioc.run();
  TEST_EXPECT(Clock::now() - start < 2s);
  TEST_EXPECT_ERR(result.error(), errc::cancelled);

  // 取消后到达的完成被忽略。
  pending.try_set_value(true);
  TEST_EXPECT_ERR(result.error(), errc::cancelled);
}

void test_stop_without_timeout() {
  asio::io_context ioc;
  Promise<bool> pending;
  std::stop_source source;

  auto result = wait_with_deadline(ioc.get_executor(), pending.get_future(), kInfinite, source.get_token());
  TEST_EXPECT(!result.ready());

  source.request_stop();
  TEST_EXPECT_ERR(result.error(), errc::cancelled);
}

void test_operation_failure_is_forwarded() {
  asio::io_context ioc;
  Promise<bool> pending;

  auto result = wait_with_deadline(ioc.get_executor(), pending.get_future(), 1s);
  pending.try_set_exception(std::make_exception_ptr(std::runtime_error("op failed")));

  TEST_EXPECT_ERR(result.error(), errc::callback_failure);
  TEST_EXPECT(result.exception() != nullptr);
  ioc.run();
}

void test_async_wait_signaled() {
  asio::io_context ioc;
  bool done = false;

  asio::co_spawn(
    ioc,
    [&]() -> asio::awaitable<void> {
      auto ok = co_await arev::core::async_wait_signaled(arev::core::ready_true());
      TEST_EXPECT_OK(ok);

      auto timed_out = co_await arev::core::async_wait_signaled(arev::core::ready_false());
      TEST_EXPECT_ERR(timed_out, errc::timeout);

      auto failed = co_await arev::core::async_wait_signaled(
        arev::core::make_error_future<bool>(arev::core::make_error_code(errc::cancelled)));
      TEST_EXPECT_ERR(failed, errc::cancelled);
      done = true;
    },
    asio::detached);

  ioc.run();
  TEST_EXPECT(done);
}

void test_losing_race_detaches_from_operation() {
  asio::io_context ioc;
  Promise<bool> never;
  auto op = never.get_future();

  auto timed_out = wait_with_deadline(ioc.get_executor(), op, 5ms);
  std::stop_source source;
  auto cancelled = wait_with_deadline(ioc.get_executor(), op, 5s, source.get_token());
  auto cancelled_untimed = wait_with_deadline(ioc.get_executor(), op, kInfinite, source.get_token());
  TEST_EXPECT_EQ(op.pending_continuations(), std::size_t{3});

  source.request_stop();
  // 取消同步完成，续体随之摘下。
  TEST_EXPECT_ERR(cancelled.error(), errc::cancelled);
  TEST_EXPECT_ERR(cancelled_untimed.error(), errc::cancelled);
  TEST_EXPECT_EQ(op.pending_continuations(), std::size_t{1});

  ioc.run();
  TEST_EXPECT(timed_out.ready());
  TEST_EXPECT(!timed_out.value());
  TEST_EXPECT_EQ(op.pending_continuations(), std::size_t{0});
}

}  // namespace

int main() {
  test_fast_paths();
  test_timeout_wins();
  test_operation_wins_and_cancels_timer();
  test_stop_wins_and_cancels_timer();
  test_stop_without_timeout();
  test_operation_failure_is_forwarded();
  test_async_wait_signaled();
  test_losing_race_detaches_from_operation();
  return ::arev::tests::run_and_report();
}
