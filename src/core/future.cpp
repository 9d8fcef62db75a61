#include "arev/core/future.hpp"

namespace arev::core {

// 函数内静态对象：首次使用时构造，线程安全；共享状态已完成，之后只读。
Future<bool> ready_true() {
  static const Future<bool> instance = make_ready_future<bool>(true);
  return instance;
}

Future<bool> ready_false() {
  static const Future<bool> instance = make_ready_future<bool>(false);
  return instance;
}

Future<void> completed_future() {
  static const Future<void> instance = make_ready_future<void>();
  return instance;
}

}  // 命名空间 arev::core
