#ifndef TRK_DETAIL_THREAD_JOIN_H
#define TRK_DETAIL_THREAD_JOIN_H

#include <cstddef>
#include <thread>
#include <utility>
#include <vector>

namespace trk {
namespace detail {

/// RAII owner of worker threads. Joins every joinable thread on join() or destruction.
class ThreadJoiner {
public:
  ThreadJoiner() = default;
  explicit ThreadJoiner(std::size_t capacity) { threads_.reserve(capacity); }

  ~ThreadJoiner() { join(); }

  ThreadJoiner(const ThreadJoiner &) = delete;
  ThreadJoiner &operator=(const ThreadJoiner &) = delete;

  template <typename Fn> void spawn(Fn &&fn) { threads_.emplace_back(std::forward<Fn>(fn)); }

  void join() {
    for (auto &t : threads_) {
      if (t.joinable()) {
        t.join();
      }
    }
  }

  std::size_t size() const { return threads_.size(); }

private:
  std::vector<std::thread> threads_;
};

} // namespace detail
} // namespace trk

#endif // TRK_DETAIL_THREAD_JOIN_H
