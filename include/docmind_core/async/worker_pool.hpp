#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <vector>

#include "docmind_core/async/worker.hpp"

namespace docmind_core::async {

/**
 * @class WorkerPool
 * @brief A fixed set of Worker threads sharing one job queue.
 *
 * Used by ingestion to embed chunks concurrently. The pool is responsible for
 * the entire lifecycle of its threads and stops them on destruction.
 */
class WorkerPool {
 public:
  /**
   * @brief Constructs the pool and its workers. Workers do not run until start().
   * @param num_threads The number of worker threads. Must be at least one.
   */
  explicit WorkerPool(size_t num_threads);

  /**
   * @brief Destructor. Stops the pool and joins every worker thread.
   */
  ~WorkerPool();

  void start();

  /**
   * @brief Refuses new jobs, lets the workers drain the queue, and joins them.
   */
  void stop();

  bool is_running() const {
    return m_is_running;
  }

  size_t size() const {
    return m_workers.size();
  }

  /**
   * @brief Queues a callable and returns a future for its result.
   *
   * Exceptions thrown by the callable are rethrown from future::get().
   * Throws std::runtime_error if the pool is not running.
   */
  template <typename F>
  auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using Result = std::invoke_result_t<std::decay_t<F>>;
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
    std::future<Result> future = task->get_future();
    if (!m_is_running || !m_queue.push([task]() { (*task)(); })) {
      throw std::runtime_error("WorkerPool is not running.");
    }
    return future;
  }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

 private:
  JobQueue m_queue;
  std::vector<std::unique_ptr<Worker>> m_workers;
  std::atomic<bool> m_is_running{false};
};

}  // namespace docmind_core::async
