#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace docmind_core {
namespace async {

using Job = std::function<void()>;

/**
 * @class JobQueue
 * @brief FIFO of pending jobs shared by the workers of one pool.
 *
 * Once closed, push() is refused and pop() keeps handing out the remaining
 * jobs until the queue is empty.
 */
class JobQueue {
 public:
  /**
   * @brief Enqueues a job and wakes one waiting worker.
   * @return false if the queue is closed and the job was not accepted.
   */
  bool push(Job job);

  /**
   * @brief Blocks until a job is available or the queue is closed and drained.
   * @return The next job, or std::nullopt when the worker should exit.
   */
  std::optional<Job> pop();

  void close();
  void reopen();
  size_t pending() const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Job> jobs_;
  bool closed_ = false;
};

/**
 * @class Worker
 * @brief A single background thread that runs jobs from a shared JobQueue.
 *
 * This class is designed to be managed by a WorkerPool. It is non-copyable
 * and non-movable to ensure clear ownership of the underlying thread.
 */
class Worker {
 public:
  /**
   * @brief Constructs a Worker instance.
   * @param worker_id A unique identifier for this worker, used for logging.
   * @param queue The queue this worker pulls jobs from.
   */
  Worker(int worker_id, JobQueue& queue);

  /**
   * @brief Destructor. Joins the worker thread.
   *
   * The owning pool must close the queue first, otherwise this blocks until it does.
   */
  ~Worker();

  /**
   * @brief Starts the worker's processing loop in a new background thread.
   *
   * Throws std::runtime_error if the worker is already running.
   */
  void start();

  // Blocks until the run loop has exited
  void join();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(Worker&&) = delete;

 private:
  void run_loop();

  int worker_id_;
  JobQueue& queue_;
  std::thread thread_;
};

}  // namespace async
}  // namespace docmind_core
