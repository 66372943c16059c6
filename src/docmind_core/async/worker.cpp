#include "docmind_core/async/worker.hpp"

#include <iostream>
#include <stdexcept>

namespace docmind_core {
namespace async {

bool JobQueue::push(Job job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    jobs_.push_back(std::move(job));
  }
  cv_.notify_one();
  return true;
}

std::optional<Job> JobQueue::pop() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return closed_ || !jobs_.empty(); });
  if (jobs_.empty()) {
    return std::nullopt;
  }
  Job job = std::move(jobs_.front());
  jobs_.pop_front();
  return job;
}

void JobQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

void JobQueue::reopen() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = false;
}

size_t JobQueue::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.size();
}

Worker::Worker(int worker_id, JobQueue& queue) : worker_id_(worker_id), queue_(queue) {}

Worker::~Worker() {
  join();
}

void Worker::start() {
  if (thread_.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  thread_ = std::thread(&Worker::run_loop, this);
}

void Worker::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void Worker::run_loop() {
  while (std::optional<Job> job = queue_.pop()) {
    // Jobs submitted through WorkerPool carry their exceptions in the future;
    // anything else escaping a raw job is logged here.
    try {
      (*job)();
    } catch (const std::exception& e) {
      std::cerr << "Worker [" << worker_id_ << "] ERROR running job: " << e.what() << std::endl;
    }
  }
}

}  // namespace async
}  // namespace docmind_core
