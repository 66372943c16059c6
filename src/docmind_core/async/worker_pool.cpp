#include "docmind_core/async/worker_pool.hpp"

#include <iostream>

namespace docmind_core::async {

WorkerPool::WorkerPool(size_t num_threads) {
  if (num_threads == 0) {
    throw std::invalid_argument("WorkerPool must have at least one thread.");
  }

  m_workers.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    m_workers.emplace_back(std::make_unique<Worker>(static_cast<int>(i), m_queue));
  }
  std::cout << "WorkerPool created with " << num_threads << " workers." << std::endl;
}

WorkerPool::~WorkerPool() {
  stop();
}

void WorkerPool::start() {
  if (m_is_running) {
    std::cerr << "Warning: WorkerPool is already running." << std::endl;
    return;
  }
  m_queue.reopen();
  for (const auto& worker : m_workers) {
    worker->start();
  }
  m_is_running = true;
}

void WorkerPool::stop() {
  if (!m_is_running) {
    return;
  }
  std::cout << "Stopping all workers in the pool..." << std::endl;
  m_is_running = false;
  m_queue.close();
  for (const auto& worker : m_workers) {
    worker->join();
  }
}

}  // namespace docmind_core::async
