/* @file TaskWorker.cpp
 * @brief background FIFO worker
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>

// labcomm headers
#include "core/TaskWorker.hpp"

using namespace labcomm::core;

TaskWorker::TaskWorker(ErrorHandler onError) : onError_(std::move(onError)) {}

TaskWorker::~TaskWorker() { stop(); }

bool TaskWorker::post(Task task) {
  std::lock_guard lock(mtx_);
  if (stopping_)
    return false;

  if (!thread_.joinable())
    thread_ = std::thread([this] { workerLoop(); });

  queue_.push_back(std::move(task));
  cv_.notify_all();
  return true;
}

void TaskWorker::waitIdle() {
  std::unique_lock lock(mtx_);
  cv_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

void TaskWorker::stop() {
  {
    std::lock_guard lock(mtx_);
    stopping_ = true;
    queue_.clear();
    cv_.notify_all();
  }
  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
    thread_.join();
}

void TaskWorker::workerLoop() {
  std::unique_lock lock(mtx_);
  for (;;) {
    cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
    if (stopping_)
      break;

    Task task = std::move(queue_.front());
    queue_.pop_front();
    busy_ = true;
    lock.unlock();

    try {
      task();
    } catch (const std::exception& e) {
      if (onError_)
        onError_(e.what());
    }

    lock.lock();
    busy_ = false;
    cv_.notify_all();
  }

  busy_ = false;
  cv_.notify_all();
}
