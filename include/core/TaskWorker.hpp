#pragma once
/** @file  TaskWorker.hpp
 *  @brief Single background thread draining a FIFO of tasks.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace labcomm::core {

  /**
 * @class TaskWorker
 * @brief Lets a timer callback hand blocking I/O off and return at once.
 *
 *  * Thread starts lazily on the first `post()`.
 *  * `stop()` lets the running task finish, drops queued ones, then joins.
 *    Must not be called from inside a task.
 *  * A task that throws std::exception is reported through the error handler;
 *    the worker keeps going.
 */
  class TaskWorker {
  public:
    using Task = std::function<void()>;
    using ErrorHandler = std::function<void(const std::string&)>;

    explicit TaskWorker(ErrorHandler onError);
    ~TaskWorker(); ///< stop() + join

    /// Returns false once the worker has been stopped.
    bool post(Task task);

    /// Block until the queue is empty and no task is running.
    void waitIdle();

    void stop();

    TaskWorker(const TaskWorker&) = delete;
    TaskWorker& operator=(const TaskWorker&) = delete;

  private:
    void workerLoop();

    ErrorHandler onError_;
    std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<Task> queue_;
    bool busy_{ false };
    bool stopping_{ false };
    std::thread thread_;
  };

} // namespace labcomm::core
