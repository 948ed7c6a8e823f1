/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 *
 * Thread System: worker pool for persistence and other blocking I/O that
 * must never run on a world's tick thread
 */

#ifndef THREAD_SYSTEM_HPP
#define THREAD_SYSTEM_HPP

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace Lifeline {

// Task priority levels
enum class TaskPriority {
  High = 0,   // Shutdown and disconnect flushes
  Normal = 1, // Periodic flushes
  Low = 2     // Housekeeping (checkpoints, cleanup)
};

// Task wrapper with priority information
struct PrioritizedTask {
  std::function<void()> task;
  TaskPriority priority{TaskPriority::Normal};
  std::string description;

  PrioritizedTask() = default;
  PrioritizedTask(std::function<void()> t, TaskPriority p, std::string desc)
      : task(std::move(t)), priority(p), description(std::move(desc)) {}
};

/**
 * @brief Thread-safe task queue with one FIFO per priority level.
 *
 * Higher priority queues always drain first; within a level tasks run in
 * submission order.
 */
class TaskQueue {
public:
  static constexpr size_t PRIORITY_COUNT = 3;

  void push(PrioritizedTask task);

  /**
   * @brief Blocks until a task is available or the queue is stopped.
   * @return false once stopped and empty
   */
  bool pop(PrioritizedTask &task);

  void stop();
  bool isStopping() const { return m_stopping.load(std::memory_order_acquire); }
  size_t size() const;
  size_t clear();

private:
  mutable std::mutex m_mutex;
  std::condition_variable m_condition;
  std::array<std::deque<PrioritizedTask>, PRIORITY_COUNT> m_queues;
  std::atomic<bool> m_stopping{false};
};

class ThreadPool {
public:
  explicit ThreadPool(size_t numThreads);
  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  void enqueue(std::function<void()> task, TaskPriority priority,
               const std::string &description);

  /**
   * @brief Stops workers; queued tasks that have not started are dropped.
   * @return number of dropped tasks
   */
  size_t shutdown();

  bool busy() const;
  bool waitForIdle(std::chrono::milliseconds timeout) const;
  size_t getQueueSize() const { return m_taskQueue.size(); }
  size_t getTotalTasksProcessed() const {
    return m_tasksProcessed.load(std::memory_order_relaxed);
  }

private:
  void workerThread(size_t threadIndex);

  std::vector<std::thread> m_workers;
  TaskQueue m_taskQueue;
  std::atomic<size_t> m_activeTasks{0};
  std::atomic<size_t> m_tasksProcessed{0};
  mutable std::mutex m_idleMutex;
  mutable std::condition_variable m_idleCondition;
};

/**
 * @brief Owns the I/O worker pool for one application context.
 *
 * Unlike a process-wide singleton this is created by AppContext and handed
 * to whoever needs it, so tests can run several independent instances.
 */
class ThreadSystem {
public:
  static constexpr unsigned int DEFAULT_THREAD_COUNT = 2;

  ThreadSystem() = default;
  ~ThreadSystem();

  ThreadSystem(const ThreadSystem &) = delete;
  ThreadSystem &operator=(const ThreadSystem &) = delete;

  /**
   * @brief Starts the worker threads.
   * @param threadCount 0 selects DEFAULT_THREAD_COUNT
   * @return false if already initialized or shut down
   */
  bool init(unsigned int threadCount = 0);

  /**
   * @brief Stops the pool. Pending tasks that have not started are dropped
   * and logged; running tasks complete first.
   */
  void clean();

  /**
   * @brief Queues a fire-and-forget task.
   * @return false if the system is not running, the task is not queued
   */
  bool enqueueTask(std::function<void()> task,
                   TaskPriority priority = TaskPriority::Normal,
                   const std::string &description = "");

  /**
   * @brief Queues a task and returns a future for its result.
   *
   * After shutdown the future holds a std::runtime_error instead of a value,
   * so callers always learn the task did not run.
   */
  template <class F>
  auto enqueueTaskWithResult(F &&f, TaskPriority priority = TaskPriority::Normal,
                             const std::string &description = "")
      -> std::future<std::invoke_result_t<F>> {
    using ResultType = std::invoke_result_t<F>;
    auto task =
        std::make_shared<std::packaged_task<ResultType()>>(std::forward<F>(f));
    std::future<ResultType> result = task->get_future();

    if (!enqueueTask([task]() { (*task)(); }, priority, description)) {
      std::promise<ResultType> rejected;
      rejected.set_exception(std::make_exception_ptr(std::runtime_error(
          "ThreadSystem not running: task '" + description + "' rejected")));
      return rejected.get_future();
    }
    return result;
  }

  bool isBusy() const;
  bool waitForIdle(std::chrono::milliseconds timeout) const;
  bool isRunning() const;
  bool isShutdown() const {
    return m_isShutdown.load(std::memory_order_acquire);
  }
  unsigned int getThreadCount() const { return m_numThreads; }
  size_t getQueueSize() const;
  size_t getTotalTasksProcessed() const;

private:
  std::unique_ptr<ThreadPool> m_threadPool{nullptr};
  unsigned int m_numThreads{0};
  std::atomic<bool> m_isShutdown{false};
  mutable std::mutex m_mutex{};
};

} // namespace Lifeline

#endif // THREAD_SYSTEM_HPP
