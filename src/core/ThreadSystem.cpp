/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/ThreadSystem.hpp"
#include "core/Logger.hpp"

#include <pthread.h>
#include <system_error>

namespace Lifeline {

// TaskQueue implementation
void TaskQueue::push(PrioritizedTask task) {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_queues[static_cast<size_t>(task.priority)].push_back(std::move(task));
  }
  m_condition.notify_one();
}

bool TaskQueue::pop(PrioritizedTask &task) {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_condition.wait(lock, [this]() {
    if (m_stopping.load(std::memory_order_acquire)) {
      return true;
    }
    for (const auto &queue : m_queues) {
      if (!queue.empty()) {
        return true;
      }
    }
    return false;
  });

  if (m_stopping.load(std::memory_order_acquire)) {
    return false;
  }

  for (auto &queue : m_queues) {
    if (!queue.empty()) {
      task = std::move(queue.front());
      queue.pop_front();
      return true;
    }
  }
  return false;
}

void TaskQueue::stop() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stopping.store(true, std::memory_order_release);
  }
  m_condition.notify_all();
}

size_t TaskQueue::size() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  size_t total = 0;
  for (const auto &queue : m_queues) {
    total += queue.size();
  }
  return total;
}

size_t TaskQueue::clear() {
  std::lock_guard<std::mutex> lock(m_mutex);
  size_t dropped = 0;
  for (auto &queue : m_queues) {
    dropped += queue.size();
    queue.clear();
  }
  return dropped;
}

// ThreadPool implementation
ThreadPool::ThreadPool(size_t numThreads) {
  m_workers.reserve(numThreads);
  for (size_t i = 0; i < numThreads; ++i) {
    m_workers.emplace_back(&ThreadPool::workerThread, this, i);
  }
}

ThreadPool::~ThreadPool() { shutdown(); }

void ThreadPool::enqueue(std::function<void()> task, TaskPriority priority,
                         const std::string &description) {
  // Counted as active from submission so waitForIdle cannot miss queued work
  m_activeTasks.fetch_add(1, std::memory_order_acq_rel);
  m_taskQueue.push(PrioritizedTask(std::move(task), priority, description));
}

size_t ThreadPool::shutdown() {
  size_t dropped = m_taskQueue.clear();
  if (dropped > 0) {
    m_activeTasks.fetch_sub(dropped, std::memory_order_acq_rel);
  }
  m_taskQueue.stop();

  for (auto &worker : m_workers) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  m_workers.clear();
  m_idleCondition.notify_all();
  return dropped;
}

bool ThreadPool::busy() const {
  return m_activeTasks.load(std::memory_order_acquire) > 0;
}

bool ThreadPool::waitForIdle(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(m_idleMutex);
  return m_idleCondition.wait_for(lock, timeout, [this]() {
    return m_activeTasks.load(std::memory_order_acquire) == 0;
  });
}

void ThreadPool::workerThread(size_t threadIndex) {
  std::string threadName = "lifeline-io-" + std::to_string(threadIndex);
  pthread_setname_np(pthread_self(), threadName.substr(0, 15).c_str());

  PrioritizedTask task;
  while (m_taskQueue.pop(task)) {
    auto taskStart = std::chrono::steady_clock::now();
    try {
      task.task();
    } catch (const std::exception &e) {
      THREADSYSTEM_ERROR("Worker " + std::to_string(threadIndex) +
                         " - task '" + task.description +
                         "' threw: " + e.what());
    }

    auto taskDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - taskStart)
                            .count();
    if (taskDuration > 100) {
      THREADSYSTEM_WARN("Worker " + std::to_string(threadIndex) +
                        " - Slow task '" + task.description +
                        "': " + std::to_string(taskDuration) + "ms");
    }

    task = PrioritizedTask();
    m_tasksProcessed.fetch_add(1, std::memory_order_relaxed);

    if (m_activeTasks.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      std::lock_guard<std::mutex> lock(m_idleMutex);
      m_idleCondition.notify_all();
    }
  }

  THREADSYSTEM_DEBUG("Worker " + std::to_string(threadIndex) + " exiting");
}

// ThreadSystem implementation
ThreadSystem::~ThreadSystem() {
  if (!m_isShutdown.load(std::memory_order_acquire)) {
    clean();
  }
}

bool ThreadSystem::init(unsigned int threadCount) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_isShutdown.load(std::memory_order_acquire)) {
    THREADSYSTEM_WARN("ThreadSystem already shut down, ignoring init request");
    return false;
  }
  if (m_threadPool) {
    THREADSYSTEM_WARN("ThreadSystem already initialized");
    return false;
  }

  m_numThreads = threadCount > 0 ? threadCount : DEFAULT_THREAD_COUNT;

  try {
    m_threadPool = std::make_unique<ThreadPool>(m_numThreads);
  } catch (const std::system_error &e) {
    THREADSYSTEM_ERROR(std::string("Failed to initialize ThreadSystem: ") +
                       e.what());
    return false;
  }

  THREADSYSTEM_INFO("ThreadSystem initialized with " +
                    std::to_string(m_numThreads) + " worker threads");
  return true;
}

void ThreadSystem::clean() {
  std::unique_ptr<ThreadPool> pool;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_isShutdown.store(true, std::memory_order_release);
    pool = std::move(m_threadPool);
  }

  if (!pool) {
    return;
  }

  size_t dropped = pool->shutdown();
  if (dropped > 0) {
    THREADSYSTEM_WARN("Dropped " + std::to_string(dropped) +
                      " pending tasks during shutdown");
  }
  THREADSYSTEM_INFO("Thread pool successfully shut down");
}

bool ThreadSystem::enqueueTask(std::function<void()> task,
                               TaskPriority priority,
                               const std::string &description) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_isShutdown.load(std::memory_order_acquire) || !m_threadPool) {
    THREADSYSTEM_DEBUG("Ignoring task after shutdown" +
                       (description.empty() ? "" : " (" + description + ")"));
    return false;
  }

  m_threadPool->enqueue(std::move(task), priority, description);
  return true;
}

bool ThreadSystem::isBusy() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_threadPool && m_threadPool->busy();
}

bool ThreadSystem::waitForIdle(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(m_mutex);
  if (!m_threadPool) {
    return true;
  }
  ThreadPool *pool = m_threadPool.get();
  lock.unlock();
  // The pool outlives this wait: clean() is only called by the owner
  return pool->waitForIdle(timeout);
}

bool ThreadSystem::isRunning() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_threadPool != nullptr;
}

size_t ThreadSystem::getQueueSize() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_threadPool ? m_threadPool->getQueueSize() : 0;
}

size_t ThreadSystem::getTotalTasksProcessed() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_threadPool ? m_threadPool->getTotalTasksProcessed() : 0;
}

} // namespace Lifeline
