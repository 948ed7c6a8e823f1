/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WRITE_BEHIND_QUEUE_HPP
#define WRITE_BEHIND_QUEUE_HPP

#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Lifeline {

/**
 * @brief Coalescing asynchronous writer keyed by Key.
 *
 * stage() records the newest value for a key; flush() hands staged values to
 * the ThreadSystem. At most one write per key is in flight, so writes for the
 * same key land in the order they were staged and a newer value simply
 * replaces an older one that has not been dispatched yet. A failed write puts
 * the value back unless a newer one was staged meanwhile.
 *
 * Tasks share the queue's internal state, so destroying the queue while
 * writes are still running is safe; those writes finish on their own.
 */
template <typename Key, typename Value>
class WriteBehindQueue {
public:
  using Writer = std::function<void(const Key &, const Value &)>;

  WriteBehindQueue(ThreadSystem &io, Writer writer, std::string name)
      : m_io(io), m_state(std::make_shared<State>()) {
    m_state->writer = std::move(writer);
    m_state->name = std::move(name);
  }

  WriteBehindQueue(const WriteBehindQueue &) = delete;
  WriteBehindQueue &operator=(const WriteBehindQueue &) = delete;

  void stage(const Key &key, Value value) {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    m_state->slots[key].staged = std::move(value);
  }

  // Dispatches every staged value
  void flush(TaskPriority priority = TaskPriority::Normal) {
    std::unique_lock<std::mutex> lock(m_state->mutex);
    // Dispatch briefly drops the lock, so walk a key snapshot
    std::vector<Key> keys;
    keys.reserve(m_state->slots.size());
    for (const auto &[key, slot] : m_state->slots) {
      if (slot.staged) {
        keys.push_back(key);
      }
    }
    for (const auto &key : keys) {
      auto it = m_state->slots.find(key);
      if (it != m_state->slots.end()) {
        requestDispatch(lock, it->first, it->second, priority);
      }
    }
  }

  // Dispatches the staged value of one key, if any
  void flush(const Key &key, TaskPriority priority) {
    std::unique_lock<std::mutex> lock(m_state->mutex);
    auto it = m_state->slots.find(key);
    if (it != m_state->slots.end()) {
      requestDispatch(lock, it->first, it->second, priority);
    }
  }

  /**
   * @brief Waits until nothing is in flight.
   * @return false on timeout
   */
  bool waitUntilIdle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_state->mutex);
    return m_state->idle.wait_for(lock, timeout,
                                  [this]() { return m_state->inFlight == 0; });
  }

  // True while a value for key is staged or being written
  bool isPending(const Key &key) const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->slots.find(key) != m_state->slots.end();
  }

  size_t pendingCount() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->slots.size();
  }

  size_t getWriteCount() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->writesCompleted;
  }

  size_t getFailureCount() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->writesFailed;
  }

private:
  struct Slot {
    std::optional<Value> staged;
    bool writing{false};
    bool redispatch{false};
    TaskPriority priority{TaskPriority::Normal};
  };

  struct State {
    std::mutex mutex;
    std::condition_variable idle;
    std::map<Key, Slot> slots;
    Writer writer;
    std::string name;
    size_t inFlight{0};
    size_t writesCompleted{0};
    size_t writesFailed{0};
  };

  void requestDispatch(std::unique_lock<std::mutex> &lock, const Key &key,
                       Slot &slot, TaskPriority priority) {
    if (!slot.staged) {
      return;
    }
    if (slot.writing) {
      slot.redispatch = true;
      slot.priority = std::min(slot.priority, priority);
      return;
    }
    startWrite(lock, m_io, m_state, key, slot, priority);
  }

  static void startWrite(std::unique_lock<std::mutex> &lock, ThreadSystem &io,
                         const std::shared_ptr<State> &state, const Key &key,
                         Slot &slot, TaskPriority priority) {
    Value value = std::move(*slot.staged);
    slot.staged.reset();
    slot.writing = true;
    slot.redispatch = false;
    slot.priority = TaskPriority::Normal;
    ++state->inFlight;

    auto task = [&io, state, key, value]() {
      runWrite(io, state, key, value);
    };
    lock.unlock();
    bool queued = io.enqueueTask(task, priority, state->name + " flush");
    if (!queued) {
      // No workers left (shutdown): write on the caller's thread
      task();
    }
    lock.lock();
  }

  static void runWrite(ThreadSystem &io, const std::shared_ptr<State> &state,
                       const Key &key, const Value &value) {
    bool written = false;
    try {
      state->writer(key, value);
      written = true;
    } catch (const std::exception &e) {
      LIFELINE_ERROR("WriteBehindQueue",
                     state->name + " write failed, keeping value for the next flush: " +
                         e.what());
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    auto it = state->slots.find(key);
    if (it != state->slots.end()) {
      Slot &slot = it->second;
      slot.writing = false;
      if (written) {
        ++state->writesCompleted;
      } else {
        ++state->writesFailed;
        if (!slot.staged) {
          slot.staged = value;
        }
      }

      if (slot.redispatch && slot.staged) {
        startWrite(lock, io, state, it->first, slot, slot.priority);
      } else if (!slot.staged && !slot.writing) {
        state->slots.erase(it);
      }
    }

    --state->inFlight;
    if (state->inFlight == 0) {
      state->idle.notify_all();
    }
  }

  ThreadSystem &m_io;
  std::shared_ptr<State> m_state;
};

} // namespace Lifeline

#endif // WRITE_BEHIND_QUEUE_HPP
