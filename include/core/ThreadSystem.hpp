/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 *
 * Thread System: fixed-size worker pool for read-only fan-out work
 */

#ifndef THREAD_SYSTEM_HPP
#define THREAD_SYSTEM_HPP

#include "Logger.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <format>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <type_traits>
#include <vector>

// Platform-specific includes for thread naming
#if defined(__linux__) || defined(__APPLE__) || defined(_GNU_SOURCE)
#include <pthread.h>
#endif

namespace PolyForge {

/**
 * @brief FIFO task queue shared by all workers
 */
class TaskQueue {
public:
  void push(std::function<void()> task) {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_tasks.push_back(std::move(task));
    }
    m_condition.notify_one();
  }

  // Blocks until a task is available or the queue is stopped
  bool pop(std::function<void()> &task) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_condition.wait(lock, [this] { return m_stopping || !m_tasks.empty(); });

    if (m_tasks.empty()) {
      return false; // stopping and drained
    }

    task = std::move(m_tasks.front());
    m_tasks.pop_front();
    return true;
  }

  void stop() {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_stopping = true;
    }
    m_condition.notify_all();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
  }

private:
  std::deque<std::function<void()>> m_tasks;
  mutable std::mutex m_mutex;
  std::condition_variable m_condition;
  bool m_stopping{false};
};

class ThreadSystem {
public:
  ThreadSystem() = default;

  ~ThreadSystem() {
    if (!m_isShutdown.load(std::memory_order_acquire)) {
      clean();
    }
  }

  /**
   * @brief Start the worker threads.
   *
   * @param customThreadCount Exact worker count, or 0 to use
   *        (hardware_concurrency - 1) with a minimum of one worker so the
   *        calling thread keeps a core for the frame loop.
   * @return true if the workers were started, false if already running or
   *         shut down
   */
  bool init(unsigned int customThreadCount = 0) {
    if (m_isShutdown.load(std::memory_order_acquire)) {
      THREADSYSTEM_WARN("ThreadSystem already shut down, ignoring init request");
      return false;
    }
    if (!m_workers.empty()) {
      THREADSYSTEM_WARN("ThreadSystem already initialized");
      return false;
    }

    if (customThreadCount > 0) {
      m_numThreads = customThreadCount;
    } else {
      unsigned int hardwareThreads = std::thread::hardware_concurrency();
      m_numThreads = (hardwareThreads > 1) ? (hardwareThreads - 1) : 1;
    }

    try {
      m_workers.reserve(m_numThreads);
      for (unsigned int i = 0; i < m_numThreads; ++i) {
        m_workers.emplace_back([this, i]() {
#if defined(__linux__) || defined(_GNU_SOURCE)
          std::string threadName = std::format("Worker-{}", i);
          pthread_setname_np(pthread_self(), threadName.c_str());
#elif defined(__APPLE__)
          std::string threadName = std::format("Worker-{}", i);
          pthread_setname_np(threadName.c_str());
#endif
          workerThread();
        });
      }
    } catch (const std::system_error &e) {
      THREADSYSTEM_ERROR(std::format("Failed to start worker threads: {}", e.what()));
      clean();
      return false;
    }

    THREADSYSTEM_INFO(std::format("ThreadSystem initialized with {} worker threads",
                                  m_numThreads));
    return true;
  }

  /**
   * @brief Stop accepting work, let queued tasks finish, join the workers.
   */
  void clean() {
    m_isShutdown.store(true, std::memory_order_release);
    m_taskQueue.stop();

    for (auto &worker : m_workers) {
      if (worker.joinable()) {
        worker.join();
      }
    }
    m_workers.clear();
    THREADSYSTEM_INFO("ThreadSystem resources cleaned!");
  }

  /**
   * @brief Queue a fire-and-forget task.
   * @throws std::runtime_error if the ThreadSystem is shut down
   */
  void enqueueTask(std::function<void()> task, const std::string &description = "") {
    if (m_isShutdown.load(std::memory_order_acquire)) {
      throw std::runtime_error("ThreadSystem is shut down, rejected task " + description);
    }
    m_totalTasksEnqueued.fetch_add(1, std::memory_order_relaxed);
    m_taskQueue.push(std::move(task));
  }

  /**
   * @brief Queue a task and receive its result through a future.
   *
   * After shutdown, or before init(), the returned future is already
   * satisfied with a default-constructed result.
   */
  template <class F, class... Args>
  auto enqueueTaskWithResult(F &&f, const std::string &description = "",
                             Args &&...args)
      -> std::future<typename std::invoke_result<F, Args...>::type> {
    using ResultType = typename std::invoke_result<F, Args...>::type;

    if (m_isShutdown.load(std::memory_order_acquire) || m_workers.empty()) {
      THREADSYSTEM_DEBUG("Returning default value for task" +
                         (description.empty() ? "" : " (" + description + ")"));
      std::promise<ResultType> promise;
      if constexpr (std::is_void_v<ResultType>) {
        promise.set_value();
      } else {
        static_assert(std::is_default_constructible_v<ResultType>,
                      "Task results must be default constructible");
        promise.set_value(ResultType{});
      }
      return promise.get_future();
    }

    auto task = std::make_shared<std::packaged_task<ResultType()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));

    std::future<ResultType> result = task->get_future();
    enqueueTask([task]() { (*task)(); }, description);
    return result;
  }

  unsigned int getThreadCount() const { return m_numThreads; }

  bool isShutdown() const {
    return m_isShutdown.load(std::memory_order_acquire);
  }

  size_t getQueueSize() const { return m_taskQueue.size(); }

  size_t getTotalTasksEnqueued() const {
    return m_totalTasksEnqueued.load(std::memory_order_relaxed);
  }

  size_t getTotalTasksProcessed() const {
    return m_totalTasksProcessed.load(std::memory_order_relaxed);
  }

private:
  void workerThread() {
    std::function<void()> task;
    while (m_taskQueue.pop(task)) {
      try {
        task();
      } catch (const std::exception &e) {
        THREADSYSTEM_ERROR(std::format("Exception in worker thread: {}", e.what()));
      }
      m_totalTasksProcessed.fetch_add(1, std::memory_order_relaxed);
    }
  }

  std::vector<std::thread> m_workers;
  TaskQueue m_taskQueue;
  unsigned int m_numThreads{0};
  std::atomic<bool> m_isShutdown{false};
  std::atomic<size_t> m_totalTasksEnqueued{0};
  std::atomic<size_t> m_totalTasksProcessed{0};

  // Prevent copying and assignment
  ThreadSystem(const ThreadSystem &) = delete;
  ThreadSystem &operator=(const ThreadSystem &) = delete;
};

} // namespace PolyForge

#endif // THREAD_SYSTEM_HPP
