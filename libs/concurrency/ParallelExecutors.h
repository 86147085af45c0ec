#pragma once

#include "IParallelExecutor.h"
#include <algorithm>
#include <queue>
#include <future>
#include <thread>
#include <vector>
#include <functional>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <exception>
#include "BoundedTaskGate.h"
#include "runner.hpp"  // for BoostRunnerExecutor

/**
 * @file ParallelExecutors.h
 * @brief Executor policies for the per-alert and per-grid-cell work.
 *
 *  - SingleThreadExecutor: runs tasks inline on the calling thread (deterministic, no concurrency).
 *  - ThreadPoolExecutor: a fixed pool sized at construction (0 = hardware concurrency).
 *  - BoostRunnerExecutor: delegates tasks to the Boost.Asio runner singleton.
 *  - BoundedExecutor: decorates another executor and caps the number of in-flight tasks.
 *
 * @section usage Guidance on choosing an executor policy
 * - SingleThreadExecutor: unit tests, debugging, or nested work inside a task
 *   that already runs on a pool (avoids waiting on the pool from inside it).
 * - ThreadPoolExecutor: the default for a grid run; amortizes thread creation.
 * - BoundedExecutor: wrap the pool when the work behind each task hits a shared
 *   collaborator (a candle store) that must not see unbounded concurrency.
 */
namespace concurrency
{
  /**
   * @brief Executes tasks synchronously on the calling thread.
   */
  class SingleThreadExecutor : public IParallelExecutor {
  public:
    std::future<void> submit(std::function<void()> task) override {
      std::promise<void> prom;
      auto fut = prom.get_future();
      try {
	task();
	prom.set_value();
      } catch (...) {
	prom.set_exception(std::current_exception());
      }
      return fut;
    }

    std::size_t concurrencyLevel() const override {
      return 1;
    }
  };

  /**
   * @brief Fixed-size thread pool executor.
   *
   * Tasks are queued and executed by a pool of worker threads. A requested size
   * of 0 picks std::thread::hardware_concurrency() (falling back to 2 when that
   * reports 0).
   */
  class ThreadPoolExecutor : public IParallelExecutor {
  public:
    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
    ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

    explicit ThreadPoolExecutor(std::size_t numThreads = 0) : stop_(false)
    {
      const std::size_t hw = std::thread::hardware_concurrency();
      const std::size_t threads = numThreads > 0 ? numThreads : (hw ? hw : 2);

      try {
	for (std::size_t i = 0; i < threads; ++i) {
	  workers_.emplace_back([this] { workerLoop(); });
	}
      }
      catch (...) {
	shutdown();
	throw;
      }
    }

    ~ThreadPoolExecutor()
    {
      shutdown();
    }

    std::future<void> submit(std::function<void()> task) override
    {
      auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
      auto fut = packaged->get_future();
      {
	std::unique_lock<std::mutex> lock(tasksMutex_);
	if (stop_)
	  throw std::runtime_error("enqueue on stopped ThreadPoolExecutor");
	tasks_.emplace([packaged]() { (*packaged)(); });
      }
      condition_.notify_one();
      return fut;
    }

    std::size_t concurrencyLevel() const override {
      return workers_.size();
    }

  private:
    void workerLoop()
    {
      for (;;) {
	std::function<void()> task;
	{
	  std::unique_lock<std::mutex> lock(tasksMutex_);
	  condition_.wait(lock, [this]{ return stop_ || !tasks_.empty(); });
	  if (stop_ && tasks_.empty()) return;
	  task = std::move(tasks_.front());
	  tasks_.pop();
	}
	task();
      }
    }

    void shutdown()
    {
      {
	std::unique_lock<std::mutex> lock(tasksMutex_);
	stop_ = true;
      }
      condition_.notify_all();
      for (auto &worker : workers_) {
	if (worker.joinable())
	  worker.join();
      }
    }

    std::vector<std::thread>          workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex                        tasksMutex_;
    std::condition_variable           condition_;
    bool                              stop_;
  };

  /**
   * @brief Submits tasks to the Boost.Asio runner singleton.
   * Wraps the runner's completion into a std::future<void>.
   */
  class BoostRunnerExecutor : public IParallelExecutor {
  public:
    explicit BoostRunnerExecutor(std::size_t numThreads = 0)
    {
      runner::ensure_initialized(numThreads);
    }

    std::future<void> submit(std::function<void()> task) override
    {
      auto prom = std::make_shared<std::promise<void>>();
      auto fut  = prom->get_future();

      runner::instance().post([task = std::move(task), prom]() {
	try {
	  task();
	  prom->set_value();
	}
	catch (...) {
	  prom->set_exception(std::current_exception());
	}
      });

      return fut;
    }

    std::size_t concurrencyLevel() const override {
      return runner::instance().threadCount();
    }
  };

  /**
   * @brief Caps the number of tasks in flight on a wrapped executor.
   *
   * submit() blocks the caller while @p maxInFlight tasks are queued or
   * running; a slot is released when a task finishes, whether it returned or
   * threw. The wrapped executor must outlive this object.
   */
  class BoundedExecutor : public IParallelExecutor {
  public:
    BoundedExecutor(IParallelExecutor& inner, std::size_t maxInFlight)
      : inner_(inner),
	gate_(std::make_shared<BoundedTaskGate>(maxInFlight > 0 ? maxInFlight : inner.concurrencyLevel()))
    {}

    std::future<void> submit(std::function<void()> task) override
    {
      gate_->acquire();
      auto gate = gate_;
      try {
	return inner_.submit([task = std::move(task), gate]() {
	  BoundedTaskGate::Releaser release(*gate);
	  task();
	});
      }
      catch (...) {
	gate_->release();
	throw;
      }
    }

    std::size_t concurrencyLevel() const override {
      return std::min(gate_->capacity(), inner_.concurrencyLevel());
    }

    std::size_t inFlight() const {
      return gate_->inUse();
    }

  private:
    IParallelExecutor& inner_;
    std::shared_ptr<BoundedTaskGate> gate_;
  };
} // namespace concurrency
