#ifndef RUNNER_HPP
#define RUNNER_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <thread>
#include <type_traits>
#include <utility>

#include <boost/asio.hpp>
#include <boost/thread.hpp>
#include <boost/thread/future.hpp>
#include <boost/thread/mutex.hpp>
#include <spdlog/spdlog.h>

namespace concurrency
{
  // Worker count: the "ncpu" environment variable when set to a positive
  // value, otherwise std::thread::hardware_concurrency() (2 if unknown).
  //   ncpu=6 ./alertbt_optimizer --config grid.json
  std::size_t getNCpus();

  ///////////////////////////////////////
  /// \brief Process-wide worker pool on a boost::asio::io_context.
  /// At most one instance exists at a time; obtain it through instance(),
  /// or size it up front with ensure_initialized().
  struct runner
  {
    // nthreads == 0 uses getNCpus()
    explicit runner(std::size_t nthreads);
    runner(const runner&) = delete;
    runner& operator=(const runner&) = delete;
    // lets queued jobs drain, then joins the workers
    ~runner();

    void stop();

    std::size_t threadCount() const { return nthreads_; }

    // queues f(args...); the returned future carries its exception, if any
    template<typename F, typename ...Args>
    boost::unique_future<void> post(F f, Args&&... args)
    {
      auto promise = std::make_shared<boost::promise<void>>();
      auto result = promise->get_future();
      auto job = std::bind(std::move(f), std::forward<Args>(args)...);

      boost::asio::post(ioc_, [promise, job = std::move(job)]() mutable {
	try
	  {
	    job();
	    promise->set_value();
	  }
	catch (const std::exception& e)
	  {
	    spdlog::error("runner job failed: {}", e.what());
	    promise->set_exception(std::current_exception());
	  }
      });

      return result;
    }

    static bool is_initialized() { return instance_ptr() != nullptr; }

    static void ensure_initialized(std::size_t num_threads = 0);

    static runner& instance();

  private:
    static runner*& instance_ptr();
    static boost::mutex& instance_mutex();

    void run();

    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> guard_;
    boost::thread_group workers_;
    std::size_t nthreads_;
  };
}

#endif // RUNNER_HPP
