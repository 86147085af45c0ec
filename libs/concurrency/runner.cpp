#include "runner.hpp"

#include <cstdlib>
#include <stdexcept>

namespace concurrency
{
  std::size_t getNCpus()
  {
    if (const char* env = std::getenv("ncpu"))
      {
	const int requested = std::atoi(env);
	if (requested > 0)
	  return static_cast<std::size_t>(requested);
      }

    const std::size_t hardware = std::thread::hardware_concurrency();
    return hardware ? hardware : 2;
  }

  runner*& runner::instance_ptr()
  {
    static runner* current = nullptr;
    return current;
  }

  boost::mutex& runner::instance_mutex()
  {
    static boost::mutex m;
    return m;
  }

  void runner::ensure_initialized(std::size_t num_threads)
  {
    boost::mutex::scoped_lock lock(instance_mutex());
    if (!instance_ptr())
      {
	// owned for the rest of the process
	static std::unique_ptr<runner> owned(new runner(num_threads));
      }
  }

  runner& runner::instance()
  {
    ensure_initialized(0);
    return *instance_ptr();
  }

  runner::runner(std::size_t nthreads)
    : ioc_(),
      guard_(new boost::asio::executor_work_guard<boost::asio::io_context::executor_type>(
	       boost::asio::make_work_guard(ioc_))),
      workers_(),
      nthreads_(nthreads == 0 ? getNCpus() : nthreads)
  {
    if (instance_ptr() != nullptr)
      throw std::logic_error("runner: only one instance may exist");

    spdlog::debug("Starting {} runner threads", nthreads_);
    for (std::size_t i = 0; i < nthreads_; ++i)
      workers_.create_thread([this]() { run(); });

    instance_ptr() = this;
  }

  runner::~runner()
  {
    try
      {
	stop();
	workers_.join_all();
      }
    catch (const std::exception& e)
      {
	spdlog::error("runner shutdown: {}", e.what());
      }
    instance_ptr() = nullptr;
  }

  void runner::stop()
  {
    guard_.reset();
  }

  void runner::run()
  {
    try
      {
	ioc_.run();
      }
    catch (const std::exception& e)
      {
	spdlog::error("runner worker: {}", e.what());
      }
  }
}
