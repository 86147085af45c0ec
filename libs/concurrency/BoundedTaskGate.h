#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <stdexcept>

namespace concurrency
{
  /**
   * @brief Counting semaphore used to bound concurrent work.
   */
  class BoundedTaskGate {
  public:
    explicit BoundedTaskGate(std::size_t capacity)
      : capacity_(capacity),
	inUse_(0)
    {
      if (capacity_ == 0)
	throw std::invalid_argument("BoundedTaskGate: capacity must be > 0");
    }

    BoundedTaskGate(const BoundedTaskGate&) = delete;
    BoundedTaskGate& operator=(const BoundedTaskGate&) = delete;

    void acquire()
    {
      std::unique_lock<std::mutex> lock(mutex_);
      available_.wait(lock, [this] { return inUse_ < capacity_; });
      ++inUse_;
    }

    void release()
    {
      {
	std::lock_guard<std::mutex> lock(mutex_);
	if (inUse_ > 0)
	  --inUse_;
      }
      available_.notify_one();
    }

    std::size_t capacity() const
    {
      return capacity_;
    }

    std::size_t inUse() const
    {
      std::lock_guard<std::mutex> lock(mutex_);
      return inUse_;
    }

    // Releases one slot on scope exit
    class Releaser {
    public:
      explicit Releaser(BoundedTaskGate& gate) : gate_(gate) {}
      ~Releaser() { gate_.release(); }

      Releaser(const Releaser&) = delete;
      Releaser& operator=(const Releaser&) = delete;

    private:
      BoundedTaskGate& gate_;
    };

  private:
    const std::size_t capacity_;
    std::size_t inUse_;
    mutable std::mutex mutex_;
    std::condition_variable available_;
  };
}
