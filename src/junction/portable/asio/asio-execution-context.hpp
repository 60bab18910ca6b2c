#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <optional>
#include <thread>
#include <vector>

namespace junction::net {

/**
 * @brief Runs a boost::asio::io_context on a pool of threads, until `stop()` is called.
 *
 * A work guard keeps the threads alive while there is nothing to do.
 */
class AsioExecutionContext {
private:
  using WorkGuardType = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

  boost::asio::io_context& io_context_;
  std::size_t size_;
  std::optional<WorkGuardType> work_guard_;
  std::vector<std::thread> pool_;

public:
  AsioExecutionContext(boost::asio::io_context& io_context, std::size_t thread_pool_size = 0)
      : io_context_{io_context}, size_{thread_pool_size == 0 ? std::thread::hardware_concurrency()
                                                             : thread_pool_size} {
    pool_.reserve(size_);
  }
  AsioExecutionContext(const AsioExecutionContext&) = delete;
  AsioExecutionContext& operator=(const AsioExecutionContext&) = delete;

  ~AsioExecutionContext() { stop(); }

  /** @brief Run the pool; does nothing if already running */
  void run() {
    if (is_running())
      return;
    if (io_context_.stopped())
      io_context_.restart();
    work_guard_.emplace(io_context_.get_executor());
    for (std::size_t i = 0; i < size_; ++i)
      pool_.emplace_back([this]() { io_context_.run(); });
  }

  /**
   * @brief Stop the io_context, and join all threads. Pending handlers are abandoned.
   * @note Must not be called from within the pool.
   */
  void stop() {
    work_guard_.reset();
    io_context_.stop();
    for (auto& thread : pool_)
      if (thread.joinable())
        thread.join();
    pool_.clear();
  }

  /** @brief true iff the execution context is running */
  bool is_running() const noexcept { return pool_.size() > 0; }
};

} // namespace junction::net
