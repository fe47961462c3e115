#ifndef KPIPELINE_FRAMEWORK_ENGINE_IO_CONTEXT_POOL_HPP_
#define KPIPELINE_FRAMEWORK_ENGINE_IO_CONTEXT_POOL_HPP_

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace kpipeline::framework
{
  // Worker threads sharing one io_context. Owned by the engine that runs calls on it.
  class IoContextPool
  {
  public:
    explicit IoContextPool(unsigned int count = std::thread::hardware_concurrency())
      : work_guard_(boost::asio::make_work_guard(ioc_))
    {
      // hardware_concurrency() 可能返回 0，保底使用 1 个线程
      if (count == 0) count = 1;

      threads_.reserve(count);
      for (unsigned int i = 0; i < count; ++i)
      {
        threads_.emplace_back([this]()
        {
          ioc_.run();
        });
      }
    }

    IoContextPool(const IoContextPool&) = delete;
    IoContextPool& operator=(const IoContextPool&) = delete;

    ~IoContextPool()
    {
      stop();
    }

    boost::asio::io_context& get_io_context()
    {
      return ioc_;
    }

    bool running_in_this_thread()
    {
      return ioc_.get_executor().running_in_this_thread();
    }

    // Lets queued work drain, then joins the workers. Runs once.
    void stop()
    {
      if (running_in_this_thread())
      {
        throw std::logic_error("IoContextPool cannot be stopped from one of its own threads");
      }
      std::call_once(stop_flag_, [this]()
      {
        work_guard_.reset();

        for (auto& t : threads_)
        {
          if (t.joinable())
          {
            t.join();
          }
        }
        threads_.clear();
        ioc_.stop();
      });
    }

  private:
    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    std::vector<std::thread> threads_;
    std::once_flag stop_flag_;
  };
}

#endif // KPIPELINE_FRAMEWORK_ENGINE_IO_CONTEXT_POOL_HPP_
