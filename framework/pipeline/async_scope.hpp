#ifndef KPIPELINE_FRAMEWORK_PIPELINE_ASYNC_SCOPE_HPP_
#define KPIPELINE_FRAMEWORK_PIPELINE_ASYNC_SCOPE_HPP_

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/spawn.hpp>

namespace kpipeline::framework
{
  // Coroutine a call is running on. Lives on that coroutine's stack.
  struct AsyncScope
  {
    boost::asio::any_io_executor executor;
    boost::asio::yield_context* yield = nullptr;
  };
}

#endif // KPIPELINE_FRAMEWORK_PIPELINE_ASYNC_SCOPE_HPP_
