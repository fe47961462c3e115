// framework/pipeline/pipeline_context.cpp
#include "pipeline_context.hpp"
#include "context/application_call.hpp"
#include "exception/pipeline_exceptions.hpp"
#include <boost/asio/error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/system_error.hpp>
#include <fmt/core.h>
#include <stdexcept>

namespace kpipeline::framework
{
  namespace
  {
    // Restores the running entry when a nested proceed() returns or unwinds.
    class CurrentEntryScope
    {
    public:
      CurrentEntryScope(const InterceptorEntry*& slot, const InterceptorEntry* entry)
        : slot_(slot), previous_(slot)
      {
        slot_ = entry;
      }

      ~CurrentEntryScope()
      {
        slot_ = previous_;
      }

    private:
      const InterceptorEntry*& slot_;
      const InterceptorEntry* previous_;
    };
  }

  const char* to_string(const ExecutionState state)
  {
    switch (state)
    {
    case ExecutionState::NotStarted: return "NotStarted";
    case ExecutionState::Running: return "Running";
    case ExecutionState::Finished: return "Finished";
    case ExecutionState::Failed: return "Failed";
    }
    return "Unknown";
  }

  PipelineContext::PipelineContext(ApplicationCall& call,
                                   std::any subject,
                                   std::shared_ptr<const InterceptorChain> chain,
                                   CancellationToken cancellation)
    : call_(call),
      subject_(std::move(subject)),
      chain_(std::move(chain)),
      cancellation_(std::move(cancellation))
  {
    if (!chain_)
    {
      throw std::invalid_argument("Interceptor chain cannot be null");
    }
  }

  std::any& PipelineContext::execute()
  {
    if (state_ != ExecutionState::NotStarted)
    {
      throw std::logic_error(fmt::format("Pipeline context cannot be executed in state {}", to_string(state_)));
    }

    state_ = ExecutionState::Running;
    try
    {
      proceed();
      // An interceptor that swallowed the cancellation does not turn it into success.
      cancellation_.throw_if_cancelled();
    }
    catch (...)
    {
      state_ = ExecutionState::Failed;
      finished_ = true;
      throw;
    }
    state_ = ExecutionState::Finished;
    finished_ = true;
    return subject_;
  }

  void PipelineContext::proceed()
  {
    switch (state_)
    {
    case ExecutionState::NotStarted:
      throw std::logic_error("proceed() called before the pipeline was executed");
    case ExecutionState::Finished:
      return;
    case ExecutionState::Failed:
      cancellation_.throw_if_cancelled();
      return;
    case ExecutionState::Running:
      break;
    }

    cancellation_.throw_if_cancelled();

    if (finished_ || index_ >= chain_->size())
    {
      finished_ = true;
      return;
    }

    const InterceptorEntryPtr entry = (*chain_)[index_++];
    const std::size_t next = index_;
    CurrentEntryScope scope(current_, entry.get());
    try
    {
      entry->handler(*this);
    }
    catch (...)
    {
      finished_ = true;
      throw;
    }

    // Returned without proceeding: nothing after it runs.
    if (index_ == next)
    {
      finished_ = true;
    }
  }

  void PipelineContext::proceed_with(std::any subject)
  {
    subject_ = std::move(subject);
    proceed();
  }

  void PipelineContext::finish()
  {
    finished_ = true;
  }

  PhasePtr PipelineContext::current_phase() const
  {
    return current_ != nullptr ? current_->phase : nullptr;
  }

  bool PipelineContext::is_async() const
  {
    const AsyncScope* scope = call_.async_scope();
    return scope != nullptr && scope->yield != nullptr;
  }

  const AsyncScope& PipelineContext::async_scope() const
  {
    const AsyncScope* scope = call_.async_scope();
    if (scope == nullptr || scope->yield == nullptr)
    {
      throw std::logic_error("Call is not running asynchronously; use ApplicationEngine::execute_async");
    }
    return *scope;
  }

  boost::asio::yield_context& PipelineContext::yield() const
  {
    return *async_scope().yield;
  }

  const boost::asio::any_io_executor& PipelineContext::executor() const
  {
    return async_scope().executor;
  }

  void PipelineContext::suspend_for(const std::chrono::steady_clock::duration duration)
  {
    cancellation_.throw_if_cancelled();

    boost::asio::steady_timer timer(executor(), duration);
    CancellationRegistration registration = cancellation_.on_cancel([&timer]()
    {
      timer.cancel();
    });

    boost::system::error_code ec;
    timer.async_wait(yield()[ec]);
    registration.reset();

    cancellation_.throw_if_cancelled();
    if (ec && ec != boost::asio::error::operation_aborted)
    {
      throw boost::system::system_error(ec);
    }
  }
}
