// framework/pipeline/pipeline_context.hpp
#ifndef KPIPELINE_FRAMEWORK_PIPELINE_PIPELINE_CONTEXT_HPP_
#define KPIPELINE_FRAMEWORK_PIPELINE_PIPELINE_CONTEXT_HPP_

#include "pipeline/async_scope.hpp"
#include "pipeline/cancellation.hpp"
#include "pipeline/pipeline_phase.hpp"
#include <any>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace kpipeline::framework
{
  class ApplicationCall;
  class PipelineContext;

  using Interceptor = std::function<void(PipelineContext&)>;

  struct InterceptorEntry
  {
    PhasePtr phase;
    Interceptor handler;
  };

  using InterceptorEntryPtr = std::shared_ptr<const InterceptorEntry>;
  using InterceptorChain = std::vector<InterceptorEntryPtr>;

  enum class ExecutionState
  {
    NotStarted,
    Running,
    Finished,
    Failed
  };

  const char* to_string(ExecutionState state);

  /**
   * @brief State of a single pipeline run.
   *
   * Interceptors form one chain over the flattened phase list. Each
   * interceptor advances the chain by calling proceed(); returning without
   * proceeding ends the chain, and finish() ends it from anywhere. Exceptions
   * unwind through the enclosing proceed() calls and terminate the chain.
   */
  class PipelineContext
  {
  public:
    PipelineContext(ApplicationCall& call,
                    std::any subject,
                    std::shared_ptr<const InterceptorChain> chain,
                    CancellationToken cancellation);

    PipelineContext(const PipelineContext&) = delete;
    PipelineContext& operator=(const PipelineContext&) = delete;

    /**
     * @brief Runs the chain from its first interceptor.
     * @return The final subject.
     * @throws std::logic_error if the context was already executed.
     */
    std::any& execute();

    void proceed();
    void proceed_with(std::any subject);
    void finish();

    ApplicationCall& call() const { return call_; }

    std::any& subject() { return subject_; }
    const std::any& subject() const { return subject_; }
    void set_subject(std::any subject) { subject_ = std::move(subject); }

    template <typename T>
    T* subject_as()
    {
      return std::any_cast<T>(&subject_);
    }

    template <typename T>
    const T* subject_as() const
    {
      return std::any_cast<T>(&subject_);
    }

    ExecutionState state() const { return state_; }
    bool is_finished() const { return finished_; }

    // Phase of the interceptor currently running, null outside of one.
    PhasePtr current_phase() const;

    const CancellationToken& cancellation() const { return cancellation_; }

    bool is_async() const;

    // Only valid while the call runs as a coroutine.
    boost::asio::yield_context& yield() const;
    const boost::asio::any_io_executor& executor() const;

    /**
     * @brief Suspends the call for `duration` without blocking the thread.
     * Resumes early with CancellationError if the call is cancelled.
     * Cancellation must happen on the call's executor.
     */
    void suspend_for(std::chrono::steady_clock::duration duration);

  private:
    const AsyncScope& async_scope() const;

    ApplicationCall& call_;
    std::any subject_;
    std::shared_ptr<const InterceptorChain> chain_;
    CancellationToken cancellation_;
    std::size_t index_ = 0;
    const InterceptorEntry* current_ = nullptr;
    bool finished_ = false;
    ExecutionState state_ = ExecutionState::NotStarted;
  };
}

#endif // KPIPELINE_FRAMEWORK_PIPELINE_PIPELINE_CONTEXT_HPP_
