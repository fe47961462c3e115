// framework/plugin/call_handling_context.hpp
#ifndef KPIPELINE_FRAMEWORK_PLUGIN_CALL_HANDLING_CONTEXT_HPP_
#define KPIPELINE_FRAMEWORK_PLUGIN_CALL_HANDLING_CONTEXT_HPP_

#include "context/outgoing_content.hpp"
#include "pipeline/pipeline_context.hpp"
#include <any>
#include <functional>
#include <stdexcept>
#include <typeindex>

namespace kpipeline::framework
{
  using BodyTransform = std::function<std::any(std::any)>;

  /**
   * @brief What a plugin handler sees of the running pipeline.
   * The handler does not proceed itself: the chain continues after it
   * returns unless it called finish().
   */
  class CallHandlingContext
  {
  public:
    explicit CallHandlingContext(PipelineContext& context) : context_(context)
    {
    }

    virtual ~CallHandlingContext() = default;

    PipelineContext& pipeline() const { return context_; }

    void finish() const { context_.finish(); }

    const CancellationToken& cancellation() const { return context_.cancellation(); }

  protected:
    PipelineContext& context_;
  };

  class CallContext : public CallHandlingContext
  {
  public:
    using CallHandlingContext::CallHandlingContext;
  };

  class CallReceiveContext : public CallHandlingContext
  {
  public:
    using CallHandlingContext::CallHandlingContext;

    std::type_index requested_type() const { return request().type; }

    const std::any& body() const { return request().value; }

    void transform_body(const BodyTransform& transform)
    {
      ReceiveRequest& current = request();
      current.value = transform(std::move(current.value));
    }

  private:
    ReceiveRequest& request() const
    {
      auto* request = context_.subject_as<ReceiveRequest>();
      if (request == nullptr)
      {
        throw std::logic_error("Receive pipeline subject is not a ReceiveRequest");
      }
      return *request;
    }
  };

  class CallRespondContext : public CallHandlingContext
  {
  public:
    using CallHandlingContext::CallHandlingContext;

    void transform_body(const BodyTransform& transform)
    {
      context_.set_subject(transform(std::move(context_.subject())));
    }
  };

  // Runs once the response value was turned into its final content.
  class CallRespondAfterTransformContext : public CallHandlingContext
  {
  public:
    using CallHandlingContext::CallHandlingContext;

    void transform_body(const BodyTransform& transform)
    {
      context_.set_subject(transform(std::move(context_.subject())));
    }
  };
}

#endif // KPIPELINE_FRAMEWORK_PLUGIN_CALL_HANDLING_CONTEXT_HPP_
