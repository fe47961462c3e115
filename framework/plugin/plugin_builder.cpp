// framework/plugin/plugin_builder.cpp
#include "plugin_builder.hpp"
#include "application/application.hpp"
#include "context/application_call.hpp"
#include "plugin/relative_plugin_builder.hpp"
#include <fmt/core.h>
#include <stdexcept>

namespace kpipeline::framework
{
  namespace
  {
    std::size_t index_of(const InterceptionCategory category)
    {
      return static_cast<std::size_t>(category);
    }

    // Continues the chain for handlers that neither finished nor proceeded.
    void proceed_unless_finished(PipelineContext& context)
    {
      if (!context.is_finished())
      {
        context.proceed();
      }
    }
  }

  const char* to_string(const InterceptionCategory category)
  {
    switch (category)
    {
    case InterceptionCategory::Call: return "call";
    case InterceptionCategory::Receive: return "receive";
    case InterceptionCategory::Respond: return "respond";
    case InterceptionCategory::AfterTransform: return "after-transform";
    }
    return "unknown";
  }

  const PhasePtr& default_phase(const InterceptionCategory category)
  {
    switch (category)
    {
    case InterceptionCategory::Call: return ApplicationCallPhases::Plugins;
    case InterceptionCategory::Receive: return ReceivePhases::Transform;
    case InterceptionCategory::Respond: return SendPhases::Transform;
    case InterceptionCategory::AfterTransform: return SendPhases::After;
    }
    throw std::invalid_argument("Unknown interception category");
  }

  void PluginBuilderBase::on_call(CallHandler handler)
  {
    if (!handler)
    {
      throw std::invalid_argument("Call handler cannot be null");
    }
    register_interceptor(InterceptionCategory::Call, [handler = std::move(handler)](PipelineContext& context)
    {
      CallContext call_context(context);
      handler(call_context, context.call());
      proceed_unless_finished(context);
    });
  }

  void PluginBuilderBase::on_call_receive(ReceiveHandler handler)
  {
    if (!handler)
    {
      throw std::invalid_argument("Receive handler cannot be null");
    }
    register_interceptor(InterceptionCategory::Receive, [handler = std::move(handler)](PipelineContext& context)
    {
      CallReceiveContext receive_context(context);
      handler(receive_context, context.call());
      proceed_unless_finished(context);
    });
  }

  void PluginBuilderBase::on_call_respond(RespondHandler handler)
  {
    if (!handler)
    {
      throw std::invalid_argument("Respond handler cannot be null");
    }
    register_interceptor(InterceptionCategory::Respond, [handler = std::move(handler)](PipelineContext& context)
    {
      CallRespondContext respond_context(context);
      handler(respond_context, context.call());
      proceed_unless_finished(context);
    });
  }

  void PluginBuilderBase::on_call_respond_after_transform(AfterTransformHandler handler)
  {
    if (!handler)
    {
      throw std::invalid_argument("After-transform handler cannot be null");
    }
    register_interceptor(InterceptionCategory::AfterTransform,
                         [handler = std::move(handler)](PipelineContext& context)
                         {
                           CallRespondAfterTransformContext after_context(context);
                           handler(after_context, context.call(), context.subject());
                           proceed_unless_finished(context);
                         });
  }

  PluginBuilder::PluginBuilder(Application& application, std::string key)
    : application_(application), key_(std::move(key))
  {
    if (key_.empty())
    {
      throw std::invalid_argument("Plugin key cannot be empty");
    }
  }

  PhasePtr PluginBuilder::new_phase()
  {
    return make_phase(fmt::format("{}Phase{}", key_, phase_counter_++));
  }

  void PluginBuilder::intercept(const InterceptionCategory category, const PhasePtr& phase, Interceptor interceptor)
  {
    if (!phase)
    {
      throw std::invalid_argument("Phase cannot be null");
    }
    if (!interceptor)
    {
      throw std::invalid_argument("Interceptor cannot be null");
    }
    add_interception(category, Interception{
                       phase, [phase, interceptor = std::move(interceptor)](Pipeline& pipeline)
                       {
                         pipeline.intercept(phase, interceptor);
                       }
                     });
  }

  BeforePluginsBuilder PluginBuilder::before(std::vector<std::string> plugin_keys)
  {
    return BeforePluginsBuilder(*this, std::move(plugin_keys));
  }

  AfterPluginsBuilder PluginBuilder::after(std::vector<std::string> plugin_keys)
  {
    return AfterPluginsBuilder(*this, std::move(plugin_keys));
  }

  void PluginBuilder::on_application_shutdown(std::function<void()> hook)
  {
    if (!hook)
    {
      throw std::invalid_argument("Shutdown hook cannot be null");
    }
    shutdown_hooks_.push_back(std::move(hook));
  }

  const std::vector<Interception>& PluginBuilder::interceptions(const InterceptionCategory category) const
  {
    return interceptions_[index_of(category)];
  }

  std::vector<PhasePtr> PluginBuilder::phases(const InterceptionCategory category) const
  {
    std::vector<PhasePtr> result;
    for (const auto& interception : interceptions(category))
    {
      result.push_back(interception.phase);
    }
    return result;
  }

  void PluginBuilder::add_interception(const InterceptionCategory category, Interception interception)
  {
    interceptions_[index_of(category)].push_back(std::move(interception));
  }

  void PluginBuilder::register_interceptor(const InterceptionCategory category, Interceptor interceptor)
  {
    intercept(category, default_phase(category), std::move(interceptor));
  }

  void PluginBuilder::apply()
  {
    for (const auto category : {
           InterceptionCategory::Call, InterceptionCategory::Receive,
           InterceptionCategory::Respond, InterceptionCategory::AfterTransform
         })
    {
      Pipeline& pipeline = pipeline_for(category);
      for (const auto& interception : interceptions(category))
      {
        interception.action(pipeline);
      }
    }
  }

  void PluginBuilder::run_shutdown_hooks() const
  {
    for (const auto& hook : shutdown_hooks_)
    {
      hook();
    }
  }

  Pipeline& PluginBuilder::pipeline_for(const InterceptionCategory category) const
  {
    switch (category)
    {
    case InterceptionCategory::Call: return application_.call_pipeline();
    case InterceptionCategory::Receive: return application_.receive_pipeline();
    case InterceptionCategory::Respond:
    case InterceptionCategory::AfterTransform: return application_.send_pipeline();
    }
    throw std::invalid_argument("Unknown interception category");
  }
}
