// framework/application/application.cpp
#include "application.hpp"
#include "context/application_call.hpp"
#include "exception/pipeline_exceptions.hpp"
#include "plugin/application_plugin.hpp"
#include <fmt/core.h>

namespace kpipeline::framework
{
  Application::Application(std::string name)
    : name_(std::move(name)),
      call_pipeline_("ApplicationCallPipeline", ApplicationCallPhases::all()),
      receive_pipeline_("ApplicationReceivePipeline", ReceivePhases::all()),
      send_pipeline_("ApplicationSendPipeline", SendPhases::all())
  {
  }

  Application::~Application() = default;

  void Application::intercept(const PhasePtr& phase, Interceptor interceptor)
  {
    call_pipeline_.intercept(phase, std::move(interceptor));
  }

  std::shared_ptr<const PluginBuilder> Application::install(const ApplicationPlugin& plugin)
  {
    if (plugins_.count(plugin.key()) != 0)
    {
      throw DuplicatePluginError(plugin.key());
    }

    auto builder = std::make_shared<PluginBuilder>(*this, plugin.key());
    plugin.setup(*builder);

    // A plugin is wired in completely or not at all.
    Pipeline::Snapshot call_state = call_pipeline_.snapshot();
    Pipeline::Snapshot receive_state = receive_pipeline_.snapshot();
    Pipeline::Snapshot send_state = send_pipeline_.snapshot();
    try
    {
      builder->apply();
    }
    catch (...)
    {
      call_pipeline_.restore(std::move(call_state));
      receive_pipeline_.restore(std::move(receive_state));
      send_pipeline_.restore(std::move(send_state));
      throw;
    }

    plugins_.emplace(plugin.key(), builder);
    plugin_order_.push_back(plugin.key());
    fmt::print("[{}] Installed plugin '{}' ({} call, {} receive, {} respond interceptions)\n", name_, plugin.key(),
               builder->interceptions(InterceptionCategory::Call).size(),
               builder->interceptions(InterceptionCategory::Receive).size(),
               builder->interceptions(InterceptionCategory::Respond).size() +
               builder->interceptions(InterceptionCategory::AfterTransform).size());
    return builder;
  }

  std::shared_ptr<const PluginBuilder> Application::find_plugin(const std::string& key) const
  {
    if (const auto it = plugins_.find(key); it != plugins_.end())
    {
      return it->second;
    }
    return nullptr;
  }

  void Application::execute(ApplicationCall& call) const
  {
    call_pipeline_.execute(call, std::any{});
  }

  void Application::shutdown()
  {
    if (shut_down_)
    {
      return;
    }
    shut_down_ = true;
    for (auto it = plugin_order_.rbegin(); it != plugin_order_.rend(); ++it)
    {
      try
      {
        plugins_.at(*it)->run_shutdown_hooks();
      }
      catch (const std::exception& e)
      {
        fmt::print(stderr, "[{}] Shutdown hook of plugin '{}' failed: {}\n", name_, *it, e.what());
      }
    }
  }
}
