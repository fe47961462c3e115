//
// Logs every call with its final status and duration.
//

#ifndef CALLLOGGINGPLUGIN_HPP
#define CALLLOGGINGPLUGIN_HPP
#include "application/application.hpp"
#include "context/application_call.hpp"
#include "plugin/application_plugin.hpp"
#include <fmt/core.h>
#include <chrono>

class CallLoggingPlugin : public kpipeline::framework::ApplicationPlugin
{
public:
  static constexpr const char* Key = "CallLogging";

  CallLoggingPlugin() : ApplicationPlugin(Key)
  {
  }

  void setup(kpipeline::framework::PluginBuilder& builder) const override
  {
    using namespace kpipeline::framework;

    builder.intercept(InterceptionCategory::Call, ApplicationCallPhases::Monitoring, [](PipelineContext& context)
    {
      const auto started_at = std::chrono::steady_clock::now();
      context.call().set_attribute("CallStartedAt", started_at);
      context.proceed();
    });

    // Runs after every other plugin rendered the response.
    builder.on_call_respond_after_transform([](CallRespondAfterTransformContext&, ApplicationCall& call,
                                               const std::any& content)
    {
      const auto* outgoing = std::any_cast<OutgoingContent>(&content);
      const auto started_at = call.get_attribute_as<std::chrono::steady_clock::time_point>("CallStartedAt");
      const auto elapsed = started_at
                             ? std::chrono::duration_cast<std::chrono::microseconds>(
                               std::chrono::steady_clock::now() - *started_at).count()
                             : 0;
      const auto method = call.get_request().method_string();
      fmt::print("{} {} -> {} ({} us)\n", std::string(method.data(), method.size()), call.path(),
                 outgoing != nullptr && outgoing->status ? static_cast<unsigned>(*outgoing->status) : 200u, elapsed);
    });
  }
};

#endif //CALLLOGGINGPLUGIN_HPP
