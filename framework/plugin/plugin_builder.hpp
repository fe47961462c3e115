// framework/plugin/plugin_builder.hpp
#ifndef KPIPELINE_FRAMEWORK_PLUGIN_PLUGIN_BUILDER_HPP_
#define KPIPELINE_FRAMEWORK_PLUGIN_PLUGIN_BUILDER_HPP_

#include "pipeline/pipeline.hpp"
#include "plugin/call_handling_context.hpp"
#include <any>
#include <array>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace kpipeline::framework
{
  class Application;
  class ApplicationCall;
  class BeforePluginsBuilder;
  class AfterPluginsBuilder;

  enum class InterceptionCategory
  {
    Call,
    Receive,
    Respond,
    AfterTransform
  };

  const char* to_string(InterceptionCategory category);

  // Phase a category registers into when no ordering is requested.
  const PhasePtr& default_phase(InterceptionCategory category);

  /**
   * @brief A pending registration of a plugin.
   * `phase` is known when the registration is declared; `action` wires it
   * into the target pipeline when the plugin is applied.
   */
  struct Interception
  {
    PhasePtr phase;
    std::function<void(Pipeline&)> action;
  };

  using CallHandler = std::function<void(CallContext&, ApplicationCall&)>;
  using ReceiveHandler = std::function<void(CallReceiveContext&, ApplicationCall&)>;
  using RespondHandler = std::function<void(CallRespondContext&, ApplicationCall&)>;
  using AfterTransformHandler =
  std::function<void(CallRespondAfterTransformContext&, ApplicationCall&, const std::any& content)>;

  /**
   * @brief Registration surface shared by the default and the relative builders.
   */
  class PluginBuilderBase
  {
  public:
    virtual ~PluginBuilderBase() = default;

    void on_call(CallHandler handler);
    void on_call_receive(ReceiveHandler handler);
    void on_call_respond(RespondHandler handler);
    void on_call_respond_after_transform(AfterTransformHandler handler);

  protected:
    virtual void register_interceptor(InterceptionCategory category, Interceptor interceptor) = 0;
  };

  /**
   * @brief Collects the interceptions of one plugin during its setup.
   */
  class PluginBuilder : public PluginBuilderBase
  {
  public:
    PluginBuilder(Application& application, std::string key);

    const std::string& key() const { return key_; }
    Application& application() const { return application_; }

    // Allocates a phase owned by this plugin.
    PhasePtr new_phase();

    /**
     * @brief Registers a raw interceptor on an existing phase.
     * The interceptor controls the chain itself: it must call proceed() for
     * later interceptors to run.
     */
    void intercept(InterceptionCategory category, const PhasePtr& phase, Interceptor interceptor);

    BeforePluginsBuilder before(std::vector<std::string> plugin_keys);
    AfterPluginsBuilder after(std::vector<std::string> plugin_keys);

    void on_application_shutdown(std::function<void()> hook);

    const std::vector<Interception>& interceptions(InterceptionCategory category) const;

    // Phases this plugin registered into for `category`, in registration order.
    std::vector<PhasePtr> phases(InterceptionCategory category) const;

    void add_interception(InterceptionCategory category, Interception interception);

    // Wires every collected interception into the application's pipelines.
    void apply();

    void run_shutdown_hooks() const;

  protected:
    void register_interceptor(InterceptionCategory category, Interceptor interceptor) override;

  private:
    Pipeline& pipeline_for(InterceptionCategory category) const;

    Application& application_;
    std::string key_;
    std::size_t phase_counter_ = 0;
    std::array<std::vector<Interception>, 4> interceptions_;
    std::vector<std::function<void()>> shutdown_hooks_;
  };
}

#endif // KPIPELINE_FRAMEWORK_PLUGIN_PLUGIN_BUILDER_HPP_
