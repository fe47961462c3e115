// framework/application/application.hpp
#ifndef KPIPELINE_FRAMEWORK_APPLICATION_APPLICATION_HPP_
#define KPIPELINE_FRAMEWORK_APPLICATION_APPLICATION_HPP_

#include "pipeline/pipeline.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace kpipeline::framework
{
  class ApplicationPlugin;
  class PluginBuilder;

  // Phases of the call pipeline. Their order is a fixed contract plugins rely on.
  struct ApplicationCallPhases
  {
    static inline const PhasePtr Setup = make_phase("Setup");
    static inline const PhasePtr Monitoring = make_phase("Monitoring");
    static inline const PhasePtr Plugins = make_phase("Plugins");
    static inline const PhasePtr Call = make_phase("Call");
    static inline const PhasePtr Fallback = make_phase("Fallback");

    static std::vector<PhasePtr> all() { return {Setup, Monitoring, Plugins, Call, Fallback}; }
  };

  struct ReceivePhases
  {
    static inline const PhasePtr Before = make_phase("Before");
    static inline const PhasePtr Transform = make_phase("Transform");
    static inline const PhasePtr After = make_phase("After");

    static std::vector<PhasePtr> all() { return {Before, Transform, After}; }
  };

  struct SendPhases
  {
    static inline const PhasePtr Before = make_phase("Before");
    static inline const PhasePtr Transform = make_phase("Transform");
    static inline const PhasePtr Render = make_phase("Render");
    static inline const PhasePtr ContentEncoding = make_phase("ContentEncoding");
    static inline const PhasePtr TransferEncoding = make_phase("TransferEncoding");
    static inline const PhasePtr After = make_phase("After");
    static inline const PhasePtr Engine = make_phase("Engine");

    static std::vector<PhasePtr> all()
    {
      return {Before, Transform, Render, ContentEncoding, TransferEncoding, After, Engine};
    }
  };

  /**
   * @brief Owns the call, receive and send pipelines and the installed plugins.
   *
   * Configured once at startup by installing plugins; afterwards the
   * pipelines are only read while calls execute.
   */
  class Application
  {
  public:
    explicit Application(std::string name = "Application");
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    const std::string& name() const { return name_; }

    Pipeline& call_pipeline() { return call_pipeline_; }
    const Pipeline& call_pipeline() const { return call_pipeline_; }
    Pipeline& receive_pipeline() { return receive_pipeline_; }
    const Pipeline& receive_pipeline() const { return receive_pipeline_; }
    Pipeline& send_pipeline() { return send_pipeline_; }
    const Pipeline& send_pipeline() const { return send_pipeline_; }

    // Registers `interceptor` on a phase of the call pipeline.
    void intercept(const PhasePtr& phase, Interceptor interceptor);

    /**
     * @brief Runs the plugin's setup and applies its interceptions.
     * If applying fails, the pipelines are left as they were and the plugin
     * is not recorded.
     * @throws DuplicatePluginError if a plugin with the same key is installed.
     */
    std::shared_ptr<const PluginBuilder> install(const ApplicationPlugin& plugin);

    std::shared_ptr<const PluginBuilder> find_plugin(const std::string& key) const;
    bool has_plugin(const std::string& key) const { return find_plugin(key) != nullptr; }
    std::vector<std::string> plugin_keys() const { return plugin_order_; }

    void execute(ApplicationCall& call) const;

    // Runs plugin shutdown hooks in reverse install order. Runs once.
    void shutdown();

  private:
    std::string name_;
    Pipeline call_pipeline_;
    Pipeline receive_pipeline_;
    Pipeline send_pipeline_;
    std::map<std::string, std::shared_ptr<const PluginBuilder>> plugins_;
    std::vector<std::string> plugin_order_;
    bool shut_down_ = false;
  };
}

#endif // KPIPELINE_FRAMEWORK_APPLICATION_APPLICATION_HPP_
