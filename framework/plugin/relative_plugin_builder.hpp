// framework/plugin/relative_plugin_builder.hpp
#ifndef KPIPELINE_FRAMEWORK_PLUGIN_RELATIVE_PLUGIN_BUILDER_HPP_
#define KPIPELINE_FRAMEWORK_PLUGIN_RELATIVE_PLUGIN_BUILDER_HPP_

#include "plugin/plugin_builder.hpp"
#include <string>
#include <vector>

namespace kpipeline::framework
{
  /**
   * @brief Registers handlers in new phases placed relative to other plugins.
   *
   * Each registration allocates a fresh phase of the current plugin. When the
   * plugin is applied, the phases the other plugins registered for the same
   * category are located in the target pipeline, and the new phase is placed
   * once, at the boundary that satisfies every dependency: before the
   * earliest of them, or after the latest.
   *
   * Every other plugin must be installed before the current one, otherwise
   * applying throws MissingDependencyError. Naming the current plugin throws
   * PhaseOrderConflictError.
   */
  class RelativePluginBuilder : public PluginBuilderBase
  {
  public:
    enum class Placement
    {
      Before,
      After
    };

    Placement placement() const { return placement_; }
    const std::vector<std::string>& other_plugins() const { return other_keys_; }

  protected:
    RelativePluginBuilder(PluginBuilder& current, std::vector<std::string> other_keys, Placement placement);

    void register_interceptor(InterceptionCategory category, Interceptor interceptor) override;

  private:
    PluginBuilder& current_;
    std::vector<std::string> other_keys_;
    Placement placement_;
  };

  class BeforePluginsBuilder : public RelativePluginBuilder
  {
  public:
    BeforePluginsBuilder(PluginBuilder& current, std::vector<std::string> other_keys)
      : RelativePluginBuilder(current, std::move(other_keys), Placement::Before)
    {
    }
  };

  class AfterPluginsBuilder : public RelativePluginBuilder
  {
  public:
    AfterPluginsBuilder(PluginBuilder& current, std::vector<std::string> other_keys)
      : RelativePluginBuilder(current, std::move(other_keys), Placement::After)
    {
    }
  };
}

#endif // KPIPELINE_FRAMEWORK_PLUGIN_RELATIVE_PLUGIN_BUILDER_HPP_
