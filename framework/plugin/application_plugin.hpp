// framework/plugin/application_plugin.hpp
#ifndef KPIPELINE_FRAMEWORK_PLUGIN_APPLICATION_PLUGIN_HPP_
#define KPIPELINE_FRAMEWORK_PLUGIN_APPLICATION_PLUGIN_HPP_

#include "plugin/plugin_builder.hpp"
#include "plugin/relative_plugin_builder.hpp"
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace kpipeline::framework
{
  /**
   * @brief An installable unit of behavior, identified by its key.
   * setup() declares the plugin's handlers on the builder it is given.
   */
  class ApplicationPlugin
  {
  public:
    explicit ApplicationPlugin(std::string key) : key_(std::move(key))
    {
      if (key_.empty())
      {
        throw std::invalid_argument("Plugin key cannot be empty");
      }
    }

    virtual ~ApplicationPlugin() = default;

    const std::string& key() const { return key_; }

    virtual void setup(PluginBuilder& builder) const = 0;

  private:
    std::string key_;
  };

  class LambdaApplicationPlugin : public ApplicationPlugin
  {
  public:
    using Body = std::function<void(PluginBuilder&)>;

    LambdaApplicationPlugin(std::string key, Body body)
      : ApplicationPlugin(std::move(key)), body_(std::move(body))
    {
      if (!body_)
      {
        throw std::invalid_argument("Plugin body cannot be null");
      }
    }

    void setup(PluginBuilder& builder) const override
    {
      body_(builder);
    }

  private:
    Body body_;
  };

  inline std::shared_ptr<ApplicationPlugin> create_application_plugin(std::string key,
                                                                      LambdaApplicationPlugin::Body body)
  {
    return std::make_shared<LambdaApplicationPlugin>(std::move(key), std::move(body));
  }
}

#endif // KPIPELINE_FRAMEWORK_PLUGIN_APPLICATION_PLUGIN_HPP_
