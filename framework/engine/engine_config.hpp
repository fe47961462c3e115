// framework/engine/engine_config.hpp
#ifndef KPIPELINE_FRAMEWORK_ENGINE_ENGINE_CONFIG_HPP_
#define KPIPELINE_FRAMEWORK_ENGINE_ENGINE_CONFIG_HPP_

#include "context/outgoing_content.hpp"
#include <any>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace kpipeline::framework
{
  class Application;
  class ApplicationCall;

  // Writes the final content of a call into the transport response.
  using ResponseWriter = std::function<void(ApplicationCall&, const OutgoingContent&)>;

  // Produces the raw request body the receive pipeline starts from.
  using ReceiveSource = std::function<std::any(ApplicationCall&)>;

  // Installs plugins and interceptors into a freshly loaded application.
  using ApplicationModule = std::function<void(Application&)>;

  struct EngineConfig
  {
    std::string application_name = "Application";

    // Worker threads running asynchronous calls.
    unsigned int threads = 1;

    // Zero disables the timeout.
    std::chrono::milliseconds call_timeout{0};

    // Error responses carry the error message in development mode.
    bool development = false;

    std::vector<ApplicationModule> modules;

    // Null collaborators fall back to the Beast message based defaults.
    ResponseWriter response_writer;
    ReceiveSource receive_source;
  };
}

#endif // KPIPELINE_FRAMEWORK_ENGINE_ENGINE_CONFIG_HPP_
